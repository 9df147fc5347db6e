#include "infra/http/TlsHttpClient.hpp"

#include <cctype>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>

namespace infra::http {
namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

constexpr int kMaxRedirects = 5;

std::runtime_error makeError(const std::string& host, const std::string& target, const std::string& message) {
    std::ostringstream oss;
    oss << "HTTPS GET request to https://" << host << target << " failed: " << message;
    return std::runtime_error(oss.str());
}

struct ParsedLocation {
    std::string host;
    std::string target;
};

ParsedLocation parseRedirectLocation(const std::string& location, const std::string& currentHost) {
    if (location.empty()) {
        throw std::runtime_error("Redirect response missing Location header");
    }

    ParsedLocation result{};

    if (location.rfind("https://", 0) == 0) {
        const std::string withoutScheme = location.substr(std::string{"https://"}.size());
        const auto slashPos = withoutScheme.find('/');
        std::string hostPart = slashPos == std::string::npos ? withoutScheme : withoutScheme.substr(0, slashPos);
        if (hostPart.empty()) {
            throw std::runtime_error("Redirect URL missing host");
        }
        const auto colonPos = hostPart.find(':');
        if (colonPos != std::string::npos) {
            const std::string portPart = hostPart.substr(colonPos + 1);
            if (portPart != "443") {
                throw std::runtime_error("Redirect to unsupported HTTPS port: " + portPart);
            }
            hostPart = hostPart.substr(0, colonPos);
        }
        result.host = hostPart;
        result.target = slashPos == std::string::npos ? std::string{"/"} : withoutScheme.substr(slashPos);
    } else if (location.rfind("http://", 0) == 0) {
        throw std::runtime_error("Insecure redirect to HTTP is not supported");
    } else {
        result.host = currentHost;
        result.target = location.front() == '/' ? location : "/" + location;
    }

    return result;
}

http::response<http::string_body> performRequest(const std::string& host,
                                                 const std::string& target,
                                                 const RequestOptions& options) {
    if (options.timeout_sec <= 0) {
        throw makeError(host, target, "timeout must be positive");
    }
    const auto timeout = std::chrono::seconds(options.timeout_sec);

    net::io_context ioc;
    ssl::context sslContext(ssl::context::tls_client);
    sslContext.set_default_verify_paths();
    sslContext.set_verify_mode(ssl::verify_peer);

    ssl::stream<beast::tcp_stream> stream(ioc, sslContext);

    if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
        const unsigned long err = ::ERR_get_error();
        const char* reason = err != 0 ? ::ERR_reason_error_string(err) : nullptr;
        std::ostringstream oss;
        oss << "Failed to set SNI hostname to '" << host << "'";
        if (reason != nullptr) {
            oss << ": " << reason;
        }
        throw makeError(host, target, oss.str());
    }

    auto resolver = net::ip::tcp::resolver(ioc);
    beast::error_code ec;
    auto const results = resolver.resolve(host, "443", ec);
    if (ec) {
        throw makeError(host, target, "DNS resolution error: " + ec.message());
    }

    auto& lowestLayer = beast::get_lowest_layer(stream);
    lowestLayer.expires_after(timeout);
    lowestLayer.connect(results, ec);
    if (ec) {
        throw makeError(host, target, "Connection error: " + ec.message());
    }

    lowestLayer.expires_after(timeout);
    stream.handshake(ssl::stream_base::client, ec);
    if (ec) {
        throw makeError(host, target, "TLS handshake error: " + ec.message());
    }

    http::request<http::empty_body> req{http::verb::get, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::user_agent, options.user_agent);
    req.set(http::field::accept, "application/json");
    req.set(http::field::connection, "close");

    lowestLayer.expires_after(timeout);
    http::write(stream, req, ec);
    if (ec) {
        throw makeError(host, target, "Write error: " + ec.message());
    }

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(64U * 1024U * 1024U);
    lowestLayer.expires_after(timeout);
    http::read(stream, buffer, parser, ec);
    if (ec) {
        throw makeError(host, target, "Read error: " + ec.message());
    }

    stream.shutdown(ec);
    if (ec == net::error::eof) {
        ec = {};
    }
    if (ec == ssl::error::stream_truncated) {
        // Allow truncated TLS shutdown which may occur with some servers.
        ec = {};
    }
    if (ec) {
        throw makeError(host, target, "TLS shutdown error: " + ec.message());
    }

    return parser.release();
}

}  // namespace

HttpResponse https_get(const std::string& host, const std::string& target, const RequestOptions& options) {
    if (host.empty()) {
        throw std::runtime_error("HTTPS GET requires a non-empty host");
    }

    std::string normalizedTarget = target.empty() ? std::string{"/"} : target;
    if (normalizedTarget.front() != '/') {
        normalizedTarget.insert(normalizedTarget.begin(), '/');
    }

    std::string currentHost = host;
    std::string currentTarget = normalizedTarget;

    for (int redirectCount = 0; redirectCount <= kMaxRedirects; ++redirectCount) {
        auto response = performRequest(currentHost, currentTarget, options);
        const auto status = static_cast<unsigned>(response.result_int());
        if (status == 301U || status == 302U || status == 307U || status == 308U) {
            try {
                const auto locationHeader = response.base()[http::field::location];
                const auto parsed = parseRedirectLocation(std::string(locationHeader), currentHost);
                currentHost = parsed.host;
                currentTarget = parsed.target;
                continue;
            } catch (const std::exception& redirectError) {
                throw makeError(currentHost, currentTarget, redirectError.what());
            }
        }

        HttpResponse result{};
        result.status = status;
        result.body = std::move(response.body());
        result.final_host = currentHost;
        result.final_target = currentTarget;
        return result;
    }

    throw makeError(currentHost, currentTarget, "Too many redirects");
}

std::string url_encode(const std::string& value) {
    std::ostringstream out;
    out << std::hex << std::uppercase;
    for (const char ch : value) {
        const auto uch = static_cast<unsigned char>(ch);
        if (std::isalnum(uch) || ch == '-' || ch == '_' || ch == '.' || ch == '~') {
            out << ch;
        } else {
            out << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(uch);
        }
    }
    return out.str();
}

std::string build_target(const std::string& path, const std::vector<std::pair<std::string, std::string>>& params) {
    std::string target = path;
    char separator = '?';
    for (const auto& [key, value] : params) {
        target.push_back(separator);
        target.append(url_encode(key)).append("=").append(url_encode(value));
        separator = '&';
    }
    return target;
}

}  // namespace infra::http
