#include "apca/core/http/beast_transport.hpp"

#include "apca/core/errors.hpp"
#include "apca/core/logging.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/url.hpp>
#include <openssl/ssl.h>

#include <stdexcept>
#include <string>

namespace apca::core {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace {

constexpr const char* kUserAgent = "apca-cpp/0.1.0";

http::verb to_verb(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:
            return http::verb::get;
        case HttpMethod::Post:
            return http::verb::post;
        case HttpMethod::Put:
            return http::verb::put;
        case HttpMethod::Patch:
            return http::verb::patch;
        case HttpMethod::Delete:
            return http::verb::delete_;
    }
    return http::verb::get;
}

struct Endpoint {
    std::string host;
    std::string port;
    std::string target;
};

Endpoint parse_endpoint(const std::string& raw_url) {
    auto parsed = boost::urls::parse_uri(raw_url);
    if (!parsed) {
        throw std::invalid_argument("Invalid request URL: " + raw_url);
    }
    boost::urls::url_view url = parsed.value();
    if (url.scheme() != "https") {
        throw std::invalid_argument("BeastHttpTransport only supports https URLs: " + raw_url);
    }
    Endpoint endpoint;
    endpoint.host = std::string(url.encoded_host().data(), url.encoded_host().size());
    endpoint.port = url.has_port() ? std::string(url.port().data(), url.port().size()) : "443";
    auto target = url.encoded_target();
    endpoint.target = target.empty() ? "/" : std::string(target.data(), target.size());
    return endpoint;
}

}  // namespace

BeastHttpTransport::BeastHttpTransport() : ssl_ctx_(ssl::context::tls_client) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

BeastHttpTransport::~BeastHttpTransport() = default;

HttpResponse BeastHttpTransport::send(const HttpRequest& request) {
    const auto endpoint = parse_endpoint(request.url);
    logger()->debug("{} {}", to_string(request.method), request.url);

    boost::system::error_code ec;
    tcp::resolver resolver{io_};
    auto const results = resolver.resolve(endpoint.host, endpoint.port, ec);
    if (ec) {
        throw TransportError("Resolve failed: " + ec.message());
    }

    beast::ssl_stream<beast::tcp_stream> stream{io_, ssl_ctx_};
    if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint.host.c_str())) {
        throw TransportError("Failed to set SNI host name for " + endpoint.host);
    }
    stream.set_verify_callback(ssl::host_name_verification(endpoint.host));

    beast::get_lowest_layer(stream).connect(results, ec);
    if (ec) {
        throw TransportError("Connect failed: " + ec.message());
    }

    stream.handshake(ssl::stream_base::client, ec);
    if (ec) {
        throw TransportError("SSL handshake failed: " + ec.message());
    }

    http::request<http::string_body> req{to_verb(request.method), endpoint.target, 11};
    req.set(http::field::host, endpoint.host);
    req.set(http::field::user_agent, kUserAgent);
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    if (!request.body.empty()) {
        req.body() = request.body;
    }
    req.prepare_payload();

    http::write(stream, req, ec);
    if (ec) {
        throw TransportError("HTTP write failed: " + ec.message());
    }

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res, ec);
    if (ec) {
        throw TransportError("HTTP read failed: " + ec.message());
    }

    HttpResponse response;
    response.status_code = static_cast<int>(res.result_int());
    for (const auto& field : res) {
        response.headers[std::string(field.name_string())] = std::string(field.value());
    }
    response.body = std::move(res.body());

    // Servers commonly drop the connection without a close_notify.
    stream.shutdown(ec);
    if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
        logger()->debug("TLS shutdown for {} reported: {}", endpoint.host, ec.message());
    }
    return response;
}

std::shared_ptr<IHttpTransport> make_beast_transport() {
    return std::make_shared<BeastHttpTransport>();
}

}  // namespace apca::core
