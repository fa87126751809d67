#include "apca/core/ws/beast_websocket_transport.hpp"

#include "apca/core/errors.hpp"
#include "apca/core/logging.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <boost/url.hpp>
#include <openssl/ssl.h>

#include <atomic>
#include <future>
#include <stdexcept>
#include <thread>

namespace apca::core::ws {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace {

constexpr const char* kUserAgent = "apca-cpp/0.1.0";

bool is_close(const beast::error_code& ec) {
    return ec == websocket::error::closed || ec == net::error::operation_aborted ||
           ec == net::error::eof || ec == ssl::error::stream_truncated;
}

}  // namespace

struct BeastWebSocketTransport::Impl {
    net::io_context io;
    ssl::context ssl_ctx{ssl::context::tls_client};
    websocket::stream<beast::ssl_stream<beast::tcp_stream>> ws{io, ssl_ctx};
    net::executor_work_guard<net::io_context::executor_type> work{io.get_executor()};
    std::thread io_thread;
    beast::flat_buffer read_buffer;
    std::atomic<bool> closed{false};
    std::string host;
    std::string port;
    std::string target;
};

BeastWebSocketTransport::BeastWebSocketTransport(const std::string& url)
    : pimpl_(std::make_unique<Impl>()) {
    auto parsed = boost::urls::parse_uri(url);
    if (!parsed) {
        throw std::invalid_argument("Invalid WebSocket URL: " + url);
    }
    boost::urls::url_view view = parsed.value();
    if (view.scheme() != "wss") {
        throw std::invalid_argument("BeastWebSocketTransport only supports wss URLs: " + url);
    }
    pimpl_->host = std::string(view.encoded_host().data(), view.encoded_host().size());
    pimpl_->port = view.has_port() ? std::string(view.port().data(), view.port().size()) : "443";
    auto target = view.encoded_target();
    pimpl_->target = target.empty() ? "/" : std::string(target.data(), target.size());

    pimpl_->ssl_ctx.set_default_verify_paths();
    pimpl_->ssl_ctx.set_verify_mode(ssl::verify_peer);

    boost::system::error_code ec;
    tcp::resolver resolver{pimpl_->io};
    auto const results = resolver.resolve(pimpl_->host, pimpl_->port, ec);
    if (ec) {
        throw TransportError("Resolve failed: " + ec.message());
    }

    auto& tls = pimpl_->ws.next_layer();
    if (!SSL_set_tlsext_host_name(tls.native_handle(), pimpl_->host.c_str())) {
        throw TransportError("Failed to set SNI host name for " + pimpl_->host);
    }
    tls.set_verify_callback(ssl::host_name_verification(pimpl_->host));

    beast::get_lowest_layer(pimpl_->ws).connect(results, ec);
    if (ec) {
        throw TransportError("Connect failed: " + ec.message());
    }

    tls.handshake(ssl::stream_base::client, ec);
    if (ec) {
        throw TransportError("SSL handshake failed: " + ec.message());
    }

    // The websocket layer keeps its own timers from here on.
    beast::get_lowest_layer(pimpl_->ws).expires_never();
    pimpl_->ws.set_option(
        websocket::stream_base::timeout::suggested(beast::role_type::client));
    pimpl_->ws.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
        req.set(http::field::user_agent, kUserAgent);
    }));

    pimpl_->ws.handshake(pimpl_->host, pimpl_->target, ec);
    if (ec) {
        throw TransportError("WebSocket handshake failed: " + ec.message());
    }

    pimpl_->io_thread = std::thread([impl = pimpl_.get()] { impl->io.run(); });
    logger()->info("connected to wss://{}:{}{}", pimpl_->host, pimpl_->port, pimpl_->target);
}

BeastWebSocketTransport::~BeastWebSocketTransport() {
    try {
        close();
    } catch (const std::exception& e) {
        logger()->warn("closing websocket to {} failed: {}", pimpl_->host, e.what());
    }
    pimpl_->work.reset();
    if (pimpl_->io_thread.joinable()) {
        pimpl_->io.stop();
        pimpl_->io_thread.join();
    }
}

void BeastWebSocketTransport::write(std::string_view payload, FrameKind kind) {
    if (pimpl_->closed) {
        throw TransportError("WebSocket to " + pimpl_->host + " is closed");
    }
    std::promise<void> done;
    auto result = done.get_future();
    net::post(pimpl_->io, [impl = pimpl_.get(), payload, kind, &done] {
        impl->ws.binary(kind == FrameKind::Binary);
        impl->ws.async_write(net::buffer(payload.data(), payload.size()),
                             [&done](beast::error_code ec, std::size_t) {
                                 if (ec) {
                                     done.set_exception(std::make_exception_ptr(
                                         TransportError("WebSocket write failed: " + ec.message())));
                                     return;
                                 }
                                 done.set_value();
                             });
    });
    result.get();
}

std::optional<Frame> BeastWebSocketTransport::read() {
    if (pimpl_->closed) {
        return std::nullopt;
    }
    std::promise<std::optional<Frame>> done;
    auto result = done.get_future();
    net::post(pimpl_->io, [impl = pimpl_.get(), &done] {
        impl->read_buffer.clear();
        impl->ws.async_read(impl->read_buffer, [impl, &done](beast::error_code ec, std::size_t) {
            if (is_close(ec)) {
                done.set_value(std::nullopt);
                return;
            }
            if (ec) {
                done.set_exception(std::make_exception_ptr(
                    TransportError("WebSocket read failed: " + ec.message())));
                return;
            }
            Frame frame;
            frame.kind = impl->ws.got_binary() ? FrameKind::Binary : FrameKind::Text;
            frame.payload = beast::buffers_to_string(impl->read_buffer.data());
            done.set_value(std::move(frame));
        });
    });
    return result.get();
}

void BeastWebSocketTransport::close() {
    if (pimpl_->closed.exchange(true) || !pimpl_->io_thread.joinable()) {
        return;
    }
    std::promise<beast::error_code> done;
    auto result = done.get_future();
    net::post(pimpl_->io, [impl = pimpl_.get(), &done] {
        impl->ws.async_close(websocket::close_code::normal,
                             [&done](beast::error_code ec) { done.set_value(ec); });
    });
    auto ec = result.get();
    // The peer may already have torn the connection down.
    if (ec && !is_close(ec)) {
        logger()->debug("websocket close to {} reported: {}", pimpl_->host, ec.message());
    }
    logger()->info("closed websocket to {}", pimpl_->host);
}

std::shared_ptr<IWebSocketTransport> make_beast_websocket_transport(const std::string& url) {
    return std::make_shared<BeastWebSocketTransport>(url);
}

}  // namespace apca::core::ws
