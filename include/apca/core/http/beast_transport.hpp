#pragma once

#include "apca/core/http_transport.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include <memory>

namespace apca::core {

/**
 * HTTPS transport over Boost.Beast. Each request opens its own TLS connection,
 * so concurrent calls from different threads never share a socket.
 */
class BeastHttpTransport final : public IHttpTransport {
  public:
    BeastHttpTransport();
    ~BeastHttpTransport() override;

    HttpResponse send(const HttpRequest& request) override;

  private:
    boost::asio::io_context io_;
    boost::asio::ssl::context ssl_ctx_;
};

std::shared_ptr<IHttpTransport> make_beast_transport();

}  // namespace apca::core
