#pragma once

#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace apca::core {

enum class HttpMethod { Get, Post, Put, Patch, Delete };

[[nodiscard]] constexpr std::string_view to_string(HttpMethod method) noexcept {
    switch (method) {
        case HttpMethod::Get:
            return "GET";
        case HttpMethod::Post:
            return "POST";
        case HttpMethod::Put:
            return "PUT";
        case HttpMethod::Patch:
            return "PATCH";
        case HttpMethod::Delete:
            return "DELETE";
    }
    return "GET";
}

using HttpHeaders = std::map<std::string, std::string>;

struct HttpRequest {
    HttpMethod method{HttpMethod::Get};
    std::string url;
    HttpHeaders headers;
    std::string body;
};

struct HttpResponse {
    int status_code{0};
    HttpHeaders headers;
    std::string body;
};

/**
 * Blocking HTTP collaborator shared by the REST clients. Implementations must be
 * safe to call from several threads at once; every paged stream issues its
 * fetches from its own task. Connection failures raise core::TransportError.
 */
class IHttpTransport {
  public:
    virtual ~IHttpTransport() = default;

    virtual HttpResponse send(const HttpRequest& request) = 0;
};

}  // namespace apca::core
