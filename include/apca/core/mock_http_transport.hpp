#pragma once

#include "apca/core/errors.hpp"
#include "apca/core/http_transport.hpp"

#include <mutex>
#include <queue>
#include <vector>

namespace apca::core {

class MockHttpTransport final : public IHttpTransport {
  public:
    MockHttpTransport() = default;

    void enqueue_response(HttpResponse response) {
        std::lock_guard lock(mutex_);
        responses_.push(std::move(response));
    }

    HttpResponse send(const HttpRequest &request) override {
        std::lock_guard lock(mutex_);
        requests_.push_back(request);
        if (responses_.empty()) {
            throw TransportError("MockHttpTransport: no responses queued");
        }
        auto response = responses_.front();
        responses_.pop();
        return response;
    }

    [[nodiscard]] std::vector<HttpRequest> requests() const {
        std::lock_guard lock(mutex_);
        return requests_;
    }

  private:
    mutable std::mutex mutex_;
    std::queue<HttpResponse> responses_;
    std::vector<HttpRequest> requests_;
};

}  // namespace apca::core
