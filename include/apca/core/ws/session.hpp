#pragma once

#include "apca/core/errors.hpp"
#include "apca/core/logging.hpp"
#include "apca/core/ws/websocket_transport.hpp"

#include <deque>
#include <exception>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace apca::core::ws {

/**
 * Connection states as the sending half observes them. Authentication is only
 * confirmed by a server message, which the caller sees on the receiving half.
 */
enum class SessionState { Connected, Authenticating, Subscribed, Listening, Closed };

// What the receiving half does with a frame its protocol cannot decode.
enum class DecodeFailurePolicy {
    Terminate,  // rethrow, then end the sequence
    Skip,       // log and keep reading
    Surface     // rethrow, the sequence stays usable
};

[[nodiscard]] inline std::string_view to_string(SessionState state) noexcept {
    switch (state) {
        case SessionState::Connected:
            return "connected";
        case SessionState::Authenticating:
            return "authenticating";
        case SessionState::Subscribed:
            return "subscribed";
        case SessionState::Listening:
            return "listening";
        case SessionState::Closed:
            return "closed";
    }
    return "unknown";
}

namespace detail {

inline void close_quietly(std::shared_ptr<IWebSocketTransport>& transport,
                          std::string_view name) noexcept {
    if (!transport) {
        return;
    }
    try {
        transport->close();
    } catch (const std::exception& e) {
        logger()->warn("{}: closing abandoned connection failed: {}", name, e.what());
    }
    transport.reset();
}

}  // namespace detail

/**
 * A Protocol describes one feed:
 *
 *     using action_type = ...;     // client to server
 *     using response_type = ...;   // server to client
 *     static constexpr FrameKind frame_kind;
 *     static constexpr std::string_view name;
 *     static std::string encode(const action_type&);
 *     static SessionState state_after(const action_type&);
 *     static std::vector<response_type> decode(std::string_view frame);  // throws ProtocolError
 *
 * decode() may return several responses for one frame, or none.
 */
template <typename Protocol>
class ResponseStream {
  public:
    using response_type = typename Protocol::response_type;

    ResponseStream(std::shared_ptr<IWebSocketTransport> transport, DecodeFailurePolicy policy)
        : transport_(std::move(transport)), policy_(policy) {}

    // Nobody reads the connection any more, so it is closed.
    ~ResponseStream() { detail::close_quietly(transport_, Protocol::name); }

    ResponseStream(ResponseStream&&) noexcept = default;
    ResponseStream& operator=(ResponseStream&& other) noexcept {
        if (this != &other) {
            detail::close_quietly(transport_, Protocol::name);
            transport_ = std::move(other.transport_);
            policy_ = other.policy_;
            pending_ = std::move(other.pending_);
            finished_ = other.finished_;
        }
        return *this;
    }
    ResponseStream(const ResponseStream&) = delete;
    ResponseStream& operator=(const ResponseStream&) = delete;

    /**
     * Blocks until the next response is available. std::nullopt once the
     * connection is closed or the stream has terminated.
     */
    std::optional<response_type> next() {
        while (pending_.empty()) {
            if (finished_) {
                return std::nullopt;
            }
            std::optional<Frame> frame;
            try {
                frame = transport_->read();
            } catch (const TransportError&) {
                finished_ = true;
                throw;
            }
            if (!frame) {
                finished_ = true;
                return std::nullopt;
            }
            try {
                auto responses = Protocol::decode(frame->payload);
                pending_.assign(std::make_move_iterator(responses.begin()),
                                std::make_move_iterator(responses.end()));
            } catch (const ProtocolError& error) {
                if (policy_ == DecodeFailurePolicy::Skip) {
                    logger()->warn("{}: dropping undecodable frame: {}", Protocol::name,
                                   error.what());
                    continue;
                }
                if (policy_ == DecodeFailurePolicy::Terminate) {
                    finished_ = true;
                }
                throw;
            }
        }
        response_type response = std::move(pending_.front());
        pending_.pop_front();
        return response;
    }

    [[nodiscard]] bool finished() const noexcept { return finished_ && pending_.empty(); }

  private:
    std::shared_ptr<IWebSocketTransport> transport_;
    DecodeFailurePolicy policy_;
    std::deque<response_type> pending_;
    bool finished_{false};
};

/**
 * Outbound half of a session. Dropping it leaves the connection open for the
 * receiving half; close() ends both directions.
 */
template <typename Protocol>
class Sender {
  public:
    using action_type = typename Protocol::action_type;

    explicit Sender(std::shared_ptr<IWebSocketTransport> transport)
        : transport_(std::move(transport)) {}

    Sender(Sender&&) noexcept = default;
    Sender& operator=(Sender&&) noexcept = default;
    Sender(const Sender&) = delete;
    Sender& operator=(const Sender&) = delete;

    // Encodes and writes one action. Throws TransportError once closed.
    void send(const action_type& action) {
        if (state_ == SessionState::Closed || !transport_) {
            throw TransportError(std::string(Protocol::name) + ": session is closed");
        }
        const auto payload = Protocol::encode(action);
        logger()->debug("{} >> {}", Protocol::name, payload);
        transport_->write(payload, Protocol::frame_kind);
        state_ = Protocol::state_after(action);
    }

    // Closes the connection. The receiving half then reaches the end of its sequence.
    void close() {
        if (state_ == SessionState::Closed) {
            return;
        }
        state_ = SessionState::Closed;
        if (transport_) {
            transport_->close();
        }
    }

    [[nodiscard]] SessionState state() const noexcept { return state_; }

  private:
    std::shared_ptr<IWebSocketTransport> transport_;
    SessionState state_{SessionState::Connected};
};

// Inbound half of a session.
template <typename Protocol>
class Receiver {
  public:
    Receiver(std::shared_ptr<IWebSocketTransport> transport, DecodeFailurePolicy policy)
        : transport_(std::move(transport)), policy_(policy) {}

    // A receiver dropped before stream() closes the connection.
    ~Receiver() { detail::close_quietly(transport_, Protocol::name); }

    Receiver(Receiver&&) noexcept = default;
    Receiver& operator=(Receiver&& other) noexcept {
        if (this != &other) {
            detail::close_quietly(transport_, Protocol::name);
            transport_ = std::move(other.transport_);
            policy_ = other.policy_;
        }
        return *this;
    }
    Receiver(const Receiver&) = delete;
    Receiver& operator=(const Receiver&) = delete;

    ResponseStream<Protocol> stream() && {
        if (!transport_) {
            throw std::logic_error(std::string(Protocol::name) + ": receiver already consumed");
        }
        return ResponseStream<Protocol>(std::move(transport_), policy_);
    }

    [[nodiscard]] DecodeFailurePolicy policy() const noexcept { return policy_; }

  private:
    std::shared_ptr<IWebSocketTransport> transport_;
    DecodeFailurePolicy policy_;
};

/**
 * An open connection speaking Protocol. split() hands the outbound and inbound
 * directions to two independent halves that can be driven from different threads.
 * The halves share the connection: it is closed by Sender::close() or when the
 * receiving half, or the ResponseStream it produced, is destroyed.
 */
template <typename Protocol>
class Session {
  public:
    explicit Session(std::shared_ptr<IWebSocketTransport> transport,
                     DecodeFailurePolicy policy = DecodeFailurePolicy::Terminate)
        : transport_(std::move(transport)), policy_(policy) {
        if (!transport_) {
            throw std::invalid_argument("Session requires a transport");
        }
    }

    Session(Session&&) noexcept = default;
    Session& operator=(Session&&) noexcept = default;
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    std::pair<Sender<Protocol>, Receiver<Protocol>> split() && {
        if (!transport_) {
            throw std::logic_error(std::string(Protocol::name) + ": session already split");
        }
        auto transport = std::move(transport_);
        return {Sender<Protocol>(transport), Receiver<Protocol>(transport, policy_)};
    }

    void set_decode_failure_policy(DecodeFailurePolicy policy) noexcept { policy_ = policy; }

  private:
    std::shared_ptr<IWebSocketTransport> transport_;
    DecodeFailurePolicy policy_;
};

}  // namespace apca::core::ws
