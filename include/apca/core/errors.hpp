#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace apca::core {

/**
 * Base class of every error raised by the library.
 */
class Error : public std::runtime_error {
  public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// Socket or HTTP connection failure.
class TransportError : public Error {
  public:
    explicit TransportError(const std::string& message) : Error(message) {}
};

enum class ProtocolErrorKind { Malformed, UnknownVariant };

// A frame that could not be decoded into the expected message taxonomy.
class ProtocolError : public Error {
  public:
    ProtocolError(ProtocolErrorKind kind, const std::string& message)
        : Error(message), kind_(kind) {}

    [[nodiscard]] ProtocolErrorKind kind() const noexcept { return kind_; }

  private:
    ProtocolErrorKind kind_;
};

// JSON decode or encode failure of a REST payload.
class SerializationError : public Error {
  public:
    explicit SerializationError(const std::string& message) : Error(message) {}
};

/**
 * Resource families of the REST API. Each family has its own, vendor defined,
 * table mapping HTTP statuses to error codes.
 */
enum class ResourceFamily { Orders, History, Positions, Watchlists, Assets, Realtime };

enum class VendorErrorCode {
    InvalidParameters,
    InsufficientFunds,
    Forbidden,
    NotFound,
    Unprocessable,
    RateLimited,
    FailedToCancel,
    FailedToLiquidate,
    InvalidSyntax,
    NotAuthenticated,
    AuthFailed,
    AlreadyAuthenticated,
    AuthTimeout,
    SymbolLimitExceeded,
    ConnectionLimitExceeded,
    SlowClient,
    V2NotEnabled,
    InsufficientSubscription,
    InternalError,
    Unexpected
};

[[nodiscard]] std::string_view to_string(ResourceFamily family) noexcept;
[[nodiscard]] std::string_view to_string(VendorErrorCode code) noexcept;

/**
 * Looks up the vendor error code for a status in the table of the given family.
 * Returns std::nullopt when the family does not document that status.
 */
[[nodiscard]] std::optional<VendorErrorCode> lookup_vendor_error(ResourceFamily family,
                                                                 int status) noexcept;

// Maps a realtime protocol error code (as carried by an `error` message).
[[nodiscard]] VendorErrorCode realtime_error_code(int code) noexcept;

class VendorError : public Error {
  public:
    VendorError(ResourceFamily family, int status, VendorErrorCode code, std::string body = {});

    [[nodiscard]] ResourceFamily family() const noexcept { return family_; }
    [[nodiscard]] int status() const noexcept { return status_; }
    [[nodiscard]] VendorErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& body() const noexcept { return body_; }

  private:
    ResourceFamily family_;
    int status_;
    VendorErrorCode code_;
    std::string body_;
};

/**
 * Throws a VendorError unless `status` is 2xx. Statuses missing from the family
 * table map to VendorErrorCode::Unexpected.
 */
void ensure_success(ResourceFamily family, int status, const std::string& body);

}  // namespace apca::core
