#include "apca/core/errors.hpp"

#include <sstream>

namespace apca::core {

namespace {

struct StatusEntry {
    int status;
    VendorErrorCode code;
};

constexpr StatusEntry kOrderStatuses[] = {
    {403, VendorErrorCode::InsufficientFunds},
    {404, VendorErrorCode::NotFound},
    {422, VendorErrorCode::Unprocessable},
    {500, VendorErrorCode::FailedToCancel},
};

constexpr StatusEntry kHistoryStatuses[] = {
    {400, VendorErrorCode::InvalidParameters},
    {403, VendorErrorCode::Forbidden},
    {404, VendorErrorCode::NotFound},
    {422, VendorErrorCode::Unprocessable},
    {429, VendorErrorCode::RateLimited},
};

constexpr StatusEntry kPositionStatuses[] = {
    {404, VendorErrorCode::NotFound},
    {500, VendorErrorCode::FailedToLiquidate},
};

constexpr StatusEntry kWatchlistStatuses[] = {
    {404, VendorErrorCode::NotFound},
    {422, VendorErrorCode::Unprocessable},
};

constexpr StatusEntry kAssetStatuses[] = {
    {404, VendorErrorCode::NotFound},
};

// 403 is "already authenticated" on the wire even though the vendor documentation
// once listed it next to the 406 description.
constexpr StatusEntry kRealtimeCodes[] = {
    {400, VendorErrorCode::InvalidSyntax},
    {401, VendorErrorCode::NotAuthenticated},
    {402, VendorErrorCode::AuthFailed},
    {403, VendorErrorCode::AlreadyAuthenticated},
    {404, VendorErrorCode::AuthTimeout},
    {405, VendorErrorCode::SymbolLimitExceeded},
    {406, VendorErrorCode::ConnectionLimitExceeded},
    {407, VendorErrorCode::SlowClient},
    {408, VendorErrorCode::V2NotEnabled},
    {409, VendorErrorCode::InsufficientSubscription},
    {500, VendorErrorCode::InternalError},
};

template <std::size_t N>
std::optional<VendorErrorCode> find_code(const StatusEntry (&table)[N], int status) noexcept {
    for (const auto& entry : table) {
        if (entry.status == status) {
            return entry.code;
        }
    }
    return std::nullopt;
}

std::string format_vendor_message(ResourceFamily family, int status, VendorErrorCode code,
                                  const std::string& body) {
    std::ostringstream oss;
    oss << to_string(family) << " request failed with status " << status << " ("
        << to_string(code) << ')';
    if (!body.empty()) {
        oss << ": " << body;
    }
    return oss.str();
}

}  // namespace

std::string_view to_string(ResourceFamily family) noexcept {
    switch (family) {
        case ResourceFamily::Orders:
            return "orders";
        case ResourceFamily::History:
            return "history";
        case ResourceFamily::Positions:
            return "positions";
        case ResourceFamily::Watchlists:
            return "watchlists";
        case ResourceFamily::Assets:
            return "assets";
        case ResourceFamily::Realtime:
            return "realtime";
    }
    return "unknown";
}

std::string_view to_string(VendorErrorCode code) noexcept {
    switch (code) {
        case VendorErrorCode::InvalidParameters:
            return "invalid parameters";
        case VendorErrorCode::InsufficientFunds:
            return "buying power or shares is not sufficient";
        case VendorErrorCode::Forbidden:
            return "forbidden";
        case VendorErrorCode::NotFound:
            return "not found";
        case VendorErrorCode::Unprocessable:
            return "unprocessable";
        case VendorErrorCode::RateLimited:
            return "rate limit exceeded";
        case VendorErrorCode::FailedToCancel:
            return "failed to cancel";
        case VendorErrorCode::FailedToLiquidate:
            return "failed to liquidate";
        case VendorErrorCode::InvalidSyntax:
            return "invalid syntax";
        case VendorErrorCode::NotAuthenticated:
            return "not authenticated";
        case VendorErrorCode::AuthFailed:
            return "auth failed";
        case VendorErrorCode::AlreadyAuthenticated:
            return "already authenticated";
        case VendorErrorCode::AuthTimeout:
            return "auth timeout";
        case VendorErrorCode::SymbolLimitExceeded:
            return "symbol limit exceeded";
        case VendorErrorCode::ConnectionLimitExceeded:
            return "connection limit exceeded";
        case VendorErrorCode::SlowClient:
            return "slow client";
        case VendorErrorCode::V2NotEnabled:
            return "v2 not enabled";
        case VendorErrorCode::InsufficientSubscription:
            return "insufficient subscription";
        case VendorErrorCode::InternalError:
            return "internal error";
        case VendorErrorCode::Unexpected:
            return "unexpected";
    }
    return "unexpected";
}

std::optional<VendorErrorCode> lookup_vendor_error(ResourceFamily family, int status) noexcept {
    switch (family) {
        case ResourceFamily::Orders:
            return find_code(kOrderStatuses, status);
        case ResourceFamily::History:
            return find_code(kHistoryStatuses, status);
        case ResourceFamily::Positions:
            return find_code(kPositionStatuses, status);
        case ResourceFamily::Watchlists:
            return find_code(kWatchlistStatuses, status);
        case ResourceFamily::Assets:
            return find_code(kAssetStatuses, status);
        case ResourceFamily::Realtime:
            return find_code(kRealtimeCodes, status);
    }
    return std::nullopt;
}

VendorErrorCode realtime_error_code(int code) noexcept {
    return find_code(kRealtimeCodes, code).value_or(VendorErrorCode::Unexpected);
}

VendorError::VendorError(ResourceFamily family, int status, VendorErrorCode code,
                         std::string body)
    : Error(format_vendor_message(family, status, code, body)), family_(family),
      status_(status), code_(code), body_(std::move(body)) {}

void ensure_success(ResourceFamily family, int status, const std::string& body) {
    if (status >= 200 && status < 300) {
        return;
    }
    auto code = lookup_vendor_error(family, status).value_or(VendorErrorCode::Unexpected);
    throw VendorError(family, status, code, body);
}

}  // namespace apca::core
