#include "apca/core/errors.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace apca::core;

namespace {

VendorErrorCode failure_code(ResourceFamily family, int status) {
    try {
        ensure_success(family, status, R"({"message":"nope"})");
    } catch (const VendorError& error) {
        assert(error.family() == family);
        assert(error.status() == status);
        assert(error.body().find("nope") != std::string::npos);
        return error.code();
    }
    assert(false && "expected a VendorError");
    return VendorErrorCode::Unexpected;
}

}  // namespace

int main() {
    ensure_success(ResourceFamily::Orders, 200, "{}");
    ensure_success(ResourceFamily::Watchlists, 204, "");

    assert(failure_code(ResourceFamily::Orders, 403) == VendorErrorCode::InsufficientFunds);
    assert(failure_code(ResourceFamily::Orders, 404) == VendorErrorCode::NotFound);
    assert(failure_code(ResourceFamily::Orders, 422) == VendorErrorCode::Unprocessable);
    assert(failure_code(ResourceFamily::Orders, 500) == VendorErrorCode::FailedToCancel);

    assert(failure_code(ResourceFamily::History, 400) == VendorErrorCode::InvalidParameters);
    assert(failure_code(ResourceFamily::History, 403) == VendorErrorCode::Forbidden);
    assert(failure_code(ResourceFamily::History, 429) == VendorErrorCode::RateLimited);

    assert(failure_code(ResourceFamily::Positions, 404) == VendorErrorCode::NotFound);
    assert(failure_code(ResourceFamily::Positions, 500) == VendorErrorCode::FailedToLiquidate);

    assert(failure_code(ResourceFamily::Watchlists, 422) == VendorErrorCode::Unprocessable);
    assert(failure_code(ResourceFamily::Assets, 404) == VendorErrorCode::NotFound);

    // Statuses a family does not document keep their number.
    assert(failure_code(ResourceFamily::Assets, 500) == VendorErrorCode::Unexpected);
    assert(failure_code(ResourceFamily::Positions, 429) == VendorErrorCode::Unexpected);
    assert(!lookup_vendor_error(ResourceFamily::Watchlists, 403).has_value());
    assert(lookup_vendor_error(ResourceFamily::History, 404) == VendorErrorCode::NotFound);

    assert(realtime_error_code(402) == VendorErrorCode::AuthFailed);
    assert(realtime_error_code(403) == VendorErrorCode::AlreadyAuthenticated);
    assert(realtime_error_code(406) == VendorErrorCode::ConnectionLimitExceeded);
    assert(realtime_error_code(409) == VendorErrorCode::InsufficientSubscription);
    assert(realtime_error_code(500) == VendorErrorCode::InternalError);
    assert(realtime_error_code(418) == VendorErrorCode::Unexpected);

    try {
        ensure_success(ResourceFamily::Orders, 404, "");
        assert(false);
    } catch (const Error& error) {
        // Catchable through the library base class.
        assert(std::string(error.what()).find("404") != std::string::npos);
    }

    ProtocolError protocol(ProtocolErrorKind::UnknownVariant, "unknown");
    assert(protocol.kind() == ProtocolErrorKind::UnknownVariant);

    std::cout << "Error mapping tests passed\n";
    return 0;
}
