#include "core/update_types.hpp"

const char* error_kind_name(UpdateErrorKind kind) {
    switch (kind) {
        case UpdateErrorKind::None:         return "none";
        case UpdateErrorKind::Network:      return "network";
        case UpdateErrorKind::Timeout:      return "timeout";
        case UpdateErrorKind::Auth:         return "auth";
        case UpdateErrorKind::RateLimit:    return "rate-limit";
        case UpdateErrorKind::Http:         return "http";
        case UpdateErrorKind::NoAsset:      return "no-asset";
        case UpdateErrorKind::Parse:        return "parse";
        case UpdateErrorKind::Io:           return "io";
        case UpdateErrorKind::Cancelled:    return "cancelled";
        case UpdateErrorKind::InvalidState: return "invalid-state";
    }
    return "unknown";
}
