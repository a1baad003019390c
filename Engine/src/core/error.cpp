#include <core/error.hpp>

namespace Annex {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Config:    return "config";
        case ErrorKind::Resource:  return "resource";
        case ErrorKind::Handle:    return "handle";
        case ErrorKind::Dimension: return "dimension";
        case ErrorKind::Io:        return "io";
        case ErrorKind::Cancelled: return "cancelled";
        case ErrorKind::Internal:  return "internal";
    }
    return "unknown";
}

} // namespace Annex
