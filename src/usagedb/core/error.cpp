#include "usagedb/core/error.h"

namespace usagedb {
namespace core {

const char* ErrorCodeName(Error::Code code) {
    switch (code) {
        case Error::Code::INVALID_ARGUMENT: return "invalid_argument";
        case Error::Code::NOT_FOUND: return "not_found";
        case Error::Code::INTERNAL: return "internal";
        case Error::Code::IO: return "io";
        case Error::Code::DATA_CORRUPTION: return "data_corruption";
        case Error::Code::UNKNOWN:
        default:
            return "unknown";
    }
}

} // namespace core
} // namespace usagedb
