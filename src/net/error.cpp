#include "net/error.hpp"

#include <sstream>

namespace relay {

const char* error_kind_name(error_kind kind) {
    switch (kind) {
    case error_kind::transport:
        return "transport";
    case error_kind::cancelled:
        return "cancelled";
    case error_kind::serialization:
        return "serialization";
    case error_kind::validation:
        return "validation";
    case error_kind::file_system:
        return "file_system";
    }
    return "unknown";
}

error error::validation_failed() {
    return error(error_kind::validation, -1, "validation failed");
}

error error::cancelled() {
    return error(error_kind::cancelled, -999, "cancelled");
}

std::string error::describe() const {
    std::ostringstream oss;
    oss << error_kind_name(kind) << " error " << code << ": " << message;
    if (offset) {
        oss << " (at byte " << *offset << ")";
    }
    return oss.str();
}

} // namespace relay
