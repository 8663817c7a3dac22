#include "net/transport.hpp"

namespace relay {

const char* task_kind_name(task_kind kind) {
    switch (kind) {
    case task_kind::data:
        return "data";
    case task_kind::upload:
        return "upload";
    case task_kind::download:
        return "download";
    }
    return "unknown";
}

} // namespace relay
