#include "net/mime_type.hpp"

#include <algorithm>
#include <cctype>

namespace relay {

namespace {
std::string trim_copy(const std::string& s) {
    const char* whitespace = " \t\r\n";
    size_t first = s.find_first_not_of(whitespace);
    if (first == std::string::npos)
        return "";
    size_t last = s.find_last_not_of(whitespace);
    return s.substr(first, last - first + 1);
}

inline std::string to_lower_copy(const std::string& s) {
    std::string r = s;
    std::transform(r.begin(), r.end(), r.begin(), ::tolower);
    return r;
}
} // namespace

std::optional<mime_type> mime_type::parse(const std::string& value) {
    std::string essence = trim_copy(value.substr(0, value.find(';')));
    size_t slash_pos = essence.find('/');
    if (slash_pos == std::string::npos)
        return std::nullopt;

    mime_type mime;
    mime.type = to_lower_copy(trim_copy(essence.substr(0, slash_pos)));
    mime.subtype = to_lower_copy(trim_copy(essence.substr(slash_pos + 1)));
    if (mime.type.empty() || mime.subtype.empty() || mime.subtype.find('/') != std::string::npos)
        return std::nullopt;
    return mime;
}

bool mime_type::matches(const mime_type& other) const {
    bool type_matches = type == other.type || type == "*" || other.type == "*";
    bool subtype_matches = subtype == other.subtype || subtype == "*" || other.subtype == "*";
    return type_matches && subtype_matches;
}

} // namespace relay
