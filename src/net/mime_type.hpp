#pragma once

#include <optional>
#include <string>

namespace relay {

// A "type/subtype" pair taken from a Content-Type or Accept entry. Either part may be "*".
struct mime_type {
    std::string type;
    std::string subtype;

    // Drops parameters after ';', trims, lowercases and splits on '/'.
    // Returns nullopt when there is no '/' or a part is empty.
    static std::optional<mime_type> parse(const std::string& value);

    // Wildcard match: "*/*" matches anything, "text/*" any text type, "*/json" any json subtype.
    bool matches(const mime_type& other) const;

    std::string str() const {
        return type + "/" + subtype;
    }
};

inline bool operator==(const mime_type& l, const mime_type& r) {
    return l.type == r.type && l.subtype == r.subtype;
}

} // namespace relay
