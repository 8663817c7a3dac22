#pragma once

#include <cstddef>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "net/error.hpp"
#include "net/http.hpp"

namespace relay {

// Output of a serializer: a typed value, an error, or neither (empty body).
template <typename T>
struct serialized {
    std::optional<T> value;
    std::optional<relay::error> error;
};

// (request, response if any, accumulated bytes if any) -> (value?, error?)
// Serializers are pure and may run on any thread.
template <typename T>
using serializer = std::function<serialized<T>(
    const url_request&, const std::optional<http_response>&, const std::optional<std::string>&)>;

struct json_options {
    // Accept a scalar at the top level, not just an object or array
    bool allow_fragments;

    json_options() : allow_fragments(true) {}
};

struct plist_options {
    // Base64-decode <data> into a json binary value; otherwise keep the base64 text
    bool decode_data;
    // Skip unrecognized elements instead of failing
    bool allow_unknown_elements;
    // Larger documents fail without being parsed; libxml2 cannot take more than INT_MAX bytes
    std::size_t max_document_size;

    plist_options()
        : decode_data(true), allow_unknown_elements(false),
          max_document_size(static_cast<std::size_t>(std::numeric_limits<int>::max())) {}
};

// Returns the accumulated bytes unchanged.
serializer<std::string> data_serializer();

// Decodes the bytes to UTF-8. Encoding precedence: `encoding`, then the response's charset,
// then ISO-8859-1.
serializer<std::string> string_serializer(std::optional<std::string> encoding = std::nullopt);

serializer<nlohmann::json> json_serializer(json_options options = json_options());

// XML property lists, mapped onto a json tree (dict -> object, data -> binary).
serializer<nlohmann::json> property_list_serializer(plist_options options = plist_options());

// Converts `bytes` from `encoding` to UTF-8. Exposed for reuse by callers decoding other bodies.
serialized<std::string> decode_text(const std::string& bytes, const std::string& encoding);

} // namespace relay
