#pragma once

#include <functional>
#include <string>
#include <vector>

#include "net/http.hpp"

namespace relay {

// Pure predicate deciding whether a completed response is acceptable.
using validation = std::function<bool(const url_request&, const http_response&)>;

// Passes when the status code is one of `acceptable`.
validation status_code_validation(std::vector<int> acceptable);

// Passes for status codes in [200, 300).
validation success_status_validation();

// Passes when the response Content-Type matches any of `acceptable` (wildcards allowed).
// A response without a Content-Type passes only if `acceptable` contains "*/*".
validation content_type_validation(std::vector<std::string> acceptable);

// Success status, and a Content-Type matching the request's Accept header.
validation default_validation();

// Entries of the request's Accept header, or "*/*" when it has none.
std::vector<std::string> acceptable_content_types(const url_request& request);

} // namespace relay
