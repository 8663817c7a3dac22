#include "net/validation.hpp"

#include <algorithm>
#include <optional>

#include "net/mime_type.hpp"

namespace relay {

namespace {
bool content_type_acceptable(const std::vector<std::string>& acceptable,
                             const http_response& response) {
    std::optional<std::string> header = response.header("Content-Type");
    std::optional<mime_type> actual = header ? mime_type::parse(*header) : std::nullopt;

    if (!actual) {
        return std::any_of(acceptable.begin(), acceptable.end(), [](const std::string& entry) {
            auto parsed = mime_type::parse(entry);
            return parsed && parsed->type == "*" && parsed->subtype == "*";
        });
    }

    for (const std::string& entry : acceptable) {
        auto parsed = mime_type::parse(entry);
        if (parsed && parsed->matches(*actual))
            return true;
    }
    return false;
}
} // namespace

validation status_code_validation(std::vector<int> acceptable) {
    return [acceptable = std::move(acceptable)](const url_request&, const http_response& response) {
        return std::find(acceptable.begin(), acceptable.end(), response.status_code) !=
               acceptable.end();
    };
}

validation success_status_validation() {
    return [](const url_request&, const http_response& response) {
        return response.status_code >= 200 && response.status_code < 300;
    };
}

validation content_type_validation(std::vector<std::string> acceptable) {
    return [acceptable = std::move(acceptable)](const url_request&, const http_response& response) {
        return content_type_acceptable(acceptable, response);
    };
}

validation default_validation() {
    return [](const url_request& request, const http_response& response) {
        if (response.status_code < 200 || response.status_code >= 300)
            return false;
        return content_type_acceptable(acceptable_content_types(request), response);
    };
}

std::vector<std::string> acceptable_content_types(const url_request& request) {
    std::vector<std::string> types;
    if (auto accept = request.header("Accept")) {
        std::string::size_type start = 0;
        while (start <= accept->size()) {
            std::string::size_type comma = accept->find(',', start);
            if (comma == std::string::npos)
                comma = accept->size();
            std::string entry = accept->substr(start, comma - start);
            std::string::size_type first = entry.find_first_not_of(" \t");
            if (first != std::string::npos) {
                std::string::size_type last = entry.find_last_not_of(" \t");
                types.push_back(entry.substr(first, last - first + 1));
            }
            start = comma + 1;
        }
    }
    if (types.empty())
        types.emplace_back("*/*");
    return types;
}

} // namespace relay
