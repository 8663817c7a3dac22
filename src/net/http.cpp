#include "net/http.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <sys/utsname.h>

namespace relay {

namespace {
// Helper function to convert string to lowercase
std::string to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

// Helper function to trim whitespace
std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t");
    if (first == std::string::npos)
        return "";
    size_t last = str.find_last_not_of(" \t");
    return str.substr(first, (last - first + 1));
}

std::optional<std::string> find_header(const header_map& headers, const std::string& name) {
    auto it = headers.find(name);
    if (it == headers.end())
        return std::nullopt;
    return it->second;
}

// Extracts `key=value` or `key="value"` from a header value's parameter list
std::optional<std::string> header_parameter(const std::string& value, const std::string& key) {
    std::istringstream stream(value);
    std::string part;
    bool first = true;
    while (std::getline(stream, part, ';')) {
        if (first) {
            first = false;
            continue;
        }
        size_t eq_pos = part.find('=');
        if (eq_pos == std::string::npos)
            continue;
        if (to_lower(trim(part.substr(0, eq_pos))) != key)
            continue;
        std::string param = trim(part.substr(eq_pos + 1));
        if (param.size() >= 2 && param.front() == '"' && param.back() == '"')
            param = param.substr(1, param.size() - 2);
        return param;
    }
    return std::nullopt;
}

std::string preferred_language() {
    const char* names[] = {"LC_ALL", "LC_MESSAGES", "LANG"};
    for (const char* name : names) {
        const char* value = std::getenv(name);
        if (!value || !*value)
            continue;
        std::string lang(value);
        // "en_US.UTF-8" -> "en-US"
        lang = lang.substr(0, lang.find('.'));
        std::replace(lang.begin(), lang.end(), '_', '-');
        if (lang != "C" && lang != "POSIX" && !lang.empty())
            return lang;
    }
    return "en-US";
}
} // namespace

const char* method_name(http_method method) {
    switch (method) {
    case http_method::options:
        return "OPTIONS";
    case http_method::get:
        return "GET";
    case http_method::head:
        return "HEAD";
    case http_method::post:
        return "POST";
    case http_method::put:
        return "PUT";
    case http_method::patch:
        return "PATCH";
    case http_method::del:
        return "DELETE";
    case http_method::trace:
        return "TRACE";
    case http_method::connect:
        return "CONNECT";
    }
    return "GET";
}

bool icase_less::operator()(const std::string& l, const std::string& r) const {
    return std::lexicographical_compare(
        l.begin(), l.end(), r.begin(), r.end(), [](unsigned char lc, unsigned char rc) {
            return std::tolower(lc) < std::tolower(rc);
        });
}

std::optional<std::string> url_request::header(const std::string& name) const {
    return find_header(headers, name);
}

std::optional<std::string> http_response::header(const std::string& name) const {
    return find_header(headers, name);
}

std::optional<std::string> http_response::mime_type() const {
    auto content_type = header("Content-Type");
    if (!content_type)
        return std::nullopt;
    std::string mime = to_lower(trim(content_type->substr(0, content_type->find(';'))));
    if (mime.empty())
        return std::nullopt;
    return mime;
}

std::optional<std::string> http_response::text_encoding_name() const {
    auto content_type = header("Content-Type");
    if (!content_type)
        return std::nullopt;
    return header_parameter(*content_type, "charset");
}

std::string http_response::suggested_filename() const {
    if (auto disposition = header("Content-Disposition")) {
        if (auto filename = header_parameter(*disposition, "filename")) {
            // Never let a server pick a path outside the destination directory
            std::string name = filename->substr(filename->find_last_of("/\\") + 1);
            if (!name.empty() && name != "." && name != "..")
                return name;
        }
    }

    std::string path = url;
    size_t scheme_pos = path.find("://");
    if (scheme_pos != std::string::npos) {
        size_t path_start = path.find('/', scheme_pos + 3);
        path = path_start == std::string::npos ? "" : path.substr(path_start);
    }
    path = path.substr(0, path.find_first_of("?#"));
    std::string name = path.substr(path.find_last_of('/') + 1);
    if (name.empty() || name == "." || name == "..")
        return "download";
    return name;
}

int parse_response_headers(const std::string& header_block, header_map& headers) {
    std::istringstream stream(header_block);
    std::string line;
    int status_code = 0;

    while (std::getline(stream, line)) {
        // Remove carriage return if present
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (line.compare(0, 5, "HTTP/") == 0) {
            // A new status line starts a new header block (redirect hops, 100-continue)
            headers.clear();
            std::istringstream status_line(line);
            std::string version;
            status_line >> version >> status_code;
            continue;
        }

        size_t colon_pos = line.find(':');
        if (colon_pos != std::string::npos) {
            std::string header_name = trim(line.substr(0, colon_pos));
            std::string header_value = trim(line.substr(colon_pos + 1));
            if (!header_name.empty())
                headers[header_name] = header_value;
        }
    }
    return status_code;
}

header_map default_http_headers() {
    header_map headers;

    // Accept-Encoding HTTP Header; see http://tools.ietf.org/html/rfc7230#section-4.2.3
    headers["Accept-Encoding"] = "gzip;q=1.0,compress;q=0.5";

    // Accept-Language HTTP Header; see http://tools.ietf.org/html/rfc7231#section-5.3.5
    headers["Accept-Language"] = preferred_language() + ";q=1.0";

    // User-Agent Header; see http://tools.ietf.org/html/rfc7231#section-5.5.3
    std::string user_agent = std::string("relay/") + VERSION;
    struct utsname info;
    if (uname(&info) == 0) {
        user_agent += std::string(" (") + info.sysname + " " + info.release + ")";
    }
    headers["User-Agent"] = user_agent;

    return headers;
}

} // namespace relay
