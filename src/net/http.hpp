#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

// Logging control: define RELAY_ENABLE_LOG to enable runtime logs
#ifdef RELAY_ENABLE_LOG
#include <iostream>
#define RELAY_LOG(stmt)                                                                            \
    do {                                                                                           \
        stmt;                                                                                      \
    } while (0)
#else
#define RELAY_LOG(stmt)                                                                            \
    do {                                                                                           \
    } while (0)
#endif

namespace relay {

constexpr const char* VERSION = "0.3.0";

// Sentinel for "length not known yet"
constexpr std::int64_t UNKNOWN_LENGTH = -1;

// See http://tools.ietf.org/html/rfc7231#section-4.3
enum class http_method {
    options,
    get,
    head,
    post,
    put,
    patch,
    del,
    trace,
    connect,
};

const char* method_name(http_method method);

struct icase_less {
    bool operator()(const std::string& l, const std::string& r) const;
};

using header_map = std::map<std::string, std::string, icase_less>;

// The outgoing request descriptor. Built by the caller, never parsed here.
struct url_request {
    http_method method;
    std::string url;
    header_map headers;
    std::string body;

    url_request() : method(http_method::get) {}
    url_request(http_method method, std::string url) : method(method), url(std::move(url)) {}

    std::optional<std::string> header(const std::string& name) const;
};

struct http_response {
    int status_code;
    std::string url;
    header_map headers;
    std::int64_t expected_content_length;

    http_response() : status_code(0), expected_content_length(UNKNOWN_LENGTH) {}

    std::optional<std::string> header(const std::string& name) const;

    // "type/subtype" part of Content-Type, lowercased, without parameters
    std::optional<std::string> mime_type() const;

    // charset parameter of Content-Type, if any
    std::optional<std::string> text_encoding_name() const;

    // Content-Disposition filename, else the last URL path component
    std::string suggested_filename() const;
};

// Parses a raw "Name: value\r\n" header block into `headers`; returns the status code of
// the last status line seen, or 0 if none.
int parse_response_headers(const std::string& header_block, header_map& headers);

// Default session headers: Accept-Encoding, Accept-Language and User-Agent.
header_map default_http_headers();

} // namespace relay
