#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>

#include "net/auth.hpp"
#include "net/http.hpp"
#include "net/transport.hpp"

// Pieces of curl_transport that work without a live transfer.
namespace relay::detail {

bool is_redirect(int status_code);

// Resolves `reference` (absolute or relative) against `base`
std::optional<std::string> resolve_url(const std::string& base, const std::string& reference);

// The request to send after a redirect to `target`. 303 always switches to GET (HEAD stays
// HEAD); 301 and 302 switch only POST, the way browsers do.
url_request redirect_request(const url_request& current, int status_code, std::string target);

// Protection space and scheme of a WWW-Authenticate header sent for `url`
auth_challenge make_challenge(const std::string& url, const std::string& authenticate_header);

// Content-Length of the response, UNKNOWN_LENGTH when absent or unparsable
std::int64_t content_length(const http_response& response);

struct resume_state {
    std::string url;
    header_map headers;
    std::filesystem::path temporary_file;
    std::int64_t offset = 0;
    std::optional<std::string> etag;
};

std::string encode_resume_data(const resume_state& state);
// Throws std::invalid_argument for blobs curl_transport did not produce
resume_state decode_resume_data(const std::string& resume_data);

// Body stream for a stream upload's attempt number `attempt` (1-based). Retries ask the
// listener for a replacement; nullptr means the body cannot be replayed.
std::shared_ptr<std::istream> upload_stream_for_attempt(int attempt,
                                                        const std::shared_ptr<std::istream>& original,
                                                        transport_listener* listener,
                                                        transport_task& task);

} // namespace relay::detail
