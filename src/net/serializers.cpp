#include "net/serializers.hpp"

#include <algorithm>
#include <cerrno>
#include <limits>
#include <iostream>
#include <stdexcept>
#include <iconv.h>
#include <libxml/parser.h>
#include <libxml/tree.h>

#include "util/byte_utils.hpp"
#include "util/defer.hpp"

namespace relay {

namespace {
constexpr const char* DEFAULT_TEXT_ENCODING = "ISO-8859-1";

bool is_empty(const std::optional<std::string>& data) {
    return !data || data->empty();
}

error serialization_error(std::string message, std::optional<std::size_t> offset = std::nullopt) {
    return error(error_kind::serialization, -1, std::move(message), offset);
}

bool encoding_supported(const std::string& encoding) {
    iconv_t cd = iconv_open("UTF-8", encoding.c_str());
    if (cd == reinterpret_cast<iconv_t>(-1))
        return false;
    iconv_close(cd);
    return true;
}

std::string node_name(xmlNodePtr node) {
    return node->name ? reinterpret_cast<const char*>(node->name) : "";
}

std::string node_text(xmlNodePtr node) {
    xmlChar* content = xmlNodeGetContent(node);
    if (!content)
        return "";
    std::string text(reinterpret_cast<const char*>(content));
    xmlFree(content);
    return text;
}

xmlNodePtr first_element(xmlNodePtr node) {
    while (node && node->type != XML_ELEMENT_NODE)
        node = node->next;
    return node;
}

xmlNodePtr next_element(xmlNodePtr node) {
    return node ? first_element(node->next) : nullptr;
}

std::string where(xmlNodePtr node) {
    return "line " + std::to_string(xmlGetLineNo(node));
}

// Converts one plist value element. Returns false and fills `out_error` on failure.
bool convert_plist_node(xmlNodePtr node, const plist_options& options, nlohmann::json& out,
                        std::string& out_error) {
    const std::string name = node_name(node);

    if (name == "dict") {
        out = nlohmann::json::object();
        for (xmlNodePtr key = first_element(node->children); key;) {
            if (node_name(key) != "key") {
                out_error = "expected <key> in <dict> at " + where(key);
                return false;
            }
            xmlNodePtr value = next_element(key);
            if (!value) {
                out_error = "missing value for key '" + node_text(key) + "' at " + where(key);
                return false;
            }
            nlohmann::json converted;
            if (!convert_plist_node(value, options, converted, out_error)) {
                if (!out_error.empty())
                    return false;
                // Unknown element skipped
                key = next_element(value);
                continue;
            }
            out[node_text(key)] = std::move(converted);
            key = next_element(value);
        }
        return true;
    }

    if (name == "array") {
        out = nlohmann::json::array();
        for (xmlNodePtr item = first_element(node->children); item; item = next_element(item)) {
            nlohmann::json converted;
            if (!convert_plist_node(item, options, converted, out_error)) {
                if (!out_error.empty())
                    return false;
                continue;
            }
            out.push_back(std::move(converted));
        }
        return true;
    }

    if (name == "string" || name == "date") {
        out = node_text(node);
        return true;
    }

    if (name == "integer") {
        std::string text = node_text(node);
        try {
            size_t consumed = 0;
            long long value = std::stoll(text, &consumed, 10);
            if (consumed != text.size())
                throw std::invalid_argument(text);
            out = value;
            return true;
        } catch (const std::exception&) {
            out_error = "invalid <integer> '" + text + "' at " + where(node);
            return false;
        }
    }

    if (name == "real") {
        std::string text = node_text(node);
        try {
            size_t consumed = 0;
            double value = std::stod(text, &consumed);
            if (consumed != text.size())
                throw std::invalid_argument(text);
            out = value;
            return true;
        } catch (const std::exception&) {
            out_error = "invalid <real> '" + text + "' at " + where(node);
            return false;
        }
    }

    if (name == "true" || name == "false") {
        out = (name == "true");
        return true;
    }

    if (name == "data") {
        std::string text = node_text(node);
        if (!options.decode_data) {
            out = text;
            return true;
        }
        auto decoded = byte_utils::base64_decode(text);
        if (!decoded) {
            out_error = "invalid base64 in <data> at " + where(node);
            return false;
        }
        out = nlohmann::json::binary(
            nlohmann::json::binary_t::container_type(decoded->begin(), decoded->end()));
        return true;
    }

    if (options.allow_unknown_elements) {
        // Signals "skip" to the container: false with an empty error
        out_error.clear();
        return false;
    }
    out_error = "unknown element <" + name + "> at " + where(node);
    return false;
}
} // namespace

serialized<std::string> decode_text(const std::string& bytes, const std::string& encoding) {
    iconv_t cd = iconv_open("UTF-8", encoding.c_str());
    if (cd == reinterpret_cast<iconv_t>(-1)) {
        return {std::nullopt, serialization_error("unsupported text encoding: " + encoding)};
    }
    RELAY_DEFER(iconv_close(cd););

    std::string output;
    output.resize(bytes.size() * 2 + 16);

    // iconv takes non-const input pointers
    std::string input = bytes;
    char* in_ptr = input.data();
    size_t in_left = input.size();
    size_t out_used = 0;

    while (in_left > 0) {
        char* out_ptr = output.data() + out_used;
        size_t out_left = output.size() - out_used;
        size_t rc = iconv(cd, &in_ptr, &in_left, &out_ptr, &out_left);
        out_used = output.size() - out_left;
        if (rc != static_cast<size_t>(-1))
            continue;

        if (errno == E2BIG) {
            output.resize(output.size() * 2);
            continue;
        }

        std::size_t offset = input.size() - in_left;
        if (errno == EILSEQ) {
            return {std::nullopt,
                    serialization_error("invalid byte sequence for encoding " + encoding, offset)};
        }
        return {std::nullopt,
                serialization_error("truncated byte sequence for encoding " + encoding, offset)};
    }

    output.resize(out_used);
    return {std::move(output), std::nullopt};
}

serializer<std::string> data_serializer() {
    return [](const url_request&, const std::optional<http_response>&,
              const std::optional<std::string>& data) -> serialized<std::string> {
        return {data, std::nullopt};
    };
}

serializer<std::string> string_serializer(std::optional<std::string> encoding) {
    return [encoding](const url_request&, const std::optional<http_response>& response,
                      const std::optional<std::string>& data) -> serialized<std::string> {
        if (is_empty(data))
            return {std::nullopt, std::nullopt};

        std::string chosen = DEFAULT_TEXT_ENCODING;
        if (encoding) {
            chosen = *encoding;
        } else if (response) {
            auto declared = response->text_encoding_name();
            if (declared && encoding_supported(*declared)) {
                chosen = *declared;
            } else if (declared) {
                RELAY_LOG(std::cout << "[relay::serializers] Unrecognized charset '" << *declared
                                    << "', using " << DEFAULT_TEXT_ENCODING << std::endl);
            }
        }
        return decode_text(*data, chosen);
    };
}

serializer<nlohmann::json> json_serializer(json_options options) {
    return [options](const url_request&, const std::optional<http_response>&,
                     const std::optional<std::string>& data) -> serialized<nlohmann::json> {
        if (is_empty(data))
            return {std::nullopt, std::nullopt};

        try {
            nlohmann::json json = nlohmann::json::parse(*data);
            if (!options.allow_fragments && !json.is_object() && !json.is_array()) {
                return {std::nullopt,
                        serialization_error("top-level JSON value is not an object or array", 0)};
            }
            return {std::move(json), std::nullopt};
        } catch (const nlohmann::json::parse_error& e) {
            return {std::nullopt, error(error_kind::serialization, e.id, e.what(), e.byte)};
        }
    };
}

serializer<nlohmann::json> property_list_serializer(plist_options options) {
    return [options](const url_request&, const std::optional<http_response>&,
                     const std::optional<std::string>& data) -> serialized<nlohmann::json> {
        if (is_empty(data))
            return {std::nullopt, std::nullopt};

        const std::size_t limit = std::min(
            options.max_document_size, static_cast<std::size_t>(std::numeric_limits<int>::max()));
        if (data->size() > limit) {
            return {std::nullopt,
                    serialization_error("property list of " + std::to_string(data->size()) +
                                        " bytes exceeds the " + std::to_string(limit) +
                                        " byte limit")};
        }

        xmlParserCtxtPtr ctxt = xmlNewParserCtxt();
        if (!ctxt) {
            std::cerr << "[relay::serializers] Failed to allocate XML parser context" << std::endl;
            return {std::nullopt, serialization_error("failed to allocate XML parser")};
        }
        RELAY_DEFER(xmlFreeParserCtxt(ctxt););

        xmlDocPtr doc = xmlCtxtReadMemory(ctxt, data->data(), static_cast<int>(data->size()),
                                          "response.plist", nullptr,
                                          XML_PARSE_NONET | XML_PARSE_NOERROR |
                                              XML_PARSE_NOWARNING);
        if (!doc) {
            std::string message = "malformed property list";
            auto last_error = xmlCtxtGetLastError(ctxt);
            if (last_error && last_error->message) {
                std::string detail = last_error->message;
                while (!detail.empty() && (detail.back() == '\n' || detail.back() == '\r'))
                    detail.pop_back();
                message += " (line " + std::to_string(last_error->line) + ", column " +
                           std::to_string(last_error->int2) + "): " + detail;
            }
            return {std::nullopt, serialization_error(message)};
        }
        RELAY_DEFER(xmlFreeDoc(doc););

        xmlNodePtr root = xmlDocGetRootElement(doc);
        if (!root || node_name(root) != "plist") {
            return {std::nullopt, serialization_error("root element is not <plist>")};
        }

        xmlNodePtr value = first_element(root->children);
        if (!value) {
            return {std::nullopt, serialization_error("empty <plist>")};
        }

        nlohmann::json out;
        std::string conversion_error;
        if (!convert_plist_node(value, options, out, conversion_error)) {
            if (conversion_error.empty())
                return {std::nullopt, std::nullopt};
            return {std::nullopt, serialization_error(conversion_error)};
        }
        return {std::move(out), std::nullopt};
    };
}

} // namespace relay
