#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace relay {

enum class error_kind {
    transport,     // network, TLS, timeout; passed through from the transport
    cancelled,     // explicit cancellation of a task
    serialization, // malformed body for the requested format
    validation,    // status or content type rejected by a validation
    file_system,   // download destination move failed
};

const char* error_kind_name(error_kind kind);

struct error {
    error_kind kind;
    long code;
    std::string message;
    std::optional<std::size_t> offset; // byte offset into the body, for serialization errors

    error(error_kind kind, long code, std::string message,
          std::optional<std::size_t> offset = std::nullopt)
        : kind(kind), code(code), message(std::move(message)), offset(offset) {}

    static error validation_failed();
    static error cancelled();

    bool is_transport() const {
        return kind == error_kind::transport || kind == error_kind::cancelled;
    }

    std::string describe() const;
};

} // namespace relay
