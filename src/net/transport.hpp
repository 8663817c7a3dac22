#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "net/auth.hpp"
#include "net/error.hpp"
#include "net/http.hpp"

namespace relay {

using task_id = std::uint64_t;

enum class task_kind {
    data,
    upload,
    download,
};

const char* task_kind_name(task_kind kind);

enum class task_state {
    suspended,
    running,
    canceling,
    completed,
};

enum class response_disposition {
    allow,
    cancel,
    become_download,
};

// Body of an upload: in-memory bytes, a file, or a one-shot stream.
struct upload_source {
    std::variant<std::string, std::filesystem::path, std::shared_ptr<std::istream>> body;

    static upload_source from_data(std::string data) {
        return upload_source{std::move(data)};
    }
    static upload_source from_file(std::filesystem::path path) {
        return upload_source{std::move(path)};
    }
    static upload_source from_stream(std::shared_ptr<std::istream> stream) {
        return upload_source{std::move(stream)};
    }

    bool is_stream() const {
        return std::holds_alternative<std::shared_ptr<std::istream>>(body);
    }
};

using resume_data_callback = std::function<void(std::optional<std::string> resume_data)>;

// Opaque handle on one transport-level exchange.
//
// A task is created suspended and emits no events until resume() is called. Every method is
// safe to call from any thread, including from inside a listener callback.
class transport_task {
public:
    virtual ~transport_task() = default;

    virtual task_id id() const = 0;
    virtual task_kind kind() const = 0;
    virtual task_state state() const = 0;

    virtual url_request original_request() const = 0;
    // The request currently on the wire; differs from the original after a redirect
    virtual url_request current_request() const = 0;
    virtual std::optional<http_response> response() const = 0;

    virtual void resume() = 0;
    virtual void suspend() = 0;
    virtual void cancel() = 0;

    // Download tasks only. `callback` runs before the task's completion event is delivered;
    // it receives nullopt when nothing resumable was written. Other kinds cancel plainly.
    virtual void cancel_producing_resume_data(resume_data_callback callback) = 0;
};

// Lifecycle events delivered by a transport.
//
// Events for one task arrive in order on some transport thread; events for different tasks
// may arrive concurrently. Implementations must not block.
class transport_listener {
public:
    virtual ~transport_listener() = default;

    // Session
    virtual void did_become_invalid(const std::optional<error>& error) = 0;
    virtual challenge_result did_receive_session_challenge(const auth_challenge& challenge) = 0;
    virtual void did_finish_background_events() = 0;

    // Every task kind
    virtual std::optional<url_request> will_redirect(transport_task& task,
                                                     const http_response& response,
                                                     url_request proposed) = 0;
    virtual challenge_result did_receive_challenge(transport_task& task,
                                                   const auth_challenge& challenge) = 0;
    virtual std::shared_ptr<std::istream> need_new_body_stream(transport_task& task) = 0;
    virtual void did_send_body_data(transport_task& task, std::int64_t bytes_sent,
                                    std::int64_t total_bytes_sent,
                                    std::int64_t total_bytes_expected) = 0;
    virtual void did_complete(transport_task& task, const std::optional<error>& error) = 0;

    // Data and upload tasks
    virtual response_disposition did_receive_response(transport_task& task,
                                                      const http_response& response) = 0;
    virtual void did_become_download_task(transport_task& task,
                                          std::shared_ptr<transport_task> download_task) = 0;
    virtual void did_receive_data(transport_task& task, std::string_view chunk) = 0;

    // Download tasks
    virtual void did_finish_downloading(transport_task& task,
                                        const std::filesystem::path& location) = 0;
    virtual void did_write_data(transport_task& task, std::int64_t bytes_written,
                                std::int64_t total_bytes_written,
                                std::int64_t total_bytes_expected) = 0;
    virtual void did_resume_at_offset(transport_task& task, std::int64_t file_offset,
                                      std::int64_t total_bytes_expected) = 0;
};

// Creates tasks and delivers their events to one listener.
class transport {
public:
    virtual ~transport() = default;

    // Must be called before the first task is created.
    virtual void set_listener(std::shared_ptr<transport_listener> listener) = 0;

    virtual std::shared_ptr<transport_task> create_data_task(const url_request& request) = 0;
    virtual std::shared_ptr<transport_task> create_upload_task(const url_request& request,
                                                               upload_source source) = 0;
    virtual std::shared_ptr<transport_task> create_download_task(const url_request& request) = 0;
    // Throws std::invalid_argument when `resume_data` was not produced by this transport type
    virtual std::shared_ptr<transport_task> create_download_task(
        const std::string& resume_data) = 0;

    // Cancels everything in flight, then reports did_become_invalid.
    virtual void invalidate_and_cancel() = 0;
    // Lets tasks in flight finish, then reports did_become_invalid.
    virtual void finish_tasks_and_invalidate() = 0;
};

} // namespace relay
