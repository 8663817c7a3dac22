#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "net/auth.hpp"
#include "net/error.hpp"
#include "net/executor.hpp"
#include "net/http.hpp"
#include "net/serial_queue.hpp"
#include "net/transport.hpp"

namespace relay {

class download_task_delegate;

struct progress_snapshot {
    std::int64_t completed_unit_count;
    std::int64_t total_unit_count; // UNKNOWN_LENGTH until the transport reports it

    double fraction() const {
        if (total_unit_count <= 0)
            return 0.0;
        return static_cast<double>(completed_unit_count) / static_cast<double>(total_unit_count);
    }
};

// (bytes in this event, total bytes so far, total bytes expected or UNKNOWN_LENGTH)
using progress_handler =
    std::function<void(std::int64_t bytes, std::int64_t total_bytes, std::int64_t total_expected)>;

using download_destination = std::function<std::filesystem::path(
    const std::filesystem::path& temporary_location, const http_response& response)>;

// Per-task overrides. An empty hook means the delegate's default behavior applies.
// Hooks must be set before the task is resumed.
struct task_hooks {
    std::function<std::optional<url_request>(const http_response&, const url_request&)>
        will_redirect = nullptr;
    std::function<challenge_result(const auth_challenge&)> did_receive_challenge = nullptr;
    std::function<std::shared_ptr<std::istream>()> need_new_body_stream = nullptr;
    std::function<void(std::int64_t, std::int64_t, std::int64_t)> did_send_body_data = nullptr;

    // Data and upload tasks
    std::function<response_disposition(const http_response&)> did_receive_response = nullptr;
    std::function<void(const std::shared_ptr<download_task_delegate>&)>
        did_become_download_task = nullptr;
    std::function<void(std::string_view)> did_receive_data = nullptr;

    // Download tasks
    download_destination did_finish_downloading = nullptr;
    std::function<void(std::int64_t, std::int64_t, std::int64_t)> did_write_data = nullptr;
    std::function<void(std::int64_t, std::int64_t)> did_resume_at_offset = nullptr;
};

// Mutable state behind one request: the completion queue, progress, the terminal error and
// the event handlers the session router forwards to.
//
// Events for a task are delivered sequentially by the transport, so the event handlers
// themselves need no locking. Fields that callers may read or set concurrently (error,
// credential, progress handler) are guarded.
class task_delegate : public std::enable_shared_from_this<task_delegate> {
public:
    task_delegate(std::shared_ptr<transport_task> task, std::shared_ptr<executor> callback_executor);
    virtual ~task_delegate() = default;

    task_delegate(const task_delegate&) = delete;
    task_delegate& operator=(const task_delegate&) = delete;

    virtual task_kind kind() const = 0;

    const std::shared_ptr<transport_task>& task() const {
        return m_task;
    }

    const std::shared_ptr<serial_queue>& queue() const {
        return m_queue;
    }

    // Accumulated body (data, upload) or resume data (download). Complete once the queue runs.
    virtual std::optional<std::string> data() const = 0;

    progress_snapshot progress() const;

    std::optional<relay::error> terminal_error() const;

    // First writer wins. Returns whether `e` was stored.
    bool record_error(relay::error e);

    std::optional<relay::credential> attached_credential() const;
    void set_credential(relay::credential value);

    void set_progress_handler(progress_handler handler);

    bool is_completed() const {
        return m_completed.load(std::memory_order_acquire);
    }

    // Explicit cancellation requested by the caller
    virtual void cancel();

    task_hooks hooks;

    // Transport events
    std::optional<url_request> will_redirect(const http_response& response, url_request proposed);
    challenge_result did_receive_challenge(const auth_challenge& challenge,
                                           credential_storage* storage);
    std::shared_ptr<std::istream> need_new_body_stream();
    virtual void did_send_body_data(std::int64_t bytes_sent, std::int64_t total_bytes_sent,
                                    std::int64_t total_bytes_expected);
    virtual response_disposition did_receive_response(const http_response& response);
    virtual void did_receive_data(std::string_view chunk);
    virtual void did_finish_downloading(const std::filesystem::path& location);
    virtual void did_write_data(std::int64_t bytes_written, std::int64_t total_bytes_written,
                                std::int64_t total_bytes_expected);
    virtual void did_resume_at_offset(std::int64_t file_offset, std::int64_t total_bytes_expected);

    // Terminal event. Records `error`, then opens the completion queue. Duplicates are ignored.
    void did_complete(const std::optional<relay::error>& error);

protected:
    virtual bool should_record_completion_error(const relay::error& error) const;

    void set_progress(std::int64_t completed, std::int64_t total);
    void report_progress(std::int64_t bytes, std::int64_t total_bytes, std::int64_t total_expected);

private:
    std::shared_ptr<transport_task> m_task;
    std::shared_ptr<serial_queue> m_queue;

    std::atomic<std::int64_t> m_completed_units{0};
    std::atomic<std::int64_t> m_total_units{UNKNOWN_LENGTH};
    std::atomic<bool> m_completed{false};

    mutable std::mutex m_mutex;
    std::optional<relay::error> m_error;
    std::optional<relay::credential> m_credential;
    progress_handler m_progress_handler;
};

// Accumulates the response body in memory and reports received bytes.
class data_task_delegate : public task_delegate {
public:
    using task_delegate::task_delegate;

    task_kind kind() const override {
        return task_kind::data;
    }

    std::optional<std::string> data() const override;

    std::int64_t expected_content_length() const {
        return m_expected_content_length.load(std::memory_order_relaxed);
    }

    response_disposition did_receive_response(const http_response& response) override;
    void did_receive_data(std::string_view chunk) override;

protected:
    virtual bool tracks_received_bytes() const {
        return true;
    }

private:
    std::string m_data;
    std::atomic<std::int64_t> m_expected_content_length{UNKNOWN_LENGTH};
};

// A data delegate whose progress follows the bytes sent rather than received.
class upload_task_delegate final : public data_task_delegate {
public:
    using data_task_delegate::data_task_delegate;

    task_kind kind() const override {
        return task_kind::upload;
    }

    void did_send_body_data(std::int64_t bytes_sent, std::int64_t total_bytes_sent,
                            std::int64_t total_bytes_expected) override;

protected:
    bool tracks_received_bytes() const override {
        return false;
    }
};

// Streams to a file owned by the transport; keeps resume data instead of a body.
class download_task_delegate final : public task_delegate {
public:
    using task_delegate::task_delegate;

    task_kind kind() const override {
        return task_kind::download;
    }

    std::optional<std::string> data() const override {
        return resume_data();
    }

    std::optional<std::string> resume_data() const;
    std::optional<std::filesystem::path> destination() const;

    // Asks the transport for resume data before cancelling
    void cancel() override;

    void did_finish_downloading(const std::filesystem::path& location) override;
    void did_write_data(std::int64_t bytes_written, std::int64_t total_bytes_written,
                        std::int64_t total_bytes_expected) override;
    void did_resume_at_offset(std::int64_t file_offset, std::int64_t total_bytes_expected) override;

protected:
    bool should_record_completion_error(const relay::error& error) const override;

private:
    void set_resume_data(std::optional<std::string> resume_data);

    std::atomic<bool> m_cancel_requested{false};

    mutable std::mutex m_download_mutex;
    std::optional<std::string> m_resume_data;
    std::optional<std::filesystem::path> m_destination;
};

// Picks the delegate variant matching the task's kind.
std::shared_ptr<task_delegate> make_task_delegate(std::shared_ptr<transport_task> task,
                                                  std::shared_ptr<executor> callback_executor);

} // namespace relay
