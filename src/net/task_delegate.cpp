#include "net/task_delegate.hpp"

#include <algorithm>
#include <iostream>
#include <system_error>

namespace relay {

task_delegate::task_delegate(std::shared_ptr<transport_task> task,
                             std::shared_ptr<executor> callback_executor)
    : m_task(std::move(task)),
      m_queue(serial_queue::create(std::move(callback_executor),
                                   "relay.task-" + std::to_string(m_task->id()))) {}

progress_snapshot task_delegate::progress() const {
    return progress_snapshot{m_completed_units.load(std::memory_order_relaxed),
                             m_total_units.load(std::memory_order_relaxed)};
}

std::optional<relay::error> task_delegate::terminal_error() const {
    std::lock_guard lock(m_mutex);
    return m_error;
}

bool task_delegate::record_error(relay::error e) {
    std::lock_guard lock(m_mutex);
    if (m_error)
        return false;
    m_error = std::move(e);
    return true;
}

std::optional<relay::credential> task_delegate::attached_credential() const {
    std::lock_guard lock(m_mutex);
    return m_credential;
}

void task_delegate::set_credential(relay::credential value) {
    std::lock_guard lock(m_mutex);
    m_credential = std::move(value);
}

void task_delegate::set_progress_handler(progress_handler handler) {
    std::lock_guard lock(m_mutex);
    m_progress_handler = std::move(handler);
}

void task_delegate::cancel() {
    m_task->cancel();
}

std::optional<url_request> task_delegate::will_redirect(const http_response& response,
                                                        url_request proposed) {
    if (hooks.will_redirect)
        return hooks.will_redirect(response, proposed);
    return proposed;
}

challenge_result task_delegate::did_receive_challenge(const auth_challenge& challenge,
                                                      credential_storage* storage) {
    if (hooks.did_receive_challenge)
        return hooks.did_receive_challenge(challenge);

    // A credential that already failed once will fail again
    if (challenge.previous_failure_count > 0)
        return challenge_result(auth_disposition::cancel_challenge);

    if (challenge.space.auth_method == auth_method::server_trust) {
        return challenge_result(auth_disposition::use_credential,
                                credential::for_trust(challenge.space.server_trust));
    }

    std::optional<relay::credential> found = attached_credential();
    if (!found && storage)
        found = storage->default_credential(challenge.space);
    if (found)
        return challenge_result(auth_disposition::use_credential, std::move(found));
    return challenge_result(auth_disposition::perform_default_handling);
}

std::shared_ptr<std::istream> task_delegate::need_new_body_stream() {
    if (hooks.need_new_body_stream)
        return hooks.need_new_body_stream();
    return nullptr;
}

void task_delegate::did_send_body_data(std::int64_t bytes_sent, std::int64_t total_bytes_sent,
                                       std::int64_t total_bytes_expected) {
    if (hooks.did_send_body_data)
        hooks.did_send_body_data(bytes_sent, total_bytes_sent, total_bytes_expected);
}

response_disposition task_delegate::did_receive_response(const http_response&) {
    return response_disposition::allow;
}

void task_delegate::did_receive_data(std::string_view) {}

void task_delegate::did_finish_downloading(const std::filesystem::path&) {}

void task_delegate::did_write_data(std::int64_t, std::int64_t, std::int64_t) {}

void task_delegate::did_resume_at_offset(std::int64_t, std::int64_t) {}

void task_delegate::did_complete(const std::optional<relay::error>& error) {
    bool expected = false;
    if (!m_completed.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        RELAY_LOG(std::cout << "[relay::task_delegate] Ignoring duplicate completion for task "
                            << m_task->id() << std::endl);
        return;
    }

    if (error && should_record_completion_error(*error))
        record_error(*error);

    RELAY_LOG(std::cout << "[relay::task_delegate] " << task_kind_name(kind()) << " task "
                        << m_task->id() << " completed"
                        << (error ? " with error: " + error->describe() : std::string())
                        << std::endl);
    m_queue->resume();
}

bool task_delegate::should_record_completion_error(const relay::error&) const {
    return true;
}

void task_delegate::set_progress(std::int64_t completed, std::int64_t total) {
    m_total_units.store(total, std::memory_order_relaxed);
    m_completed_units.store(completed, std::memory_order_relaxed);
}

void task_delegate::report_progress(std::int64_t bytes, std::int64_t total_bytes,
                                    std::int64_t total_expected) {
    progress_handler handler;
    {
        std::lock_guard lock(m_mutex);
        handler = m_progress_handler;
    }
    if (handler)
        handler(bytes, total_bytes, total_expected);
}

std::optional<std::string> data_task_delegate::data() const {
    return m_data;
}

response_disposition data_task_delegate::did_receive_response(const http_response& response) {
    m_expected_content_length.store(response.expected_content_length, std::memory_order_relaxed);
    if (tracks_received_bytes())
        set_progress(static_cast<std::int64_t>(m_data.size()), response.expected_content_length);

    if (hooks.did_receive_response)
        return hooks.did_receive_response(response);
    return response_disposition::allow;
}

void data_task_delegate::did_receive_data(std::string_view chunk) {
    if (hooks.did_receive_data)
        hooks.did_receive_data(chunk);

    m_data.append(chunk.data(), chunk.size());
    if (!tracks_received_bytes())
        return;

    const auto total = static_cast<std::int64_t>(m_data.size());
    const std::int64_t expected = expected_content_length();
    set_progress(total, expected);
    report_progress(static_cast<std::int64_t>(chunk.size()), total, expected);
}

void upload_task_delegate::did_send_body_data(std::int64_t bytes_sent,
                                              std::int64_t total_bytes_sent,
                                              std::int64_t total_bytes_expected) {
    data_task_delegate::did_send_body_data(bytes_sent, total_bytes_sent, total_bytes_expected);

    // A retried body stream restarts from zero; never move progress backwards
    const std::int64_t completed = std::max(progress().completed_unit_count, total_bytes_sent);
    set_progress(completed, total_bytes_expected);
    report_progress(bytes_sent, total_bytes_sent, total_bytes_expected);
}

std::optional<std::string> download_task_delegate::resume_data() const {
    std::lock_guard lock(m_download_mutex);
    return m_resume_data;
}

std::optional<std::filesystem::path> download_task_delegate::destination() const {
    std::lock_guard lock(m_download_mutex);
    return m_destination;
}

void download_task_delegate::set_resume_data(std::optional<std::string> resume_data) {
    std::lock_guard lock(m_download_mutex);
    m_resume_data = std::move(resume_data);
}

void download_task_delegate::cancel() {
    m_cancel_requested.store(true, std::memory_order_release);

    std::weak_ptr<task_delegate> weak_self = weak_from_this();
    task()->cancel_producing_resume_data([weak_self](std::optional<std::string> resume_data) {
        auto self = std::static_pointer_cast<download_task_delegate>(weak_self.lock());
        if (self)
            self->set_resume_data(std::move(resume_data));
    });
}

void download_task_delegate::did_finish_downloading(const std::filesystem::path& location) {
    if (!hooks.did_finish_downloading)
        return;

    std::filesystem::path target =
        hooks.did_finish_downloading(location, task()->response().value_or(http_response()));

    std::error_code ec;
    std::filesystem::rename(location, target, ec);
    if (ec == std::errc::cross_device_link) {
        ec.clear();
        std::filesystem::copy_file(location, target,
                                   std::filesystem::copy_options::overwrite_existing, ec);
        if (!ec)
            std::filesystem::remove(location, ec);
    }

    if (ec) {
        std::cerr << "[relay::download] Failed to move " << location << " to " << target << ": "
                  << ec.message() << std::endl;
        record_error(relay::error(error_kind::file_system, ec.value(),
                                  "could not move downloaded file to " + target.string() + ": " +
                                      ec.message()));
        return;
    }

    std::lock_guard lock(m_download_mutex);
    m_destination = std::move(target);
}

void download_task_delegate::did_write_data(std::int64_t bytes_written,
                                            std::int64_t total_bytes_written,
                                            std::int64_t total_bytes_expected) {
    if (hooks.did_write_data)
        hooks.did_write_data(bytes_written, total_bytes_written, total_bytes_expected);

    set_progress(total_bytes_written, total_bytes_expected);
    report_progress(bytes_written, total_bytes_written, total_bytes_expected);
}

void download_task_delegate::did_resume_at_offset(std::int64_t file_offset,
                                                  std::int64_t total_bytes_expected) {
    if (hooks.did_resume_at_offset)
        hooks.did_resume_at_offset(file_offset, total_bytes_expected);

    set_progress(file_offset, total_bytes_expected);
}

bool download_task_delegate::should_record_completion_error(const relay::error& error) const {
    // A requested cancel that produced resume data is not a failure to report. The transport
    // delivers the resume data callback before the completion event.
    if (error.kind == error_kind::cancelled && m_cancel_requested.load(std::memory_order_acquire))
        return !resume_data();
    return true;
}

std::shared_ptr<task_delegate> make_task_delegate(std::shared_ptr<transport_task> task,
                                                  std::shared_ptr<executor> callback_executor) {
    switch (task->kind()) {
    case task_kind::upload:
        return std::make_shared<upload_task_delegate>(std::move(task),
                                                      std::move(callback_executor));
    case task_kind::download:
        return std::make_shared<download_task_delegate>(std::move(task),
                                                        std::move(callback_executor));
    case task_kind::data:
        break;
    }
    return std::make_shared<data_task_delegate>(std::move(task), std::move(callback_executor));
}

} // namespace relay
