#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>

#include "net/auth.hpp"
#include "net/executor.hpp"
#include "net/task_delegate.hpp"
#include "net/transport.hpp"

namespace relay {

// Session-wide handlers. Task-level hooks here only apply to tasks with no registered delegate.
struct session_hooks {
    std::function<void(const std::optional<relay::error>&)> did_become_invalid = nullptr;
    std::function<challenge_result(const auth_challenge&)> did_receive_challenge = nullptr;
    std::function<void()> did_finish_background_events = nullptr;

    std::function<std::optional<url_request>(transport_task&, const http_response&,
                                             const url_request&)>
        task_will_redirect = nullptr;
    std::function<challenge_result(transport_task&, const auth_challenge&)>
        task_did_receive_challenge = nullptr;
    std::function<std::shared_ptr<std::istream>(transport_task&)> task_need_new_body_stream =
        nullptr;
    std::function<void(transport_task&, std::int64_t, std::int64_t, std::int64_t)>
        task_did_send_body_data = nullptr;
    std::function<void(transport_task&, const std::optional<relay::error>&)> task_did_complete =
        nullptr;

    std::function<response_disposition(transport_task&, const http_response&)>
        data_task_did_receive_response = nullptr;
    std::function<void(transport_task&, const std::shared_ptr<transport_task>&)>
        data_task_did_become_download_task = nullptr;
    std::function<void(transport_task&, std::string_view)> data_task_did_receive_data = nullptr;

    std::function<void(transport_task&, const std::filesystem::path&)>
        download_task_did_finish_downloading = nullptr;
    std::function<void(transport_task&, std::int64_t, std::int64_t, std::int64_t)>
        download_task_did_write_data = nullptr;
    std::function<void(transport_task&, std::int64_t, std::int64_t)>
        download_task_did_resume_at_offset = nullptr;
};

// Routes transport events to the task delegate registered for the task's id.
//
// The registry is read on every event and written on issue and completion; readers share
// the lock, writers hold it exclusively. A completion is forwarded before its delegate is
// removed, so a concurrent lookup sees either the finished delegate or nothing.
class session_delegate final : public transport_listener {
public:
    session_delegate(std::shared_ptr<executor> callback_executor,
                     std::shared_ptr<credential_storage> storage);

    // Throws std::logic_error if a delegate is already registered for the same task id.
    void add(const std::shared_ptr<task_delegate>& delegate);
    std::shared_ptr<task_delegate> find(task_id id) const;
    void remove(task_id id);
    std::size_t size() const;

    const std::shared_ptr<credential_storage>& storage() const {
        return m_storage;
    }

    session_hooks hooks;

    void did_become_invalid(const std::optional<relay::error>& error) override;
    challenge_result did_receive_session_challenge(const auth_challenge& challenge) override;
    void did_finish_background_events() override;

    std::optional<url_request> will_redirect(transport_task& task, const http_response& response,
                                             url_request proposed) override;
    challenge_result did_receive_challenge(transport_task& task,
                                           const auth_challenge& challenge) override;
    std::shared_ptr<std::istream> need_new_body_stream(transport_task& task) override;
    void did_send_body_data(transport_task& task, std::int64_t bytes_sent,
                            std::int64_t total_bytes_sent,
                            std::int64_t total_bytes_expected) override;
    void did_complete(transport_task& task, const std::optional<relay::error>& error) override;

    response_disposition did_receive_response(transport_task& task,
                                              const http_response& response) override;
    void did_become_download_task(transport_task& task,
                                  std::shared_ptr<transport_task> download_task) override;
    void did_receive_data(transport_task& task, std::string_view chunk) override;

    void did_finish_downloading(transport_task& task,
                                const std::filesystem::path& location) override;
    void did_write_data(transport_task& task, std::int64_t bytes_written,
                        std::int64_t total_bytes_written,
                        std::int64_t total_bytes_expected) override;
    void did_resume_at_offset(transport_task& task, std::int64_t file_offset,
                              std::int64_t total_bytes_expected) override;

private:
    std::shared_ptr<executor> m_executor;
    std::shared_ptr<credential_storage> m_storage;

    mutable std::shared_mutex m_mutex;
    std::unordered_map<task_id, std::shared_ptr<task_delegate>> m_delegates;
};

} // namespace relay
