#include "net/session_delegate.hpp"

#include <iostream>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace relay {

session_delegate::session_delegate(std::shared_ptr<executor> callback_executor,
                                   std::shared_ptr<credential_storage> storage)
    : m_executor(std::move(callback_executor)), m_storage(std::move(storage)) {}

void session_delegate::add(const std::shared_ptr<task_delegate>& delegate) {
    const task_id id = delegate->task()->id();
    std::unique_lock lock(m_mutex);
    if (!m_delegates.emplace(id, delegate).second)
        throw std::logic_error("a delegate is already registered for task " + std::to_string(id));
}

std::shared_ptr<task_delegate> session_delegate::find(task_id id) const {
    std::shared_lock lock(m_mutex);
    auto it = m_delegates.find(id);
    if (it == m_delegates.end())
        return nullptr;
    return it->second;
}

void session_delegate::remove(task_id id) {
    std::unique_lock lock(m_mutex);
    m_delegates.erase(id);
}

std::size_t session_delegate::size() const {
    std::shared_lock lock(m_mutex);
    return m_delegates.size();
}

void session_delegate::did_become_invalid(const std::optional<relay::error>& error) {
    RELAY_LOG(std::cout << "[relay::session] Session invalidated"
                        << (error ? ": " + error->describe() : std::string()) << std::endl);

    // Anything still registered will never hear from the transport again
    std::vector<std::shared_ptr<task_delegate>> orphans;
    {
        std::unique_lock lock(m_mutex);
        for (auto& entry : m_delegates)
            orphans.push_back(std::move(entry.second));
        m_delegates.clear();
    }
    for (const auto& delegate : orphans)
        delegate->did_complete(error ? *error : relay::error::cancelled());

    if (hooks.did_become_invalid)
        hooks.did_become_invalid(error);
}

challenge_result session_delegate::did_receive_session_challenge(const auth_challenge& challenge) {
    if (hooks.did_receive_challenge)
        return hooks.did_receive_challenge(challenge);
    return challenge_result(auth_disposition::perform_default_handling);
}

void session_delegate::did_finish_background_events() {
    if (hooks.did_finish_background_events)
        hooks.did_finish_background_events();
}

std::optional<url_request> session_delegate::will_redirect(transport_task& task,
                                                           const http_response& response,
                                                           url_request proposed) {
    if (auto delegate = find(task.id()))
        return delegate->will_redirect(response, std::move(proposed));
    if (hooks.task_will_redirect)
        return hooks.task_will_redirect(task, response, proposed);
    return proposed;
}

challenge_result session_delegate::did_receive_challenge(transport_task& task,
                                                         const auth_challenge& challenge) {
    if (auto delegate = find(task.id()))
        return delegate->did_receive_challenge(challenge, m_storage.get());
    if (hooks.task_did_receive_challenge)
        return hooks.task_did_receive_challenge(task, challenge);
    return did_receive_session_challenge(challenge);
}

std::shared_ptr<std::istream> session_delegate::need_new_body_stream(transport_task& task) {
    if (auto delegate = find(task.id()))
        return delegate->need_new_body_stream();
    if (hooks.task_need_new_body_stream)
        return hooks.task_need_new_body_stream(task);
    return nullptr;
}

void session_delegate::did_send_body_data(transport_task& task, std::int64_t bytes_sent,
                                          std::int64_t total_bytes_sent,
                                          std::int64_t total_bytes_expected) {
    if (auto delegate = find(task.id()))
        delegate->did_send_body_data(bytes_sent, total_bytes_sent, total_bytes_expected);
    else if (hooks.task_did_send_body_data)
        hooks.task_did_send_body_data(task, bytes_sent, total_bytes_sent, total_bytes_expected);
}

void session_delegate::did_complete(transport_task& task, const std::optional<relay::error>& error) {
    auto delegate = find(task.id());
    if (!delegate) {
        if (hooks.task_did_complete)
            hooks.task_did_complete(task, error);
        return;
    }

    delegate->did_complete(error);
    remove(task.id());
}

response_disposition session_delegate::did_receive_response(transport_task& task,
                                                            const http_response& response) {
    if (auto delegate = find(task.id()))
        return delegate->did_receive_response(response);
    if (hooks.data_task_did_receive_response)
        return hooks.data_task_did_receive_response(task, response);
    return response_disposition::allow;
}

void session_delegate::did_become_download_task(transport_task& task,
                                                std::shared_ptr<transport_task> download_task) {
    auto delegate = find(task.id());
    if (!delegate) {
        if (hooks.data_task_did_become_download_task)
            hooks.data_task_did_become_download_task(task, download_task);
        return;
    }

    auto download = std::make_shared<download_task_delegate>(download_task, m_executor);
    if (auto credential = delegate->attached_credential())
        download->set_credential(std::move(*credential));
    add(download);

    RELAY_LOG(std::cout << "[relay::session] Task " << task.id() << " became download task "
                        << download_task->id() << std::endl);
    if (delegate->hooks.did_become_download_task)
        delegate->hooks.did_become_download_task(download);
}

void session_delegate::did_receive_data(transport_task& task, std::string_view chunk) {
    if (auto delegate = find(task.id()))
        delegate->did_receive_data(chunk);
    else if (hooks.data_task_did_receive_data)
        hooks.data_task_did_receive_data(task, chunk);
}

void session_delegate::did_finish_downloading(transport_task& task,
                                              const std::filesystem::path& location) {
    if (auto delegate = find(task.id()))
        delegate->did_finish_downloading(location);
    else if (hooks.download_task_did_finish_downloading)
        hooks.download_task_did_finish_downloading(task, location);
}

void session_delegate::did_write_data(transport_task& task, std::int64_t bytes_written,
                                      std::int64_t total_bytes_written,
                                      std::int64_t total_bytes_expected) {
    if (auto delegate = find(task.id()))
        delegate->did_write_data(bytes_written, total_bytes_written, total_bytes_expected);
    else if (hooks.download_task_did_write_data)
        hooks.download_task_did_write_data(task, bytes_written, total_bytes_written,
                                           total_bytes_expected);
}

void session_delegate::did_resume_at_offset(transport_task& task, std::int64_t file_offset,
                                            std::int64_t total_bytes_expected) {
    if (auto delegate = find(task.id()))
        delegate->did_resume_at_offset(file_offset, total_bytes_expected);
    else if (hooks.download_task_did_resume_at_offset)
        hooks.download_task_did_resume_at_offset(task, file_offset, total_bytes_expected);
}

} // namespace relay
