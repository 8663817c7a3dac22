#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "net/transport.hpp"

namespace relay {

// transport backed by the libcurl multi interface.
//
// All transfers run on one worker thread owned by the transport. Public methods and task
// controls queue a command and wake the worker, so they never block on network activity.
// Redirects and authentication challenges are surfaced to the listener instead of being
// handled inside libcurl.
class curl_transport final : public transport {
public:
    struct options {
        long timeout_seconds;         // whole transfer, 0 for none
        long connect_timeout_seconds;
        long max_redirects;
        bool verify_peer;
        std::filesystem::path temporary_directory; // where downloads are staged
        std::string user_agent;                    // used when a request sets none

        options();
    };

    explicit curl_transport(options opts = options());
    ~curl_transport() override;

    curl_transport(const curl_transport&) = delete;
    curl_transport& operator=(const curl_transport&) = delete;

    void set_listener(std::shared_ptr<transport_listener> listener) override;

    std::shared_ptr<transport_task> create_data_task(const url_request& request) override;
    std::shared_ptr<transport_task> create_upload_task(const url_request& request,
                                                       upload_source source) override;
    std::shared_ptr<transport_task> create_download_task(const url_request& request) override;
    std::shared_ptr<transport_task> create_download_task(const std::string& resume_data) override;

    void invalidate_and_cancel() override;
    void finish_tasks_and_invalidate() override;

private:
    class impl;
    class task;
    struct transfer;

    std::shared_ptr<impl> pimpl;
};

} // namespace relay
