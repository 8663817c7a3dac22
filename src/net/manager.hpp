#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "net/auth.hpp"
#include "net/curl_transport.hpp"
#include "net/executor.hpp"
#include "net/http.hpp"
#include "net/request.hpp"
#include "net/session_delegate.hpp"
#include "net/task_delegate.hpp"
#include "net/transport.hpp"

namespace relay {

// Places a finished download at `directory` / the response's suggested file name.
download_destination suggested_download_destination(const std::filesystem::path& directory);

// Issues requests on one transport session and owns the delegate registry for it.
//
// Every issued task gets a delegate registered before the task can produce events. Completion
// handlers run on a worker pool owned by the manager unless a request asks otherwise.
class manager {
public:
    struct options {
        bool start_requests_immediately;
        std::size_t callback_threads;
        header_map default_headers; // added to every request that does not set the header
        std::shared_ptr<credential_storage> credential_store;
        curl_transport::options transport_options; // only used when the manager builds its transport

        options();
    };

    explicit manager(options opts = options());
    manager(std::shared_ptr<transport> session, options opts);
    ~manager();

    manager(const manager&) = delete;
    manager& operator=(const manager&) = delete;

    // Process-wide default manager backed by a curl_transport, created on first use.
    static manager& shared();

    relay::request request(const url_request& request);
    relay::request request(http_method method, const std::string& url, header_map headers = {});

    relay::request upload(const url_request& request, upload_source source);
    relay::request upload(http_method method, const std::string& url, upload_source source);

    relay::request download(const url_request& request, download_destination destination);
    relay::request download(http_method method, const std::string& url,
                            download_destination destination);
    // Continues a download from the resume data a cancelled download left behind.
    // Throws std::invalid_argument if the transport does not recognize the data.
    relay::request resume_download(const std::string& resume_data,
                                   download_destination destination);

    const std::shared_ptr<session_delegate>& delegate() const {
        return m_delegate;
    }

    const std::shared_ptr<transport>& session() const {
        return m_session;
    }

    bool start_requests_immediately() const {
        return m_options.start_requests_immediately;
    }

    // Runs on the callback pool when the transport reports its background events are done.
    void set_background_completion_handler(std::function<void()> handler);

private:
    url_request prepare(const url_request& request) const;
    relay::request start(std::shared_ptr<transport_task> task,
                         const std::function<void(task_delegate&)>& configure);

    options m_options;
    std::shared_ptr<executor> m_callback_executor;
    std::shared_ptr<session_delegate> m_delegate;
    std::shared_ptr<transport> m_session;

    // Task creation is serialized so ids are handed out and registered in order
    std::mutex m_create_mutex;
};

} // namespace relay
