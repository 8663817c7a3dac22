#include "net/manager.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace relay {

download_destination suggested_download_destination(const std::filesystem::path& directory) {
    return [directory](const std::filesystem::path&, const http_response& response) {
        return directory / response.suggested_filename();
    };
}

manager::options::options()
    : start_requests_immediately(true), callback_threads(2),
      default_headers(default_http_headers()), credential_store(nullptr) {}

manager::manager(options opts)
    : manager(std::make_shared<curl_transport>(opts.transport_options), opts) {}

manager::manager(std::shared_ptr<transport> session, options opts)
    : m_options(std::move(opts)),
      m_callback_executor(
          std::make_shared<thread_pool>(std::max<std::size_t>(1, m_options.callback_threads))),
      m_delegate(std::make_shared<session_delegate>(m_callback_executor,
                                                    m_options.credential_store)),
      m_session(std::move(session)) {
    if (!m_session)
        throw std::invalid_argument("manager requires a transport");
    m_session->set_listener(m_delegate);
}

manager::~manager() {
    RELAY_LOG(std::cout << "[relay::manager] Invalidating session with " << m_delegate->size()
                        << " requests in flight" << std::endl);
    m_session->invalidate_and_cancel();
}

manager& manager::shared() {
    static manager instance;
    return instance;
}

url_request manager::prepare(const url_request& request) const {
    url_request prepared = request;
    for (const auto& header : m_options.default_headers)
        prepared.headers.emplace(header.first, header.second);
    return prepared;
}

relay::request manager::start(std::shared_ptr<transport_task> task,
                              const std::function<void(task_delegate&)>& configure) {
    auto delegate = make_task_delegate(std::move(task), m_callback_executor);
    if (configure)
        configure(*delegate);
    m_delegate->add(delegate);

    RELAY_LOG(std::cout << "[relay::manager] Issued " << task_kind_name(delegate->kind())
                        << " task " << delegate->task()->id() << " "
                        << delegate->task()->original_request().url << std::endl);

    relay::request handle(delegate);
    if (m_options.start_requests_immediately)
        handle.resume();
    return handle;
}

relay::request manager::request(const url_request& request) {
    std::lock_guard lock(m_create_mutex);
    return start(m_session->create_data_task(prepare(request)), nullptr);
}

relay::request manager::request(http_method method, const std::string& url, header_map headers) {
    url_request built(method, url);
    built.headers = std::move(headers);
    return request(built);
}

relay::request manager::upload(const url_request& request, upload_source source) {
    std::shared_ptr<std::istream> stream;
    if (source.is_stream())
        stream = std::get<std::shared_ptr<std::istream>>(source.body);

    std::lock_guard lock(m_create_mutex);
    auto task = m_session->create_upload_task(prepare(request), std::move(source));
    return start(std::move(task), [stream](task_delegate& delegate) {
        if (!stream)
            return;
        // The transport asks again on every retry. The stream is only handed back once it is
        // rewound to the start; a stream that cannot seek fails the retry instead of sending
        // what is left of it.
        delegate.hooks.need_new_body_stream = [stream]() -> std::shared_ptr<std::istream> {
            stream->clear();
            stream->seekg(0, std::ios::beg);
            if (stream->fail()) {
                RELAY_LOG(std::cout << "[relay::manager] Upload stream cannot be rewound"
                                    << std::endl);
                return nullptr;
            }
            return stream;
        };
    });
}

relay::request manager::upload(http_method method, const std::string& url, upload_source source) {
    return upload(url_request(method, url), std::move(source));
}

relay::request manager::download(const url_request& request, download_destination destination) {
    std::lock_guard lock(m_create_mutex);
    auto task = m_session->create_download_task(prepare(request));
    return start(std::move(task), [destination = std::move(destination)](task_delegate& delegate) {
        delegate.hooks.did_finish_downloading = destination;
    });
}

relay::request manager::download(http_method method, const std::string& url,
                                 download_destination destination) {
    return download(url_request(method, url), std::move(destination));
}

relay::request manager::resume_download(const std::string& resume_data,
                                        download_destination destination) {
    std::lock_guard lock(m_create_mutex);
    auto task = m_session->create_download_task(resume_data);
    return start(std::move(task), [destination = std::move(destination)](task_delegate& delegate) {
        delegate.hooks.did_finish_downloading = destination;
    });
}

void manager::set_background_completion_handler(std::function<void()> handler) {
    std::shared_ptr<executor> callback_executor = m_callback_executor;
    m_delegate->hooks.did_finish_background_events = [callback_executor,
                                                      handler = std::move(handler)] {
        if (handler)
            callback_executor->post(handler);
    };
}

} // namespace relay
