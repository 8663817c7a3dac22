#include "net/curl_transport.hpp"
#include "net/curl_transport_detail.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <fstream>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <vector>
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <unistd.h>

#include "util/defer.hpp"

namespace relay {

namespace {
constexpr int RESUME_DATA_VERSION = 1;
constexpr int POLL_TIMEOUT_MS = 1000;

// Helper function to convert string to lowercase
std::string to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

relay::error transport_error(CURLcode code, const char* detail) {
    std::string message = curl_easy_strerror(code);
    if (detail && *detail)
        message += std::string(": ") + detail;
    return relay::error(error_kind::transport, static_cast<long>(code), message);
}

relay::error file_error(const std::string& message) {
    return relay::error(error_kind::file_system, errno, message + ": " + std::strerror(errno));
}
} // namespace

namespace detail {

std::int64_t content_length(const http_response& response) {
    auto value = response.header("Content-Length");
    if (!value)
        return UNKNOWN_LENGTH;
    try {
        return static_cast<std::int64_t>(std::stoll(*value));
    } catch (const std::exception& e) {
        std::cerr << "[relay::curl_transport] Error parsing content length: " << e.what()
                  << std::endl;
        return UNKNOWN_LENGTH;
    }
}

bool is_redirect(int status_code) {
    return status_code == 301 || status_code == 302 || status_code == 303 ||
           status_code == 307 || status_code == 308;
}

std::optional<std::string> resolve_url(const std::string& base, const std::string& reference) {
    CURLU* handle = curl_url();
    if (!handle)
        return std::nullopt;
    RELAY_DEFER(curl_url_cleanup(handle););

    if (curl_url_set(handle, CURLUPART_URL, base.c_str(), 0) != CURLUE_OK)
        return std::nullopt;
    if (curl_url_set(handle, CURLUPART_URL, reference.c_str(), 0) != CURLUE_OK)
        return std::nullopt;

    char* resolved = nullptr;
    if (curl_url_get(handle, CURLUPART_URL, &resolved, 0) != CURLUE_OK)
        return std::nullopt;
    std::string result(resolved);
    curl_free(resolved);
    return result;
}

url_request redirect_request(const url_request& current, int status_code, std::string target) {
    url_request next = current;
    next.url = std::move(target);

    bool switch_to_get = status_code == 303
                             ? current.method != http_method::head
                             : (status_code == 301 || status_code == 302) &&
                                   current.method == http_method::post;
    if (switch_to_get) {
        next.method = http_method::get;
        next.body.clear();
        next.headers.erase("Content-Type");
        next.headers.erase("Content-Length");
    }
    return next;
}

auth_challenge make_challenge(const std::string& url, const std::string& authenticate_header) {
    auth_challenge challenge;

    CURLU* handle = curl_url();
    if (handle && curl_url_set(handle, CURLUPART_URL, url.c_str(), 0) == CURLUE_OK) {
        char* value = nullptr;
        if (curl_url_get(handle, CURLUPART_SCHEME, &value, 0) == CURLUE_OK) {
            challenge.space.protocol = value;
            curl_free(value);
        }
        if (curl_url_get(handle, CURLUPART_HOST, &value, 0) == CURLUE_OK) {
            challenge.space.host = value;
            curl_free(value);
        }
        if (curl_url_get(handle, CURLUPART_PORT, &value, CURLU_DEFAULT_PORT) == CURLUE_OK) {
            challenge.space.port = std::atoi(value);
            curl_free(value);
        }
    }
    if (handle)
        curl_url_cleanup(handle);

    std::string lowered = to_lower(authenticate_header);
    std::string scheme = lowered.substr(0, lowered.find(' '));
    if (scheme == "basic")
        challenge.space.auth_method = auth_method::http_basic;
    else if (scheme == "digest")
        challenge.space.auth_method = auth_method::http_digest;
    else
        challenge.space.auth_method = auth_method::other;

    size_t realm_pos = lowered.find("realm=");
    if (realm_pos != std::string::npos) {
        size_t start = realm_pos + 6;
        size_t end;
        if (start < authenticate_header.size() && authenticate_header[start] == '"') {
            ++start;
            end = authenticate_header.find('"', start);
        } else {
            end = authenticate_header.find(',', start);
        }
        if (end == std::string::npos)
            end = authenticate_header.size();
        challenge.space.realm = authenticate_header.substr(start, end - start);
    }
    return challenge;
}

std::string encode_resume_data(const resume_state& state) {
    nlohmann::json blob = {
        {"version", RESUME_DATA_VERSION},
        {"url", state.url},
        {"headers", nlohmann::json::object()},
        {"temporary_file", state.temporary_file.string()},
        {"offset", state.offset},
    };
    for (const auto& header : state.headers)
        blob["headers"][header.first] = header.second;
    if (state.etag)
        blob["etag"] = *state.etag;
    return blob.dump();
}

resume_state decode_resume_data(const std::string& resume_data) {
    resume_state state;
    try {
        nlohmann::json blob = nlohmann::json::parse(resume_data);
        if (!blob.is_object() || blob.value("version", 0) != RESUME_DATA_VERSION)
            throw std::invalid_argument("resume data was not produced by curl_transport");

        state.url = blob.at("url").get<std::string>();
        for (const auto& header : blob.at("headers").items())
            state.headers[header.key()] = header.value().get<std::string>();
        state.temporary_file = blob.at("temporary_file").get<std::string>();
        state.offset = blob.at("offset").get<std::int64_t>();
        if (blob.contains("etag"))
            state.etag = blob.at("etag").get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("malformed resume data: ") + e.what());
    }
    if (state.offset < 0)
        throw std::invalid_argument("malformed resume data: negative offset");
    return state;
}

std::shared_ptr<std::istream> upload_stream_for_attempt(int attempt,
                                                        const std::shared_ptr<std::istream>& original,
                                                        transport_listener* listener,
                                                        transport_task& task) {
    if (attempt <= 1)
        return original;
    // A one-shot stream cannot be replayed; ask for a fresh one on every retry
    if (!listener)
        return nullptr;
    return listener->need_new_body_stream(task);
}

} // namespace detail

// One attempt at a request: a libcurl easy handle plus its body and header state.
// Redirects and authentication retries start a fresh transfer for the same task.
struct curl_transport::transfer {
    impl* engine = nullptr;
    task* owner = nullptr;
    CURLM* multi = nullptr;
    CURL* easy = nullptr;
    curl_slist* header_list = nullptr;
    bool added = false;
    char error_buffer[CURL_ERROR_SIZE];

    std::string header_block;
    bool response_handled = false;
    bool headerless = false; // non-HTTP scheme, the response was synthesized
    bool discard_body = false;
    bool digest_pending = false;
    std::optional<url_request> redirect_to;
    std::optional<relay::credential> retry_with;
    std::optional<relay::error> abort_error;

    std::shared_ptr<const std::string> memory_body;
    std::size_t memory_offset = 0;
    std::shared_ptr<std::istream> stream_body;
    std::int64_t body_size = UNKNOWN_LENGTH;
    std::int64_t last_sent = 0;

    transfer() {
        error_buffer[0] = '\0';
    }

    ~transfer() {
        if (easy) {
            if (added)
                curl_multi_remove_handle(multi, easy);
            curl_easy_cleanup(easy);
        }
        if (header_list)
            curl_slist_free_all(header_list);
    }

    transfer(const transfer&) = delete;
    transfer& operator=(const transfer&) = delete;
};

class curl_transport::task final : public transport_task,
                                   public std::enable_shared_from_this<curl_transport::task> {
public:
    task(std::weak_ptr<impl> engine, task_id id, task_kind kind, url_request request)
        : m_engine(std::move(engine)), m_id(id), m_kind(kind), m_state(task_state::suspended),
          m_original(request), m_current(std::move(request)) {}

    task_id id() const override {
        return m_id;
    }

    task_kind kind() const override {
        return m_kind;
    }

    task_state state() const override {
        std::lock_guard lock(m_mutex);
        return m_state;
    }

    url_request original_request() const override {
        std::lock_guard lock(m_mutex);
        return m_original;
    }

    url_request current_request() const override {
        std::lock_guard lock(m_mutex);
        return m_current;
    }

    std::optional<http_response> response() const override {
        std::lock_guard lock(m_mutex);
        return m_response;
    }

    void resume() override;
    void suspend() override;
    void cancel() override;
    void cancel_producing_resume_data(resume_data_callback callback) override;

    void set_state(task_state state) {
        std::lock_guard lock(m_mutex);
        m_state = state;
    }

    void set_current_request(url_request request) {
        std::lock_guard lock(m_mutex);
        m_current = std::move(request);
    }

    void set_response(http_response response) {
        std::lock_guard lock(m_mutex);
        m_response = std::move(response);
    }

    // Worker thread only from here on
    std::optional<upload_source> upload;
    std::unique_ptr<transfer> active;
    bool started = false;
    int attempts = 0;
    int redirects = 0;
    int auth_failures = 0;
    std::optional<relay::credential> login;
    relay::auth_method login_method = auth_method::http_basic;

    std::filesystem::path temp_path;
    std::ofstream file;
    std::int64_t written = 0;
    std::int64_t resume_offset = 0;
    std::int64_t expected = UNKNOWN_LENGTH;
    std::optional<std::string> etag;
    bool keep_temp = false;

private:
    template <typename CommandT>
    bool dispatch(CommandT command);

    const std::weak_ptr<impl> m_engine;
    const task_id m_id;
    const task_kind m_kind;

    mutable std::mutex m_mutex;
    task_state m_state;
    url_request m_original;
    url_request m_current;
    std::optional<http_response> m_response;
};

class curl_transport::impl : public std::enable_shared_from_this<curl_transport::impl> {
public:
    explicit impl(options opts) : m_options(std::move(opts)), m_multi(nullptr), m_share(nullptr) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
        m_multi = curl_multi_init();
        if (!m_multi) {
            curl_global_cleanup();
            throw std::runtime_error("Failed to initialize curl multi handle");
        }

        // One cookie jar for every transfer of this transport
        m_share = curl_share_init();
        if (m_share)
            curl_share_setopt(m_share, CURLSHOPT_SHARE, CURL_LOCK_DATA_COOKIE);
    }

    ~impl() {
        if (m_share)
            curl_share_cleanup(m_share);
        curl_multi_cleanup(m_multi);
        curl_global_cleanup();
    }

    impl(const impl&) = delete;
    impl& operator=(const impl&) = delete;

    void start() {
        m_worker = std::thread([self = shared_from_this()] { self->run(); });
    }

    void stop() {
        {
            std::lock_guard lock(m_mutex);
            if (m_stopping)
                return;
            m_stopping = true;
        }
        curl_multi_wakeup(m_multi);

        if (!m_worker.joinable())
            return;
        if (m_worker.get_id() == std::this_thread::get_id())
            m_worker.detach();
        else
            m_worker.join();
    }

    void post(std::function<void()> command) {
        {
            std::lock_guard lock(m_mutex);
            m_commands.push_back(std::move(command));
        }
        curl_multi_wakeup(m_multi);
    }

    void set_listener(std::shared_ptr<transport_listener> listener) {
        std::lock_guard lock(m_mutex);
        m_listener = std::move(listener);
    }

    void mark_invalidated() {
        m_invalidated.store(true, std::memory_order_release);
    }

    std::shared_ptr<task> create_task(task_kind kind, const url_request& request,
                                      std::optional<upload_source> source) {
        if (m_invalidated.load(std::memory_order_acquire))
            throw std::logic_error("cannot create a task on an invalidated transport");

        auto created = std::make_shared<task>(weak_from_this(), m_next_id.fetch_add(1), kind,
                                              request);
        created->upload = std::move(source);
        return created;
    }

    void adopt(const std::shared_ptr<task>& created) {
        post([this, created] { m_tasks.emplace(created->id(), created); });
    }

    std::shared_ptr<task> create_resumed_download(const std::string& resume_data) {
        detail::resume_state state = detail::decode_resume_data(resume_data);
        url_request request(http_method::get, state.url);
        request.headers = state.headers;
        std::filesystem::path temp_path = state.temporary_file;
        std::int64_t offset = state.offset;

        auto created = create_task(task_kind::download, request, std::nullopt);

        // Trust the bytes actually on disk over the recorded offset
        std::error_code ec;
        auto on_disk = std::filesystem::file_size(temp_path, ec);
        if (ec) {
            RELAY_LOG(std::cout << "[relay::curl_transport] Partial download " << temp_path
                                << " is gone, starting over" << std::endl);
            offset = 0;
            temp_path.clear();
        } else {
            offset = std::min<std::int64_t>(offset, static_cast<std::int64_t>(on_disk));
        }

        created->temp_path = temp_path;
        created->resume_offset = offset;
        created->etag = state.etag;
        adopt(created);
        return created;
    }

    // Worker thread only

    void resume_task(const std::shared_ptr<task>& target) {
        if (m_tasks.find(target->id()) == m_tasks.end())
            return;
        if (target->state() != task_state::suspended)
            return;

        target->set_state(task_state::running);
        if (!target->started) {
            target->started = true;
            if (target->kind() == task_kind::download && !ensure_temp_file(*target)) {
                finish_task(target, file_error("could not create a temporary download file"));
                return;
            }
            start_transfer(target);
            return;
        }
        if (target->active)
            curl_easy_pause(target->active->easy, CURLPAUSE_CONT);
    }

    void suspend_task(const std::shared_ptr<task>& target) {
        if (m_tasks.find(target->id()) == m_tasks.end())
            return;
        if (target->state() != task_state::running)
            return;

        target->set_state(task_state::suspended);
        if (target->active)
            curl_easy_pause(target->active->easy, CURLPAUSE_ALL);
    }

    void cancel_task(const std::shared_ptr<task>& target, const resume_data_callback& callback) {
        if (m_tasks.find(target->id()) == m_tasks.end()) {
            if (callback)
                callback(std::nullopt);
            return;
        }

        target->set_state(task_state::canceling);
        if (callback) {
            std::optional<std::string> resume_data;
            if (target->kind() == task_kind::download)
                resume_data = make_resume_data(*target);
            callback(std::move(resume_data));
        }
        finish_task(target, relay::error::cancelled());
    }

    void invalidate(bool cancel_running) {
        m_invalidate_when_idle = true;
        if (cancel_running) {
            auto remaining = m_tasks;
            for (const auto& entry : remaining) {
                entry.second->set_state(task_state::canceling);
                finish_task(entry.second, relay::error::cancelled());
            }
        }
        check_idle();
    }

    static size_t header_callback(char* data, size_t size, size_t nitems, void* userdata) {
        auto* current = static_cast<transfer*>(userdata);
        return current->engine->on_header(*current, data, size * nitems);
    }

    static size_t write_callback(char* data, size_t size, size_t nmemb, void* userdata) {
        auto* current = static_cast<transfer*>(userdata);
        return current->engine->on_body(*current, data, size * nmemb);
    }

    static size_t read_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* current = static_cast<transfer*>(userdata);
        const size_t capacity = size * nitems;

        if (current->memory_body) {
            size_t remaining = current->memory_body->size() - current->memory_offset;
            size_t count = std::min(remaining, capacity);
            std::memcpy(buffer, current->memory_body->data() + current->memory_offset, count);
            current->memory_offset += count;
            return count;
        }
        if (current->stream_body) {
            current->stream_body->read(buffer, static_cast<std::streamsize>(capacity));
            if (current->stream_body->bad()) {
                current->abort_error = relay::error(error_kind::transport, CURLE_READ_ERROR,
                                                    "failed to read the upload body");
                return CURL_READFUNC_ABORT;
            }
            return static_cast<size_t>(current->stream_body->gcount());
        }
        return 0;
    }

    static int seek_callback(void* userdata, curl_off_t offset, int origin) {
        auto* current = static_cast<transfer*>(userdata);
        if (origin != SEEK_SET || offset < 0)
            return CURL_SEEKFUNC_CANTSEEK;

        if (current->memory_body) {
            if (static_cast<size_t>(offset) > current->memory_body->size())
                return CURL_SEEKFUNC_FAIL;
            current->memory_offset = static_cast<size_t>(offset);
            return CURL_SEEKFUNC_OK;
        }
        if (current->stream_body) {
            current->stream_body->clear();
            current->stream_body->seekg(static_cast<std::streamoff>(offset));
            return current->stream_body->fail() ? CURL_SEEKFUNC_CANTSEEK : CURL_SEEKFUNC_OK;
        }
        return CURL_SEEKFUNC_CANTSEEK;
    }

    static int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t ultotal,
                                 curl_off_t ulnow) {
        auto* current = static_cast<transfer*>(userdata);
        current->engine->on_upload_progress(*current, ultotal, ulnow);
        return 0;
    }

private:
    void run() {
        while (true) {
            std::deque<std::function<void()>> commands;
            bool stopping;
            {
                std::lock_guard lock(m_mutex);
                commands.swap(m_commands);
                m_active_listener = m_listener;
                stopping = m_stopping;
            }
            if (stopping && commands.empty())
                break;

            for (auto& command : commands)
                command();

            int running = 0;
            CURLMcode rc = curl_multi_perform(m_multi, &running);
            if (rc != CURLM_OK) {
                std::cerr << "[relay::curl_transport] curl_multi_perform() failed: "
                          << curl_multi_strerror(rc) << std::endl;
            }
            process_messages();

            rc = curl_multi_poll(m_multi, nullptr, 0, POLL_TIMEOUT_MS, nullptr);
            if (rc != CURLM_OK) {
                std::cerr << "[relay::curl_transport] curl_multi_poll() failed: "
                          << curl_multi_strerror(rc) << std::endl;
            }
        }

        // Anything still in flight is cancelled so handlers waiting on it can run
        invalidate(true);
        m_tasks.clear();
        m_active_listener.reset();
    }

    void process_messages() {
        while (true) {
            int remaining = 0;
            CURLMsg* message = curl_multi_info_read(m_multi, &remaining);
            if (!message)
                break;
            if (message->msg != CURLMSG_DONE)
                continue;

            void* private_data = nullptr;
            curl_easy_getinfo(message->easy_handle, CURLINFO_PRIVATE, &private_data);
            if (auto* current = static_cast<transfer*>(private_data))
                complete_transfer(*current, message->data.result);
        }
    }

    bool ensure_temp_file(task& target) {
        if (!target.temp_path.empty())
            return true;

        std::string pattern = (m_options.temporary_directory / "relay-download-XXXXXX").string();
        std::vector<char> name(pattern.begin(), pattern.end());
        name.push_back('\0');
        int fd = mkstemp(name.data());
        if (fd < 0) {
            std::cerr << "[relay::curl_transport] Failed to create temporary file in "
                      << m_options.temporary_directory << ": " << std::strerror(errno)
                      << std::endl;
            return false;
        }
        close(fd);
        target.temp_path = name.data();
        return true;
    }

    bool open_download_file(task& target, bool append) {
        if (target.file.is_open())
            target.file.close();
        target.file.clear();
        target.file.open(target.temp_path,
                         std::ios::binary | (append ? std::ios::app : std::ios::trunc));
        if (!target.file) {
            std::cerr << "[relay::curl_transport] Failed to open " << target.temp_path
                      << " for writing" << std::endl;
            return false;
        }
        return true;
    }

    void start_transfer(const std::shared_ptr<task>& target) {
        auto next = std::make_unique<transfer>();
        next->engine = this;
        next->owner = target.get();
        next->multi = m_multi;
        next->easy = curl_easy_init();
        if (!next->easy) {
            std::cerr << "[relay::curl_transport] Failed to initialize curl handle" << std::endl;
            finish_task(target, relay::error(error_kind::transport, CURLE_FAILED_INIT,
                                             "failed to initialize curl handle"));
            return;
        }

        CURL* easy = next->easy;
        const url_request request = target->current_request();
        transport_listener* listener = m_active_listener.get();
        ++target->attempts;

        curl_easy_setopt(easy, CURLOPT_PRIVATE, next.get());
        curl_easy_setopt(easy, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(easy, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(easy, CURLOPT_ERRORBUFFER, next->error_buffer);
        curl_easy_setopt(easy, CURLOPT_FOLLOWLOCATION, 0L);
        curl_easy_setopt(easy, CURLOPT_TIMEOUT, m_options.timeout_seconds);
        curl_easy_setopt(easy, CURLOPT_CONNECTTIMEOUT, m_options.connect_timeout_seconds);
        curl_easy_setopt(easy, CURLOPT_SSL_VERIFYPEER, m_options.verify_peer ? 1L : 0L);
        curl_easy_setopt(easy, CURLOPT_SSL_VERIFYHOST, m_options.verify_peer ? 2L : 0L);
        // Prefer HTTP/2 over TLS if available (falls back automatically)
        curl_easy_setopt(easy, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
        curl_easy_setopt(easy, CURLOPT_ACCEPT_ENCODING, "");
        curl_easy_setopt(easy, CURLOPT_COOKIEFILE, "");
        if (m_share)
            curl_easy_setopt(easy, CURLOPT_SHARE, m_share);

        curl_easy_setopt(easy, CURLOPT_HEADERFUNCTION, &impl::header_callback);
        curl_easy_setopt(easy, CURLOPT_HEADERDATA, next.get());
        curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, &impl::write_callback);
        curl_easy_setopt(easy, CURLOPT_WRITEDATA, next.get());

        if (!request.header("User-Agent"))
            curl_easy_setopt(easy, CURLOPT_USERAGENT, m_options.user_agent.c_str());
        for (const auto& header : request.headers) {
            std::string line = header.first + ": " + header.second;
            next->header_list = curl_slist_append(next->header_list, line.c_str());
        }

        // Request body
        if (target->kind() == task_kind::upload && target->upload) {
            if (auto* data = std::get_if<std::string>(&target->upload->body)) {
                next->memory_body = std::make_shared<const std::string>(*data);
                next->body_size = static_cast<std::int64_t>(data->size());
            } else if (auto* path = std::get_if<std::filesystem::path>(&target->upload->body)) {
                auto in = std::make_shared<std::ifstream>(*path, std::ios::binary);
                if (!*in) {
                    finish_task(target, file_error("could not open " + path->string()));
                    return;
                }
                std::error_code ec;
                auto size = std::filesystem::file_size(*path, ec);
                next->body_size = ec ? UNKNOWN_LENGTH : static_cast<std::int64_t>(size);
                next->stream_body = std::move(in);
            } else {
                auto& stream = std::get<std::shared_ptr<std::istream>>(target->upload->body);
                next->stream_body =
                    detail::upload_stream_for_attempt(target->attempts, stream, listener, *target);
                if (!next->stream_body) {
                    finish_task(target, relay::error(error_kind::transport, CURLE_SEND_FAIL_REWIND,
                                                     "upload body stream cannot be replayed"));
                    return;
                }
            }
        } else if (!request.body.empty()) {
            next->memory_body = std::make_shared<const std::string>(request.body);
            next->body_size = static_cast<std::int64_t>(request.body.size());
        }
        const bool has_body = next->memory_body || next->stream_body;

        if (request.method == http_method::head) {
            curl_easy_setopt(easy, CURLOPT_NOBODY, 1L);
        } else if (request.method == http_method::get && !has_body) {
            curl_easy_setopt(easy, CURLOPT_HTTPGET, 1L);
        } else {
            curl_easy_setopt(easy, CURLOPT_CUSTOMREQUEST, method_name(request.method));
        }

        if (has_body) {
            curl_easy_setopt(easy, CURLOPT_UPLOAD, 1L);
            curl_easy_setopt(easy, CURLOPT_INFILESIZE_LARGE,
                             static_cast<curl_off_t>(next->body_size));
            curl_easy_setopt(easy, CURLOPT_READFUNCTION, &impl::read_callback);
            curl_easy_setopt(easy, CURLOPT_READDATA, next.get());
            curl_easy_setopt(easy, CURLOPT_SEEKFUNCTION, &impl::seek_callback);
            curl_easy_setopt(easy, CURLOPT_SEEKDATA, next.get());
            curl_easy_setopt(easy, CURLOPT_NOPROGRESS, 0L);
            curl_easy_setopt(easy, CURLOPT_XFERINFOFUNCTION, &impl::progress_callback);
            curl_easy_setopt(easy, CURLOPT_XFERINFODATA, next.get());
        } else if (request.method == http_method::post) {
            curl_easy_setopt(easy, CURLOPT_POSTFIELDS, "");
            curl_easy_setopt(easy, CURLOPT_POSTFIELDSIZE, 0L);
        }

        if (target->login) {
            curl_easy_setopt(easy, CURLOPT_USERNAME, target->login->user.c_str());
            curl_easy_setopt(easy, CURLOPT_PASSWORD, target->login->password.c_str());
            switch (target->login_method) {
            case auth_method::http_basic:
                curl_easy_setopt(easy, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
                break;
            case auth_method::http_digest:
                // libcurl answers the nonce round trip itself
                curl_easy_setopt(easy, CURLOPT_HTTPAUTH, CURLAUTH_DIGEST);
                next->digest_pending = true;
                break;
            case auth_method::server_trust:
            case auth_method::other:
                curl_easy_setopt(easy, CURLOPT_HTTPAUTH, CURLAUTH_ANY);
                break;
            }
        }

        if (target->kind() == task_kind::download && target->resume_offset > 0) {
            curl_easy_setopt(easy, CURLOPT_RESUME_FROM_LARGE,
                             static_cast<curl_off_t>(target->resume_offset));
            if (target->etag) {
                std::string line = "If-Range: " + *target->etag;
                next->header_list = curl_slist_append(next->header_list, line.c_str());
            }
        }

        if (next->header_list)
            curl_easy_setopt(easy, CURLOPT_HTTPHEADER, next->header_list);

        RELAY_LOG(std::cout << "[relay::curl_transport] Task " << target->id() << " "
                            << method_name(request.method) << " " << request.url << " (attempt "
                            << target->attempts << ")" << std::endl);

        CURLMcode rc = curl_multi_add_handle(m_multi, easy);
        if (rc != CURLM_OK) {
            std::cerr << "[relay::curl_transport] curl_multi_add_handle() failed: "
                      << curl_multi_strerror(rc) << std::endl;
            finish_task(target, relay::error(error_kind::transport, CURLE_FAILED_INIT,
                                             curl_multi_strerror(rc)));
            return;
        }
        next->added = true;
        target->active = std::move(next);

        if (target->state() == task_state::suspended)
            curl_easy_pause(easy, CURLPAUSE_ALL);
    }

    size_t on_header(transfer& current, const char* data, size_t size) {
        std::string line(data, size);
        if (line.compare(0, 5, "HTTP/") == 0)
            current.header_block.clear();
        current.header_block += line;
        if (line != "\r\n" && line != "\n")
            return size;

        header_map headers;
        int status_code = parse_response_headers(current.header_block, headers);
        current.header_block.clear();

        // Interim responses and trailers
        if (current.response_handled || (status_code >= 100 && status_code < 200))
            return size;

        http_response response;
        response.status_code = status_code;
        response.headers = std::move(headers);
        response.url = effective_url(current);
        response.expected_content_length = detail::content_length(response);

        return handle_response(current, std::move(response)) ? size : 0;
    }

    std::string effective_url(transfer& current) {
        char* url = nullptr;
        if (curl_easy_getinfo(current.easy, CURLINFO_EFFECTIVE_URL, &url) == CURLE_OK && url)
            return url;
        return current.owner->current_request().url;
    }

    // Schemes like file:// send no header block. The first body bytes, or the end of an empty
    // transfer, stand in for it with the status and length libcurl reports.
    bool ensure_response(transfer& current) {
        if (current.response_handled)
            return true;

        http_response response;
        long code = 0;
        if (curl_easy_getinfo(current.easy, CURLINFO_RESPONSE_CODE, &code) == CURLE_OK)
            response.status_code = static_cast<int>(code);
        response.url = effective_url(current);
        curl_off_t length = -1;
        if (curl_easy_getinfo(current.easy, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) ==
                CURLE_OK &&
            length >= 0) {
            response.expected_content_length = static_cast<std::int64_t>(length);
        } else {
            response.expected_content_length = UNKNOWN_LENGTH;
        }

        current.headerless = true;
        return handle_response(current, std::move(response));
    }

    // Returns false to abort the transfer; `current.abort_error` says why.
    bool handle_response(transfer& current, http_response response) {
        task& owner = *current.owner;
        transport_listener* listener = m_active_listener.get();

        if (detail::is_redirect(response.status_code)) {
            if (auto location = response.header("Location")) {
                if (owner.redirects >= m_options.max_redirects) {
                    current.abort_error = relay::error(
                        error_kind::transport, CURLE_TOO_MANY_REDIRECTS,
                        "stopped after " + std::to_string(owner.redirects) + " redirects");
                    return false;
                }
                if (auto target = detail::resolve_url(response.url, *location)) {
                    url_request proposed = detail::redirect_request(
                        owner.current_request(), response.status_code, *target);
                    std::optional<url_request> next =
                        listener ? listener->will_redirect(owner, response, proposed)
                                 : std::optional<url_request>(proposed);
                    if (next) {
                        current.redirect_to = std::move(next);
                        current.discard_body = true;
                        current.response_handled = true;
                        return true;
                    }
                }
            }
        }

        if (response.status_code == 401) {
            if (current.digest_pending) {
                current.digest_pending = false;
                current.discard_body = true;
                return true;
            }
            if (auto header = response.header("WWW-Authenticate")) {
                auth_challenge challenge = detail::make_challenge(response.url, *header);
                challenge.previous_failure_count = owner.auth_failures;
                challenge.failure_response = response;

                challenge_result result =
                    listener ? listener->did_receive_challenge(owner, challenge) : challenge_result();
                switch (result.disposition) {
                case auth_disposition::use_credential:
                    if (result.credential) {
                        current.retry_with = std::move(result.credential);
                        owner.login_method = challenge.space.auth_method;
                        current.discard_body = true;
                        current.response_handled = true;
                        return true;
                    }
                    break;
                case auth_disposition::cancel_challenge:
                    current.abort_error = relay::error::cancelled();
                    return false;
                case auth_disposition::perform_default_handling:
                case auth_disposition::reject_protection_space:
                    break;
                }
            }
        }

        // A digest round trip may have muted the first 401 body; this one is kept
        current.discard_body = false;
        current.response_handled = true;
        owner.set_response(response);

        if (owner.kind() == task_kind::download)
            return begin_download(current, response);

        response_disposition disposition =
            listener ? listener->did_receive_response(owner, response) : response_disposition::allow;
        switch (disposition) {
        case response_disposition::allow:
            return true;
        case response_disposition::cancel:
            current.abort_error = relay::error::cancelled();
            return false;
        case response_disposition::become_download:
            return convert_to_download(current, response);
        }
        return true;
    }

    bool begin_download(transfer& current, const http_response& response) {
        task& owner = *current.owner;

        bool append = false;
        if (owner.resume_offset > 0) {
            // file:// applies the resume offset itself
            if (response.status_code == 206 || current.headerless) {
                append = true;
            } else {
                RELAY_LOG(std::cout << "[relay::curl_transport] Server ignored the range for task "
                                    << owner.id() << ", restarting" << std::endl);
                owner.resume_offset = 0;
            }
        }

        owner.expected = response.expected_content_length >= 0
                             ? response.expected_content_length + owner.resume_offset
                             : UNKNOWN_LENGTH;
        owner.etag = response.header("ETag");
        owner.written = owner.resume_offset;

        if (!open_download_file(owner, append)) {
            current.abort_error = file_error("could not open " + owner.temp_path.string());
            return false;
        }

        if (append) {
            if (auto* listener = m_active_listener.get())
                listener->did_resume_at_offset(owner, owner.resume_offset, owner.expected);
        }
        return true;
    }

    bool convert_to_download(transfer& current, const http_response& response) {
        auto data_task = m_tasks.at(current.owner->id());

        auto download = std::make_shared<task>(weak_from_this(), m_next_id.fetch_add(1),
                                               task_kind::download,
                                               data_task->original_request());
        download->set_current_request(data_task->current_request());
        download->set_response(response);
        download->set_state(task_state::running);
        download->started = true;
        download->expected = response.expected_content_length;

        if (!ensure_temp_file(*download) || !open_download_file(*download, false)) {
            current.abort_error = file_error("could not stage the converted download");
            return false;
        }

        m_tasks.emplace(download->id(), download);
        current.owner = download.get();
        download->active = std::move(data_task->active);

        RELAY_LOG(std::cout << "[relay::curl_transport] Task " << data_task->id()
                            << " continues as download task " << download->id() << std::endl);
        if (auto* listener = m_active_listener.get())
            listener->did_become_download_task(*data_task, download);
        finish_task(data_task, std::nullopt);
        return true;
    }

    size_t on_body(transfer& current, const char* data, size_t size) {
        if (current.discard_body)
            return size;
        if (!ensure_response(current))
            return 0;

        // A converted data task continues on its download task from here
        task& owner = *current.owner;
        transport_listener* listener = m_active_listener.get();

        if (owner.kind() == task_kind::download) {
            owner.file.write(data, static_cast<std::streamsize>(size));
            if (!owner.file) {
                current.abort_error = file_error("could not write " + owner.temp_path.string());
                return 0;
            }
            owner.written += static_cast<std::int64_t>(size);
            if (listener) {
                listener->did_write_data(owner, static_cast<std::int64_t>(size), owner.written,
                                         owner.expected);
            }
            return size;
        }

        if (listener)
            listener->did_receive_data(owner, std::string_view(data, size));
        return size;
    }

    void on_upload_progress(transfer& current, curl_off_t ultotal, curl_off_t ulnow) {
        if (ulnow <= current.last_sent)
            return;

        const std::int64_t sent = static_cast<std::int64_t>(ulnow) - current.last_sent;
        current.last_sent = static_cast<std::int64_t>(ulnow);
        std::int64_t expected = current.body_size;
        if (expected < 0 && ultotal > 0)
            expected = static_cast<std::int64_t>(ultotal);

        if (auto* listener = m_active_listener.get())
            listener->did_send_body_data(*current.owner, sent, current.last_sent, expected);
    }

    void complete_transfer(transfer& current, CURLcode code) {
        // An empty non-HTTP body never reached on_body
        if (code == CURLE_OK && !current.abort_error && !ensure_response(current) &&
            !current.abort_error) {
            current.abort_error = relay::error::cancelled();
        }

        auto it = m_tasks.find(current.owner->id());
        if (it == m_tasks.end())
            return;
        std::shared_ptr<task> owner = it->second;

        if (current.abort_error) {
            relay::error reason = *current.abort_error;
            finish_task(owner, std::move(reason));
            return;
        }
        if (code != CURLE_OK) {
            finish_task(owner, transport_error(code, current.error_buffer));
            return;
        }

        if (current.redirect_to) {
            url_request next = std::move(*current.redirect_to);
            ++owner->redirects;
            RELAY_LOG(std::cout << "[relay::curl_transport] Task " << owner->id()
                                << " redirected to " << next.url << std::endl);
            owner->set_current_request(std::move(next));
            owner->active.reset();
            start_transfer(owner);
            return;
        }
        if (current.retry_with) {
            owner->login = std::move(current.retry_with);
            ++owner->auth_failures;
            owner->active.reset();
            start_transfer(owner);
            return;
        }

        if (owner->kind() == task_kind::download) {
            owner->file.close();
            if (auto* listener = m_active_listener.get())
                listener->did_finish_downloading(*owner, owner->temp_path);
        }
        finish_task(owner, std::nullopt);
    }

    std::optional<std::string> make_resume_data(task& target) {
        if (!target.started || target.temp_path.empty())
            return std::nullopt;
        if (target.file.is_open())
            target.file.close();
        if (target.written <= 0)
            return std::nullopt;

        target.keep_temp = true;
        detail::resume_state state;
        state.url = target.original_request().url;
        state.headers = target.original_request().headers;
        state.temporary_file = target.temp_path;
        state.offset = target.written;
        state.etag = target.etag;
        return detail::encode_resume_data(state);
    }

    void finish_task(const std::shared_ptr<task>& target, std::optional<relay::error> error) {
        target->active.reset();
        if (target->file.is_open())
            target->file.close();
        if (target->kind() == task_kind::download && !target->keep_temp &&
            !target->temp_path.empty()) {
            std::error_code ec;
            std::filesystem::remove(target->temp_path, ec);
            if (ec) {
                std::cerr << "[relay::curl_transport] Failed to remove " << target->temp_path
                          << ": " << ec.message() << std::endl;
            }
        }

        target->set_state(task_state::completed);
        m_tasks.erase(target->id());

        RELAY_LOG(std::cout << "[relay::curl_transport] Task " << target->id() << " finished"
                            << (error ? ": " + error->describe() : std::string()) << std::endl);
        if (auto* listener = m_active_listener.get())
            listener->did_complete(*target, error);
        check_idle();
    }

    void check_idle() {
        if (!m_invalidate_when_idle || m_reported_invalid || !m_tasks.empty())
            return;
        m_reported_invalid = true;
        if (auto* listener = m_active_listener.get())
            listener->did_become_invalid(std::nullopt);
    }

    options m_options;
    CURLM* m_multi;
    CURLSH* m_share;
    std::thread m_worker;
    std::atomic<task_id> m_next_id{1};
    std::atomic<bool> m_invalidated{false};

    std::mutex m_mutex;
    std::deque<std::function<void()>> m_commands;
    std::shared_ptr<transport_listener> m_listener;
    bool m_stopping = false;

    // Worker thread only
    std::shared_ptr<transport_listener> m_active_listener;
    std::unordered_map<task_id, std::shared_ptr<task>> m_tasks;
    bool m_invalidate_when_idle = false;
    bool m_reported_invalid = false;
};

template <typename CommandT>
bool curl_transport::task::dispatch(CommandT command) {
    auto engine = m_engine.lock();
    if (!engine)
        return false;
    impl* raw = engine.get();
    engine->post([raw, self = shared_from_this(), command = std::move(command)] {
        command(*raw, self);
    });
    return true;
}

void curl_transport::task::resume() {
    dispatch([](impl& engine, const std::shared_ptr<task>& self) { engine.resume_task(self); });
}

void curl_transport::task::suspend() {
    dispatch([](impl& engine, const std::shared_ptr<task>& self) { engine.suspend_task(self); });
}

void curl_transport::task::cancel() {
    dispatch([](impl& engine, const std::shared_ptr<task>& self) {
        engine.cancel_task(self, nullptr);
    });
}

void curl_transport::task::cancel_producing_resume_data(resume_data_callback callback) {
    auto shared_callback = std::make_shared<resume_data_callback>(std::move(callback));
    bool queued = dispatch([shared_callback](impl& engine, const std::shared_ptr<task>& self) {
        engine.cancel_task(self, *shared_callback);
    });
    if (!queued && *shared_callback)
        (*shared_callback)(std::nullopt);
}

curl_transport::options::options()
    : timeout_seconds(60), connect_timeout_seconds(30), max_redirects(16), verify_peer(true),
      temporary_directory(std::filesystem::temp_directory_path()),
      user_agent(std::string("relay/") + VERSION) {}

curl_transport::curl_transport(options opts) : pimpl(std::make_shared<impl>(std::move(opts))) {
    pimpl->start();
}

curl_transport::~curl_transport() {
    pimpl->stop();
}

void curl_transport::set_listener(std::shared_ptr<transport_listener> listener) {
    pimpl->set_listener(std::move(listener));
}

std::shared_ptr<transport_task> curl_transport::create_data_task(const url_request& request) {
    auto created = pimpl->create_task(task_kind::data, request, std::nullopt);
    pimpl->adopt(created);
    return created;
}

std::shared_ptr<transport_task> curl_transport::create_upload_task(const url_request& request,
                                                                   upload_source source) {
    auto created = pimpl->create_task(task_kind::upload, request, std::move(source));
    pimpl->adopt(created);
    return created;
}

std::shared_ptr<transport_task> curl_transport::create_download_task(const url_request& request) {
    auto created = pimpl->create_task(task_kind::download, request, std::nullopt);
    pimpl->adopt(created);
    return created;
}

std::shared_ptr<transport_task> curl_transport::create_download_task(
    const std::string& resume_data) {
    return pimpl->create_resumed_download(resume_data);
}

void curl_transport::invalidate_and_cancel() {
    pimpl->mark_invalidated();
    impl* engine = pimpl.get();
    pimpl->post([engine] { engine->invalidate(true); });
}

void curl_transport::finish_tasks_and_invalidate() {
    pimpl->mark_invalidated();
    impl* engine = pimpl.get();
    pimpl->post([engine] { engine->invalidate(false); });
}

} // namespace relay
