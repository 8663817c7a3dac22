#include <condition_variable>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "net/manager.hpp"
#include "util/byte_utils.hpp"

namespace {
enum class output_mode {
    text,
    json,
    download,
};

struct fetch_args {
    std::string url;
    output_mode mode = output_mode::text;
    std::filesystem::path directory;
    std::optional<std::string> accept;
};

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " <url> [--json|--text|--download <dir>] [--accept <types>]" << std::endl;
}

bool parse_args(int argc, char** argv, fetch_args& out) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--json") {
            out.mode = output_mode::json;
        } else if (arg == "--text") {
            out.mode = output_mode::text;
        } else if (arg == "--download" && i + 1 < argc) {
            out.mode = output_mode::download;
            out.directory = argv[++i];
        } else if (arg == "--accept" && i + 1 < argc) {
            out.accept = argv[++i];
        } else if (!arg.empty() && arg[0] != '-' && out.url.empty()) {
            out.url = arg;
        } else {
            return false;
        }
    }
    return !out.url.empty();
}

// Lets main wait for the response handler, which runs on the manager's callback pool
class completion_latch {
public:
    void finish(int exit_code) {
        std::lock_guard lock(m_mutex);
        m_exit_code = exit_code;
        m_done = true;
        m_cv.notify_all();
    }

    int wait() {
        std::unique_lock lock(m_mutex);
        m_cv.wait(lock, [this] { return m_done; });
        return m_exit_code;
    }

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_done = false;
    int m_exit_code = 0;
};

template <typename T>
int report(const relay::response_result<T>& result) {
    if (result.response) {
        std::cerr << relay::method_name(result.request.method) << " " << result.request.url
                  << " -> " << result.response->status_code << std::endl;
    }
    if (result.error) {
        std::cerr << "Request failed: " << result.error->describe() << std::endl;
        return 1;
    }
    return 0;
}

void print_progress(std::int64_t, std::int64_t total, std::int64_t expected) {
    std::cerr << "\r" << relay::byte_utils::format_bytes(total) << " / "
              << relay::byte_utils::format_bytes(expected) << std::flush;
}
} // namespace

int main(int argc, char** argv) {
    fetch_args args;
    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 2;
    }

    relay::manager session;
    relay::url_request request(relay::http_method::get, args.url);
    if (args.accept)
        request.headers["Accept"] = *args.accept;

    completion_latch latch;

    switch (args.mode) {
    case output_mode::download: {
        auto saved_to = std::make_shared<std::filesystem::path>();
        auto suggested = relay::suggested_download_destination(args.directory);
        relay::download_destination destination =
            [suggested, saved_to](const std::filesystem::path& temporary,
                                  const relay::http_response& response) {
                *saved_to = suggested(temporary, response);
                return *saved_to;
            };

        session.download(request, destination)
            .on_progress(print_progress)
            .validate()
            .response_data([&latch, saved_to](const relay::response_result<std::string>& result) {
                std::cerr << std::endl;
                int code = report(result);
                if (code == 0)
                    std::cout << saved_to->string() << std::endl;
                latch.finish(code);
            });
        break;
    }
    case output_mode::json:
        session.request(request).validate().response_json(
            [&latch](const relay::response_result<nlohmann::json>& result) {
                int code = report(result);
                if (code == 0 && result.value)
                    std::cout << result.value->dump(2) << std::endl;
                latch.finish(code);
            });
        break;
    case output_mode::text:
        session.request(request).validate().response_string(
            [&latch](const relay::response_result<std::string>& result) {
                int code = report(result);
                if (code == 0 && result.value)
                    std::cout << *result.value << std::endl;
                latch.finish(code);
            });
        break;
    }

    return latch.wait();
}
