#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace relay {

class executor {
public:
    virtual ~executor() = default;

    virtual void post(std::function<void()> work) = 0;
};

// Runs work on the calling thread.
class inline_executor final : public executor {
public:
    void post(std::function<void()> work) override {
        work();
    }
};

// Fixed-size worker pool. Work still queued at destruction is run before the workers exit.
class thread_pool final : public executor {
public:
    explicit thread_pool(std::size_t thread_count);
    ~thread_pool() override;

    thread_pool(const thread_pool&) = delete;
    thread_pool& operator=(const thread_pool&) = delete;

    void post(std::function<void()> work) override;

    std::size_t size() const {
        return m_threads.size();
    }

private:
    // Shared with the workers so a worker may drop the last pool reference safely
    struct state {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<std::function<void()>> work;
        bool stopping = false;
    };

    static void worker_loop(std::shared_ptr<state> shared);

    std::shared_ptr<state> m_state;
    std::vector<std::thread> m_threads;
};

} // namespace relay
