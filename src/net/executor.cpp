#include "net/executor.hpp"

#include <iostream>

namespace relay {

thread_pool::thread_pool(std::size_t thread_count) : m_state(std::make_shared<state>()) {
    if (thread_count == 0)
        thread_count = 1;
    m_threads.reserve(thread_count);
    for (std::size_t i = 0; i < thread_count; ++i) {
        m_threads.emplace_back(&thread_pool::worker_loop, m_state);
    }
}

thread_pool::~thread_pool() {
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        m_state->stopping = true;
    }
    m_state->cv.notify_all();

    for (auto& thread : m_threads) {
        if (thread.get_id() == std::this_thread::get_id()) {
            // The last reference was released from inside a work item
            thread.detach();
        } else if (thread.joinable()) {
            thread.join();
        }
    }
}

void thread_pool::post(std::function<void()> work) {
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        m_state->work.push_back(std::move(work));
    }
    m_state->cv.notify_one();
}

void thread_pool::worker_loop(std::shared_ptr<state> shared) {
    while (true) {
        std::function<void()> work;
        {
            std::unique_lock<std::mutex> lock(shared->mutex);
            shared->cv.wait(lock, [&]() { return shared->stopping || !shared->work.empty(); });
            if (shared->work.empty())
                return;
            work = std::move(shared->work.front());
            shared->work.pop_front();
        }

        try {
            work();
        } catch (const std::exception& e) {
            std::cerr << "[relay::thread_pool] Work item threw: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "[relay::thread_pool] Work item threw a non-standard exception" << std::endl;
        }
    }
}

} // namespace relay
