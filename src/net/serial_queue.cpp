#include "net/serial_queue.hpp"

#include <iostream>

#include "net/http.hpp"

namespace relay {

std::shared_ptr<serial_queue> serial_queue::create(std::shared_ptr<executor> target,
                                                   std::string label) {
    return std::shared_ptr<serial_queue>(new serial_queue(std::move(target), std::move(label)));
}

serial_queue::serial_queue(std::shared_ptr<executor> target, std::string label)
    : m_target(std::move(target)), m_label(std::move(label)) {}

void serial_queue::async(std::function<void()> work) {
    bool start_drain = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_pending.push_back(std::move(work));
        start_drain = !m_suspended && claim_drain_locked();
    }
    if (start_drain)
        post_drain();
}

bool serial_queue::resume() {
    bool start_drain = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_suspended)
            return false;
        m_suspended = false;
        RELAY_LOG(std::cout << "[relay::serial_queue] " << m_label << " resumed with "
                            << m_pending.size() << " pending" << std::endl);
        start_drain = claim_drain_locked();
    }
    if (start_drain)
        post_drain();
    return true;
}

bool serial_queue::is_suspended() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_suspended;
}

bool serial_queue::claim_drain_locked() {
    // A single drain at a time keeps the items ordered
    if (m_draining || m_pending.empty())
        return false;
    m_draining = true;
    return true;
}

void serial_queue::post_drain() {
    auto self = shared_from_this();
    m_target->post([self]() { self->drain(); });
}

void serial_queue::drain() {
    while (true) {
        std::function<void()> work;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_pending.empty()) {
                m_draining = false;
                return;
            }
            work = std::move(m_pending.front());
            m_pending.pop_front();
        }

        try {
            work();
        } catch (const std::exception& e) {
            std::cerr << "[relay::serial_queue] " << m_label << ": handler threw: " << e.what()
                      << std::endl;
        } catch (...) {
            std::cerr << "[relay::serial_queue] " << m_label
                      << ": handler threw a non-standard exception" << std::endl;
        }
    }
}

} // namespace relay
