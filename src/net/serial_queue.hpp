#pragma once

#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "net/executor.hpp"

namespace relay {

// Strictly ordered work queue that starts suspended.
//
// Work submitted with async() is buffered until resume() is called once; from then on the
// buffered work and anything submitted later runs on the target executor, one item at a time,
// in submission order. Submitting never blocks and is safe from any thread.
class serial_queue : public std::enable_shared_from_this<serial_queue> {
public:
    static std::shared_ptr<serial_queue> create(std::shared_ptr<executor> target,
                                                std::string label);

    serial_queue(const serial_queue&) = delete;
    serial_queue& operator=(const serial_queue&) = delete;

    void async(std::function<void()> work);

    // Opens the queue. Only the first call has an effect; returns whether this call opened it.
    bool resume();

    bool is_suspended() const;

    const std::string& label() const {
        return m_label;
    }

private:
    serial_queue(std::shared_ptr<executor> target, std::string label);

    bool claim_drain_locked();
    void post_drain();
    void drain();

    std::shared_ptr<executor> m_target;
    std::string m_label;

    mutable std::mutex m_mutex;
    std::deque<std::function<void()>> m_pending;
    bool m_suspended = true;
    bool m_draining = false;
};

} // namespace relay
