#pragma once

#include <utility>

namespace relay {

// Runs a cleanup function on scope exit unless dismissed.
template <typename FunctionT>
class deferred {
public:
    explicit deferred(FunctionT&& function)
        : m_function(std::forward<FunctionT>(function)), m_active(true) {}

    deferred(const deferred&) = delete;
    deferred& operator=(const deferred&) = delete;

    deferred(deferred&& other) noexcept
        : m_function(std::move(other.m_function)), m_active(other.m_active) {
        other.m_active = false;
    }
    deferred& operator=(deferred&&) = delete;

    ~deferred() {
        if (m_active)
            m_function();
    }

    void dismiss() {
        m_active = false;
    }

private:
    FunctionT m_function;
    bool m_active;
};

template <typename FunctionT>
auto make_deferred(FunctionT&& function) {
    return deferred<FunctionT>(std::forward<FunctionT>(function));
}

} // namespace relay

#define RELAY_UNIQUE_VAR_NAME(prefix) RELAY_UNIQUE_VAR_NAME_IMPL(prefix, __COUNTER__)
#define RELAY_UNIQUE_VAR_NAME_IMPL(prefix, counter) RELAY_UNIQUE_VAR_NAME_CONCAT(prefix, counter)
#define RELAY_UNIQUE_VAR_NAME_CONCAT(prefix, counter) prefix##counter

#define RELAY_DEFER_IMPL(varname, content)                                                         \
    auto varname = ::relay::make_deferred([&]() { content })
#define RELAY_DEFER(content) RELAY_DEFER_IMPL(RELAY_UNIQUE_VAR_NAME(relay_deferred_holder_), content)
