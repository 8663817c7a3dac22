#include "net/auth.hpp"

namespace relay {

bool operator<(const protection_space& l, const protection_space& r) {
    // server_trust is per-connection state, not part of the key
    return std::tie(l.host, l.port, l.protocol, l.realm, l.auth_method) <
           std::tie(r.host, r.port, r.protocol, r.realm, r.auth_method);
}

credential credential::for_trust(const std::string& server_trust) {
    credential c;
    c.persistence = credential_persistence::none;
    c.trust = server_trust;
    return c;
}

void memory_credential_storage::set_default_credential(const protection_space& space,
                                                       credential value) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_credentials[space] = std::move(value);
}

void memory_credential_storage::remove(const protection_space& space) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_credentials.erase(space);
}

std::optional<credential> memory_credential_storage::default_credential(
    const protection_space& space) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_credentials.find(space);
    if (it == m_credentials.end())
        return std::nullopt;
    return it->second;
}

} // namespace relay
