#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>

#include "net/http.hpp"

namespace relay {

enum class auth_method {
    http_basic,
    http_digest,
    server_trust,
    other,
};

enum class credential_persistence {
    none,
    for_session,
    permanent,
};

struct protection_space {
    std::string host;
    int port;
    std::string protocol;
    std::string realm;
    relay::auth_method auth_method;
    // Opaque trust reference presented by the server, only for server_trust spaces
    std::string server_trust;

    protection_space() : port(0), auth_method(relay::auth_method::http_basic) {}
};

bool operator<(const protection_space& l, const protection_space& r);

struct credential {
    std::string user;
    std::string password;
    credential_persistence persistence;
    // Set when this credential accepts a presented server trust rather than a login
    std::optional<std::string> trust;

    credential() : persistence(credential_persistence::for_session) {}
    credential(std::string user, std::string password,
               credential_persistence persistence = credential_persistence::for_session)
        : user(std::move(user)), password(std::move(password)), persistence(persistence) {}

    static credential for_trust(const std::string& server_trust);
};

struct auth_challenge {
    protection_space space;
    int previous_failure_count;
    std::optional<http_response> failure_response;

    auth_challenge() : previous_failure_count(0) {}
};

enum class auth_disposition {
    use_credential,
    perform_default_handling,
    cancel_challenge,
    reject_protection_space,
};

struct challenge_result {
    auth_disposition disposition;
    std::optional<relay::credential> credential;

    challenge_result() : disposition(auth_disposition::perform_default_handling) {}
    challenge_result(auth_disposition disposition,
                     std::optional<relay::credential> credential = std::nullopt)
        : disposition(disposition), credential(std::move(credential)) {}
};

// Session-wide credential lookup consulted when a task has no credential of its own.
class credential_storage {
public:
    virtual ~credential_storage() = default;

    virtual std::optional<credential> default_credential(const protection_space& space) = 0;
};

class memory_credential_storage final : public credential_storage {
public:
    void set_default_credential(const protection_space& space, credential value);
    void remove(const protection_space& space);

    std::optional<credential> default_credential(const protection_space& space) override;

private:
    std::mutex m_mutex;
    std::map<protection_space, credential> m_credentials;
};

} // namespace relay
