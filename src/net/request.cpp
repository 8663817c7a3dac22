#include "net/request.hpp"

#include <sstream>

namespace relay {

request::request(std::shared_ptr<task_delegate> delegate) : m_delegate(std::move(delegate)) {}

url_request request::original_request() const {
    return m_delegate->task()->original_request();
}

std::optional<http_response> request::received_response() const {
    return m_delegate->task()->response();
}

progress_snapshot request::progress() const {
    return m_delegate->progress();
}

request& request::authenticate(const std::string& user, const std::string& password,
                               credential_persistence persistence) {
    return authenticate(relay::credential(user, password, persistence));
}

request& request::authenticate(relay::credential value) {
    m_delegate->set_credential(std::move(value));
    return *this;
}

request& request::on_progress(progress_handler handler) {
    m_delegate->set_progress_handler(std::move(handler));
    return *this;
}

request& request::validate() {
    return validate(default_validation());
}

request& request::validate(validation predicate) {
    std::shared_ptr<task_delegate> delegate = m_delegate;
    delegate->queue()->async([delegate, predicate = std::move(predicate)] {
        // Nothing to judge without a response, and an earlier error already decides the outcome
        if (delegate->terminal_error())
            return;
        std::optional<http_response> response = delegate->task()->response();
        if (!response)
            return;

        if (!predicate(delegate->task()->original_request(), *response))
            delegate->record_error(relay::error::validation_failed());
    });
    return *this;
}

request& request::validate_status(std::vector<int> acceptable) {
    return validate(status_code_validation(std::move(acceptable)));
}

request& request::validate_content_type(std::vector<std::string> acceptable) {
    return validate(content_type_validation(std::move(acceptable)));
}

request& request::response(response_handler<std::string> handler) {
    return response_data(std::move(handler));
}

request& request::response_data(response_handler<std::string> handler,
                                std::shared_ptr<executor> handler_executor) {
    return response(data_serializer(), std::move(handler), std::move(handler_executor));
}

request& request::response_string(response_handler<std::string> handler,
                                  std::optional<std::string> encoding,
                                  std::shared_ptr<executor> handler_executor) {
    return response(string_serializer(std::move(encoding)), std::move(handler),
                    std::move(handler_executor));
}

request& request::response_json(response_handler<nlohmann::json> handler, json_options options,
                                std::shared_ptr<executor> handler_executor) {
    return response(json_serializer(options), std::move(handler), std::move(handler_executor));
}

request& request::response_property_list(response_handler<nlohmann::json> handler,
                                         plist_options options,
                                         std::shared_ptr<executor> handler_executor) {
    return response(property_list_serializer(options), std::move(handler),
                    std::move(handler_executor));
}

request& request::resume() {
    m_delegate->task()->resume();
    return *this;
}

request& request::suspend() {
    m_delegate->task()->suspend();
    return *this;
}

request& request::cancel() {
    m_delegate->cancel();
    return *this;
}

std::string request::description() const {
    url_request original = original_request();
    std::ostringstream oss;
    oss << method_name(original.method) << " " << original.url;
    if (auto response = received_response())
        oss << " (" << response->status_code << ")";
    return oss.str();
}

} // namespace relay
