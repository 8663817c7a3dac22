#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "net/auth.hpp"
#include "net/error.hpp"
#include "net/executor.hpp"
#include "net/http.hpp"
#include "net/serializers.hpp"
#include "net/task_delegate.hpp"
#include "net/validation.hpp"

namespace relay {

// Everything a response handler gets: the exchange, the body, the typed value and the error.
template <typename T>
struct response_result {
    url_request request;
    std::optional<http_response> response;
    std::optional<std::string> data;
    std::optional<T> value;
    std::optional<relay::error> error;

    // An empty body is a success with no value
    bool is_success() const {
        return !error;
    }
};

template <typename T>
using response_handler = std::function<void(const response_result<T>&)>;

namespace detail {
// Keeps a parameter out of template argument deduction so lambdas convert to it
template <typename T>
struct non_deduced {
    using type = T;
};
} // namespace detail

// Handle on one issued request.
//
// Copies share the same underlying delegate. Validation and response handlers are queued in
// attachment order and run once the transport reports completion; attaching after completion
// runs the handler right away, still in order.
class request {
public:
    explicit request(std::shared_ptr<task_delegate> delegate);

    const std::shared_ptr<task_delegate>& delegate() const {
        return m_delegate;
    }

    const std::shared_ptr<transport_task>& task() const {
        return m_delegate->task();
    }

    url_request original_request() const;
    std::optional<http_response> received_response() const;
    progress_snapshot progress() const;

    request& authenticate(const std::string& user, const std::string& password,
                          credential_persistence persistence = credential_persistence::for_session);
    request& authenticate(relay::credential value);

    // Called with (bytes, total bytes, total expected) as data is sent, received or written.
    request& on_progress(progress_handler handler);

    // Success status, and a Content-Type matching the request's Accept header.
    request& validate();
    request& validate(validation predicate);
    request& validate_status(std::vector<int> acceptable);
    request& validate_content_type(std::vector<std::string> acceptable);

    // `handler` runs on `handler_executor` if given, else on the completion queue's executor.
    template <typename T>
    request& response(serializer<T> serializer,
                      typename detail::non_deduced<response_handler<T>>::type handler,
                      std::shared_ptr<executor> handler_executor = nullptr);

    request& response(response_handler<std::string> handler);
    request& response_data(response_handler<std::string> handler,
                           std::shared_ptr<executor> handler_executor = nullptr);
    request& response_string(response_handler<std::string> handler,
                             std::optional<std::string> encoding = std::nullopt,
                             std::shared_ptr<executor> handler_executor = nullptr);
    request& response_json(response_handler<nlohmann::json> handler,
                           json_options options = json_options(),
                           std::shared_ptr<executor> handler_executor = nullptr);
    request& response_property_list(response_handler<nlohmann::json> handler,
                                    plist_options options = plist_options(),
                                    std::shared_ptr<executor> handler_executor = nullptr);

    request& resume();
    request& suspend();
    // Downloads keep resume data, available through delegate()->data() once completed.
    request& cancel();

    // "<METHOD> <url> (<status>)"
    std::string description() const;

private:
    std::shared_ptr<task_delegate> m_delegate;
};

template <typename T>
request& request::response(serializer<T> serializer,
                           typename detail::non_deduced<response_handler<T>>::type handler,
                           std::shared_ptr<executor> handler_executor) {
    std::shared_ptr<task_delegate> delegate = m_delegate;
    delegate->queue()->async([delegate, serializer = std::move(serializer),
                              handler = std::move(handler),
                              handler_executor = std::move(handler_executor)]() {
        auto result = std::make_shared<response_result<T>>();
        result->request = delegate->task()->original_request();
        result->response = delegate->task()->response();
        result->data = delegate->data();
        result->error = delegate->terminal_error();

        // A transport, validation or file error always wins over serialization
        if (!result->error) {
            serialized<T> output = serializer(result->request, result->response, result->data);
            result->value = std::move(output.value);
            result->error = std::move(output.error);
        }

        if (handler_executor)
            handler_executor->post([handler, result] { handler(*result); });
        else
            handler(*result);
    });
    return *this;
}

} // namespace relay
