#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <random>
#include <stdexcept>
#include <thread>
#include <vector>

#include "fake_transport.hpp"
#include "net/session_delegate.hpp"

using namespace relay;
using relay::testing::countdown;
using relay::testing::fake_task;
using relay::testing::fake_transport;

namespace {
class SessionDelegateTest : public ::testing::Test {
protected:
    SessionDelegateTest()
        : storage(std::make_shared<memory_credential_storage>()),
          router(std::make_shared<session_delegate>(std::make_shared<inline_executor>(), storage)),
          transport(std::make_shared<fake_transport>()) {
        transport->set_listener(router);
    }

    std::shared_ptr<fake_task> create(task_kind kind = task_kind::data) {
        url_request request(http_method::get, "https://example.com/item");
        std::shared_ptr<transport_task> created;
        switch (kind) {
        case task_kind::data:
            created = transport->create_data_task(request);
            break;
        case task_kind::upload:
            created = transport->create_upload_task(request, upload_source::from_data("body"));
            break;
        case task_kind::download:
            created = transport->create_download_task(request);
            break;
        }
        return std::static_pointer_cast<fake_task>(created);
    }

    std::shared_ptr<task_delegate> register_delegate(const std::shared_ptr<fake_task>& task) {
        auto delegate = make_task_delegate(task, std::make_shared<inline_executor>());
        router->add(delegate);
        return delegate;
    }

    std::shared_ptr<memory_credential_storage> storage;
    std::shared_ptr<session_delegate> router;
    std::shared_ptr<fake_transport> transport;
};
} // namespace

TEST_F(SessionDelegateTest, RegistryRejectsDuplicates) {
    auto task = create();
    auto delegate = register_delegate(task);

    EXPECT_EQ(router->find(task->id()), delegate);
    EXPECT_EQ(router->size(), 1u);
    EXPECT_THROW(router->add(make_task_delegate(task, std::make_shared<inline_executor>())),
                 std::logic_error);
    EXPECT_EQ(router->find(task->id()), delegate);

    router->remove(task->id());
    EXPECT_EQ(router->find(task->id()), nullptr);
    EXPECT_EQ(router->size(), 0u);
}

TEST_F(SessionDelegateTest, RoutesEventsToTheRegisteredDelegate) {
    auto first = create();
    auto second = create();
    auto first_delegate = register_delegate(first);
    auto second_delegate = register_delegate(second);

    transport->respond(*first, 200);
    transport->respond(*second, 200);
    transport->send_data(*first, "first");
    transport->send_data(*second, "second");
    transport->send_data(*first, "-more");

    EXPECT_EQ(first_delegate->data(), std::optional<std::string>("first-more"));
    EXPECT_EQ(second_delegate->data(), std::optional<std::string>("second"));
}

TEST_F(SessionDelegateTest, CompletionIsForwardedBeforeRemoval) {
    auto task = create();
    auto delegate = register_delegate(task);

    bool registered_during_completion = false;
    delegate->queue()->async([&] {
        registered_during_completion = router->find(task->id()) != nullptr;
    });

    transport->complete(*task);

    EXPECT_TRUE(registered_during_completion);
    EXPECT_TRUE(delegate->is_completed());
    EXPECT_EQ(router->find(task->id()), nullptr);
}

TEST_F(SessionDelegateTest, UnknownTasksUseSessionHooks) {
    auto task = create();

    std::string received;
    std::optional<relay::error> completion_error;
    bool completed = false;
    router->hooks.data_task_did_receive_data = [&](transport_task&, std::string_view chunk) {
        received.append(chunk);
    };
    router->hooks.task_did_complete = [&](transport_task&,
                                          const std::optional<relay::error>& error) {
        completed = true;
        completion_error = error;
    };

    transport->send_data(*task, "orphan");
    transport->complete(*task, relay::error(error_kind::transport, 6, "could not resolve host"));

    EXPECT_EQ(received, "orphan");
    EXPECT_TRUE(completed);
    ASSERT_TRUE(completion_error);
    EXPECT_EQ(completion_error->code, 6);
}

TEST_F(SessionDelegateTest, RedirectForUnknownTaskFollowsByDefault) {
    auto task = create();

    auto followed = transport->redirect(*task, 302, "https://example.com/elsewhere");
    ASSERT_TRUE(followed);
    EXPECT_EQ(task->current_request().url, "https://example.com/elsewhere");

    router->hooks.task_will_redirect = [](transport_task&, const http_response&,
                                          const url_request&) {
        return std::optional<url_request>();
    };
    EXPECT_FALSE(transport->redirect(*task, 302, "https://example.com/again"));
    EXPECT_EQ(task->current_request().url, "https://example.com/elsewhere");
}

TEST_F(SessionDelegateTest, DelegateHookWinsOverSessionHook) {
    auto task = create();
    auto delegate = register_delegate(task);

    bool session_hook_called = false;
    router->hooks.task_will_redirect = [&](transport_task&, const http_response&,
                                           const url_request& proposed) {
        session_hook_called = true;
        return std::optional<url_request>(proposed);
    };
    delegate->hooks.will_redirect = [](const http_response&, const url_request& proposed) {
        url_request stripped = proposed;
        stripped.headers.erase("Authorization");
        return std::optional<url_request>(stripped);
    };

    ASSERT_TRUE(transport->redirect(*task, 301, "https://other.example.com/"));
    EXPECT_FALSE(session_hook_called);
}

TEST_F(SessionDelegateTest, ChallengeForUnknownTaskFallsBackToSession) {
    auto task = create();
    auth_challenge challenge;
    challenge.space.host = "example.com";

    EXPECT_EQ(transport->challenge(*task, challenge).disposition,
              auth_disposition::perform_default_handling);

    router->hooks.did_receive_challenge = [](const auth_challenge&) {
        return challenge_result(auth_disposition::cancel_challenge);
    };
    EXPECT_EQ(transport->challenge(*task, challenge).disposition,
              auth_disposition::cancel_challenge);
    EXPECT_EQ(router->did_receive_session_challenge(challenge).disposition,
              auth_disposition::cancel_challenge);
}

TEST_F(SessionDelegateTest, ChallengeConsultsCredentialStorage) {
    auto task = create();
    register_delegate(task);

    auth_challenge challenge;
    challenge.space.host = "example.com";
    challenge.space.port = 443;
    challenge.space.protocol = "https";
    challenge.space.realm = "api";
    storage->set_default_credential(challenge.space, credential("stored", "pw"));

    challenge_result result = transport->challenge(*task, challenge);
    EXPECT_EQ(result.disposition, auth_disposition::use_credential);
    ASSERT_TRUE(result.credential);
    EXPECT_EQ(result.credential->user, "stored");
}

TEST_F(SessionDelegateTest, BecomeDownloadRegistersADownloadDelegate) {
    auto task = create();
    auto delegate = register_delegate(task);
    delegate->set_credential(credential("user", "pw"));
    delegate->hooks.did_receive_response = [](const http_response&) {
        return response_disposition::become_download;
    };

    std::shared_ptr<download_task_delegate> converted;
    delegate->hooks.did_become_download_task =
        [&](const std::shared_ptr<download_task_delegate>& download) { converted = download; };

    ASSERT_EQ(transport->respond(*task, 200), response_disposition::become_download);
    auto download = transport->become_download(*task);

    ASSERT_TRUE(converted);
    EXPECT_EQ(converted->task()->id(), download->id());
    EXPECT_EQ(router->find(download->id()), converted);
    ASSERT_TRUE(converted->attached_credential());
    EXPECT_EQ(converted->attached_credential()->user, "user");

    // The data task is done; the transfer continues on the download task
    EXPECT_TRUE(delegate->is_completed());
    EXPECT_FALSE(delegate->terminal_error());
    EXPECT_EQ(router->find(task->id()), nullptr);

    transport->write_data(*download, 10, 10);
    EXPECT_EQ(converted->progress().completed_unit_count, 10);
}

TEST_F(SessionDelegateTest, InvalidationCompletesOrphans) {
    auto first = create();
    auto second = create(task_kind::download);
    auto first_delegate = register_delegate(first);
    auto second_delegate = register_delegate(second);

    bool invalidated = false;
    router->hooks.did_become_invalid = [&](const std::optional<relay::error>& error) {
        invalidated = true;
        EXPECT_FALSE(error);
    };

    router->did_become_invalid(std::nullopt);

    EXPECT_TRUE(invalidated);
    EXPECT_EQ(router->size(), 0u);
    EXPECT_TRUE(first_delegate->is_completed());
    EXPECT_TRUE(second_delegate->is_completed());
    ASSERT_TRUE(first_delegate->terminal_error());
    EXPECT_EQ(first_delegate->terminal_error()->kind, error_kind::cancelled);
}

TEST_F(SessionDelegateTest, BackgroundEventsHook) {
    int calls = 0;
    router->did_finish_background_events();
    router->hooks.did_finish_background_events = [&] { ++calls; };
    router->did_finish_background_events();
    EXPECT_EQ(calls, 1);
}

TEST(SessionDelegateStress, ConcurrentIssueAndCompletionLeavesRegistryEmpty) {
    constexpr int THREADS = 8;
    constexpr int PER_THREAD = 100;
    constexpr int TOTAL = THREADS * PER_THREAD;

    auto pool = std::make_shared<thread_pool>(4);
    auto router = std::make_shared<session_delegate>(pool, nullptr);
    auto transport = std::make_shared<fake_transport>();
    transport->set_listener(router);

    countdown handlers(TOTAL);
    std::atomic<int> handler_runs{0};

    std::mutex issued_mutex;
    std::vector<std::pair<std::shared_ptr<fake_task>, std::shared_ptr<task_delegate>>> issued;

    std::vector<std::thread> issuers;
    for (int t = 0; t < THREADS; ++t) {
        issuers.emplace_back([&] {
            for (int i = 0; i < PER_THREAD; ++i) {
                auto task = std::static_pointer_cast<fake_task>(
                    transport->create_data_task(url_request(http_method::get, "https://example.com/")));
                auto delegate = make_task_delegate(task, pool);
                router->add(delegate);
                delegate->queue()->async([&] {
                    handler_runs.fetch_add(1);
                    handlers.signal();
                });

                std::lock_guard lock(issued_mutex);
                issued.emplace_back(task, delegate);
            }
        });
    }
    for (auto& thread : issuers)
        thread.join();
    ASSERT_EQ(router->size(), static_cast<std::size_t>(TOTAL));

    std::mt19937 rng(::testing::UnitTest::GetInstance()->random_seed());
    std::shuffle(issued.begin(), issued.end(), rng);

    std::vector<std::thread> completers;
    for (int t = 0; t < THREADS; ++t) {
        completers.emplace_back([&, t] {
            for (std::size_t i = t; i < issued.size(); i += THREADS) {
                fake_task& task = *issued[i].first;
                transport->respond(task, 200);
                transport->send_data(task, "payload");
                transport->complete(task);
                // A duplicate completion arriving from the transport is ignored
                router->did_complete(task, std::nullopt);
            }
        });
    }
    for (auto& thread : completers)
        thread.join();

    EXPECT_EQ(router->size(), 0u);
    ASSERT_TRUE(handlers.wait());
    EXPECT_EQ(handler_runs.load(), TOTAL);
    for (const auto& entry : issued) {
        EXPECT_TRUE(entry.second->is_completed());
        EXPECT_EQ(entry.second->data(), std::optional<std::string>("payload"));
    }
}
