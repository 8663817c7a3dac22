#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <vector>

#include "fake_transport.hpp"
#include "net/task_delegate.hpp"

using namespace relay;
using relay::testing::fake_task;

namespace {
std::shared_ptr<fake_task> make_fake(task_kind kind, task_id id = 1) {
    return std::make_shared<fake_task>(id, kind,
                                       url_request(http_method::get, "https://example.com/file"),
                                       std::weak_ptr<transport_listener>());
}

template <typename DelegateT>
std::shared_ptr<DelegateT> make_delegate(task_kind kind) {
    return std::make_shared<DelegateT>(make_fake(kind), std::make_shared<inline_executor>());
}

auth_challenge challenge_for(auth_method method, int previous_failures = 0) {
    auth_challenge challenge;
    challenge.space.host = "example.com";
    challenge.space.port = 443;
    challenge.space.protocol = "https";
    challenge.space.realm = "files";
    challenge.space.auth_method = method;
    challenge.previous_failure_count = previous_failures;
    return challenge;
}

struct progress_event {
    std::int64_t bytes;
    std::int64_t total;
    std::int64_t expected;
};

class scratch_directory {
public:
    scratch_directory() {
        m_path = std::filesystem::temp_directory_path() /
                 ("relay-test-" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                  "-" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(m_path);
        std::filesystem::create_directories(m_path);
    }

    ~scratch_directory() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    const std::filesystem::path& path() const {
        return m_path;
    }

    std::filesystem::path write(const std::string& name, const std::string& content) const {
        std::filesystem::path file = m_path / name;
        std::ofstream(file, std::ios::binary) << content;
        return file;
    }

private:
    std::filesystem::path m_path;
};
} // namespace

TEST(TaskDelegate, FactoryPicksVariantByKind) {
    auto executor = std::make_shared<inline_executor>();
    EXPECT_EQ(make_task_delegate(make_fake(task_kind::data), executor)->kind(), task_kind::data);
    EXPECT_EQ(make_task_delegate(make_fake(task_kind::upload), executor)->kind(),
              task_kind::upload);
    EXPECT_EQ(make_task_delegate(make_fake(task_kind::download), executor)->kind(),
              task_kind::download);
}

TEST(TaskDelegate, DataAccumulatesChunksAndReportsProgress) {
    auto delegate = make_delegate<data_task_delegate>(task_kind::data);
    std::vector<progress_event> events;
    delegate->set_progress_handler([&](std::int64_t bytes, std::int64_t total, std::int64_t expected) {
        events.push_back({bytes, total, expected});
    });

    http_response response;
    response.status_code = 200;
    response.expected_content_length = 9;
    EXPECT_EQ(delegate->did_receive_response(response), response_disposition::allow);
    EXPECT_EQ(delegate->expected_content_length(), 9);

    delegate->did_receive_data("abc");
    delegate->did_receive_data("defg");
    delegate->did_receive_data("hi");

    EXPECT_EQ(delegate->data(), std::optional<std::string>("abcdefghi"));
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[1].bytes, 4);
    EXPECT_EQ(events[1].total, 7);
    EXPECT_EQ(events[2].total, 9);
    EXPECT_EQ(events[2].expected, 9);

    progress_snapshot progress = delegate->progress();
    EXPECT_EQ(progress.completed_unit_count, 9);
    EXPECT_EQ(progress.total_unit_count, 9);
    EXPECT_DOUBLE_EQ(progress.fraction(), 1.0);
}

TEST(TaskDelegate, UnknownLengthKeepsTotalUnknown) {
    auto delegate = make_delegate<data_task_delegate>(task_kind::data);
    delegate->did_receive_response(http_response());
    delegate->did_receive_data("abc");

    EXPECT_EQ(delegate->progress().total_unit_count, UNKNOWN_LENGTH);
    EXPECT_EQ(delegate->progress().completed_unit_count, 3);
    EXPECT_DOUBLE_EQ(delegate->progress().fraction(), 0.0);
}

TEST(TaskDelegate, ChunkHookSeesDataBeforeAccumulation) {
    auto delegate = make_delegate<data_task_delegate>(task_kind::data);
    std::vector<std::string> chunks;
    delegate->hooks.did_receive_data = [&](std::string_view chunk) {
        chunks.emplace_back(chunk);
    };

    delegate->did_receive_data("one");
    delegate->did_receive_data("two");

    EXPECT_EQ(chunks, (std::vector<std::string>{"one", "two"}));
    EXPECT_EQ(delegate->data(), std::optional<std::string>("onetwo"));
}

TEST(TaskDelegate, ResponseHookChoosesDisposition) {
    auto delegate = make_delegate<data_task_delegate>(task_kind::data);
    delegate->hooks.did_receive_response = [](const http_response&) {
        return response_disposition::become_download;
    };
    EXPECT_EQ(delegate->did_receive_response(http_response()),
              response_disposition::become_download);
}

TEST(TaskDelegate, CompletionOpensQueueExactlyOnce) {
    auto delegate = make_delegate<data_task_delegate>(task_kind::data);
    int runs = 0;
    delegate->queue()->async([&] { ++runs; });
    EXPECT_EQ(runs, 0);
    EXPECT_FALSE(delegate->is_completed());

    delegate->did_complete(std::nullopt);
    EXPECT_EQ(runs, 1);
    EXPECT_TRUE(delegate->is_completed());

    delegate->did_complete(relay::error(error_kind::transport, 7, "late duplicate"));
    EXPECT_EQ(runs, 1);
    EXPECT_FALSE(delegate->terminal_error());
}

TEST(TaskDelegate, FirstErrorWins) {
    auto delegate = make_delegate<data_task_delegate>(task_kind::data);
    EXPECT_TRUE(delegate->record_error(relay::error(error_kind::transport, 28, "timed out")));
    EXPECT_FALSE(delegate->record_error(relay::error::validation_failed()));

    delegate->did_complete(relay::error(error_kind::transport, 56, "connection reset"));
    ASSERT_TRUE(delegate->terminal_error());
    EXPECT_EQ(delegate->terminal_error()->code, 28);
}

TEST(TaskDelegate, RedirectDefaultsToProposedRequest) {
    auto delegate = make_delegate<data_task_delegate>(task_kind::data);
    url_request proposed(http_method::get, "https://example.com/moved");

    auto followed = delegate->will_redirect(http_response(), proposed);
    ASSERT_TRUE(followed);
    EXPECT_EQ(followed->url, "https://example.com/moved");

    delegate->hooks.will_redirect = [](const http_response&, const url_request&) {
        return std::optional<url_request>();
    };
    EXPECT_FALSE(delegate->will_redirect(http_response(), proposed));
}

TEST(TaskDelegate, ChallengeRefusesRepeatedFailure) {
    auto delegate = make_delegate<data_task_delegate>(task_kind::data);
    delegate->set_credential(credential("user", "secret"));

    challenge_result result =
        delegate->did_receive_challenge(challenge_for(auth_method::http_basic, 1), nullptr);
    EXPECT_EQ(result.disposition, auth_disposition::cancel_challenge);
    EXPECT_FALSE(result.credential);
}

TEST(TaskDelegate, ChallengeAcceptsServerTrust) {
    auto delegate = make_delegate<data_task_delegate>(task_kind::data);
    auth_challenge challenge = challenge_for(auth_method::server_trust);
    challenge.space.server_trust = "trust-ref";

    challenge_result result = delegate->did_receive_challenge(challenge, nullptr);
    EXPECT_EQ(result.disposition, auth_disposition::use_credential);
    ASSERT_TRUE(result.credential);
    EXPECT_EQ(result.credential->trust, std::optional<std::string>("trust-ref"));
}

TEST(TaskDelegate, ChallengePrefersAttachedCredentialOverStorage) {
    auto delegate = make_delegate<data_task_delegate>(task_kind::data);
    memory_credential_storage storage;
    auth_challenge challenge = challenge_for(auth_method::http_digest);
    storage.set_default_credential(challenge.space, credential("stored", "pw"));

    challenge_result from_storage = delegate->did_receive_challenge(challenge, &storage);
    EXPECT_EQ(from_storage.disposition, auth_disposition::use_credential);
    ASSERT_TRUE(from_storage.credential);
    EXPECT_EQ(from_storage.credential->user, "stored");

    delegate->set_credential(credential("attached", "pw"));
    challenge_result attached = delegate->did_receive_challenge(challenge, &storage);
    ASSERT_TRUE(attached.credential);
    EXPECT_EQ(attached.credential->user, "attached");
}

TEST(TaskDelegate, ChallengeWithoutCredentialUsesDefaultHandling) {
    auto delegate = make_delegate<data_task_delegate>(task_kind::data);
    memory_credential_storage storage;

    challenge_result result =
        delegate->did_receive_challenge(challenge_for(auth_method::http_basic), &storage);
    EXPECT_EQ(result.disposition, auth_disposition::perform_default_handling);
}

TEST(TaskDelegate, ChallengeHookOverridesPolicy) {
    auto delegate = make_delegate<data_task_delegate>(task_kind::data);
    delegate->hooks.did_receive_challenge = [](const auth_challenge&) {
        return challenge_result(auth_disposition::reject_protection_space);
    };

    challenge_result result =
        delegate->did_receive_challenge(challenge_for(auth_method::server_trust), nullptr);
    EXPECT_EQ(result.disposition, auth_disposition::reject_protection_space);
}

TEST(TaskDelegate, UploadProgressNeverMovesBackwards) {
    auto delegate = make_delegate<upload_task_delegate>(task_kind::upload);
    std::vector<std::int64_t> completed;
    delegate->set_progress_handler([&](std::int64_t, std::int64_t, std::int64_t) {
        completed.push_back(delegate->progress().completed_unit_count);
    });

    delegate->did_send_body_data(10, 10, 100);
    delegate->did_send_body_data(30, 40, 100);
    // A retry replays the body from the start
    delegate->did_send_body_data(5, 5, 100);
    delegate->did_send_body_data(60, 100, 100);

    EXPECT_EQ(completed, (std::vector<std::int64_t>{10, 40, 40, 100}));
}

TEST(TaskDelegate, UploadProgressIgnoresReceivedBytes) {
    auto delegate = make_delegate<upload_task_delegate>(task_kind::upload);
    delegate->did_send_body_data(50, 50, 50);

    http_response response;
    response.expected_content_length = 1000;
    delegate->did_receive_response(response);
    delegate->did_receive_data("reply");

    EXPECT_EQ(delegate->progress().completed_unit_count, 50);
    EXPECT_EQ(delegate->progress().total_unit_count, 50);
    EXPECT_EQ(delegate->data(), std::optional<std::string>("reply"));
}

TEST(TaskDelegate, DownloadResumeCountsFromOffset) {
    auto delegate = make_delegate<download_task_delegate>(task_kind::download);
    std::int64_t resumed_at = 0;
    delegate->hooks.did_resume_at_offset = [&](std::int64_t offset, std::int64_t) {
        resumed_at = offset;
    };

    delegate->did_resume_at_offset(500, 1000);
    EXPECT_EQ(resumed_at, 500);
    EXPECT_EQ(delegate->progress().completed_unit_count, 500);

    delegate->did_write_data(100, 600, 1000);
    EXPECT_EQ(delegate->progress().completed_unit_count, 600);
    EXPECT_EQ(delegate->progress().total_unit_count, 1000);
}

TEST(TaskDelegate, DownloadMovesFileToDestination) {
    scratch_directory scratch;
    std::filesystem::path temporary = scratch.write("partial.tmp", "payload");
    std::filesystem::path target = scratch.path() / "final.bin";

    auto delegate = make_delegate<download_task_delegate>(task_kind::download);
    delegate->hooks.did_finish_downloading = [&](const std::filesystem::path& location,
                                                 const http_response&) {
        EXPECT_TRUE(location == temporary);
        return target;
    };

    delegate->did_finish_downloading(temporary);

    EXPECT_FALSE(delegate->terminal_error());
    ASSERT_TRUE(delegate->destination());
    EXPECT_TRUE(*delegate->destination() == target);
    EXPECT_TRUE(std::filesystem::exists(target));
    EXPECT_FALSE(std::filesystem::exists(temporary));
}

TEST(TaskDelegate, DownloadMoveFailureIsTerminalError) {
    scratch_directory scratch;
    std::filesystem::path temporary = scratch.write("partial.tmp", "payload");

    auto delegate = make_delegate<download_task_delegate>(task_kind::download);
    delegate->hooks.did_finish_downloading = [&](const std::filesystem::path&,
                                                 const http_response&) {
        return scratch.path() / "missing-directory" / "final.bin";
    };

    delegate->did_finish_downloading(temporary);
    delegate->did_complete(std::nullopt);

    ASSERT_TRUE(delegate->terminal_error());
    EXPECT_EQ(delegate->terminal_error()->kind, error_kind::file_system);
    EXPECT_FALSE(delegate->destination());
}

TEST(TaskDelegate, DownloadWithoutDestinationLeavesFile) {
    scratch_directory scratch;
    std::filesystem::path temporary = scratch.write("partial.tmp", "payload");

    auto delegate = make_delegate<download_task_delegate>(task_kind::download);
    delegate->did_finish_downloading(temporary);

    EXPECT_FALSE(delegate->destination());
    EXPECT_TRUE(std::filesystem::exists(temporary));
}

TEST(TaskDelegate, ExplicitDownloadCancelWithResumeDataIsNotAnError) {
    auto task = make_fake(task_kind::download);
    auto delegate =
        std::make_shared<download_task_delegate>(task, std::make_shared<inline_executor>());
    task->set_bytes_written(250);

    delegate->cancel();
    delegate->did_complete(relay::error::cancelled());

    EXPECT_FALSE(delegate->terminal_error());
    ASSERT_TRUE(delegate->resume_data());
    EXPECT_EQ(delegate->data(), delegate->resume_data());
}

TEST(TaskDelegate, ExplicitDownloadCancelWithoutResumeDataIsRecorded) {
    auto delegate = make_delegate<download_task_delegate>(task_kind::download);
    delegate->cancel();
    delegate->did_complete(relay::error::cancelled());

    // Nothing was written, so there is nothing to resume and the cancel stays visible
    EXPECT_FALSE(delegate->resume_data());
    ASSERT_TRUE(delegate->terminal_error());
    EXPECT_EQ(delegate->terminal_error()->kind, error_kind::cancelled);
}

TEST(TaskDelegate, DownloadFailureWithoutCancelIsRecorded) {
    auto delegate = make_delegate<download_task_delegate>(task_kind::download);
    delegate->did_complete(relay::error::cancelled());

    ASSERT_TRUE(delegate->terminal_error());
    EXPECT_EQ(delegate->terminal_error()->kind, error_kind::cancelled);
}

TEST(TaskDelegate, DataCancelIsImmediate) {
    auto task = make_fake(task_kind::data);
    auto delegate = std::make_shared<data_task_delegate>(task, std::make_shared<inline_executor>());

    delegate->cancel();
    EXPECT_EQ(task->cancel_count(), 1);
    EXPECT_EQ(task->state(), task_state::completed);
}
