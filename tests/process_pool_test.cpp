#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <set>
#include <sys/wait.h>
#include <unistd.h>

#include "core/orchestrator/worker_messages.hpp"
#include "infra/process_pool/process_pool.hpp"

using objcp::infra::ProcessPool;

TEST(ProcessPoolTest, FramesSurviveAPipe)
{
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    ASSERT_TRUE(objcp::infra::write_frame(fds[1], "first"));
    ASSERT_TRUE(objcp::infra::write_frame(fds[1], ""));
    ::close(fds[1]);

    EXPECT_EQ(objcp::infra::read_frame(fds[0]).value_or("?"), "first");
    EXPECT_EQ(objcp::infra::read_frame(fds[0]).value_or("?"), "");
    EXPECT_FALSE(objcp::infra::read_frame(fds[0]).has_value());
    ::close(fds[0]);
}

TEST(ProcessPoolTest, EveryJobProducesOneResult)
{
    std::mutex mutex;
    std::set<std::string> results;
    std::set<pid_t> workers;

    ProcessPool pool{
        3, 2,
        [](const std::string& job) { return job + ":" + std::to_string(::getpid()); },
        [&](const std::string& result) {
            std::lock_guard lock(mutex);
            const auto colon = result.find(':');
            results.insert(result.substr(0, colon));
            workers.insert(static_cast<pid_t>(std::stol(result.substr(colon + 1))));
            return true;
        },
    };
    ASSERT_TRUE(pool.start().has_value());
    for (int i = 0; i < 30; ++i) {
        ASSERT_TRUE(pool.dispatch("job" + std::to_string(i)).has_value());
    }
    ASSERT_TRUE(pool.finish().has_value());

    EXPECT_EQ(results.size(), 30u);
    EXPECT_FALSE(workers.contains(::getpid()));
    EXPECT_EQ(workers.size(), 3u);
}

TEST(ProcessPoolTest, StoppingSkipsJobsNotYetStarted)
{
    std::atomic<int> received{0};
    ProcessPool pool{
        1, 1,
        [](const std::string& job) { ::usleep(20'000); return job; },
        [&](const std::string&) {
            ++received;
            return false;   // first result stops the pool
        },
    };
    ASSERT_TRUE(pool.start().has_value());
    for (int i = 0; i < 20; ++i) {
        ASSERT_TRUE(pool.dispatch("job").has_value());
    }
    ASSERT_TRUE(pool.finish().has_value());
    EXPECT_TRUE(pool.stopped());
    EXPECT_LT(received.load(), 20);
}

TEST(ProcessPoolTest, SharedFlagIsSeenByForkedChild)
{
    auto flag = objcp::infra::SharedFlag::create();
    ASSERT_TRUE(flag.has_value());
    EXPECT_FALSE(flag->is_set());

    const pid_t pid = ::fork();
    ASSERT_NE(pid, -1);
    if (pid == 0) {
        // Wait for the parent, then report what the child sees.
        for (int i = 0; i < 500 && !flag->is_set(); ++i) {
            ::usleep(10000);
        }
        ::_exit(flag->is_set() ? 0 : 1);
    }

    flag->set();
    int status = 0;
    ASSERT_EQ(::waitpid(pid, &status, 0), pid);
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
}

TEST(ProcessPoolTest, StopRequestedBeforeStartReachesWorkers)
{
    std::atomic<int> results{0};
    ProcessPool pool{1, 1,
        [](const std::string& job) { return job; },
        [&](const std::string&) { ++results; return true; }};
    pool.stop_new_work();
    EXPECT_TRUE(pool.stopped());
    EXPECT_FALSE(pool.dispatch("before start").has_value());

    ASSERT_TRUE(pool.start().has_value());
    ASSERT_TRUE(pool.dispatch("job").has_value());
    ASSERT_TRUE(pool.finish().has_value());
    EXPECT_EQ(results.load(), 0);
}

TEST(WorkerMessagesTest, ShapeAndEventSurviveEncoding)
{
    const objcp::core::NamingShape shape{
        .source = "gs://b/dir, with comma",
        .expanded_source = "gs://b/dir, with comma/x: y",
        .names_container = true,
        .is_multi_source_request = true,
        .destination_had_existing_container = false,
    };
    auto decoded = objcp::core::decode_shape(objcp::core::encode_shape(shape));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->source, shape.source);
    EXPECT_EQ(decoded->expanded_source, shape.expanded_source);
    EXPECT_TRUE(decoded->names_container);
    ASSERT_TRUE(decoded->destination_had_existing_container.has_value());
    EXPECT_FALSE(*decoded->destination_had_existing_container);

    const objcp::core::CompletionEvent event{
        .tag = "failure",
        .bytes_transferred = 42,
        .elapsed_seconds = 0.25,
        .aborts_run = true,
        .error_code = objcp::infra::ErrorCode::TransferFailed,
        .message = "Error copying x: boom",
    };
    auto back = objcp::core::decode_event(objcp::core::encode_event(event));
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->tag, "failure");
    EXPECT_EQ(back->bytes_transferred, 42u);
    EXPECT_DOUBLE_EQ(back->elapsed_seconds, 0.25);
    EXPECT_TRUE(back->aborts_run);
    EXPECT_EQ(back->error_code, objcp::infra::ErrorCode::TransferFailed);
    EXPECT_EQ(back->message, "Error copying x: boom");

    EXPECT_FALSE(objcp::core::decode_event("not: [valid").has_value());
}
