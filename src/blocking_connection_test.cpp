#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "blocking_connection.hpp"
#include "memory_backend.hpp"
#include "task_runner.hpp"

using namespace bucketfs;

namespace {
    // Tracks how many backend calls overlap; each read holds the backend briefly
    class OverlapCountingBackend : public IBucketBackend {
    public:
        google::cloud::future<StatusOr<std::vector<RawObject>>> AsyncListObjects(
            const std::string&) override {
            return google::cloud::make_ready_future(
                StatusOr<std::vector<RawObject>>(std::vector<RawObject>{}));
        }

        google::cloud::future<StatusOr<std::string>> AsyncReadObject(
            const std::string&, const std::string& object_name) override {
            int now = ++in_flight;
            int seen = max_in_flight.load();
            while (now > seen && !max_in_flight.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            --in_flight;
            return google::cloud::make_ready_future(StatusOr<std::string>(object_name));
        }

        std::atomic<int> in_flight{0};
        std::atomic<int> max_in_flight{0};
    };

    // Throws instead of returning a future
    class ThrowingBackend : public IBucketBackend {
    public:
        google::cloud::future<StatusOr<std::vector<RawObject>>> AsyncListObjects(
            const std::string&) override {
            throw std::runtime_error("listing exploded");
        }

        google::cloud::future<StatusOr<std::string>> AsyncReadObject(
            const std::string&, const std::string&) override {
            throw std::runtime_error("read exploded");
        }
    };

    // Throws a value that is not a std::exception
    class NonStandardThrowingBackend : public IBucketBackend {
    public:
        google::cloud::future<StatusOr<std::vector<RawObject>>> AsyncListObjects(
            const std::string&) override {
            throw 42;
        }

        google::cloud::future<StatusOr<std::string>> AsyncReadObject(
            const std::string&, const std::string&) override {
            throw std::string("not an exception class");
        }
    };

    // Calls back into the connection from inside a backend operation
    class ReentrantBackend : public IBucketBackend {
    public:
        google::cloud::future<StatusOr<std::vector<RawObject>>> AsyncListObjects(
            const std::string&) override {
            return google::cloud::make_ready_future(
                StatusOr<std::vector<RawObject>>(std::vector<RawObject>{}));
        }

        google::cloud::future<StatusOr<std::string>> AsyncReadObject(
            const std::string& bucket_name, const std::string&) override {
            auto nested = connection->listObjects(bucket_name);
            nested_code = nested.status().code();
            return google::cloud::make_ready_future(StatusOr<std::string>(std::string("outer")));
        }

        BlockingConnection* connection = nullptr;
        StatusCode nested_code = StatusCode::kOk;
    };
}

// ============================================================================
// TaskRunner Tests
// ============================================================================

TEST(TaskRunnerTest, RunsTasksInSubmissionOrder) {
    std::vector<int> order;
    std::vector<std::future<void>> pending;
    {
        TaskRunner runner;
        for (int i = 0; i < 50; ++i) {
            pending.push_back(runner.submit([&order, i] { order.push_back(i); }));
        }
        for (auto& f : pending) {
            f.get();
        }
    }

    ASSERT_EQ(order.size(), 50u);
    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(order[i], i);
    }
}

TEST(TaskRunnerTest, ReturnsTaskResult) {
    TaskRunner runner;
    auto result = runner.submit([] { return std::string("done"); });
    EXPECT_EQ(result.get(), "done");
}

TEST(TaskRunnerTest, DestructorFinishesQueuedTasks) {
    std::atomic<int> completed{0};
    {
        TaskRunner runner;
        for (int i = 0; i < 10; ++i) {
            runner.submit([&completed] {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                ++completed;
            });
        }
    }
    EXPECT_EQ(completed.load(), 10);
}

TEST(TaskRunnerTest, KnowsItsWorkerThread) {
    TaskRunner runner;
    EXPECT_FALSE(runner.runsOnWorker());
    EXPECT_TRUE(runner.submit([&runner] { return runner.runsOnWorker(); }).get());
}

// ============================================================================
// BlockingConnection Tests
// ============================================================================

TEST(BlockingConnectionTest, ReturnsListing) {
    auto backend = std::make_unique<MemoryBackend>();
    backend->setObject("a.txt", "hello", std::chrono::system_clock::time_point(std::chrono::seconds(10)));
    BlockingConnection connection(std::move(backend));

    auto objects = connection.listObjects("bucket");

    ASSERT_TRUE(objects.ok());
    ASSERT_EQ(objects->size(), 1u);
    EXPECT_EQ(objects->front().name.value_or(""), "a.txt");
    EXPECT_EQ(objects->front().size.value_or(-1), 5);
}

TEST(BlockingConnectionTest, ReturnsObjectContent) {
    auto backend = std::make_unique<MemoryBackend>();
    backend->setObject("a.txt", "hello", std::chrono::system_clock::time_point{});
    BlockingConnection connection(std::move(backend));

    auto content = connection.readObject("bucket", "a.txt");

    ASSERT_TRUE(content.ok());
    EXPECT_EQ(*content, "hello");
}

TEST(BlockingConnectionTest, PropagatesStatusCodeUnchanged) {
    auto backend = std::make_unique<MemoryBackend>();
    backend->failList(Status(StatusCode::kPermissionDenied, "no access"));
    backend->failRead("a.txt", Status(StatusCode::kResourceExhausted, "slow down"));
    BlockingConnection connection(std::move(backend));

    auto objects = connection.listObjects("bucket");
    EXPECT_EQ(objects.status().code(), StatusCode::kPermissionDenied);
    EXPECT_EQ(objects.status().message(), "no access");

    auto content = connection.readObject("bucket", "a.txt");
    EXPECT_EQ(content.status().code(), StatusCode::kResourceExhausted);

    auto missing = connection.readObject("bucket", "missing.txt");
    EXPECT_EQ(missing.status().code(), StatusCode::kNotFound);
}

TEST(BlockingConnectionTest, ConvertsThrownExceptionToStatus) {
    BlockingConnection connection(std::make_unique<ThrowingBackend>());

    auto objects = connection.listObjects("bucket");
    EXPECT_EQ(objects.status().code(), StatusCode::kUnknown);
    EXPECT_NE(objects.status().message().find("listing exploded"), std::string::npos);

    // The runner survives and keeps serving
    auto content = connection.readObject("bucket", "a.txt");
    EXPECT_EQ(content.status().code(), StatusCode::kUnknown);
}

TEST(BlockingConnectionTest, ConvertsNonStandardThrowToStatus) {
    BlockingConnection connection(std::make_unique<NonStandardThrowingBackend>());

    auto objects = connection.listObjects("bucket");
    EXPECT_EQ(objects.status().code(), StatusCode::kUnknown);
    EXPECT_EQ(objects.status().message(), "non-standard exception");

    auto content = connection.readObject("bucket", "a.txt");
    EXPECT_EQ(content.status().code(), StatusCode::kUnknown);
}

TEST(BlockingConnectionTest, SerializesCallsFromManyThreads) {
    auto backend = std::make_unique<OverlapCountingBackend>();
    auto* backend_ptr = backend.get();
    BlockingConnection connection(std::move(backend));

    std::atomic<int> succeeded{0};
    std::vector<std::thread> callers;
    for (int t = 0; t < 4; ++t) {
        callers.emplace_back([&connection, &succeeded, t] {
            for (int i = 0; i < 5; ++i) {
                const std::string name = "obj-" + std::to_string(t) + "-" + std::to_string(i);
                auto content = connection.readObject("bucket", name);
                if (content.ok() && *content == name) {
                    ++succeeded;
                }
            }
        });
    }
    for (auto& caller : callers) {
        caller.join();
    }

    EXPECT_EQ(succeeded.load(), 20);
    EXPECT_EQ(backend_ptr->max_in_flight.load(), 1);
}

TEST(BlockingConnectionTest, RejectsCallFromRunnerThread) {
    auto backend = std::make_unique<ReentrantBackend>();
    auto* backend_ptr = backend.get();
    BlockingConnection connection(std::move(backend));
    backend_ptr->connection = &connection;

    auto content = connection.readObject("bucket", "a.txt");

    ASSERT_TRUE(content.ok());
    EXPECT_EQ(*content, "outer");
    EXPECT_EQ(backend_ptr->nested_code, StatusCode::kFailedPrecondition);
}
