#pragma once

#include <memory>
#include <string>
#include <vector>
#include "backend.hpp"
#include "task_runner.hpp"

namespace bucketfs {

/**
 * BlockingConnection - Call-and-wait access to an asynchronous backend
 *
 * Every call is submitted to a private single-threaded TaskRunner and the
 * caller is parked until the backend's future resolves on that thread, so at
 * most one backend operation is in flight at any time. Errors are returned
 * with their original status code; nothing is retried, cached or timed out.
 */
class BlockingConnection {
public:
    explicit BlockingConnection(std::unique_ptr<IBucketBackend> backend, bool debug_mode = false);
    ~BlockingConnection() = default;

    BlockingConnection(const BlockingConnection&) = delete;
    BlockingConnection& operator=(const BlockingConnection&) = delete;

    StatusOr<std::vector<RawObject>> listObjects(const std::string& bucket_name);

    StatusOr<std::string> readObject(const std::string& bucket_name,
                                     const std::string& object_name);

private:
    template <class T, class Call>
    StatusOr<T> blockOn(const char* operation, Call call);

    std::unique_ptr<IBucketBackend> backend_;
    bool debug_mode_;
    // Declared last: the worker is joined before the backend it calls is destroyed
    TaskRunner runner_;
};

} // namespace bucketfs
