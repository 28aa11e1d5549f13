#include "blocking_connection.hpp"
#include <exception>
#include <iostream>
#include <utility>

namespace bucketfs {

BlockingConnection::BlockingConnection(std::unique_ptr<IBucketBackend> backend, bool debug_mode)
    : backend_(std::move(backend)),
      debug_mode_(debug_mode) {}

template <class T, class Call>
StatusOr<T> BlockingConnection::blockOn(const char* operation, Call call)
{
    // Waiting on our own worker would never return
    if (runner_.runsOnWorker()) {
        return Status(StatusCode::kFailedPrecondition,
                      std::string(operation) + " called from the backend runner thread");
    }

    auto pending = runner_.submit([operation, call = std::move(call)]() -> StatusOr<T> {
        try {
            return call().get();
        } catch (const std::exception& e) {
            std::cerr << "[ERROR] Backend threw during " << operation << ": " << e.what() << std::endl;
            return Status(StatusCode::kUnknown, e.what());
        } catch (...) {
            std::cerr << "[ERROR] Backend threw during " << operation << ": non-standard exception" << std::endl;
            return Status(StatusCode::kUnknown, "non-standard exception");
        }
    });
    StatusOr<T> result = pending.get();

    if (debug_mode_) {
        std::cout << "[DEBUG] " << operation << " finished: "
                  << (result ? "ok" : result.status().message()) << std::endl;
    }
    return result;
}

StatusOr<std::vector<RawObject>> BlockingConnection::listObjects(const std::string& bucket_name)
{
    return blockOn<std::vector<RawObject>>("listObjects", [this, bucket_name] {
        return backend_->AsyncListObjects(bucket_name);
    });
}

StatusOr<std::string> BlockingConnection::readObject(const std::string& bucket_name,
                                                     const std::string& object_name)
{
    return blockOn<std::string>("readObject", [this, bucket_name, object_name] {
        return backend_->AsyncReadObject(bucket_name, object_name);
    });
}

} // namespace bucketfs
