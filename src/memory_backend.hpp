#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "backend.hpp"

namespace bucketfs {

/**
 * MemoryBackend - In-process bucket for tests and local smoke mounts
 *
 * Objects are listed in insertion order, followed by any raw records added
 * with addRawRecord(). Failures can be injected per key or for the listing.
 */
class MemoryBackend : public IBucketBackend {
public:
    MemoryBackend() = default;

    // Add or replace an object
    void setObject(const std::string& name,
                   const std::string& content,
                   std::chrono::system_clock::time_point last_modified);

    // Append a listing record as-is (may be incomplete, may not be readable)
    void addRawRecord(const RawObject& record);

    // Make every future read of object_name fail with status
    void failRead(const std::string& object_name, Status status);

    // Make every future listing fail with status
    void failList(Status status);

    google::cloud::future<StatusOr<std::vector<RawObject>>> AsyncListObjects(
        const std::string& bucket_name) override;

    google::cloud::future<StatusOr<std::string>> AsyncReadObject(
        const std::string& bucket_name,
        const std::string& object_name) override;

    int listCalls() const { return list_calls_.load(); }
    int readCalls() const { return read_calls_.load(); }

private:
    struct StoredObject {
        std::string content;
        std::chrono::system_clock::time_point last_modified;
    };

    mutable std::mutex mutex_;
    std::vector<std::string> order_;
    std::map<std::string, StoredObject> objects_;
    std::vector<RawObject> raw_records_;
    std::map<std::string, Status> read_failures_;
    std::optional<Status> list_failure_;

    std::atomic<int> list_calls_{0};
    std::atomic<int> read_calls_{0};
};

} // namespace bucketfs
