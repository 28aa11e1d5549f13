#pragma once

#include <memory>
#include <string>
#include <vector>
#include "backend.hpp"
#include "gcs_sdk_interface.hpp"

namespace bucketfs {

/**
 * GcsBackend - IBucketBackend over Google Cloud Storage
 *
 * Converts SDK metadata into RawObject records and hands results back as
 * futures. The SDK client is blocking, so the call itself runs on whichever
 * thread invokes the Async* method; BlockingConnection makes that its own
 * runner thread.
 *
 * Uses dependency injection with IGCSSDKClient to enable proper unit testing.
 */
class GcsBackend : public IBucketBackend {
public:
    explicit GcsBackend(const BackendOptions& options);
    // Constructor for dependency injection (enables mocking in tests)
    explicit GcsBackend(std::unique_ptr<IGCSSDKClient> sdk_client, bool debug_mode = false);
    ~GcsBackend() override = default;

    google::cloud::future<StatusOr<std::vector<RawObject>>> AsyncListObjects(
        const std::string& bucket_name) override;

    google::cloud::future<StatusOr<std::string>> AsyncReadObject(
        const std::string& bucket_name,
        const std::string& object_name) override;

    // Map one SDK record; empty names and unset timestamps become missing fields
    static RawObject toRawObject(const gcs::ObjectMetadata& metadata);

    // SDK client options for the given backend settings
    static google::cloud::Options makeClientOptions(const BackendOptions& options);

private:
    std::unique_ptr<IGCSSDKClient> sdk_client_;
    bool debug_mode_;
};

} // namespace bucketfs
