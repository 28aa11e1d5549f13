#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "google/cloud/future.h"
#include "google/cloud/status_or.h"

namespace bucketfs {

using google::cloud::Status;
using google::cloud::StatusCode;
using google::cloud::StatusOr;

/**
 * RawObject - One record of a bucket listing, as delivered by a backend
 *
 * Every field is optional: backends report whatever the store returned and
 * leave validation to the inode table, which drops incomplete records.
 */
struct RawObject {
    std::optional<std::string> name;
    std::optional<std::int64_t> size;
    std::optional<std::chrono::system_clock::time_point> last_modified;
};

/**
 * BackendOptions - Backend selection and backend-specific settings
 */
struct BackendOptions {
    std::string provider = "gcs";

    // GCS: override the REST endpoint (e.g. an emulator at http://localhost:4443)
    std::optional<std::string> endpoint;

    // GCS: skip credential discovery, send unauthenticated requests
    bool anonymous = false;

    bool debug_mode = false;
};

/**
 * IBucketBackend - Asynchronous access to an object store
 *
 * Both operations may fail independently; failures travel inside the
 * returned StatusOr, never as exceptions.
 */
class IBucketBackend {
public:
    virtual ~IBucketBackend() = default;

    // List every object currently stored in the bucket
    virtual google::cloud::future<StatusOr<std::vector<RawObject>>> AsyncListObjects(
        const std::string& bucket_name) = 0;

    // Download the full content of one object
    virtual google::cloud::future<StatusOr<std::string>> AsyncReadObject(
        const std::string& bucket_name,
        const std::string& object_name) = 0;
};

/**
 * Build the backend named by options.provider ("gcs" or "memory").
 *
 * @throws std::runtime_error for an unknown provider
 */
std::unique_ptr<IBucketBackend> makeBackend(const BackendOptions& options);

} // namespace bucketfs
