#pragma once

#include <string>
#include <vector>
#include "google/cloud/options.h"
#include "google/cloud/storage/client.h"
#include "google/cloud/status.h"
#include "google/cloud/status_or.h"

namespace gcs = ::google::cloud::storage;
using google::cloud::Status;
using google::cloud::StatusOr;

namespace bucketfs {

/**
 * Raw interface wrapper for GCS SDK - minimal logic, just drains SDK streams
 * This allows mocking the SDK in tests while GcsBackend contains the business logic
 */
class IGCSSDKClient {
public:
    virtual ~IGCSSDKClient() = default;

    // Request struct for ReadObject
    struct ReadObjectRequest {
        std::string bucket_name;
        std::string object_name;

        bool operator==(const ReadObjectRequest& other) const {
            return bucket_name == other.bucket_name && object_name == other.object_name;
        }
    };

    // Request struct for ListObjects
    struct ListObjectsRequest {
        std::string bucket_name;
        std::string prefix;

        bool operator==(const ListObjectsRequest& other) const {
            return bucket_name == other.bucket_name && prefix == other.prefix;
        }
    };

    // Read object - whole content, or the first stream error
    virtual StatusOr<std::string> ReadObject(const ReadObjectRequest& request) const = 0;

    // List objects - every page, or the first listing error
    virtual StatusOr<std::vector<gcs::ObjectMetadata>> ListObjects(
        const ListObjectsRequest& request) const = 0;
};

/**
 * Real implementation - thin wrapper over google::cloud::storage::Client
 * Just forwards calls to the SDK with no business logic
 */
class GCSSDKClientImpl : public IGCSSDKClient {
public:
    explicit GCSSDKClientImpl(google::cloud::Options options);

    StatusOr<std::string> ReadObject(const ReadObjectRequest& request) const override;

    StatusOr<std::vector<gcs::ObjectMetadata>> ListObjects(
        const ListObjectsRequest& request) const override;

private:
    mutable gcs::Client client_;
};

} // namespace bucketfs
