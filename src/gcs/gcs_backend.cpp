#include "gcs_backend.hpp"
#include <iostream>
#include <limits>
#include <utility>
#include "google/cloud/credentials.h"

namespace bucketfs {

GcsBackend::GcsBackend(const BackendOptions& options)
    : sdk_client_(std::make_unique<GCSSDKClientImpl>(makeClientOptions(options))),
      debug_mode_(options.debug_mode) {}

GcsBackend::GcsBackend(std::unique_ptr<IGCSSDKClient> sdk_client, bool debug_mode)
    : sdk_client_(std::move(sdk_client)),
      debug_mode_(debug_mode) {}

google::cloud::Options GcsBackend::makeClientOptions(const BackendOptions& options)
{
    google::cloud::Options client_options;
    if (options.endpoint) {
        client_options.set<gcs::RestEndpointOption>(*options.endpoint);
    }
    if (options.anonymous) {
        client_options.set<google::cloud::UnifiedCredentialsOption>(
            google::cloud::MakeInsecureCredentials());
    }
    return client_options;
}

RawObject GcsBackend::toRawObject(const gcs::ObjectMetadata& metadata)
{
    RawObject object;
    if (!metadata.name().empty()) {
        object.name = metadata.name();
    }
    if (metadata.size() <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        object.size = static_cast<std::int64_t>(metadata.size());
    }
    if (metadata.updated() != std::chrono::system_clock::time_point{}) {
        object.last_modified = metadata.updated();
    }
    return object;
}

google::cloud::future<StatusOr<std::vector<RawObject>>> GcsBackend::AsyncListObjects(
    const std::string& bucket_name)
{
    if (debug_mode_) {
        std::cout << "[DEBUG] Listing objects in GCS bucket: " << bucket_name << std::endl;
    }

    StatusOr<std::vector<gcs::ObjectMetadata>> listing;
    try {
        listing = sdk_client_->ListObjects({bucket_name, ""});
    } catch (const std::exception& e) {
        listing = Status(StatusCode::kUnknown,
                         "unable to list objects in bucket=" + bucket_name + ": " + e.what());
    }
    if (!listing) {
        return google::cloud::make_ready_future(
            StatusOr<std::vector<RawObject>>(std::move(listing).status()));
    }

    std::vector<RawObject> objects;
    objects.reserve(listing->size());
    for (const auto& metadata : *listing) {
        objects.push_back(toRawObject(metadata));
    }
    return google::cloud::make_ready_future(StatusOr<std::vector<RawObject>>(std::move(objects)));
}

google::cloud::future<StatusOr<std::string>> GcsBackend::AsyncReadObject(
    const std::string& bucket_name,
    const std::string& object_name)
{
    if (debug_mode_) {
        std::cout << "[DEBUG] Reading from GCS: " << object_name << std::endl;
    }

    IGCSSDKClient::ReadObjectRequest request;
    request.bucket_name = bucket_name;
    request.object_name = object_name;

    StatusOr<std::string> content;
    try {
        content = sdk_client_->ReadObject(request);
    } catch (const std::exception& e) {
        content = Status(StatusCode::kUnknown,
                         "unable to read object=" + object_name + ": " + e.what());
    }
    return google::cloud::make_ready_future(std::move(content));
}

} // namespace bucketfs
