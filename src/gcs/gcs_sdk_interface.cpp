#include "gcs_sdk_interface.hpp"
#include <iterator>
#include <utility>

namespace bucketfs {

GCSSDKClientImpl::GCSSDKClientImpl(google::cloud::Options options)
    : client_(gcs::Client(std::move(options))) {}

StatusOr<std::string> GCSSDKClientImpl::ReadObject(const ReadObjectRequest& request) const {
    auto reader = client_.ReadObject(request.bucket_name, request.object_name);
    if (!reader) {
        return reader.status();
    }
    std::string content{std::istreambuf_iterator<char>{reader}, {}};
    // The stream only reports transfer errors once it has been drained
    if (!reader.status().ok()) {
        return reader.status();
    }
    return content;
}

StatusOr<std::vector<gcs::ObjectMetadata>> GCSSDKClientImpl::ListObjects(
    const ListObjectsRequest& request) const
{
    std::vector<gcs::ObjectMetadata> objects;
    for (auto&& object_metadata : client_.ListObjects(request.bucket_name, gcs::Prefix(request.prefix))) {
        if (!object_metadata) {
            return std::move(object_metadata).status();
        }
        objects.push_back(*std::move(object_metadata));
    }
    return objects;
}

} // namespace bucketfs
