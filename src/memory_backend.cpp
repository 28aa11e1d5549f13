#include "memory_backend.hpp"
#include <utility>

namespace bucketfs {

void MemoryBackend::setObject(const std::string& name,
                              const std::string& content,
                              std::chrono::system_clock::time_point last_modified)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (objects_.find(name) == objects_.end()) {
        order_.push_back(name);
    }
    objects_[name] = StoredObject{content, last_modified};
}

void MemoryBackend::addRawRecord(const RawObject& record)
{
    std::lock_guard<std::mutex> lock(mutex_);
    raw_records_.push_back(record);
}

void MemoryBackend::failRead(const std::string& object_name, Status status)
{
    std::lock_guard<std::mutex> lock(mutex_);
    read_failures_[object_name] = std::move(status);
}

void MemoryBackend::failList(Status status)
{
    std::lock_guard<std::mutex> lock(mutex_);
    list_failure_ = std::move(status);
}

google::cloud::future<StatusOr<std::vector<RawObject>>> MemoryBackend::AsyncListObjects(
    const std::string&)
{
    ++list_calls_;
    std::lock_guard<std::mutex> lock(mutex_);
    if (list_failure_) {
        return google::cloud::make_ready_future(StatusOr<std::vector<RawObject>>(*list_failure_));
    }

    std::vector<RawObject> records;
    for (const auto& name : order_) {
        const auto& object = objects_.at(name);
        RawObject record;
        record.name = name;
        record.size = static_cast<std::int64_t>(object.content.size());
        record.last_modified = object.last_modified;
        records.push_back(std::move(record));
    }
    records.insert(records.end(), raw_records_.begin(), raw_records_.end());
    return google::cloud::make_ready_future(StatusOr<std::vector<RawObject>>(std::move(records)));
}

google::cloud::future<StatusOr<std::string>> MemoryBackend::AsyncReadObject(
    const std::string& bucket_name,
    const std::string& object_name)
{
    ++read_calls_;
    std::lock_guard<std::mutex> lock(mutex_);
    auto failure = read_failures_.find(object_name);
    if (failure != read_failures_.end()) {
        return google::cloud::make_ready_future(StatusOr<std::string>(failure->second));
    }

    auto it = objects_.find(object_name);
    if (it == objects_.end()) {
        return google::cloud::make_ready_future(StatusOr<std::string>(
            Status(StatusCode::kNotFound,
                   "object not found: " + bucket_name + "/" + object_name)));
    }
    return google::cloud::make_ready_future(StatusOr<std::string>(it->second.content));
}

} // namespace bucketfs
