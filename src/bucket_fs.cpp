// Bucket filesystem class implementation

#include "bucket_fs.hpp"
#include <cerrno>
#include <fcntl.h>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace bucketfs {

int toErrno(const Status& status)
{
    switch (status.code()) {
        case StatusCode::kOk:
            return 0;
        case StatusCode::kNotFound:
            return ENOENT;
        case StatusCode::kInvalidArgument:
            return EINVAL;
        default:
            return EIO;
    }
}

BucketFS::BucketFS(const std::string& bucket_name,
                   std::unique_ptr<IBucketBackend> backend,
                   const BucketFSConfig& config)
    : bucket_name_(bucket_name),
      config_(config),
      connection_(std::move(backend), config.debug_mode),
      table_(buildTable(connection_, bucket_name, config))
{
    std::cout << "Initialized bucketfs for bucket: " << bucket_name_
              << " (" << table_.size() - 1 << " objects";
    if (table_.skipped() > 0) {
        std::cout << ", " << table_.skipped() << " skipped";
    }
    std::cout << ")" << std::endl;
}

InodeTable BucketFS::buildTable(BlockingConnection& connection,
                                const std::string& bucket_name,
                                const BucketFSConfig& config)
{
    if (config.debug_mode) {
        std::cout << "[DEBUG] Loading object list from bucket: " << bucket_name << std::endl;
    }

    auto objects = connection.listObjects(bucket_name);
    if (!objects) {
        throw std::runtime_error("unable to list objects in bucket=" + bucket_name +
                                 ": " + objects.status().message());
    }
    return InodeTable(*objects, config.verbose_logging);
}

StatusOr<InodeAttributes> BucketFS::getAttributes(Inode ino) const
{
    if (config_.debug_mode) {
        std::cout << "[DEBUG] getattr(ino=" << ino << ")" << std::endl;
    }

    const InodeAttributes* attr = table_.attributes(ino);
    if (attr == nullptr) {
        std::cerr << "[WARN] Attempted to get attrs of non-existent file, ino=" << ino << std::endl;
        return Status(StatusCode::kNotFound, "no such inode: " + std::to_string(ino));
    }
    return *attr;
}

StatusOr<InodeAttributes> BucketFS::lookup(Inode parent, const std::string& name) const
{
    if (config_.debug_mode) {
        std::cout << "[DEBUG] lookup(parent=" << parent << ", name=" << name << ")" << std::endl;
    }

    // Flat namespace: only the root has children
    if (parent != kRootInode) {
        return Status(StatusCode::kNotFound, "not a directory: " + std::to_string(parent));
    }

    auto ino = table_.inodeOf(name);
    if (!ino) {
        return Status(StatusCode::kNotFound, "no such entry: " + name);
    }

    if (config_.debug_mode) {
        std::cout << "[DEBUG] Looked up ino=" << *ino << " by name=" << name << std::endl;
    }
    return *table_.attributes(*ino);
}

Status BucketFS::listDirectory(Inode ino, off_t offset, const DirectoryFiller& filler) const
{
    if (config_.debug_mode) {
        std::cout << "[DEBUG] readdir(ino=" << ino << ", offset=" << offset << ")" << std::endl;
    }

    if (ino != kRootInode) {
        std::cerr << "[WARN] Attempted to read non-root dir, ino=" << ino << std::endl;
        return Status(StatusCode::kNotFound, "not a directory: " + std::to_string(ino));
    }
    if (offset < 0) {
        return Status(StatusCode::kInvalidArgument, "negative directory offset");
    }

    // Offsets are positions in the fixed listing order, so a later call
    // picks up exactly where the previous one stopped
    const auto& entries = table_.entries();
    for (std::size_t i = static_cast<std::size_t>(offset); i < entries.size(); ++i) {
        if (!filler(entries[i], static_cast<off_t>(i + 1))) {
            if (config_.debug_mode) {
                std::cout << "[DEBUG] Directory buffer full at offset " << i << std::endl;
            }
            break;
        }
    }
    return Status();
}

StatusOr<std::string> BucketFS::read(Inode ino, off_t offset, std::size_t size)
{
    if (config_.debug_mode) {
        std::cout << "[DEBUG] read(ino=" << ino << ", offset=" << offset
                  << ", size=" << size << ")" << std::endl;
    }

    const std::string* object_name = table_.objectName(ino);
    if (object_name == nullptr) {
        return Status(StatusCode::kNotFound, "no object behind inode: " + std::to_string(ino));
    }
    if (offset < 0) {
        return Status(StatusCode::kInvalidArgument, "negative read offset");
    }

    // The whole object is downloaded on every read
    auto content = connection_.readObject(bucket_name_, *object_name);
    if (!content) {
        std::cerr << "[ERROR] Failed to read object " << *object_name << ": "
                  << content.status().message() << std::endl;
        // Any fetch failure is an I/O error for the reader, even kNotFound:
        // the inode itself exists
        return Status(StatusCode::kUnavailable,
                      "unable to download object=" + *object_name + ", cause=" +
                      google::cloud::StatusCodeToString(content.status().code()) + ": " +
                      content.status().message());
    }

    const auto start = static_cast<std::size_t>(offset);
    if (start >= content->size()) {
        return std::string();
    }
    return content->substr(start, size);
}

int BucketFS::checkOpen(Inode ino, int flags) const
{
    const InodeAttributes* attr = table_.attributes(ino);
    if (attr == nullptr) {
        return ENOENT;
    }
    if (attr->is_directory) {
        return EISDIR;
    }
    if ((flags & O_ACCMODE) != O_RDONLY) {
        return EACCES;
    }
    return 0;
}

int BucketFS::checkOpenDir(Inode ino) const
{
    if (table_.attributes(ino) == nullptr) {
        return ENOENT;
    }
    return ino == kRootInode ? 0 : ENOTDIR;
}

} // namespace bucketfs
