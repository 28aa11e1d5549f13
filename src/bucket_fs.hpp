// Bucket filesystem class definition

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <sys/types.h>
#include "backend.hpp"
#include "blocking_connection.hpp"
#include "config.hpp"
#include "inode_table.hpp"

namespace bucketfs {

/**
 * BucketFS - Read-only view of one bucket as a flat directory
 *
 * The bucket is listed once, at construction; the resulting InodeTable is
 * never modified, so objects added or removed afterwards stay invisible for
 * the lifetime of the mount. Metadata requests are answered from the table.
 * Reads download the whole object through the BlockingConnection on every
 * call and return the requested byte range of it.
 *
 * Requests are expected one at a time (single-threaded session loop).
 */
class BucketFS
{
public:
    /**
     * Directory filler: receives one entry and the offset that resumes after
     * it. Returns false when the destination buffer is full; the entry was
     * not consumed and enumeration stops.
     */
    using DirectoryFiller = std::function<bool(const InodeTable::Entry& entry, off_t next_offset)>;

    /**
     * List the bucket and build the inode table
     *
     * @throws std::runtime_error if the listing fails
     */
    BucketFS(const std::string& bucket_name,
             std::unique_ptr<IBucketBackend> backend,
             const BucketFSConfig& config);
    ~BucketFS() = default;

    BucketFS(const BucketFS&) = delete;
    BucketFS& operator=(const BucketFS&) = delete;

    // Filesystem requests
    StatusOr<InodeAttributes> getAttributes(Inode ino) const;
    StatusOr<InodeAttributes> lookup(Inode parent, const std::string& name) const;
    Status listDirectory(Inode ino, off_t offset, const DirectoryFiller& filler) const;
    StatusOr<std::string> read(Inode ino, off_t offset, std::size_t size);

    // 0 or the errno to reply with
    int checkOpen(Inode ino, int flags) const;
    int checkOpenDir(Inode ino) const;

    // Accessors
    const std::string& bucketName() const { return bucket_name_; }
    const InodeTable& inodes() const { return table_; }
    const BucketFSConfig& config() const { return config_; }

private:
    static InodeTable buildTable(BlockingConnection& connection,
                                 const std::string& bucket_name,
                                 const BucketFSConfig& config);

    std::string bucket_name_;
    BucketFSConfig config_;
    BlockingConnection connection_;
    InodeTable table_;
};

// errno for a failed request: ENOENT for kNotFound, EINVAL for kInvalidArgument, EIO otherwise
int toErrno(const Status& status);

} // namespace bucketfs
