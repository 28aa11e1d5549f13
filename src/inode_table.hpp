#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <sys/stat.h>
#include <unordered_map>
#include <vector>
#include "backend.hpp"

namespace bucketfs {

using Inode = std::uint64_t;

constexpr Inode kRootInode = 1;
// Name under which the root lists and indexes itself
constexpr const char* kRootName = ".";
constexpr blksize_t kBlockSize = 512;

/**
 * InodeAttributes - Precomputed stat information for one inode
 */
struct InodeAttributes {
    Inode ino = 0;
    bool is_directory = false;
    std::uint64_t size = 0;
    std::chrono::system_clock::time_point mtime{};

    // -r--r--r-- with the file type bits
    mode_t mode() const { return (is_directory ? S_IFDIR : S_IFREG) | 0444; }

    std::uint64_t blocks() const { return (size + kBlockSize - 1) / kBlockSize; }

    // Fill a struct stat the way the kernel expects it
    void fillStat(struct stat* stbuf) const;
};

/**
 * InodeTable - Immutable inode/name index over one bucket listing
 *
 * Inode 1 is the root directory; accepted listing records get 2, 3, ... in
 * the order they were listed. Records with missing or unusable fields are
 * skipped with a warning and do not consume an inode number.
 */
class InodeTable {
public:
    struct Entry {
        Inode ino;
        std::string name;
        bool is_directory;
    };

    /**
     * Build the table from one listing
     *
     * @param objects Listing records in backend order
     * @param verbose_logging Log every accepted entry
     */
    explicit InodeTable(const std::vector<RawObject>& objects, bool verbose_logging = false);

    InodeTable(const InodeTable&) = delete;
    InodeTable& operator=(const InodeTable&) = delete;
    InodeTable(InodeTable&&) = default;
    InodeTable& operator=(InodeTable&&) = default;

    // Attributes for an inode, if it exists
    const InodeAttributes* attributes(Inode ino) const;

    // Inode for a name in the root directory
    std::optional<Inode> inodeOf(const std::string& name) const;

    // Object name behind a regular-file inode; nullptr for the root and unknown inodes
    const std::string* objectName(Inode ino) const;

    // Directory listing order: the root's self-entry, then inodes 2..N+1
    const std::vector<Entry>& entries() const { return entries_; }

    // Number of inodes, root included
    std::size_t size() const { return attrs_.size(); }

    // Number of listing records that were skipped
    std::size_t skipped() const { return skipped_; }

private:
    std::unordered_map<Inode, InodeAttributes> attrs_;
    std::unordered_map<std::string, Inode> inodes_;
    std::vector<Entry> entries_;
    std::size_t skipped_ = 0;
};

} // namespace bucketfs
