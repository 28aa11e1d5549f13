#include "inode_table.hpp"
#include <algorithm>
#include <cstring>
#include <iostream>

namespace bucketfs {

namespace {
    struct ObjectEntry {
        std::string name;
        std::uint64_t size;
        std::chrono::system_clock::time_point last_modified;
    };

    // Pull the three required fields out of a listing record.
    // On failure returns nullopt and sets reason.
    std::optional<ObjectEntry> extractEntry(const RawObject& object, std::string& reason) {
        if (!object.name) {
            reason = "key not available";
            return std::nullopt;
        }
        if (object.name->empty()) {
            reason = "key is empty";
            return std::nullopt;
        }
        // A directory entry name is a single path component
        if (object.name->find('/') != std::string::npos || *object.name == "." || *object.name == "..") {
            reason = "key is not a valid file name";
            return std::nullopt;
        }
        if (!object.size) {
            reason = "size not available";
            return std::nullopt;
        }
        if (*object.size < 0) {
            reason = "size cannot be converted into a byte count";
            return std::nullopt;
        }
        if (!object.last_modified) {
            reason = "last modified not available";
            return std::nullopt;
        }
        return ObjectEntry{*object.name, static_cast<std::uint64_t>(*object.size), *object.last_modified};
    }

    timespec toTimespec(std::chrono::system_clock::time_point tp) {
        auto since_epoch = tp.time_since_epoch();
        auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
        // Keep tv_nsec in [0, 1e9) for times before the epoch
        if (secs > since_epoch) {
            secs -= std::chrono::seconds(1);
        }
        auto nsecs = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - secs);
        timespec ts{};
        ts.tv_sec = static_cast<time_t>(secs.count());
        ts.tv_nsec = static_cast<long>(nsecs.count());
        return ts;
    }
}

void InodeAttributes::fillStat(struct stat* stbuf) const
{
    std::memset(stbuf, 0, sizeof(struct stat));
    stbuf->st_ino = ino;
    stbuf->st_mode = mode();
    stbuf->st_nlink = 1;
    stbuf->st_uid = 0;
    stbuf->st_gid = 0;
    stbuf->st_size = static_cast<off_t>(size);
    stbuf->st_blksize = kBlockSize;
    stbuf->st_blocks = static_cast<blkcnt_t>(blocks());
    stbuf->st_mtim = toTimespec(mtime);
    // atime and ctime stay at the epoch
}

InodeTable::InodeTable(const std::vector<RawObject>& objects, bool verbose_logging)
{
    entries_.push_back(Entry{kRootInode, kRootName, true});

    InodeAttributes root;
    root.ino = kRootInode;
    root.is_directory = true;

    Inode next_ino = kRootInode + 1;
    for (const auto& object : objects) {
        std::string reason;
        auto entry = extractEntry(object, reason);
        if (!entry) {
            std::cerr << "[WARN] Unable to extract fields from object "
                      << (object.name ? "'" + *object.name + "'" : std::string("<unnamed>"))
                      << ", cause=" << reason << std::endl;
            ++skipped_;
            continue;
        }
        if (inodes_.find(entry->name) != inodes_.end()) {
            std::cerr << "[WARN] Skipping duplicate object '" << entry->name << "'" << std::endl;
            ++skipped_;
            continue;
        }

        const Inode ino = next_ino++;
        InodeAttributes attr;
        attr.ino = ino;
        attr.is_directory = false;
        attr.size = entry->size;
        attr.mtime = entry->last_modified;
        attrs_.emplace(ino, attr);
        inodes_.emplace(entry->name, ino);
        entries_.push_back(Entry{ino, entry->name, false});

        // The root reports the total size and newest mtime of its children
        root.size += attr.size;
        root.mtime = std::max(root.mtime, attr.mtime);

        if (verbose_logging) {
            std::cout << "Found entry: " << entry->name << " (ino: " << ino
                      << ", size: " << entry->size << " bytes)" << std::endl;
        }
    }

    attrs_.emplace(kRootInode, root);
    inodes_.emplace(kRootName, kRootInode);
}

const InodeAttributes* InodeTable::attributes(Inode ino) const
{
    auto it = attrs_.find(ino);
    return it == attrs_.end() ? nullptr : &it->second;
}

std::optional<Inode> InodeTable::inodeOf(const std::string& name) const
{
    auto it = inodes_.find(name);
    if (it == inodes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const std::string* InodeTable::objectName(Inode ino) const
{
    // Inodes are dense, so entries_[ino - 1] belongs to ino
    if (ino <= kRootInode || ino > entries_.size()) {
        return nullptr;
    }
    return &entries_[ino - 1].name;
}

} // namespace bucketfs
