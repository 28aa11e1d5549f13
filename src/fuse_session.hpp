#pragma once

#ifndef FUSE_USE_VERSION
#define FUSE_USE_VERSION 35
#endif

#include <fuse_lowlevel.h>
#include <string>
#include <vector>
#include "bucket_fs.hpp"

namespace bucketfs {

// Seconds the kernel may cache attributes and name lookups
constexpr double kAttrTimeout = 1.0;

/**
 * DirectoryBuffer - readdir reply buffer of the size the kernel asked for
 *
 * Entries are packed with fuse_add_direntry(). An entry that does not fit
 * is rejected and leaves the buffer untouched, so the next readdir call can
 * resume from the last accepted entry's offset.
 */
class DirectoryBuffer
{
public:
    DirectoryBuffer(fuse_req_t req, size_t capacity);

    // Append one entry; false when it does not fit in the remaining space
    bool add(const InodeTable::Entry& entry, off_t next_offset);

    const char* data() const { return buffer_.data(); }
    size_t size() const { return used_; }
    size_t capacity() const { return buffer_.size(); }

private:
    fuse_req_t req_;
    std::vector<char> buffer_;
    size_t used_ = 0;
};

/**
 * FuseSession - Low-level FUSE session serving one BucketFS
 *
 * Owns the fuse_session: constructing it parses the FUSE arguments and
 * mounts, destruction unmounts. The static callbacks recover the BucketFS
 * from the request's userdata pointer and translate results into
 * fuse_reply_* calls.
 */
class FuseSession
{
public:
    /**
     * @param fs Filesystem to serve; must outlive the session
     * @param args Arguments for fuse_session_new(), program name first
     * @param mount_point Directory to mount on
     * @throws std::runtime_error if the session cannot be created or mounted
     */
    FuseSession(BucketFS& fs, const std::vector<std::string>& args, const std::string& mount_point);
    ~FuseSession();

    // no copy
    FuseSession(const FuseSession&) = delete;
    FuseSession& operator=(const FuseSession&) = delete;

    /**
     * Serve requests one at a time until unmounted or signalled
     *
     * @return fuse_session_loop() status, 0 on a clean exit
     */
    int loop();

    /**
     * Provides access to the static low-level operations table.
     */
    static const fuse_lowlevel_ops* Operations();

    // FUSE operations
    static void init(void* userdata, struct fuse_conn_info* conn);
    static void lookup(fuse_req_t req, fuse_ino_t parent, const char* name);
    static void getattr(fuse_req_t req, fuse_ino_t ino, struct fuse_file_info* fi);
    static void open(fuse_req_t req, fuse_ino_t ino, struct fuse_file_info* fi);
    static void read(fuse_req_t req, fuse_ino_t ino, size_t size, off_t offset,
                     struct fuse_file_info* fi);
    static void opendir(fuse_req_t req, fuse_ino_t ino, struct fuse_file_info* fi);
    static void readdir(fuse_req_t req, fuse_ino_t ino, size_t size, off_t offset,
                        struct fuse_file_info* fi);

private:
    // Unmount and release whatever has been set up so far
    void teardown();

    static BucketFS* this_(fuse_req_t req)
    {
        return static_cast<BucketFS*>(fuse_req_userdata(req));
    }

    struct fuse_session* session_ = nullptr;
    bool mounted_ = false;
    bool signals_installed_ = false;
};

} // namespace bucketfs
