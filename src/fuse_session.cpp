#include "fuse_session.hpp"
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <fuse_log.h>

namespace bucketfs {

namespace {
    void logFuseMessage(enum fuse_log_level level, const char* fmt, va_list ap) {
        const char* level_str = "UNKNOWN";
        switch (level) {
            case FUSE_LOG_EMERG:   level_str = "EMERG"; break;
            case FUSE_LOG_ALERT:   level_str = "ALERT"; break;
            case FUSE_LOG_CRIT:    level_str = "CRIT"; break;
            case FUSE_LOG_ERR:     level_str = "ERR"; break;
            case FUSE_LOG_WARNING: level_str = "WARNING"; break;
            case FUSE_LOG_NOTICE:  level_str = "NOTICE"; break;
            case FUSE_LOG_INFO:    level_str = "INFO"; break;
            case FUSE_LOG_DEBUG:   level_str = "DEBUG"; break;
        }
        fprintf(stderr, "[FUSE-%s] ", level_str);
        vfprintf(stderr, fmt, ap);
    }
}

DirectoryBuffer::DirectoryBuffer(fuse_req_t req, size_t capacity)
    : req_(req),
      buffer_(capacity) {}

bool DirectoryBuffer::add(const InodeTable::Entry& entry, off_t next_offset)
{
    // Only st_ino and the type bits of st_mode are used by fuse_add_direntry
    struct stat stbuf;
    std::memset(&stbuf, 0, sizeof(stbuf));
    stbuf.st_ino = entry.ino;
    stbuf.st_mode = entry.is_directory ? S_IFDIR : S_IFREG;

    // Returns the space the entry needs; nothing is written when that exceeds what is left
    const size_t remaining = buffer_.size() - used_;
    const size_t entry_size = fuse_add_direntry(req_, buffer_.data() + used_, remaining,
                                                entry.name.c_str(), &stbuf, next_offset);
    if (entry_size > remaining) {
        return false;
    }
    used_ += entry_size;
    return true;
}

FuseSession::FuseSession(BucketFS& fs, const std::vector<std::string>& args, const std::string& mount_point)
{
    // Route libfuse's own messages through our prefixes if debug or verbose mode enabled
    if (fs.config().debug_mode || fs.config().verbose_logging) {
        fuse_set_log_func(logFuseMessage);
    }

    struct fuse_args fuse_args = FUSE_ARGS_INIT(0, nullptr);
    for (const auto& arg : args) {
        if (fuse_opt_add_arg(&fuse_args, arg.c_str()) != 0) {
            fuse_opt_free_args(&fuse_args);
            throw std::runtime_error("unable to build FUSE arguments");
        }
    }

    session_ = fuse_session_new(&fuse_args, Operations(), sizeof(fuse_lowlevel_ops), &fs);
    fuse_opt_free_args(&fuse_args);
    if (session_ == nullptr) {
        throw std::runtime_error("unable to create FUSE session (check the FUSE options)");
    }

    if (fuse_set_signal_handlers(session_) != 0) {
        teardown();
        throw std::runtime_error("unable to install FUSE signal handlers");
    }
    signals_installed_ = true;

    if (fuse_session_mount(session_, mount_point.c_str()) != 0) {
        teardown();
        throw std::runtime_error("unable to mount bucket fs at mountpoint=" + mount_point);
    }
    mounted_ = true;
}

FuseSession::~FuseSession()
{
    teardown();
}

void FuseSession::teardown()
{
    if (session_ == nullptr) {
        return;
    }
    if (mounted_) {
        fuse_session_unmount(session_);
        mounted_ = false;
    }
    if (signals_installed_) {
        fuse_remove_signal_handlers(session_);
        signals_installed_ = false;
    }
    fuse_session_destroy(session_);
    session_ = nullptr;
}

int FuseSession::loop()
{
    // Single-threaded loop: requests are handled strictly one after another
    return fuse_session_loop(session_);
}

const fuse_lowlevel_ops* FuseSession::Operations()
{
    static const fuse_lowlevel_ops operations = [] {
        fuse_lowlevel_ops ops;
        std::memset(&ops, 0, sizeof(ops));
        ops.init = FuseSession::init;
        ops.lookup = FuseSession::lookup;
        ops.getattr = FuseSession::getattr;
        ops.open = FuseSession::open;
        ops.read = FuseSession::read;
        ops.opendir = FuseSession::opendir;
        ops.readdir = FuseSession::readdir;
        return ops;
    }();
    return &operations;
}

void FuseSession::init(void* userdata, struct fuse_conn_info* conn)
{
    const auto ptr = static_cast<BucketFS*>(userdata);
    if (ptr->config().debug_mode) {
        std::cout << "[DEBUG] FUSE connection initialized (protocol "
                  << conn->proto_major << "." << conn->proto_minor << ")" << std::endl;
    }
}

void FuseSession::lookup(fuse_req_t req, fuse_ino_t parent, const char* name)
{
    const auto ptr = this_(req);

    auto attr = ptr->lookup(parent, name);
    if (!attr) {
        fuse_reply_err(req, toErrno(attr.status()));
        return;
    }

    struct fuse_entry_param e;
    std::memset(&e, 0, sizeof(e));
    e.ino = attr->ino;
    e.attr_timeout = kAttrTimeout;
    e.entry_timeout = kAttrTimeout;
    attr->fillStat(&e.attr);
    fuse_reply_entry(req, &e);
}

void FuseSession::getattr(fuse_req_t req, fuse_ino_t ino, struct fuse_file_info*)
{
    const auto ptr = this_(req);

    auto attr = ptr->getAttributes(ino);
    if (!attr) {
        fuse_reply_err(req, toErrno(attr.status()));
        return;
    }

    struct stat stbuf;
    attr->fillStat(&stbuf);
    fuse_reply_attr(req, &stbuf, kAttrTimeout);
}

void FuseSession::open(fuse_req_t req, fuse_ino_t ino, struct fuse_file_info* fi)
{
    const auto ptr = this_(req);

    const int err = ptr->checkOpen(ino, fi->flags);
    if (err != 0) {
        fuse_reply_err(req, err);
        return;
    }
    fuse_reply_open(req, fi);
}

void FuseSession::read(fuse_req_t req, fuse_ino_t ino, size_t size, off_t offset,
                       struct fuse_file_info*)
{
    const auto ptr = this_(req);

    auto content = ptr->read(ino, offset, size);
    if (!content) {
        fuse_reply_err(req, toErrno(content.status()));
        return;
    }
    fuse_reply_buf(req, content->data(), content->size());
}

void FuseSession::opendir(fuse_req_t req, fuse_ino_t ino, struct fuse_file_info* fi)
{
    const auto ptr = this_(req);

    const int err = ptr->checkOpenDir(ino);
    if (err != 0) {
        fuse_reply_err(req, err);
        return;
    }
    fuse_reply_open(req, fi);
}

void FuseSession::readdir(fuse_req_t req, fuse_ino_t ino, size_t size, off_t offset,
                          struct fuse_file_info*)
{
    const auto ptr = this_(req);

    DirectoryBuffer buffer(req, size);
    auto status = ptr->listDirectory(ino, offset,
        [&buffer](const InodeTable::Entry& entry, off_t next_offset) {
            return buffer.add(entry, next_offset);
        });

    if (!status.ok()) {
        fuse_reply_err(req, toErrno(status));
        return;
    }
    // An empty reply tells the kernel the listing is complete
    fuse_reply_buf(req, buffer.data(), buffer.size());
}

} // namespace bucketfs
