// Tests for the readdir reply buffer

#include <gtest/gtest.h>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include "bucket_fs.hpp"
#include "fuse_session.hpp"
#include "memory_backend.hpp"

using namespace bucketfs;

namespace {
    // Space fuse_add_direntry() needs for one entry with this name
    size_t direntSize(const std::string& name) {
        return fuse_add_direntry(nullptr, nullptr, 0, name.c_str(), nullptr, 0);
    }

    const std::chrono::system_clock::time_point T1 =
        std::chrono::system_clock::time_point(std::chrono::seconds(1600000000));
}

class DirectoryBufferTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto backend = std::make_unique<MemoryBackend>();
        backend->setObject("a.txt", "0123456789", T1);
        backend->setObject("b.txt", "abcdefghijklmnopqrst", T1);
        fs = std::make_unique<BucketFS>("test-bucket", std::move(backend), config);
    }

    // Fill a buffer the way readdir does, remembering the last accepted offset
    Status fill(DirectoryBuffer& buffer, off_t offset, off_t& last_offset) {
        return fs->listDirectory(kRootInode, offset,
            [&buffer, &last_offset](const InodeTable::Entry& entry, off_t next_offset) {
                if (!buffer.add(entry, next_offset)) {
                    return false;
                }
                last_offset = next_offset;
                return true;
            });
    }

    BucketFSConfig config;
    std::unique_ptr<BucketFS> fs;
};

TEST_F(DirectoryBufferTest, EntryThatDoesNotFitLeavesBufferUnchanged) {
    const auto& entries = fs->inodes().entries();
    ASSERT_EQ(entries.size(), 3u);
    const size_t two_entries = direntSize(entries[0].name) + direntSize(entries[1].name);

    DirectoryBuffer buffer(nullptr, two_entries);
    EXPECT_TRUE(buffer.add(entries[0], 1));
    EXPECT_TRUE(buffer.add(entries[1], 2));
    EXPECT_EQ(buffer.size(), two_entries);

    EXPECT_FALSE(buffer.add(entries[2], 3));
    EXPECT_EQ(buffer.size(), two_entries);
    EXPECT_EQ(buffer.capacity(), two_entries);
}

TEST_F(DirectoryBufferTest, ListingResumesFromLastAcceptedOffset) {
    const auto& entries = fs->inodes().entries();
    const size_t two_entries = direntSize(entries[0].name) + direntSize(entries[1].name);

    off_t last_offset = 0;
    DirectoryBuffer first(nullptr, two_entries);
    ASSERT_TRUE(fill(first, 0, last_offset).ok());
    EXPECT_EQ(first.size(), two_entries);
    EXPECT_EQ(last_offset, 2);

    DirectoryBuffer second(nullptr, 4096);
    ASSERT_TRUE(fill(second, last_offset, last_offset).ok());
    EXPECT_EQ(second.size(), direntSize(entries[2].name));
    EXPECT_EQ(last_offset, 3);

    // Nothing left: the empty reply ends the listing
    DirectoryBuffer third(nullptr, 4096);
    ASSERT_TRUE(fill(third, last_offset, last_offset).ok());
    EXPECT_EQ(third.size(), 0u);
}

TEST_F(DirectoryBufferTest, BufferTooSmallForAnyEntryStaysEmpty) {
    const auto& entries = fs->inodes().entries();

    DirectoryBuffer buffer(nullptr, direntSize(entries[0].name) - 1);
    off_t last_offset = 0;
    ASSERT_TRUE(fill(buffer, 0, last_offset).ok());

    EXPECT_EQ(buffer.size(), 0u);
    EXPECT_EQ(last_offset, 0);
}

TEST_F(DirectoryBufferTest, PackedEntriesAreAligned) {
    const auto& entries = fs->inodes().entries();

    DirectoryBuffer buffer(nullptr, 4096);
    for (std::size_t i = 0; i < entries.size(); ++i) {
        ASSERT_TRUE(buffer.add(entries[i], static_cast<off_t>(i + 1)));
    }

    EXPECT_EQ(buffer.size(), direntSize(".") + direntSize("a.txt") + direntSize("b.txt"));
    EXPECT_EQ(buffer.size() % sizeof(std::uint64_t), 0u);
}
