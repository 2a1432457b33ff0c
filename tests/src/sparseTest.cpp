/*
 *    Copyright (C) 2026 The cowcopy authors
 *
 *    This file is part of cowcopy.
 *
 *    cowcopy is free software: you can redistribute it and/or modify
 *    it under the terms of the GNU General Public License as published by
 *    the Free Software Foundation, either version 3 of the License, or
 *    (at your option) any later version.
 *
 *    cowcopy is distributed in the hope that it will be useful,
 *    but WITHOUT ANY WARRANTY; without even the implied warranty of
 *    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *    GNU General Public License for more details.
 *
 *    You should have received a copy of the GNU General Public License
 *    along with cowcopy.  If not, see <https://www.gnu.org/licenses/>.
 */

#include "gtest/gtest.h"
#include "fileOps.hpp"
#include "testUtils.hpp"

using namespace file_ops;
using namespace test_utils;

class SparseTest : public ::testing::Test {
protected:
	ScratchDir dir;

	void SetUp() override {
		if (!fs_supports_sparse())
			GTEST_SKIP() << "filesystem has no holes";
	}
};

TEST_F(SparseTest, PresizedFileIsSparse) {
	fs::path file = dir / "sparse.bin";
	truncate_file(file, SPARSE_FILE_SZ);
	EXPECT_TRUE(probably_sparse(FileDescriptor::open_read(file)));

	write_file(file, "test");
	EXPECT_TRUE(probably_sparse(FileDescriptor::open_read(file)));
}

TEST_F(SparseTest, HalfWrittenFileIsSparse) {
	fs::path file = dir / "sparse.bin";
	truncate_file(file, SPARSE_FILE_SZ);
	write_file(file, std::string(SPARSE_FILE_SZ / 2, 'x'));
	EXPECT_TRUE(probably_sparse(FileDescriptor::open_read(file)));
}

TEST_F(SparseTest, WrittenFileIsNotSparse) {
	fs::path file = dir / "dense.bin";
	write_file(file, std::string(128 * 1024, 'X'));
	EXPECT_FALSE(probably_sparse(FileDescriptor::open_read(file)));
}

TEST_F(SparseTest, EmptyFileIsNotSparse) {
	fs::path file = dir / "empty.bin";
	truncate_file(file, 0);
	EXPECT_FALSE(probably_sparse(FileDescriptor::open_read(file)));
}

TEST_F(SparseTest, AllocateFileLeavesItSparse) {
	fs::path file = dir / "sparse.bin";
	const uint64_t len = 32 * 1024 * 1024;
	{
		FileDescriptor fd = FileDescriptor::create(file);
		allocate_file(fd, len);
	}
	EXPECT_EQ(fs::file_size(file), len);
	EXPECT_TRUE(probably_sparse(FileDescriptor::open_read(file)));
}

TEST_F(SparseTest, SeekDataFindsWrittenRegion) {
	fs::path file = dir / "sparse.bin";
	const off_t offset = 512 * 1024;
	truncate_file(file, SPARSE_FILE_SZ);
	write_file(file, TEST_DATA, offset);

	FileDescriptor fd = FileDescriptor::open_read(file);
	EXPECT_TRUE(probably_sparse(fd));
	boost::optional<uint64_t> off = file_ops::lseek(fd, 0, SEEK_DATA);
	ASSERT_TRUE(off);
	EXPECT_EQ(*off, uint64_t(offset));
}

TEST_F(SparseTest, SeekDataInHoleOnlyFileIsEnd) {
	fs::path file = dir / "sparse.bin";
	truncate_file(file, SPARSE_FILE_SZ);
	FileDescriptor fd = FileDescriptor::open_read(file);
	EXPECT_FALSE(file_ops::lseek(fd, 0, SEEK_DATA));
}

TEST_F(SparseTest, SeekPastEndIsEnd) {
	fs::path file = dir / "dense.bin";
	write_file(file, TEST_DATA);
	FileDescriptor fd = FileDescriptor::open_read(file);
	EXPECT_FALSE(file_ops::lseek(fd, 4096, SEEK_DATA));
	EXPECT_FALSE(file_ops::lseek(fd, 4096, SEEK_HOLE));
}

TEST_F(SparseTest, SeekSetMovesCursor) {
	fs::path file = dir / "dense.bin";
	write_file(file, TEST_DATA);
	FileDescriptor fd = FileDescriptor::open_read(file);
	boost::optional<uint64_t> off = file_ops::lseek(fd, 5, SEEK_SET);
	ASSERT_TRUE(off);
	EXPECT_EQ(*off, 5u);
	char buf[4];
	ASSERT_EQ(::read(fd.get(), buf, sizeof(buf)), 4);
	EXPECT_EQ(std::string(buf, 4), "data");
}

TEST_F(SparseTest, SegmentsWalkDataAndHoles) {
	fs::path from = dir / "from.bin";
	fs::path to = dir / "to.bin";
	const blksize_t bs = block_size(dir.path());
	const uint64_t len = 64 * bs;
	truncate_file(from, len);
	write_file(from, std::string(bs, 'a'), 8 * bs);
	write_file(from, std::string(bs, 'b'), 32 * bs);
	truncate_file(to, len);

	FileDescriptor infd = FileDescriptor::open_read(from);
	FileDescriptor outfd = FileDescriptor::open(to, O_WRONLY);

	std::pair<uint64_t, uint64_t> seg = next_sparse_segments(infd, outfd, 0);
	EXPECT_EQ(seg.first, uint64_t(8 * bs));
	EXPECT_EQ(seg.second, uint64_t(9 * bs));
	EXPECT_EQ(::lseek(infd.get(), 0, SEEK_CUR), off_t(8 * bs));
	EXPECT_EQ(::lseek(outfd.get(), 0, SEEK_CUR), off_t(8 * bs));

	seg = next_sparse_segments(infd, outfd, seg.second);
	EXPECT_EQ(seg.first, uint64_t(32 * bs));
	EXPECT_EQ(seg.second, uint64_t(33 * bs));

	// only a hole left: both ends collapse to the length
	seg = next_sparse_segments(infd, outfd, seg.second);
	EXPECT_EQ(seg.first, len);
	EXPECT_EQ(seg.second, len);
}
