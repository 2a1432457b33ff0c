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
#include "fiemap.hpp"
#include "fileOps.hpp"
#include "testUtils.hpp"

using namespace file_ops;
using namespace test_utils;

TEST(MergeExtentsTest, EmptyStaysEmpty) {
	EXPECT_TRUE(merge_extents({}).empty());
}

TEST(MergeExtentsTest, JoinsTouchingAndOverlapping) {
	std::vector<Extent> merged = merge_extents({ {0, 10}, {10, 20}, {15, 30}, {40, 50} });
	ASSERT_EQ(merged.size(), 2u);
	EXPECT_EQ(merged[0], (Extent{0, 30}));
	EXPECT_EQ(merged[1], (Extent{40, 50}));
}

TEST(MergeExtentsTest, SortsFirst) {
	std::vector<Extent> merged = merge_extents({ {40, 50}, {0, 10}, {5, 8}, {20, 30} });
	ASSERT_EQ(merged.size(), 3u);
	EXPECT_EQ(merged[0], (Extent{0, 10}));
	EXPECT_EQ(merged[1], (Extent{20, 30}));
	EXPECT_EQ(merged[2], (Extent{40, 50}));
}

TEST(MergeExtentsTest, DisjointUntouched) {
	std::vector<Extent> in = { {0, 1}, {2, 3}, {4, 5} };
	EXPECT_EQ(merge_extents(in), in);
}

class ExtentsTest : public ::testing::Test {
protected:
	ScratchDir dir;

	void SetUp() override {
		if (!fs_supports_extents())
			GTEST_SKIP() << "filesystem has no extents";
	}
};

TEST_F(ExtentsTest, HoleOnlyFileHasNoExtents) {
	fs::path file = dir / "sparse.bin";
	truncate_file(file, SPARSE_FILE_SZ);
	boost::optional<std::vector<Extent>> extents = map_extents(FileDescriptor::open_read(file));
	ASSERT_TRUE(extents);
	EXPECT_TRUE(extents->empty());
}

TEST_F(ExtentsTest, SingleBlockExtent) {
	fs::path from = dir / "from.txt";
	fs::path file = dir / "sparse.bin";
	const uint64_t offset = 512 * 1024;
	write_file(from, TEST_DATA);
	truncate_file(file, SPARSE_FILE_SZ);
	{
		FileDescriptor infd = FileDescriptor::open_read(from);
		FileDescriptor outfd = FileDescriptor::open(file, O_WRONLY);
		ASSERT_EQ(copy_file_offset(infd, outfd, sizeof(TEST_DATA) - 1, 0, offset), sizeof(TEST_DATA) - 1);
	}
	const blksize_t bs = block_size(file);

	boost::optional<std::vector<Extent>> extents = map_extents(FileDescriptor::open_read(file));
	ASSERT_TRUE(extents);
	ASSERT_EQ(extents->size(), 1u);
	EXPECT_EQ(extents->front().start, offset);
	EXPECT_EQ(extents->front().end, offset + bs);
}

TEST_F(ExtentsTest, ManyExtentsAcrossBatches) {
	fs::path file = dir / "sparse.bin";
	const blksize_t bs = block_size(dir.path());
	const uint64_t fsize = 1024 * 1024;
	truncate_file(file, fsize);
	// every other block, far more extents than one FIEMAP batch holds
	std::string block(bs, '\xff');
	for (uint64_t off = 0; off < fsize; off += 2 * bs)
		write_file(file, block, off);
	ASSERT_GT(fsize / bs / 2, uint64_t(FIEMAP_BATCH_SIZE));

	boost::optional<std::vector<Extent>> extents = map_extents(FileDescriptor::open_read(file));
	ASSERT_TRUE(extents);
	EXPECT_EQ(extents->size(), fsize / bs / 2);
	for (size_t i = 0; i < extents->size(); ++i) {
		EXPECT_EQ((*extents)[i].start, i * 2 * bs);
		EXPECT_EQ((*extents)[i].end, i * 2 * bs + bs);
	}
}

TEST_F(ExtentsTest, DenseFileIsOneRange) {
	fs::path file = dir / "file.bin";
	const uint64_t size = 128 * 1024;
	write_file(file, std::string(size, 'X'));

	boost::optional<std::vector<Extent>> extents = map_extents(FileDescriptor::open_read(file));
	ASSERT_TRUE(extents);
	std::vector<Extent> merged = merge_extents(*extents);
	ASSERT_EQ(merged.size(), 1u);
	EXPECT_EQ(merged.front(), (Extent{0, size}));
}

TEST_F(ExtentsTest, ProcfsIsUnsupported) {
	FileDescriptor fd = FileDescriptor::open_read("/proc/cpuinfo");
	EXPECT_FALSE(map_extents(fd));
}
