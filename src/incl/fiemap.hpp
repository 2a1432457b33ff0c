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

#pragma once

#include <cstddef>
#include <cstdint>

extern "C" {
	#include <linux/fiemap.h>
}

/**
 * @brief Number of extents requested from the kernel per FS_IOC_FIEMAP call.
 *
 */
#define FIEMAP_BATCH_SIZE 32

/**
 * @brief One extent as returned by FS_IOC_FIEMAP. Same layout as the kernel's
 * struct fiemap_extent (linux/fiemap.h), checked below.
 *
 */
struct FiemapExtent {
	uint64_t fe_logical;       ///< Logical offset in bytes of the start of the extent
	uint64_t fe_physical;      ///< Physical offset in bytes of the start of the extent
	uint64_t fe_length;        ///< Length in bytes of the extent
	uint64_t fe_reserved64[2];
	uint32_t fe_flags;         ///< FIEMAP_EXTENT_* flags
	uint32_t fe_reserved[3];
};

/**
 * @brief FS_IOC_FIEMAP request header followed by room for FIEMAP_BATCH_SIZE
 * extents. The header has the layout of the kernel's struct fiemap.
 *
 */
struct FiemapRequest {
	uint64_t fm_start;          ///< Logical offset (inclusive) to start mapping at (in)
	uint64_t fm_length;         ///< Logical length of the range to map (in)
	uint32_t fm_flags;          ///< FIEMAP_FLAG_* flags (in/out)
	uint32_t fm_mapped_extents; ///< Number of extents mapped (out)
	uint32_t fm_extent_count;   ///< Size of fm_extents (in)
	uint32_t fm_reserved;
	FiemapExtent fm_extents[FIEMAP_BATCH_SIZE]; ///< Mapped extents (out)
};

static_assert(sizeof(FiemapExtent) == 56, "fiemap_extent is 56 bytes");
static_assert(sizeof(FiemapExtent) == sizeof(struct fiemap_extent), "FiemapExtent size mismatch");
static_assert(offsetof(FiemapExtent, fe_logical) == offsetof(struct fiemap_extent, fe_logical), "fe_logical");
static_assert(offsetof(FiemapExtent, fe_physical) == offsetof(struct fiemap_extent, fe_physical), "fe_physical");
static_assert(offsetof(FiemapExtent, fe_length) == offsetof(struct fiemap_extent, fe_length), "fe_length");
static_assert(offsetof(FiemapExtent, fe_flags) == offsetof(struct fiemap_extent, fe_flags), "fe_flags");
static_assert(sizeof(struct fiemap) == 32, "fiemap header is 32 bytes");
static_assert(offsetof(FiemapRequest, fm_mapped_extents) == offsetof(struct fiemap, fm_mapped_extents), "fm_mapped_extents");
static_assert(offsetof(FiemapRequest, fm_extent_count) == offsetof(struct fiemap, fm_extent_count), "fm_extent_count");
static_assert(offsetof(FiemapRequest, fm_extents) == sizeof(struct fiemap), "fm_extents follows the header");
static_assert(sizeof(FiemapRequest) == sizeof(struct fiemap) + FIEMAP_BATCH_SIZE * sizeof(FiemapExtent),
			  "no padding after fm_extents");
