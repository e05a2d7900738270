// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "FileType.hxx"

#include <cstdint>

#include <sys/stat.h>
#include <time.h>

namespace FileOp {

/**
 * The subset of a stat() result the file operations are interested
 * in.
 */
struct FileStat {
	FileType type;

	uint_least64_t size;

	/**
	 * Permission bits (including setuid/setgid/sticky), without
	 * the file type.
	 */
	mode_t mode;

	uid_t uid;
	gid_t gid;

	struct timespec mtime, atime;

	dev_t dev;
	ino_t ino;

	[[gnu::pure]]
	static FileStat FromStat(const struct stat &st) noexcept;

	/**
	 * Do both refer to the same inode?
	 */
	constexpr bool IsSameFile(const FileStat &other) const noexcept {
		return dev == other.dev && ino == other.ino;
	}

	/**
	 * Was this file modified more recently than the other one?
	 */
	constexpr bool IsNewerThan(const FileStat &other) const noexcept {
		return mtime.tv_sec != other.mtime.tv_sec
			? mtime.tv_sec > other.mtime.tv_sec
			: mtime.tv_nsec > other.mtime.tv_nsec;
	}
};

} // namespace FileOp
