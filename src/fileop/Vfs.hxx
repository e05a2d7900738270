// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstddef>
#include <memory>
#include <span>
#include <string>

#include <sys/types.h>
#include <time.h>

namespace FileOp {

struct FileStat;

/**
 * An open file inside a #Vfs.  The destructor closes it (without
 * error reporting); call Close() to find out whether closing
 * succeeded.
 *
 * All methods report errors like the POSIX functions they resemble:
 * they return a negative value or false and set errno.
 */
class VfsFile {
public:
	virtual ~VfsFile() noexcept = default;

	/**
	 * @return the number of bytes read, 0 on end of file, -1 on
	 * error
	 */
	virtual ssize_t Read(std::span<std::byte> dest) noexcept = 0;

	/**
	 * Write all of the given data.
	 */
	virtual bool Write(std::span<const std::byte> src) noexcept = 0;

	/**
	 * Move the file position to the given absolute offset.
	 */
	virtual bool Seek(off_t offset) noexcept = 0;

	virtual bool Close() noexcept = 0;
};

/**
 * An open directory inside a #Vfs.
 */
class VfsDirectory {
public:
	virtual ~VfsDirectory() noexcept = default;

	/**
	 * @return the next name (never "." or "..") or nullptr at
	 * the end; the pointer is valid until the next call
	 */
	virtual const char *Read() noexcept = 0;
};

/**
 * The filesystem surface the file operations are implemented on.
 * Paths are passed through verbatim; it is up to the implementation
 * how to interpret them.
 *
 * Errors are reported POSIX-style: false/nullptr is returned and
 * errno is set.
 */
class Vfs {
public:
	virtual ~Vfs() noexcept = default;

	/**
	 * @param follow follow a symlink (stat()) or not (lstat())
	 */
	virtual bool Stat(const char *path, bool follow, FileStat &st) noexcept = 0;

	virtual std::unique_ptr<VfsFile> OpenFile(const char *path, int flags,
						  mode_t mode=0666) = 0;

	virtual std::unique_ptr<VfsDirectory> OpenDirectory(const char *path) = 0;

	virtual bool MakeDirectory(const char *path, mode_t mode) noexcept = 0;
	virtual bool RemoveDirectory(const char *path) noexcept = 0;
	virtual bool Unlink(const char *path) noexcept = 0;
	virtual bool Rename(const char *from, const char *to) noexcept = 0;

	/**
	 * Create a hard link.
	 */
	virtual bool Link(const char *from, const char *to) noexcept = 0;

	virtual bool Symlink(const char *target, const char *path) noexcept = 0;
	virtual bool ReadLink(const char *path, std::string &target) = 0;

	virtual bool Chmod(const char *path, mode_t mode) noexcept = 0;
	virtual bool Chown(const char *path, uid_t uid, gid_t gid) noexcept = 0;
	virtual bool SetTimes(const char *path,
			      const struct timespec &atime,
			      const struct timespec &mtime) noexcept = 0;
};

} // namespace FileOp
