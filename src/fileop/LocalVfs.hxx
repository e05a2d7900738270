// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Vfs.hxx"

namespace FileOp {

/**
 * A #Vfs implementation which passes all calls to the local kernel.
 */
class LocalVfs : public Vfs {
public:
	/**
	 * A process-wide instance, for callers which do not need a
	 * custom #Vfs.
	 */
	static LocalVfs &GetDefault() noexcept;

	/* virtual methods from class Vfs */
	bool Stat(const char *path, bool follow, FileStat &st) noexcept override;
	std::unique_ptr<VfsFile> OpenFile(const char *path, int flags,
					  mode_t mode) override;
	std::unique_ptr<VfsDirectory> OpenDirectory(const char *path) override;
	bool MakeDirectory(const char *path, mode_t mode) noexcept override;
	bool RemoveDirectory(const char *path) noexcept override;
	bool Unlink(const char *path) noexcept override;
	bool Rename(const char *from, const char *to) noexcept override;
	bool Link(const char *from, const char *to) noexcept override;
	bool Symlink(const char *target, const char *path) noexcept override;
	bool ReadLink(const char *path, std::string &target) override;
	bool Chmod(const char *path, mode_t mode) noexcept override;
	bool Chown(const char *path, uid_t uid, gid_t gid) noexcept override;
	bool SetTimes(const char *path,
		      const struct timespec &atime,
		      const struct timespec &mtime) noexcept override;
};

} // namespace FileOp
