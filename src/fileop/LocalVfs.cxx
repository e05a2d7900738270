// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "LocalVfs.hxx"
#include "FileStat.hxx"
#include "io/DirectoryReader.hxx"
#include "io/UniqueFileDescriptor.hxx"

#include <array>
#include <system_error>

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <stdio.h> // for rename()
#include <unistd.h>
#include <sys/stat.h>

namespace FileOp {

namespace {

class LocalFile final : public VfsFile {
	UniqueFileDescriptor fd;

public:
	explicit LocalFile(UniqueFileDescriptor &&_fd) noexcept
		:fd(std::move(_fd)) {}

	ssize_t Read(std::span<std::byte> dest) noexcept override {
		ssize_t nbytes;
		do {
			nbytes = fd.Read(dest);
		} while (nbytes < 0 && errno == EINTR);

		return nbytes;
	}

	bool Write(std::span<const std::byte> src) noexcept override {
		return fd.FullWrite(src);
	}

	bool Seek(off_t offset) noexcept override {
		return fd.Seek(offset) == offset;
	}

	bool Close() noexcept override {
		return fd.Close();
	}
};

class LocalDirectory final : public VfsDirectory {
	DirectoryReader reader;

public:
	explicit LocalDirectory(const char *path)
		:reader(path) {}

	const char *Read() noexcept override {
		return reader.Read();
	}
};

} // anonymous namespace

LocalVfs &
LocalVfs::GetDefault() noexcept
{
	static LocalVfs instance;
	return instance;
}

bool
LocalVfs::Stat(const char *path, bool follow, FileStat &st) noexcept
{
	struct stat buffer;
	if ((follow ? stat(path, &buffer) : lstat(path, &buffer)) < 0)
		return false;

	st = FileStat::FromStat(buffer);
	return true;
}

std::unique_ptr<VfsFile>
LocalVfs::OpenFile(const char *path, int flags, mode_t mode)
{
	UniqueFileDescriptor fd;
	if (!fd.Open(path, flags, mode))
		return nullptr;

	return std::make_unique<LocalFile>(std::move(fd));
}

std::unique_ptr<VfsDirectory>
LocalVfs::OpenDirectory(const char *path)
{
	try {
		return std::make_unique<LocalDirectory>(path);
	} catch (const std::system_error &e) {
		errno = e.code().value();
		return nullptr;
	}
}

bool
LocalVfs::MakeDirectory(const char *path, mode_t mode) noexcept
{
	return mkdir(path, mode) == 0;
}

bool
LocalVfs::RemoveDirectory(const char *path) noexcept
{
	return rmdir(path) == 0;
}

bool
LocalVfs::Unlink(const char *path) noexcept
{
	return unlink(path) == 0;
}

bool
LocalVfs::Rename(const char *from, const char *to) noexcept
{
	return rename(from, to) == 0;
}

bool
LocalVfs::Link(const char *from, const char *to) noexcept
{
	return link(from, to) == 0;
}

bool
LocalVfs::Symlink(const char *target, const char *path) noexcept
{
	return symlink(target, path) == 0;
}

bool
LocalVfs::ReadLink(const char *path, std::string &target)
{
	std::array<char, PATH_MAX> buffer;

	ssize_t length = readlink(path, buffer.data(), buffer.size());
	if (length < 0)
		return false;

	if (static_cast<std::size_t>(length) == buffer.size()) {
		errno = ENAMETOOLONG;
		return false;
	}

	target.assign(buffer.data(), length);
	return true;
}

bool
LocalVfs::Chmod(const char *path, mode_t mode) noexcept
{
	return chmod(path, mode) == 0;
}

bool
LocalVfs::Chown(const char *path, uid_t uid, gid_t gid) noexcept
{
	return chown(path, uid, gid) == 0;
}

bool
LocalVfs::SetTimes(const char *path,
		   const struct timespec &atime,
		   const struct timespec &mtime) noexcept
{
	const struct timespec times[2]{atime, mtime};
	return utimensat(AT_FDCWD, path, times, 0) == 0;
}

} // namespace FileOp
