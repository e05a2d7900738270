// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "FileDescriptor.hxx"

#include <errno.h>

#ifndef O_CLOEXEC
#define O_CLOEXEC 0
#endif

bool
FileDescriptor::Open(FileDescriptor dir, const char *pathname,
		     int flags, mode_t mode) noexcept
{
	fd = ::openat(dir.Get(), pathname, flags | O_NOCTTY | O_CLOEXEC, mode);
	return IsDefined();
}

bool
FileDescriptor::Open(const char *pathname, int flags, mode_t mode) noexcept
{
	fd = ::open(pathname, flags | O_NOCTTY | O_CLOEXEC, mode);
	return IsDefined();
}

bool
FileDescriptor::OpenReadOnly(const char *pathname) noexcept
{
	return Open(pathname, O_RDONLY);
}

bool
FileDescriptor::FullWrite(std::span<const std::byte> src) const noexcept
{
	while (!src.empty()) {
		ssize_t nbytes = Write(src);
		if (nbytes < 0) [[unlikely]] {
			if (errno == EINTR)
				continue;

			return false;
		}

		if (nbytes == 0) [[unlikely]] {
			errno = ENOSPC;
			return false;
		}

		src = src.subspan(nbytes);
	}

	return true;
}
