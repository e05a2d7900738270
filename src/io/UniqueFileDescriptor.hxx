// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "FileDescriptor.hxx"

#include <utility>

/**
 * An OO wrapper for a UNIX file descriptor which closes it
 * automatically in the destructor.
 */
class UniqueFileDescriptor : public FileDescriptor {
public:
	UniqueFileDescriptor() noexcept
		:FileDescriptor(FileDescriptor::Undefined()) {}

	explicit UniqueFileDescriptor(int _fd) noexcept
		:FileDescriptor(_fd) {}

	explicit UniqueFileDescriptor(FileDescriptor _fd) noexcept
		:FileDescriptor(_fd) {}

	UniqueFileDescriptor(const UniqueFileDescriptor &) = delete;

	UniqueFileDescriptor(UniqueFileDescriptor &&other) noexcept
		:FileDescriptor(other.Steal()) {}

	~UniqueFileDescriptor() noexcept {
		if (IsDefined())
			Close();
	}

	UniqueFileDescriptor &operator=(UniqueFileDescriptor &&other) noexcept {
		using std::swap;
		swap(fd, other.fd);
		return *this;
	}

	/**
	 * Convert this object to its #FileDescriptor base type.  This
	 * is an explicit method to make sure the caller is aware that
	 * the returned object is unmanaged.
	 */
	const FileDescriptor &ToFileDescriptor() const noexcept {
		return *this;
	}

	/**
	 * Release ownership and return the unmanaged
	 * #FileDescriptor.
	 */
	FileDescriptor Release() noexcept {
		return FileDescriptor{Steal()};
	}

	bool Open(const char *pathname, int flags, mode_t mode=0666) noexcept {
		if (IsDefined())
			Close();
		return FileDescriptor::Open(pathname, flags, mode);
	}

	bool OpenReadOnly(const char *pathname) noexcept {
		if (IsDefined())
			Close();
		return FileDescriptor::OpenReadOnly(pathname);
	}
};
