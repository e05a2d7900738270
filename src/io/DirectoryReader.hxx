// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <dirent.h>

/**
 * Reads the names in a directory, skipping the special entries "."
 * and "..".
 */
class DirectoryReader {
	DIR *const dir;

public:
	/**
	 * Throws std::system_error on error.
	 */
	explicit DirectoryReader(const char *path);

	DirectoryReader(const DirectoryReader &) = delete;

	~DirectoryReader() noexcept {
		closedir(dir);
	}

	DirectoryReader &operator=(const DirectoryReader &) = delete;

	/**
	 * @return the next name or nullptr at the end of the
	 * directory
	 */
	const char *Read() noexcept;
};
