// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "FileStat.hxx"

#include <cassert>
#include <optional>
#include <string>
#include <string_view>

namespace FileOp {

/**
 * A path plus the result of exactly one stat() call on it.  If the
 * stat() call failed, the entry "does not exist".
 *
 * Entries are resolved fresh for each step of a tree walk and are
 * never modified afterwards.
 */
class Entry {
	std::string path;

	std::optional<FileStat> stat;

public:
	explicit Entry(std::string _path) noexcept
		:path(std::move(_path)) {}

	Entry(std::string _path, const FileStat &_stat) noexcept
		:path(std::move(_path)), stat(_stat) {}

	const std::string &GetPath() const noexcept {
		return path;
	}

	const char *c_str() const noexcept {
		return path.c_str();
	}

	bool Exists() const noexcept {
		return stat.has_value();
	}

	const FileStat &GetStat() const noexcept {
		assert(stat);
		return *stat;
	}

	FileType GetType() const noexcept {
		return GetStat().type;
	}

	bool IsDirectory() const noexcept {
		return Exists() && stat->type == FileType::DIRECTORY;
	}
};

/**
 * Append a name to a directory path, separated by exactly one slash.
 */
std::string
JoinPath(std::string_view directory, std::string_view name);

/**
 * Return the last segment of the given path, ignoring trailing
 * slashes.
 */
[[gnu::pure]]
std::string_view
GetBaseName(std::string_view path) noexcept;

} // namespace FileOp
