// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace FileOp {

/**
 * The kinds of filesystem calls which are guarded by
 * Walker::TryIo().  Each has its own message template.
 */
enum class IoOperation : uint_least8_t {
	OPEN,
	CREATE,
	READ,
	WRITE,
	CLOSE_TARGET,
	MKDIR,
	RMDIR,
	UNLINK,
	STAT_SOURCE,
	READLINK,
	SYMLINK,
	OPENDIR,
	ALLOCATE,
};

/**
 * Format the human-readable message describing a failed filesystem
 * call.
 *
 * @param error the errno value
 */
[[gnu::cold]]
std::string
FormatIoError(IoOperation operation, std::string_view path, int error);

[[gnu::cold]]
std::string
FormatSameFile(std::string_view source, std::string_view target);

[[gnu::cold]]
std::string
FormatMustBeDirectory(std::string_view path);

[[gnu::cold]]
std::string
FormatSubdirectoryOfItself(std::string_view source, std::string_view target);

[[gnu::cold]]
std::string
FormatUnsupportedType(std::string_view type_name);

} // namespace FileOp
