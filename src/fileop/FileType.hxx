// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstdint>
#include <string_view>

namespace FileOp {

enum class FileType : uint_least8_t {
	REGULAR,
	DIRECTORY,
	LINK,

	/**
	 * Device nodes, FIFOs and sockets.
	 */
	SPECIAL,
};

constexpr std::string_view
ToString(FileType type) noexcept
{
	switch (type) {
	case FileType::REGULAR:
		return "regular";

	case FileType::DIRECTORY:
		return "directory";

	case FileType::LINK:
		return "link";

	case FileType::SPECIAL:
		break;
	}

	return "special";
}

} // namespace FileOp
