// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "IoGuard.hxx"

#include <fmt/format.h>

#include <string.h>

namespace FileOp {

static constexpr std::string_view
GetTemplate(IoOperation operation) noexcept
{
	switch (operation) {
	case IoOperation::OPEN:
		return "Cannot open source file \"{}\"\n{}";

	case IoOperation::CREATE:
		return "Cannot create target file \"{}\"\n{}";

	case IoOperation::READ:
		return "Cannot read source file \"{}\"\n{}";

	case IoOperation::WRITE:
		return "Cannot write target file \"{}\"\n{}";

	case IoOperation::CLOSE_TARGET:
		return "Cannot close target file \"{}\"\n{}";

	case IoOperation::MKDIR:
		return "Cannot create target directory \"{}\"\n{}";

	case IoOperation::RMDIR:
		return "Cannot remove directory \"{}\"\n{}";

	case IoOperation::UNLINK:
		return "Cannot remove file \"{}\"\n{}";

	case IoOperation::STAT_SOURCE:
		return "Cannot stat source file \"{}\"\n{}";

	case IoOperation::READLINK:
		return "Cannot read source link \"{}\"\n{}";

	case IoOperation::SYMLINK:
		return "Cannot create target symlink \"{}\"\n{}";

	case IoOperation::OPENDIR:
		return "Cannot read directory \"{}\"\n{}";

	case IoOperation::ALLOCATE:
		return "Cannot allocate a transfer buffer for \"{}\"\n{}";
	}

	return "\"{}\"\n{}";
}

std::string
FormatIoError(IoOperation operation, std::string_view path, int error)
{
	return fmt::format(fmt::runtime(GetTemplate(operation)),
			   path, strerror(error));
}

std::string
FormatSameFile(std::string_view source, std::string_view target)
{
	return fmt::format("\"{}\"\nand\n\"{}\"\nare the same file",
			   source, target);
}

std::string
FormatMustBeDirectory(std::string_view path)
{
	return fmt::format("Destination \"{}\" must be a directory", path);
}

std::string
FormatSubdirectoryOfItself(std::string_view source, std::string_view target)
{
	return fmt::format("An attempt was made to make '{}' a subdirectory ('{}') of itself.",
			   source, target);
}

std::string
FormatUnsupportedType(std::string_view type_name)
{
	return fmt::format("I don't know how to copy files of type '{}'",
			   type_name);
}

} // namespace FileOp
