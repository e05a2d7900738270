// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Entry.hxx"

namespace FileOp {

static constexpr FileType
ModeToFileType(mode_t mode) noexcept
{
	if (S_ISREG(mode))
		return FileType::REGULAR;
	else if (S_ISDIR(mode))
		return FileType::DIRECTORY;
	else if (S_ISLNK(mode))
		return FileType::LINK;
	else
		return FileType::SPECIAL;
}

FileStat
FileStat::FromStat(const struct stat &st) noexcept
{
	return {
		.type = ModeToFileType(st.st_mode),
		.size = static_cast<uint_least64_t>(st.st_size),
		.mode = static_cast<mode_t>(st.st_mode & ~S_IFMT),
		.uid = st.st_uid,
		.gid = st.st_gid,
		.mtime = st.st_mtim,
		.atime = st.st_atim,
		.dev = st.st_dev,
		.ino = st.st_ino,
	};
}

std::string
JoinPath(std::string_view directory, std::string_view name)
{
	std::string result{directory};
	if (result.empty() || result.back() != '/')
		result.push_back('/');
	result.append(name);
	return result;
}

std::string_view
GetBaseName(std::string_view path) noexcept
{
	while (path.size() > 1 && path.back() == '/')
		path.remove_suffix(1);

	const auto slash = path.rfind('/');
	if (slash == path.npos || path.size() == 1)
		return path;

	return path.substr(slash + 1);
}

} // namespace FileOp
