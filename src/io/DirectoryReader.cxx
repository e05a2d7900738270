// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "DirectoryReader.hxx"
#include "FileName.hxx"
#include "lib/fmt/SystemError.hxx"

DirectoryReader::DirectoryReader(const char *path)
	:dir(opendir(path))
{
	if (dir == nullptr)
		throw FmtErrno("Failed to open directory {}", path);
}

const char *
DirectoryReader::Read() noexcept
{
	while (const auto *ent = readdir(dir))
		if (!IsSpecialFilename(ent->d_name))
			return ent->d_name;

	return nullptr;
}
