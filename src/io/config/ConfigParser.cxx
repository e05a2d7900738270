// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ConfigParser.hxx"
#include "LineParser.hxx"
#include "io/UniqueFileDescriptor.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "lib/fmt/SystemError.hxx"

#include <fmt/format.h>

#include <array>
#include <string>

#include <string.h>

using std::string_view_literals::operator""sv;

/**
 * Configuration files larger than this are rejected.
 */
static constexpr std::size_t MAX_CONFIG_SIZE = 256 * 1024;

bool
ConfigParser::PreParseLine(LineParser &)
{
	return false;
}

bool
CommentConfigParser::PreParseLine(LineParser &line)
{
	if (child.PreParseLine(line))
		return true;

	if (line.front() == '#' || line.IsEnd())
		/* ignore empty lines and comments */
		return true;

	return ConfigParser::PreParseLine(line);
}

void
CommentConfigParser::ParseLine(LineParser &line)
{
	child.ParseLine(line);
}

void
CommentConfigParser::Finish()
{
	child.Finish();
	ConfigParser::Finish();
}

void
ParseConfigText(const std::filesystem::path &path, char *text,
		ConfigParser &parser)
{
	unsigned i = 1;
	while (text != nullptr) {
		char *line = text;
		text = strchr(text, '\n');
		if (text != nullptr)
			*text++ = 0;

		LineParser line_parser(line);

		try {
			if (!parser.PreParseLine(line_parser))
				parser.ParseLine(line_parser);
		} catch (...) {
			std::throw_with_nested(LineParser::Error{fmt::format("{}:{}"sv,
									     path.native(), i)});
		}

		++i;
	}

	parser.Finish();
}

static std::string
LoadConfigFile(const std::filesystem::path &path)
{
	UniqueFileDescriptor fd;
	if (!fd.OpenReadOnly(path.c_str()))
		throw FmtErrno("Failed to open {}", path.native());

	std::string result;
	std::array<char, 4096> buffer;

	while (true) {
		ssize_t nbytes = fd.Read(buffer.data(), buffer.size());
		if (nbytes < 0)
			throw FmtErrno("Failed to read {}", path.native());

		if (nbytes == 0)
			break;

		result.append(buffer.data(), nbytes);
		if (result.size() > MAX_CONFIG_SIZE)
			throw FmtRuntimeError("File is too large: {}",
					      path.native());
	}

	return result;
}

void
ParseConfigFile(const std::filesystem::path &path, ConfigParser &parser)
{
	auto text = LoadConfigFile(path);
	ParseConfigText(path, text.data(), parser);
}
