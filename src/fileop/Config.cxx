// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Config.hxx"
#include "PresetContext.hxx"
#include "io/config/LineParser.hxx"

#include <string_view>

using std::string_view_literals::operator""sv;

namespace FileOp {

void
Config::ApplyTo(PresetContext &ctx) const noexcept
{
	ctx.options = options;
	ctx.overwrite = on_overwrite;
	ctx.io_error = on_error;
	ctx.partial = on_partial;
	ctx.non_empty_dir = on_non_empty_dir;
}

static std::optional<OverwriteChoice>
ParseOverwriteChoice(std::string_view value)
{
	if (value == "ask"sv)
		return std::nullopt;
	else if (value == "overwrite"sv)
		return OverwriteChoice::OVERWRITE;
	else if (value == "skip"sv)
		return OverwriteChoice::SKIP;
	else if (value == "update"sv)
		return OverwriteChoice::UPDATE;
	else if (value == "reget"sv)
		return OverwriteChoice::REGET;
	else if (value == "abort"sv)
		return OverwriteChoice::ABORT;
	else
		throw LineParser::Error{"ask/overwrite/skip/update/reget/abort expected"};
}

static std::optional<IoErrorChoice>
ParseIoErrorChoice(std::string_view value)
{
	if (value == "ask"sv)
		return std::nullopt;
	else if (value == "skip"sv)
		return IoErrorChoice::SKIP;
	else if (value == "abort"sv)
		return IoErrorChoice::ABORT;
	else
		throw LineParser::Error{"ask/skip/abort expected"};
}

static std::optional<PartialChoice>
ParsePartialChoice(std::string_view value)
{
	if (value == "ask"sv)
		return std::nullopt;
	else if (value == "delete"sv)
		return PartialChoice::DELETE;
	else if (value == "keep"sv)
		return PartialChoice::KEEP;
	else
		throw LineParser::Error{"ask/delete/keep expected"};
}

static std::optional<NonEmptyDirChoice>
ParseNonEmptyDirChoice(std::string_view value)
{
	if (value == "ask"sv)
		return std::nullopt;
	else if (value == "delete"sv)
		return NonEmptyDirChoice::DELETE;
	else if (value == "skip"sv)
		return NonEmptyDirChoice::SKIP;
	else if (value == "abort"sv)
		return NonEmptyDirChoice::ABORT;
	else
		throw LineParser::Error{"ask/delete/skip/abort expected"};
}

void
ConfigFileParser::ParseLine(LineParser &line)
{
	const std::string_view word = line.ExpectWord();

	if (word == "preserve"sv) {
		config.options.preserve = line.NextBool();
		line.ExpectEnd();
	} else if (word == "deref"sv) {
		config.options.deref = line.NextBool();
		line.ExpectEnd();
	} else if (word == "buffer_size"sv) {
		config.options.buffer_size = line.NextPositiveInteger();
		line.ExpectEnd();
	} else if (word == "on_overwrite"sv)
		config.on_overwrite = ParseOverwriteChoice(line.ExpectValueAndEnd());
	else if (word == "on_error"sv)
		config.on_error = ParseIoErrorChoice(line.ExpectValueAndEnd());
	else if (word == "on_partial"sv)
		config.on_partial = ParsePartialChoice(line.ExpectValueAndEnd());
	else if (word == "on_non_empty_dir"sv)
		config.on_non_empty_dir = ParseNonEmptyDirChoice(line.ExpectValueAndEnd());
	else
		throw LineParser::Error{"Unknown option"};
}

void
LoadConfigFile(Config &config, const std::filesystem::path &path)
{
	ConfigFileParser parser{config};
	CommentConfigParser comment_parser{parser};
	ParseConfigFile(path, comment_parser);
}

} // namespace FileOp
