// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Context.hxx"
#include "io/config/ConfigParser.hxx"

#include <filesystem>
#include <optional>

namespace FileOp {

class PresetContext;

/**
 * Settings loaded from a configuration file.  Unset answers
 * ("ask") are left to the interactive context.
 */
struct Config {
	ContextOptions options;

	std::optional<OverwriteChoice> on_overwrite;
	std::optional<IoErrorChoice> on_error;
	std::optional<PartialChoice> on_partial;
	std::optional<NonEmptyDirChoice> on_non_empty_dir;

	/**
	 * Copy the options and the preset answers into the given
	 * context.
	 */
	void ApplyTo(PresetContext &ctx) const noexcept;
};

/**
 * Parses the lines of a configuration file into a #Config.  Wrap it
 * in a #CommentConfigParser to allow comments and empty lines.
 */
class ConfigFileParser final : public ConfigParser {
	Config &config;

public:
	explicit ConfigFileParser(Config &_config) noexcept
		:config(_config) {}

	/* virtual methods from class ConfigParser */
	void ParseLine(LineParser &line) override;
};

/**
 * Load the given configuration file into the #Config object.
 * Settings which are not mentioned in the file are left alone.
 *
 * Throws on error.
 */
void
LoadConfigFile(Config &config, const std::filesystem::path &path);

} // namespace FileOp
