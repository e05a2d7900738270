// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <filesystem>

class LineParser;

class ConfigParser {
public:
	virtual ~ConfigParser() noexcept = default;

	virtual bool PreParseLine(LineParser &line);
	virtual void ParseLine(LineParser &line) = 0;
	virtual void Finish() {}
};

/**
 * A #ConfigParser which ignores empty lines and lines starting with
 * '#'.
 */
class CommentConfigParser final : public ConfigParser {
	ConfigParser &child;

public:
	explicit CommentConfigParser(ConfigParser &_child)
		:child(_child) {}

	/* virtual methods from class ConfigParser */
	bool PreParseLine(LineParser &line) override;
	void ParseLine(LineParser &line) final;
	void Finish() override;
};

/**
 * Feed all lines of the given text to the parser and call its
 * Finish() method.  The buffer is modified in place.
 *
 * Errors are rethrown nested in a #LineParser::Error which names the
 * given path and the line number.
 */
void
ParseConfigText(const std::filesystem::path &path, char *text,
		ConfigParser &parser);

/**
 * Load the specified file and feed it to the parser.
 *
 * Throws on error.
 */
void
ParseConfigFile(const std::filesystem::path &path, ConfigParser &parser);
