// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Choice.hxx"

#include <fmt/format.h>

namespace FileOp {

void
ThrowInvalidChoice(std::string_view question, unsigned value)
{
	throw InvalidChoice{fmt::format("Invalid choice {} for {}",
					value, question)};
}

std::string_view
ToString(ResumeCommand command) noexcept
{
	switch (command) {
	case ResumeCommand::CONTINUE:
		return "continue";

	case ResumeCommand::ABORT:
		return "abort";

	case ResumeCommand::SKIP:
		return "skip";
	}

	return "?";
}

std::string_view
ToString(OverwriteChoice choice) noexcept
{
	switch (choice) {
	case OverwriteChoice::ABORT:
		return "abort";

	case OverwriteChoice::SKIP:
		return "skip";

	case OverwriteChoice::OVERWRITE:
		return "overwrite";

	case OverwriteChoice::UPDATE:
		return "update";

	case OverwriteChoice::REGET:
		return "reget";
	}

	return "?";
}

} // namespace FileOp
