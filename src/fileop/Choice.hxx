// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string_view>

namespace FileOp {

/**
 * The command passed to Operation::Resume() at a suspension point.
 */
enum class ResumeCommand : uint_least8_t {
	CONTINUE,

	/**
	 * Clean up and terminate the whole operation.
	 */
	ABORT,

	/**
	 * Clean up and continue with the next entry.  Not allowed
	 * before deleting a file.
	 */
	SKIP,
};

/**
 * The answer to Context::DecideOnIoError().
 */
enum class IoErrorChoice : uint_least8_t {
	ABORT,
	SKIP,
};

/**
 * The answer to Context::DecideOnOverwrite().
 */
enum class OverwriteChoice : uint_least8_t {
	ABORT,
	SKIP,
	OVERWRITE,

	/**
	 * Overwrite only if the source is newer than the
	 * destination.
	 */
	UPDATE,

	/**
	 * The destination is a prefix of the source; append the
	 * rest.
	 */
	REGET,
};

/**
 * The answer to Context::DecideOnPartial().
 */
enum class PartialChoice : uint_least8_t {
	DELETE,
	KEEP,
};

/**
 * The answer to Context::DecideOnNonEmptyDirDeletion().
 */
enum class NonEmptyDirChoice : uint_least8_t {
	ABORT,
	SKIP,

	/**
	 * Delete the directory and everything below it without
	 * asking again.
	 */
	DELETE,
};

/**
 * A #Context has returned a value which is not allowed for the
 * question.  This is a programming error which ends the operation.
 */
class InvalidChoice : public std::logic_error {
public:
	using std::logic_error::logic_error;
};

[[noreturn]] [[gnu::cold]]
void
ThrowInvalidChoice(std::string_view question, unsigned value);

std::string_view
ToString(ResumeCommand command) noexcept;

std::string_view
ToString(OverwriteChoice choice) noexcept;

} // namespace FileOp
