// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Choice.hxx"

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace FileOp {

class Entry;
class Operation;

static constexpr std::size_t DEFAULT_BUFFER_SIZE = 1024 * 1024;
static constexpr std::size_t MAX_BUFFER_SIZE = std::size_t{1} << 31;

struct ContextOptions {
	/**
	 * Copy permissions, owner and time stamps to the target?
	 * Failures are ignored, because many filesystems do not
	 * support all attributes.
	 */
	bool preserve = true;

	/**
	 * Follow symlinks when examining sources?
	 */
	bool deref = false;

	/**
	 * The maximum number of bytes transferred between two
	 * suspension points.
	 */
	std::size_t buffer_size = DEFAULT_BUFFER_SIZE;
};

/**
 * The policy of one batch operation: it decides how conflicts and
 * errors are resolved, receives progress notifications and drives
 * the #Operation.
 *
 * The Decide*() methods must return one of the enum values; anything
 * else throws #InvalidChoice and ends the operation.
 */
class Context {
public:
	ContextOptions options;

	Context() = default;

	explicit Context(const ContextOptions &_options) noexcept
		:options(_options) {}

	virtual ~Context() noexcept = default;

	Context(const Context &) = delete;
	Context &operator=(const Context &) = delete;

	/**
	 * A filesystem call has failed.
	 *
	 * @param message a human-readable message containing the path
	 * and the operating system's error string
	 */
	virtual IoErrorChoice DecideOnIoError(std::string_view message) = 0;

	/**
	 * The target exists and is not a directory.
	 */
	virtual OverwriteChoice DecideOnOverwrite(const Entry &source,
						  const Entry &target) = 0;

	/**
	 * Copying was aborted or skipped, and an incomplete target
	 * file was left behind.
	 */
	virtual PartialChoice DecideOnPartial(const Entry &source,
					      const Entry &target) = 0;

	/**
	 * A non-empty directory is about to be deleted, and recursive
	 * deletion has not been authorized for it yet.
	 */
	virtual NonEmptyDirChoice DecideOnNonEmptyDirDeletion(const Entry &entry) = 0;

	virtual void NotifyCopyStart(const Entry &, const Entry &) {}
	virtual void NotifyMoveStart(const Entry &, const Entry &) {}
	virtual void NotifyDeleteStart(const Entry &) {}

	/**
	 * Called after each buffer has been transferred.
	 */
	virtual void NotifyFileProgress(uint_least64_t, uint_least64_t) {}

	/**
	 * Drive the given operation.  The default implementation runs
	 * it to completion, resuming each suspension point with
	 * ResumeCommand::CONTINUE.
	 *
	 * If this method returns before the operation has finished,
	 * the remaining work is discarded.
	 *
	 * Exceptions from Operation::Start() and Operation::Resume()
	 * (contract violations) propagate.
	 */
	virtual void Start(Operation &operation);
};

} // namespace FileOp
