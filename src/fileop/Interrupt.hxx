// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Choice.hxx"
#include "Operation.hxx"

#include <csignal>

namespace FileOp {

/**
 * Requests which are set by signal handlers and polled by a driver
 * at each suspension point.
 */
struct InterruptFlags {
	/**
	 * Abort the operation (offering to delete a partial file).
	 */
	volatile std::sig_atomic_t abort = 0;

	/**
	 * Skip the file which is currently being copied.
	 */
	volatile std::sig_atomic_t skip = 0;

	/**
	 * Stop resuming until this is cleared (or #abort is set).
	 */
	volatile std::sig_atomic_t paused = 0;
};

/**
 * Translate the pending requests into the command for the given
 * suspension point.  A skip request is consumed; at a point which
 * cannot be skipped, it is dropped.
 */
ResumeCommand
NextCommand(InterruptFlags &flags, SuspendPoint point) noexcept;

/**
 * Block the calling thread while InterruptFlags::paused is set.
 * The flags must be modified by handlers for #pause_signal or
 * SIGINT, which are blocked while checking the flags.
 */
void
WaitWhilePaused(const InterruptFlags &flags,
		int pause_signal=SIGUSR1) noexcept;

/**
 * Start the operation and resume it until it is finished, according
 * to the #InterruptFlags.
 */
void
DriveInterruptible(Operation &operation, InterruptFlags &flags);

} // namespace FileOp
