// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Interrupt.hxx"

#include <signal.h>

namespace FileOp {

ResumeCommand
NextCommand(InterruptFlags &flags, SuspendPoint point) noexcept
{
	if (flags.abort)
		return ResumeCommand::ABORT;

	if (flags.skip) {
		flags.skip = 0;

		if (point == SuspendPoint::CHUNK)
			return ResumeCommand::SKIP;
	}

	return ResumeCommand::CONTINUE;
}

void
WaitWhilePaused(const InterruptFlags &flags, int pause_signal) noexcept
{
	if (!flags.paused)
		return;

	sigset_t mask, old_mask;
	sigemptyset(&mask);
	sigaddset(&mask, SIGINT);
	sigaddset(&mask, pause_signal);
	sigprocmask(SIG_BLOCK, &mask, &old_mask);

	while (flags.paused && !flags.abort)
		sigsuspend(&old_mask);

	sigprocmask(SIG_SETMASK, &old_mask, nullptr);
}

void
DriveInterruptible(Operation &operation, InterruptFlags &flags)
{
	operation.Start();

	while (!operation.IsFinished()) {
		WaitWhilePaused(flags);
		operation.Resume(NextCommand(flags, operation.GetSuspendPoint()));
	}
}

} // namespace FileOp
