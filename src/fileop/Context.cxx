// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Context.hxx"
#include "Operation.hxx"

namespace FileOp {

void
Context::Start(Operation &operation)
{
	operation.Start();

	while (!operation.IsFinished())
		operation.Resume(ResumeCommand::CONTINUE);
}

} // namespace FileOp
