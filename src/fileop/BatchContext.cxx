// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "BatchContext.hxx"
#include "Entry.hxx"
#include "Interrupt.hxx"
#include "io/Logger.hxx"

#include <fmt/format.h>

namespace FileOp {

void
BatchContext::Start(Operation &operation)
{
	if (interrupt != nullptr)
		DriveInterruptible(operation, *interrupt);
	else
		Context::Start(operation);
}

IoErrorChoice
BatchContext::DecideOnIoError(std::string_view message)
{
	LogFmt(1, "fileop", "{}", message);
	return IoErrorChoice::SKIP;
}

void
BatchContext::NotifyCopyStart(const Entry &source, const Entry &target)
{
	fmt::print(out, "{} -> {}\n", source.GetPath(), target.GetPath());
}

void
BatchContext::NotifyMoveStart(const Entry &source, const Entry &target)
{
	fmt::print(out, "{} -> {}\n", source.GetPath(), target.GetPath());
}

void
BatchContext::NotifyDeleteStart(const Entry &entry)
{
	fmt::print(out, "rm {}\n", entry.GetPath());
}

} // namespace FileOp
