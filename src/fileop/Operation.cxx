// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Operation.hxx"
#include "Walker.hxx"

#include <cassert>
#include <stdexcept>
#include <utility>

namespace FileOp {

std::string_view
ToString(OperationType type) noexcept
{
	switch (type) {
	case OperationType::COPY:
		return "copy";

	case OperationType::MOVE:
		return "move";

	case OperationType::DELETE:
		return "delete";
	}

	return "?";
}

static Co::Task<Outcome>
RunEntry(Walker &walker, OperationType type, const OperationPair &pair)
{
	switch (type) {
	case OperationType::COPY:
		return walker.CopyEntry(pair.source, pair.target, false);

	case OperationType::MOVE:
		return walker.MoveEntry(pair.source, pair.target, false);

	case OperationType::DELETE:
		break;
	}

	return walker.DeleteEntry(pair.source, false);
}

static Co::InvokeTask
RunBatch(Operation &operation, Walker &walker, OperationPairList pairs)
{
	for (const auto &pair : pairs) {
		if (co_await RunEntry(walker, operation.GetType(), pair) == Outcome::ABORTED) {
			operation.SetAborted();
			break;
		}
	}
}

Operation::Operation(OperationType _type, Context &ctx, Vfs &vfs,
		     OperationPairList &&pairs)
	:type(_type),
	 walker(std::make_unique<Walker>(ctx, vfs, *this)),
	 task(RunBatch(*this, *walker, std::move(pairs)))
{
}

Operation::~Operation() noexcept = default;

inline void
Operation::CheckFinished()
{
	if (task.Done())
		if (auto error = task.TakeError()) {
			aborted = true;
			std::rethrow_exception(error);
		}
}

void
Operation::Start()
{
	assert(!started);

	started = true;
	task.Start();
	CheckFinished();
}

void
Operation::Resume(ResumeCommand _command)
{
	if (!suspended)
		throw std::logic_error{"Operation is not suspended"};

	switch (_command) {
	case ResumeCommand::CONTINUE:
	case ResumeCommand::ABORT:
		break;

	case ResumeCommand::SKIP:
		if (suspend_point == SuspendPoint::DELETE)
			throw std::invalid_argument{"Cannot skip before deleting a file"};
		break;

	default:
		throw std::invalid_argument{"Invalid resume command"};
	}

	command = _command;
	suspend_point = SuspendPoint::NONE;
	std::exchange(suspended, nullptr).resume();
	CheckFinished();
}

} // namespace FileOp
