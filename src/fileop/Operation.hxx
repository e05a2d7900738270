// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Choice.hxx"
#include "OperationPair.hxx"
#include "co/InvokeTask.hxx"

#include <cstdint>
#include <memory>
#include <string_view>

namespace FileOp {

class Context;
class Vfs;
class Walker;

enum class OperationType : uint_least8_t {
	COPY,
	MOVE,
	DELETE,
};

/**
 * Where a suspended #Operation is waiting for Resume().
 */
enum class SuspendPoint : uint_least8_t {
	/**
	 * Not suspended (not started yet, running or finished).
	 */
	NONE,

	/**
	 * After a buffer has been copied.  Allowed commands:
	 * CONTINUE, ABORT, SKIP.
	 */
	CHUNK,

	/**
	 * Before a file (not a directory) gets deleted.  Allowed
	 * commands: CONTINUE, ABORT.
	 */
	DELETE,
};

enum class OperationResult : uint_least8_t {
	COMPLETED,
	ABORTED,
};

std::string_view
ToString(OperationType type) noexcept;

/**
 * One batch copy/move/delete operation.  It is a cooperative state
 * machine: Start() runs it until the first suspension point, and
 * each Resume() call runs it until the next one.  Between two
 * suspension points, exactly one unit of work is done (one buffer,
 * one file deletion).
 *
 * Errors and conflicts are resolved synchronously by the #Context
 * while the operation is running.
 *
 * Destroying an unfinished instance discards the remaining work; all
 * files and directories opened by it are closed.
 */
class Operation {
	const OperationType type;

	const std::unique_ptr<Walker> walker;

	Co::InvokeTask task;

	/**
	 * The innermost coroutine waiting in Suspend().
	 */
	std::coroutine_handle<> suspended;

	SuspendPoint suspend_point = SuspendPoint::NONE;

	ResumeCommand command = ResumeCommand::CONTINUE;

	bool started = false, aborted = false;

public:
	/**
	 * @param pairs the entries to be worked on; for
	 * OperationType::DELETE, only the "source" attribute is used
	 */
	Operation(OperationType _type, Context &ctx, Vfs &vfs,
		  OperationPairList &&pairs);

	~Operation() noexcept;

	Operation(const Operation &) = delete;
	Operation &operator=(const Operation &) = delete;

	OperationType GetType() const noexcept {
		return type;
	}

	/**
	 * Run until the first suspension point (or until the
	 * operation finishes).  May only be called once.
	 *
	 * Throws #InvalidChoice if the #Context breaks its contract.
	 */
	void Start();

	bool IsFinished() const noexcept {
		return started && task.Done();
	}

	SuspendPoint GetSuspendPoint() const noexcept {
		return suspend_point;
	}

	/**
	 * Continue after a suspension point.  May only be called
	 * while the operation is suspended.
	 *
	 * Throws std::invalid_argument if the command is not allowed
	 * at the current suspension point, and #InvalidChoice if the
	 * #Context breaks its contract.
	 */
	void Resume(ResumeCommand _command);

	/**
	 * Returns OperationResult::COMPLETED if the operation has
	 * finished without being aborted.
	 */
	OperationResult GetResult() const noexcept {
		return IsFinished() && !aborted
			? OperationResult::COMPLETED
			: OperationResult::ABORTED;
	}

	class SuspendAwaitable {
		Operation &operation;
		const SuspendPoint point;

	public:
		SuspendAwaitable(Operation &_operation,
				 SuspendPoint _point) noexcept
			:operation(_operation), point(_point) {}

		bool await_ready() const noexcept {
			return false;
		}

		void await_suspend(std::coroutine_handle<> h) noexcept {
			operation.suspended = h;
			operation.suspend_point = point;
		}

		ResumeCommand await_resume() const noexcept {
			return operation.command;
		}
	};

	/**
	 * Suspend the calling coroutine and return control to the
	 * caller of Start()/Resume().  The co_await expression
	 * evaluates to the command passed to the next Resume() call.
	 */
	SuspendAwaitable Suspend(SuspendPoint point) noexcept {
		return {*this, point};
	}

	/**
	 * Mark this operation as aborted; called when the batch stops
	 * early.
	 */
	void SetAborted() noexcept {
		aborted = true;
	}

private:
	void CheckFinished();
};

} // namespace FileOp
