// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "UniqueHandle.hxx"
#include "Compat.hxx"

#include <cassert>
#include <exception>
#include <utility>

namespace Co {

/**
 * A helper task which invokes a coroutine from synchronous code.
 *
 * It is suspended initially; Start() runs it until its first
 * suspension (or until it finishes).  After that, synchronous code
 * can check Done() after each resumption of whatever the coroutine
 * is waiting for.  The coroutine frame stays alive after completion
 * until this object is destroyed, so the error (if any) can be
 * collected with TakeError().
 */
class [[nodiscard]] InvokeTask {
public:
	struct promise_type {
		std::exception_ptr error;

		auto initial_suspend() noexcept {
			return std::suspend_always{};
		}

		auto final_suspend() noexcept {
			return std::suspend_always{};
		}

		void return_void() noexcept {
		}

		InvokeTask get_return_object() noexcept {
			return InvokeTask(std::coroutine_handle<promise_type>::from_promise(*this));
		}

		void unhandled_exception() noexcept {
			error = std::current_exception();
		}
	};

private:
	UniqueHandle<promise_type> coroutine;

	explicit InvokeTask(std::coroutine_handle<promise_type> _coroutine) noexcept
		:coroutine(_coroutine)
	{
	}

public:
	InvokeTask() = default;

	bool IsDefined() const noexcept {
		return coroutine;
	}

	void Start() noexcept {
		assert(coroutine);
		assert(!coroutine->done());

		coroutine->resume();
	}

	bool Done() const noexcept {
		return coroutine->done();
	}

	std::exception_ptr TakeError() noexcept {
		assert(Done());

		return std::exchange(coroutine->promise().error, {});
	}
};

} // namespace Co
