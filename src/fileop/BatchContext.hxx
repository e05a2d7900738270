// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Context.hxx"

#include <cstdio>

namespace FileOp {

struct InterruptFlags;

/**
 * A #Context which never asks and behaves like the shell's
 * cp/mv/rm: it prints each entry to a stream, overwrites existing
 * files, skips entries which fail, deletes incomplete files and
 * deletes non-empty directories recursively.
 *
 * Without #InterruptFlags, every suspension point is resumed with
 * ResumeCommand::CONTINUE.
 */
class BatchContext final : public Context {
	FILE *const out;

	InterruptFlags *interrupt = nullptr;

public:
	explicit BatchContext(FILE *_out=stdout) noexcept
		:out(_out) {}

	BatchContext(const ContextOptions &_options, FILE *_out=stdout) noexcept
		:Context(_options), out(_out) {}

	/**
	 * Resume according to the given flags (which are usually set
	 * by signal handlers).
	 */
	void SetInterruptFlags(InterruptFlags &_interrupt) noexcept {
		interrupt = &_interrupt;
	}

	void Start(Operation &operation) override;

	/* virtual methods from class Context */
	IoErrorChoice DecideOnIoError(std::string_view message) override;

	OverwriteChoice DecideOnOverwrite(const Entry &,
					  const Entry &) override {
		return OverwriteChoice::OVERWRITE;
	}

	PartialChoice DecideOnPartial(const Entry &, const Entry &) override {
		return PartialChoice::DELETE;
	}

	NonEmptyDirChoice DecideOnNonEmptyDirDeletion(const Entry &) override {
		return NonEmptyDirChoice::DELETE;
	}

	void NotifyCopyStart(const Entry &source,
			     const Entry &target) override;
	void NotifyMoveStart(const Entry &source,
			     const Entry &target) override;
	void NotifyDeleteStart(const Entry &entry) override;
};

} // namespace FileOp
