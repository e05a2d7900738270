// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Choice.hxx"
#include "Entry.hxx"
#include "IoGuard.hxx"
#include "co/Task.hxx"
#include "io/Logger.hxx"
#include "system/LargeAllocation.hxx"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace FileOp {

class Context;
class Vfs;
class Operation;

/**
 * The result of working on one entry.  This is how errors cross
 * suspension points: nothing below Operation throws for I/O errors.
 */
enum class Outcome : uint_least8_t {
	SUCCESS,

	/**
	 * This entry was not (completely) transferred, but the
	 * operation goes on with the next one.
	 */
	FAILED,

	/**
	 * Terminate the whole operation.
	 */
	ABORTED,
};

/**
 * The recursive tree walkers of one #Operation.  Each walker method
 * is a coroutine; all of them suspend only inside
 * Operation::Suspend().
 */
class Walker {
	Context &ctx;
	Vfs &vfs;
	Operation &operation;

	const LLogger logger{"fileop"};

	/**
	 * The transfer buffer, allocated by the first regular file
	 * copy and reused by all others.
	 */
	LargeAllocation buffer;

public:
	Walker(Context &_ctx, Vfs &_vfs, Operation &_operation) noexcept
		:ctx(_ctx), vfs(_vfs), operation(_operation) {}

	Walker(const Walker &) = delete;
	Walker &operator=(const Walker &) = delete;

	/**
	 * Copy a file, a symlink or a directory tree.
	 *
	 * @param target_is_final if false and #target is an existing
	 * directory, the source is copied into it
	 */
	Co::Task<Outcome> CopyEntry(std::string source, std::string target,
				    bool target_is_final);

	/**
	 * Rename an entry, falling back to copy+delete.
	 */
	Co::Task<Outcome> MoveEntry(std::string source, std::string target,
				    bool target_is_final);

	/**
	 * @param recursive true if deleting a non-empty directory has
	 * already been authorized
	 */
	Co::Task<Outcome> DeleteEntry(std::string path, bool recursive);

private:
	/**
	 * The I/O guard: if #success is false, ask the #Context what
	 * to do about the failure described by errno.
	 *
	 * @return SUCCESS, FAILED (skip) or ABORTED
	 */
	Outcome TryIo(IoOperation io, std::string_view path, bool success);

	/**
	 * Deliver a conflict report through the I/O error question.
	 * The entry is abandoned in any case.
	 *
	 * @return FAILED or ABORTED
	 */
	Outcome Report(std::string_view message);

	/**
	 * Obtain the transfer buffer with the configured size,
	 * guarded by IoOperation::ALLOCATE.
	 */
	std::pair<Outcome, std::span<std::byte>> GetBuffer(std::string_view path);

	/**
	 * Examine the target.  Does not report errors; a target which
	 * cannot be examined "does not exist".
	 */
	Entry ResolveTarget(std::string target, std::string_view source,
			    bool target_is_final) noexcept;

	/**
	 * Examine the source, guarded by IoOperation::STAT_SOURCE.
	 */
	std::pair<Outcome, Entry> ResolveSource(std::string path, bool follow);

	/**
	 * Ask about an existing target (unless it is a directory) and
	 * resolve OverwriteChoice::UPDATE.
	 *
	 * @return the choice; never UPDATE
	 */
	OverwriteChoice ResolveOverwrite(const Entry &source,
					 const Entry &target);

	/**
	 * Copy the contents of a regular file; this is the only place
	 * which suspends at SuspendPoint::CHUNK.
	 *
	 * @param choice OVERWRITE or REGET
	 */
	Co::Task<Outcome> CopyRegularFile(const Entry &source,
					  const Entry &target,
					  OverwriteChoice choice);

	/**
	 * Ask whether the incomplete target shall be deleted, and
	 * delete it.
	 */
	void OfferPartialDelete(const Entry &source, const Entry &target);

	Outcome CopyLink(const Entry &source, const Entry &target);
	Outcome CopySpecial(const Entry &source);

	/**
	 * Copy owner, permissions and time stamps.  Failures are
	 * logged and ignored.
	 */
	void CopyAttributes(const Entry &source, const Entry &target) noexcept;

	/**
	 * Make sure the target is a directory, creating it if
	 * necessary.
	 */
	Outcome PrepareTargetDirectory(const Entry &target);

	Co::Task<Outcome> CopyDirectory(const Entry &source,
					const Entry &target);

	/**
	 * Move the contents of a directory which could not be renamed,
	 * and delete the source directory if all of them were moved.
	 */
	Co::Task<Outcome> MoveDirectory(const Entry &source,
					const Entry &target);

	Co::Task<Outcome> DeleteDirectory(const Entry &entry, bool recursive);
};

} // namespace FileOp
