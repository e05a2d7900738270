// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Walker.hxx"
#include "Context.hxx"
#include "Operation.hxx"
#include "Vfs.hxx"

#include <vector>

namespace FileOp {

Co::Task<Outcome>
Walker::DeleteEntry(std::string path, bool recursive)
{
	/* never follow symlinks here: deleting a symlink must not
	   touch what it points to */
	const auto [outcome, entry] = ResolveSource(std::move(path), false);
	if (!entry.Exists())
		co_return outcome;

	ctx.NotifyDeleteStart(entry);

	if (entry.IsDirectory())
		co_return co_await DeleteDirectory(entry, recursive);

	if (co_await operation.Suspend(SuspendPoint::DELETE) == ResumeCommand::ABORT) {
		logger.Fmt(2, "Aborted before deleting \"{}\"", entry.GetPath());
		co_return Outcome::ABORTED;
	}

	const auto o = TryIo(IoOperation::UNLINK, entry.GetPath(),
			     vfs.Unlink(entry.c_str()));
	if (o == Outcome::SUCCESS)
		logger.Fmt(3, "Deleted \"{}\"", entry.GetPath());
	co_return o;
}

Co::Task<Outcome>
Walker::DeleteDirectory(const Entry &entry, bool recursive)
{
	/* read all names first, because deleting while reading may
	   confuse readdir() on some filesystems */
	std::vector<std::string> names;

	{
		const auto dir = vfs.OpenDirectory(entry.c_str());
		if (const auto o = TryIo(IoOperation::OPENDIR, entry.GetPath(), dir != nullptr);
		    o != Outcome::SUCCESS)
			co_return o;

		while (const char *name = dir->Read())
			names.emplace_back(name);
	}

	if (!names.empty() && !recursive) {
		switch (const auto choice = ctx.DecideOnNonEmptyDirDeletion(entry)) {
		case NonEmptyDirChoice::SKIP:
			logger.Fmt(2, "Skipped non-empty directory \"{}\"",
				   entry.GetPath());
			co_return Outcome::FAILED;

		case NonEmptyDirChoice::ABORT:
			logger.Fmt(2, "Aborted at non-empty directory \"{}\"",
				   entry.GetPath());
			co_return Outcome::ABORTED;

		case NonEmptyDirChoice::DELETE:
			recursive = true;
			break;

		default:
			ThrowInvalidChoice("non-empty directory",
					   static_cast<unsigned>(choice));
		}
	}

	bool complete = true;

	for (const auto &name : names) {
		switch (co_await DeleteEntry(JoinPath(entry.GetPath(), name),
					     recursive)) {
		case Outcome::SUCCESS:
			break;

		case Outcome::FAILED:
			complete = false;
			break;

		case Outcome::ABORTED:
			co_return Outcome::ABORTED;
		}
	}

	if (!complete)
		co_return Outcome::FAILED;

	const auto o = TryIo(IoOperation::RMDIR, entry.GetPath(),
			     vfs.RemoveDirectory(entry.c_str()));
	if (o == Outcome::SUCCESS)
		logger.Fmt(3, "Deleted directory \"{}\"", entry.GetPath());
	co_return o;
}

} // namespace FileOp
