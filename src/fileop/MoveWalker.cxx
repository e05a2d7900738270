// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Walker.hxx"
#include "Context.hxx"
#include "Vfs.hxx"

#include <errno.h>
#include <string.h>

namespace FileOp {

Co::Task<Outcome>
Walker::MoveEntry(std::string source_path, std::string target_path,
		  bool target_is_final)
{
	const auto target = ResolveTarget(std::move(target_path), source_path,
					  target_is_final);
	const auto [outcome, source] = ResolveSource(std::move(source_path),
						     ctx.options.deref);
	if (!source.Exists())
		co_return outcome;

	ctx.NotifyMoveStart(source, target);

	const auto choice = ResolveOverwrite(source, target);
	if (choice == OverwriteChoice::ABORT)
		co_return Outcome::ABORTED;
	else if (choice == OverwriteChoice::SKIP)
		co_return Outcome::FAILED;

	if (vfs.Rename(source.c_str(), target.c_str())) {
		logger.Fmt(3, "Renamed \"{}\" to \"{}\"",
			   source.GetPath(), target.GetPath());
		co_return Outcome::SUCCESS;
	}

	const int e = errno;
	if (e == EINVAL)
		co_return Report(FormatSubdirectoryOfItself(source.GetPath(),
							    target.GetPath()));

	/* EXDEV is the usual reason, but some network filesystems
	   report other errors, so fall back to copying regardless */
	logger.Fmt(2, "Cannot rename \"{}\" to \"{}\" ({}), copying instead",
		   source.GetPath(), target.GetPath(), strerror(e));

	switch (source.GetType()) {
	case FileType::REGULAR:
		if (const auto o = co_await CopyRegularFile(source, target, choice);
		    o != Outcome::SUCCESS)
			co_return o;

		co_return TryIo(IoOperation::UNLINK, source.GetPath(),
				vfs.Unlink(source.c_str()));

	case FileType::DIRECTORY:
		co_return co_await MoveDirectory(source, target);

	case FileType::LINK:
		if (const auto o = CopyLink(source, target);
		    o != Outcome::SUCCESS)
			co_return o;

		co_return TryIo(IoOperation::UNLINK, source.GetPath(),
				vfs.Unlink(source.c_str()));

	case FileType::SPECIAL:
		break;
	}

	co_return CopySpecial(source);
}

Co::Task<Outcome>
Walker::MoveDirectory(const Entry &source, const Entry &target)
{
	if (const auto o = PrepareTargetDirectory(target); o != Outcome::SUCCESS)
		co_return o;

	auto dir = vfs.OpenDirectory(source.c_str());
	if (const auto o = TryIo(IoOperation::OPENDIR, source.GetPath(), dir != nullptr);
	    o != Outcome::SUCCESS)
		co_return o;

	bool complete = true;

	while (const char *name = dir->Read()) {
		switch (co_await MoveEntry(JoinPath(source.GetPath(), name),
					   JoinPath(target.GetPath(), name),
					   true)) {
		case Outcome::SUCCESS:
			break;

		case Outcome::FAILED:
			complete = false;
			break;

		case Outcome::ABORTED:
			co_return Outcome::ABORTED;
		}
	}

	dir.reset();

	if (ctx.options.preserve)
		CopyAttributes(source, target);

	if (!complete) {
		/* what is left in the source is exactly what was not
		   moved */
		logger.Fmt(2, "Keeping \"{}\"", source.GetPath());
		co_return Outcome::FAILED;
	}

	co_return TryIo(IoOperation::RMDIR, source.GetPath(),
			vfs.RemoveDirectory(source.c_str()));
}

} // namespace FileOp
