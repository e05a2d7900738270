// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Walker.hxx"
#include "Context.hxx"
#include "Vfs.hxx"

namespace FileOp {

Co::Task<Outcome>
Walker::CopyEntry(std::string source_path, std::string target_path,
		  bool target_is_final)
{
	const auto target = ResolveTarget(std::move(target_path), source_path,
					  target_is_final);
	const auto [outcome, source] = ResolveSource(std::move(source_path),
						     ctx.options.deref);
	if (!source.Exists())
		/* already reported */
		co_return outcome;

	ctx.NotifyCopyStart(source, target);

	const auto choice = ResolveOverwrite(source, target);
	if (choice == OverwriteChoice::ABORT)
		co_return Outcome::ABORTED;
	else if (choice == OverwriteChoice::SKIP)
		co_return Outcome::FAILED;

	switch (source.GetType()) {
	case FileType::REGULAR:
		co_return co_await CopyRegularFile(source, target, choice);

	case FileType::DIRECTORY:
		co_return co_await CopyDirectory(source, target);

	case FileType::LINK:
		co_return CopyLink(source, target);

	case FileType::SPECIAL:
		break;
	}

	co_return CopySpecial(source);
}

Co::Task<Outcome>
Walker::CopyDirectory(const Entry &source, const Entry &target)
{
	if (const auto o = PrepareTargetDirectory(target); o != Outcome::SUCCESS)
		co_return o;

	const auto dir = vfs.OpenDirectory(source.c_str());
	if (const auto o = TryIo(IoOperation::OPENDIR, source.GetPath(), dir != nullptr);
	    o != Outcome::SUCCESS)
		co_return o;

	Outcome result = Outcome::SUCCESS;

	while (const char *name = dir->Read()) {
		switch (co_await CopyEntry(JoinPath(source.GetPath(), name),
					   JoinPath(target.GetPath(), name),
					   true)) {
		case Outcome::SUCCESS:
			break;

		case Outcome::FAILED:
			result = Outcome::FAILED;
			break;

		case Outcome::ABORTED:
			co_return Outcome::ABORTED;
		}
	}

	/* after the contents, because the source's mode may forbid
	   writing into the directory */
	if (ctx.options.preserve)
		CopyAttributes(source, target);

	co_return result;
}

} // namespace FileOp
