// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Walker.hxx"
#include "Context.hxx"
#include "Vfs.hxx"

#include <errno.h>
#include <string.h>

namespace FileOp {

Outcome
Walker::TryIo(IoOperation io, std::string_view path, bool success)
{
	if (success) [[likely]]
		return Outcome::SUCCESS;

	const int e = errno;
	const auto message = FormatIoError(io, path, e);
	logger.Fmt(2, "{}", message);

	switch (const auto choice = ctx.DecideOnIoError(message)) {
	case IoErrorChoice::SKIP:
		return Outcome::FAILED;

	case IoErrorChoice::ABORT:
		logger(2, "aborted");
		return Outcome::ABORTED;

	default:
		ThrowInvalidChoice("I/O error", static_cast<unsigned>(choice));
	}
}

Outcome
Walker::Report(std::string_view message)
{
	logger.Fmt(2, "{}", message);

	switch (const auto choice = ctx.DecideOnIoError(message)) {
	case IoErrorChoice::SKIP:
		return Outcome::FAILED;

	case IoErrorChoice::ABORT:
		logger(2, "aborted");
		return Outcome::ABORTED;

	default:
		ThrowInvalidChoice("I/O error", static_cast<unsigned>(choice));
	}
}

Entry
Walker::ResolveTarget(std::string target, std::string_view source,
		      bool target_is_final) noexcept
{
	FileStat st;
	if (!vfs.Stat(target.c_str(), true, st))
		return Entry{std::move(target)};

	if (!target_is_final && st.type == FileType::DIRECTORY) {
		target = JoinPath(target, GetBaseName(source));
		if (!vfs.Stat(target.c_str(), true, st))
			return Entry{std::move(target)};
	}

	return Entry{std::move(target), st};
}

std::pair<Outcome, Entry>
Walker::ResolveSource(std::string path, bool follow)
{
	FileStat st;
	if (vfs.Stat(path.c_str(), follow, st))
		return {Outcome::SUCCESS, Entry{std::move(path), st}};

	auto outcome = TryIo(IoOperation::STAT_SOURCE, path, false);
	return {outcome, Entry{std::move(path)}};
}

OverwriteChoice
Walker::ResolveOverwrite(const Entry &source, const Entry &target)
{
	if (!target.Exists() || target.IsDirectory())
		return OverwriteChoice::OVERWRITE;

	switch (auto choice = ctx.DecideOnOverwrite(source, target)) {
	case OverwriteChoice::ABORT:
	case OverwriteChoice::SKIP:
	case OverwriteChoice::OVERWRITE:
	case OverwriteChoice::REGET:
		logger.Fmt(3, "{}: {}", target.GetPath(), ToString(choice));
		return choice;

	case OverwriteChoice::UPDATE:
		choice = source.GetStat().IsNewerThan(target.GetStat())
			? OverwriteChoice::OVERWRITE
			: OverwriteChoice::SKIP;
		logger.Fmt(3, "{}: update -> {}",
			   target.GetPath(), ToString(choice));
		return choice;

	default:
		ThrowInvalidChoice("overwrite", static_cast<unsigned>(choice));
	}
}

void
Walker::CopyAttributes(const Entry &source, const Entry &target) noexcept
{
	const auto &st = source.GetStat();
	const char *path = target.c_str();

	/* chown() first, because it may clear the setuid/setgid
	   bits */
	if (!vfs.Chown(path, st.uid, st.gid))
		logger.Fmt(4, "Failed to change owner of \"{}\": {}",
			   path, strerror(errno));

	if (!vfs.Chmod(path, st.mode))
		logger.Fmt(4, "Failed to change mode of \"{}\": {}",
			   path, strerror(errno));

	if (!vfs.SetTimes(path, st.atime, st.mtime))
		logger.Fmt(4, "Failed to set times of \"{}\": {}",
			   path, strerror(errno));
}

Outcome
Walker::PrepareTargetDirectory(const Entry &target)
{
	if (!target.Exists())
		return TryIo(IoOperation::MKDIR, target.GetPath(),
			     vfs.MakeDirectory(target.c_str(), 0777));

	if (!target.IsDirectory())
		return Report(FormatMustBeDirectory(target.GetPath()));

	return Outcome::SUCCESS;
}

} // namespace FileOp
