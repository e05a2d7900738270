// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Walker.hxx"
#include "Context.hxx"
#include "Operation.hxx"
#include "Vfs.hxx"
#include <new>

#include <errno.h>
#include <fcntl.h>
#include <string.h>

namespace FileOp {

void
Walker::OfferPartialDelete(const Entry &source, const Entry &target)
{
	switch (const auto choice = ctx.DecideOnPartial(source, target)) {
	case PartialChoice::DELETE:
		logger.Fmt(2, "Deleting partial file \"{}\"", target.GetPath());
		if (!vfs.Unlink(target.c_str()))
			logger.Fmt(4, "Failed to delete \"{}\": {}",
				   target.GetPath(), strerror(errno));
		break;

	case PartialChoice::KEEP:
		logger.Fmt(2, "Keeping partial file \"{}\"", target.GetPath());
		break;

	default:
		ThrowInvalidChoice("partial file", static_cast<unsigned>(choice));
	}
}

std::pair<Outcome, std::span<std::byte>>
Walker::GetBuffer(std::string_view path)
{
	const std::size_t size = ctx.options.buffer_size > 0
		? ctx.options.buffer_size
		: DEFAULT_BUFFER_SIZE;

	if (buffer.size() < size) {
		buffer = {};

		try {
			buffer = LargeAllocation{size};
		} catch (const std::bad_alloc &) {
			errno = ENOMEM;
		}
	}

	if (const auto o = TryIo(IoOperation::ALLOCATE, path, buffer);
	    o != Outcome::SUCCESS)
		return {o, {}};

	return {Outcome::SUCCESS, buffer.first(size)};
}

Co::Task<Outcome>
Walker::CopyRegularFile(const Entry &source, const Entry &target,
			OverwriteChoice choice)
{
	if (target.Exists() && source.GetStat().IsSameFile(target.GetStat()))
		/* never truncate a file onto itself */
		co_return Report(FormatSameFile(source.GetPath(), target.GetPath()));

	/* before the target is truncated */
	const auto [buffer_outcome, transfer_buffer] = GetBuffer(source.GetPath());
	if (buffer_outcome != Outcome::SUCCESS)
		co_return buffer_outcome;

	auto src = vfs.OpenFile(source.c_str(), O_RDONLY);
	if (const auto o = TryIo(IoOperation::OPEN, source.GetPath(), src != nullptr);
	    o != Outcome::SUCCESS)
		co_return o;

	const bool reget = choice == OverwriteChoice::REGET && target.Exists();

	auto dst = reget
		? vfs.OpenFile(target.c_str(), O_WRONLY|O_APPEND)
		: vfs.OpenFile(target.c_str(), O_WRONLY|O_CREAT|O_TRUNC, 0666);
	if (const auto o = TryIo(IoOperation::CREATE, target.GetPath(), dst != nullptr);
	    o != Outcome::SUCCESS)
		co_return o;

	uint_least64_t position = 0;

	if (reget) {
		position = target.GetStat().size;

		if (!src->Seek(static_cast<off_t>(position))) {
			logger.Fmt(2, "Cannot seek \"{}\", copying it completely: {}",
				   source.GetPath(), strerror(errno));
			src.reset();
			dst.reset();
			co_return co_await CopyRegularFile(source, target,
							   OverwriteChoice::OVERWRITE);
		}
	}

	const uint_least64_t total = source.GetStat().size;

	while (true) {
		const auto nbytes = src->Read(transfer_buffer);
		if (const auto o = TryIo(IoOperation::READ, source.GetPath(), nbytes >= 0);
		    o != Outcome::SUCCESS) {
			dst.reset();
			OfferPartialDelete(source, target);
			co_return o;
		}

		if (nbytes == 0)
			break;

		if (const auto o = TryIo(IoOperation::WRITE, target.GetPath(),
					 dst->Write(transfer_buffer.first(static_cast<std::size_t>(nbytes))));
		    o != Outcome::SUCCESS) {
			dst.reset();
			OfferPartialDelete(source, target);
			co_return o;
		}

		position += nbytes;
		ctx.NotifyFileProgress(position, total);

		switch (co_await operation.Suspend(SuspendPoint::CHUNK)) {
		case ResumeCommand::CONTINUE:
			break;

		case ResumeCommand::ABORT:
			logger.Fmt(2, "Aborted copying \"{}\"", source.GetPath());
			dst.reset();
			OfferPartialDelete(source, target);
			co_return Outcome::ABORTED;

		case ResumeCommand::SKIP:
			logger.Fmt(2, "Skipped \"{}\"", source.GetPath());
			dst.reset();
			OfferPartialDelete(source, target);
			co_return Outcome::FAILED;
		}
	}

	src.reset();

	if (const auto o = TryIo(IoOperation::CLOSE_TARGET, target.GetPath(),
				 dst->Close());
	    o != Outcome::SUCCESS) {
		dst.reset();
		OfferPartialDelete(source, target);
		co_return o;
	}

	dst.reset();

	if (ctx.options.preserve)
		CopyAttributes(source, target);

	logger.Fmt(3, "Copied \"{}\" to \"{}\"", source.GetPath(), target.GetPath());
	co_return Outcome::SUCCESS;
}

Outcome
Walker::CopyLink(const Entry &source, const Entry &target)
{
	std::string contents;
	if (const auto o = TryIo(IoOperation::READLINK, source.GetPath(),
				 vfs.ReadLink(source.c_str(), contents));
	    o != Outcome::SUCCESS)
		return o;

	if (target.Exists())
		if (const auto o = TryIo(IoOperation::UNLINK, target.GetPath(),
					 vfs.Unlink(target.c_str()));
		    o != Outcome::SUCCESS)
			return o;

	return TryIo(IoOperation::SYMLINK, target.GetPath(),
		     vfs.Symlink(contents.c_str(), target.c_str()));
}

Outcome
Walker::CopySpecial(const Entry &source)
{
	const auto o = Report(FormatUnsupportedType(ToString(source.GetType())));
	logger.Fmt(2, "Not copied: \"{}\"", source.GetPath());
	return o;
}

} // namespace FileOp
