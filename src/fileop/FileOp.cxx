// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "FileOp.hxx"
#include "Context.hxx"
#include "LocalVfs.hxx"
#include "io/Logger.hxx"

namespace FileOp {

OperationResult
Run(Context &ctx, Vfs &vfs, OperationType type, OperationPairList &&pairs)
{
	LogFmt(3, "fileop", "Starting {} of {} entries",
	       ToString(type), pairs.size());

	Operation operation{type, ctx, vfs, std::move(pairs)};
	ctx.Start(operation);

	const auto result = operation.GetResult();
	if (result == OperationResult::ABORTED)
		LogFmt(2, "fileop", "The {} was aborted", ToString(type));
	return result;
}

OperationResult
Run(Context &ctx, OperationType type, OperationPairList &&pairs)
{
	return Run(ctx, LocalVfs::GetDefault(), type, std::move(pairs));
}

static OperationPairList
MakeDeleteList(std::span<const std::string> paths)
{
	OperationPairList result;
	result.reserve(paths.size());

	for (const auto &path : paths)
		result.push_back({path, {}});

	return result;
}

OperationResult
Delete(Context &ctx, Vfs &vfs, std::span<const std::string> paths)
{
	return Run(ctx, vfs, OperationType::DELETE, MakeDeleteList(paths));
}

OperationResult
Delete(Context &ctx, Vfs &vfs, std::string_view path)
{
	return Run(ctx, vfs, OperationType::DELETE, {{std::string{path}, {}}});
}

OperationResult
Delete(Context &ctx, std::span<const std::string> paths)
{
	return Delete(ctx, LocalVfs::GetDefault(), paths);
}

OperationResult
Delete(Context &ctx, std::string_view path)
{
	return Delete(ctx, LocalVfs::GetDefault(), path);
}

} // namespace FileOp
