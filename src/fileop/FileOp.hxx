// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Operation.hxx"
#include "OperationPair.hxx"

#include <span>
#include <string>
#include <string_view>

namespace FileOp {

class Context;
class Vfs;

/**
 * Construct an #Operation for the given pairs and let the #Context
 * drive it.
 *
 * Throws #InvalidChoice (and whatever else Context::Start() throws)
 * on contract violations.
 */
OperationResult
Run(Context &ctx, Vfs &vfs, OperationType type, OperationPairList &&pairs);

/**
 * Like Run(), but with the process-wide #LocalVfs.
 */
OperationResult
Run(Context &ctx, OperationType type, OperationPairList &&pairs);

/**
 * Copy files and directory trees.
 *
 * @param sources one path (anything convertible to
 * std::string_view) or a list of paths (a std::span<const
 * std::string> or a container convertible to it)
 *
 * @param targets one path or a list of paths (of the same length
 * as #sources); if it is one existing directory, all sources are
 * copied into it
 *
 * Throws std::invalid_argument (before touching any file) if the
 * lists differ in length.
 */
template<typename S, typename T>
OperationResult
Copy(Context &ctx, Vfs &vfs, const S &sources, const T &targets)
{
	return Run(ctx, vfs, OperationType::COPY,
		   Canonicalize(sources, targets));
}

template<typename S, typename T>
OperationResult
Copy(Context &ctx, const S &sources, const T &targets)
{
	return Run(ctx, OperationType::COPY, Canonicalize(sources, targets));
}

/**
 * Move (rename) files and directory trees, falling back to copying
 * and deleting.  The parameters are the same as for Copy().
 */
template<typename S, typename T>
OperationResult
Move(Context &ctx, Vfs &vfs, const S &sources, const T &targets)
{
	return Run(ctx, vfs, OperationType::MOVE,
		   Canonicalize(sources, targets));
}

template<typename S, typename T>
OperationResult
Move(Context &ctx, const S &sources, const T &targets)
{
	return Run(ctx, OperationType::MOVE, Canonicalize(sources, targets));
}

OperationResult
Delete(Context &ctx, Vfs &vfs, std::span<const std::string> paths);

OperationResult
Delete(Context &ctx, Vfs &vfs, std::string_view path);

OperationResult
Delete(Context &ctx, std::span<const std::string> paths);

OperationResult
Delete(Context &ctx, std::string_view path);

} // namespace FileOp
