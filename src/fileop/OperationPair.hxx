// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace FileOp {

/**
 * One source and the target it shall be copied/moved to.  If the
 * target is an existing directory, the source will be placed inside
 * it (this is decided later, when the target is examined).
 */
struct OperationPair {
	std::string source, target;

	bool operator==(const OperationPair &) const noexcept = default;
};

using OperationPairList = std::vector<OperationPair>;

/**
 * Build the pair list for one source and one target.
 */
OperationPairList
Canonicalize(std::string_view source, std::string_view target);

/**
 * Build the pair list for many sources sharing one target (which is
 * usually a directory).
 */
OperationPairList
Canonicalize(std::span<const std::string> sources, std::string_view target);

/**
 * Build the pair list from parallel lists of sources and targets.
 *
 * Throws std::invalid_argument if the lists differ in length.
 */
OperationPairList
Canonicalize(std::span<const std::string> sources,
	     std::span<const std::string> targets);

} // namespace FileOp
