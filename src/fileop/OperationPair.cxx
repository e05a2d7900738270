// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "OperationPair.hxx"
#include "lib/fmt/RuntimeError.hxx"

namespace FileOp {

OperationPairList
Canonicalize(std::string_view source, std::string_view target)
{
	return {{std::string{source}, std::string{target}}};
}

OperationPairList
Canonicalize(std::span<const std::string> sources, std::string_view target)
{
	OperationPairList result;
	result.reserve(sources.size());

	for (const auto &source : sources)
		result.push_back({source, std::string{target}});

	return result;
}

OperationPairList
Canonicalize(std::span<const std::string> sources,
	     std::span<const std::string> targets)
{
	if (sources.size() != targets.size())
		throw FmtInvalidArgument("Got {} sources but {} targets",
					 sources.size(), targets.size());

	OperationPairList result;
	result.reserve(sources.size());

	for (std::size_t i = 0; i < sources.size(); ++i)
		result.push_back({sources[i], targets[i]});

	return result;
}

} // namespace FileOp
