// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "PresetContext.hxx"

namespace FileOp {

/**
 * Return the preset if there is one; otherwise invoke the given
 * function and store its answer if it was chosen "for all".
 */
template<typename T, typename F>
static T
Lookup(std::optional<T> &preset, F &&ask)
{
	if (preset)
		return *preset;

	bool for_all = false;
	const T choice = ask(for_all);
	if (for_all)
		preset = choice;
	return choice;
}

IoErrorChoice
PresetContext::DecideOnIoError(std::string_view message)
{
	return Lookup(io_error, [&](bool &for_all){
		return AskIoError(message, for_all);
	});
}

OverwriteChoice
PresetContext::DecideOnOverwrite(const Entry &source, const Entry &target)
{
	return Lookup(overwrite, [&](bool &for_all){
		return AskOverwrite(source, target, for_all);
	});
}

PartialChoice
PresetContext::DecideOnPartial(const Entry &source, const Entry &target)
{
	if (partial)
		return *partial;

	return AskPartial(source, target);
}

NonEmptyDirChoice
PresetContext::DecideOnNonEmptyDirDeletion(const Entry &entry)
{
	return Lookup(non_empty_dir, [&](bool &for_all){
		return AskNonEmptyDirDeletion(entry, for_all);
	});
}

} // namespace FileOp
