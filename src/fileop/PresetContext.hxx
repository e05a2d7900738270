// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Context.hxx"

#include <optional>

namespace FileOp {

/**
 * A #Context which remembers answers.  Each question is first looked
 * up in the presets; only if there is none, the Ask*() method is
 * invoked, which may choose to make its answer sticky ("for all").
 */
class PresetContext : public Context {
public:
	std::optional<OverwriteChoice> overwrite;
	std::optional<IoErrorChoice> io_error;
	std::optional<PartialChoice> partial;
	std::optional<NonEmptyDirChoice> non_empty_dir;

	using Context::Context;

	/**
	 * Preset all answers which are not yet set, so the user is
	 * never asked: overwrite, skip errors, delete partial files
	 * and non-empty directories.
	 */
	void SetPassive() noexcept {
		if (!overwrite)
			overwrite = OverwriteChoice::OVERWRITE;
		if (!io_error)
			io_error = IoErrorChoice::SKIP;
		if (!partial)
			partial = PartialChoice::DELETE;
		if (!non_empty_dir)
			non_empty_dir = NonEmptyDirChoice::DELETE;
	}

	/* virtual methods from class Context */
	IoErrorChoice DecideOnIoError(std::string_view message) final;
	OverwriteChoice DecideOnOverwrite(const Entry &source,
					  const Entry &target) final;
	PartialChoice DecideOnPartial(const Entry &source,
				      const Entry &target) final;
	NonEmptyDirChoice DecideOnNonEmptyDirDeletion(const Entry &entry) final;

protected:
	/**
	 * @param for_all set this to true to use the answer for all
	 * further questions of this kind
	 */
	virtual IoErrorChoice AskIoError(std::string_view message,
					 bool &for_all) = 0;

	virtual OverwriteChoice AskOverwrite(const Entry &source,
					     const Entry &target,
					     bool &for_all) = 0;

	virtual PartialChoice AskPartial(const Entry &source,
					 const Entry &target) = 0;

	virtual NonEmptyDirChoice AskNonEmptyDirDeletion(const Entry &entry,
							 bool &for_all) = 0;
};

} // namespace FileOp
