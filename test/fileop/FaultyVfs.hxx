// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "fileop/LocalVfs.hxx"

#include <cstdint>
#include <limits>
#include <set>
#include <string>

/**
 * A #FileOp::LocalVfs which injects failures and observes how source
 * files are read.
 */
class FaultyVfs final : public FileOp::LocalVfs {
public:
	/**
	 * If non-zero, all Rename() calls fail with this errno.
	 */
	int rename_errno = 0;

	/**
	 * OpenFile() fails with EACCES for these paths.
	 */
	std::set<std::string> fail_open;

	/**
	 * Seek() fails with ESPIPE on all files.
	 */
	bool fail_seek = false;

	/**
	 * Reading from a read-only file fails with EIO once its file
	 * position has reached this offset.
	 */
	uint_least64_t fail_read_at = std::numeric_limits<uint_least64_t>::max();

	/**
	 * Writing to a writable file fails with ENOSPC once this many
	 * bytes have been written to it.
	 */
	uint_least64_t fail_write_at = std::numeric_limits<uint_least64_t>::max();

	/**
	 * Close() of writable files fails with EIO (after closing).
	 */
	bool fail_close = false;

	/**
	 * The lowest file offset any read-only file was read from.
	 */
	uint_least64_t min_read_offset = std::numeric_limits<uint_least64_t>::max();

	uint_least64_t n_bytes_read = 0;

	std::unique_ptr<FileOp::VfsFile> OpenFile(const char *path, int flags,
						  mode_t mode) override;
	bool Rename(const char *from, const char *to) noexcept override;
};
