// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "util/RoundPowerOfTwo.hxx"

#include <cstddef>

#include <sys/mman.h>

static constexpr std::size_t PAGE_SIZE = 4096;

/**
 * Round up the parameter, make it page-aligned.
 */
static constexpr std::size_t
AlignToPageSize(std::size_t size) noexcept
{
	return RoundUpToPowerOfTwo(size, PAGE_SIZE);
}

/**
 * Allocate pages from the kernel
 *
 * Throws std::bad_alloc on error.
 *
 * @param size the size of the allocation; must be a multiple of
 * #PAGE_SIZE
 */
void *
AllocatePages(std::size_t size);

static inline void
FreePages(void *p, std::size_t size) noexcept
{
	munmap(p, size);
}
