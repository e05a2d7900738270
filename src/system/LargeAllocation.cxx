// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "LargeAllocation.hxx"
#include "PageAllocator.hxx"

LargeAllocation::LargeAllocation(std::size_t _size)
	:data(AllocatePages(AlignToPageSize(_size))),
	 the_size(AlignToPageSize(_size))
{
}

void
LargeAllocation::Free(void *p, std::size_t size) noexcept
{
	FreePages(p, size);
}
