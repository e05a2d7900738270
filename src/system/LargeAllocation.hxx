// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstddef>
#include <span>
#include <utility>

/**
 * Allocates anonymous memory using mmap(), rounded up to whole
 * pages.
 */
class LargeAllocation {
	void *data = nullptr;
	std::size_t the_size = 0;

public:
	LargeAllocation() = default;

	/**
	 * Throws std::bad_alloc on error.
	 */
	explicit LargeAllocation(std::size_t _size);

	LargeAllocation(LargeAllocation &&src) noexcept
		:data(std::exchange(src.data, nullptr)),
		 the_size(std::exchange(src.the_size, 0)) {}

	~LargeAllocation() noexcept {
		if (data != nullptr)
			Free(data, the_size);
	}

	LargeAllocation &operator=(LargeAllocation &&src) noexcept {
		using std::swap;
		swap(data, src.data);
		swap(the_size, src.the_size);
		return *this;
	}

	operator bool() const noexcept {
		return data != nullptr;
	}

	void *get() const noexcept {
		return data;
	}

	std::size_t size() const noexcept {
		return the_size;
	}

	/**
	 * Return the first #n bytes of the allocation as a writable
	 * span (clipped to the allocation size).
	 */
	std::span<std::byte> first(std::size_t n) const noexcept {
		return {static_cast<std::byte *>(data), n < the_size ? n : the_size};
	}

private:
	static void Free(void *p, std::size_t size) noexcept;
};
