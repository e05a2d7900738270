// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "PrintException.hxx"

#include <cstdio>

void
PrintException(const std::exception &e) noexcept
{
	fprintf(stderr, "%s\n", e.what());

	try {
		std::rethrow_if_nested(e);
	} catch (const std::exception &nested) {
		PrintException(nested);
	} catch (...) {
		fprintf(stderr, "Unrecognized nested exception\n");
	}
}

void
PrintException(const std::exception_ptr &ep) noexcept
{
	try {
		std::rethrow_exception(ep);
	} catch (const std::exception &e) {
		PrintException(e);
	} catch (...) {
		fprintf(stderr, "Unrecognized exception\n");
	}
}
