// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Logger.hxx"
#include "lib/fmt/ToBuffer.hxx"

#include <sys/uio.h>
#include <unistd.h>

unsigned LoggerDetail::max_level = 1;

static constexpr struct iovec
MakeIovec(std::string_view s) noexcept
{
	return { const_cast<char *>(s.data()), s.size() };
}

void
LoggerDetail::Write(std::string_view domain, std::string_view msg) noexcept
{
	struct iovec v[5];
	std::size_t n = 0;

	if (!domain.empty()) {
		v[n++] = MakeIovec("[");
		v[n++] = MakeIovec(domain);
		v[n++] = MakeIovec("] ");
	}

	v[n++] = MakeIovec(msg);
	v[n++] = MakeIovec("\n");

	ssize_t nbytes = writev(STDERR_FILENO, v, n);
	(void)nbytes;
}

void
LoggerDetail::Fmt(unsigned level, std::string_view domain,
		  fmt::string_view format_str, fmt::format_args args) noexcept
{
	if (!CheckLevel(level))
		return;

	const auto msg = VFmtBuffer<1024>(format_str, args);
	Write(domain, msg);
}
