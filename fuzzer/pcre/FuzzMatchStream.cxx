// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "lib/pcre/UniqueRegex.hxx"
#include "lib/pcre/MatchStream.hxx"
#include "lib/pcre/GroupMatchStream.hxx"
#include "lib/pcre/Error.hxx"

#include <cstdint>
#include <cstdlib>
#include <iterator>
#include <string_view>

extern "C" {
int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size);
}

/**
 * The first byte selects the pattern, the rest is the input.
 */
static constexpr const char *patterns[] = {
	"(v)([0-9]+.[0-9]+.[0-9]+)",
	"x*",
	"(a)?(b)|c*",
	"^.",
	"$",
	"(*LIMIT_MATCH=100)(a+)+[bc]",
};

static void
Check(bool condition) noexcept
{
	if (!condition)
		abort();
}

int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size)
{
	if (size == 0)
		return 0;

	static constexpr std::size_t n_patterns = std::size(patterns);
	const UniqueRegex r{patterns[data[0] % n_patterns]};

	const std::string_view input{(const char *)data + 1, size - 1};

	try {
		std::size_t previous = 0, n = 0;
		auto s = r.MatchAll(input);
		while (const auto m = s.NextSpan()) {
			Check(m->start >= previous);
			Check(m->end <= input.size());
			Check(++n <= input.size());
			previous = m->start;
		}
	} catch (const Pcre::MatchError &) {
	}

	try {
		std::size_t previous = 0, n = 0;
		auto s = r.MatchAllGroups(input);
		while (const auto m = s.Next()) {
			Check(m.size() == r.GetCaptureCount() + 1);
			Check(m[0].start >= previous);
			Check(m[0].start < m[0].end);
			Check(++n <= input.size());
			previous = m[0].start;
		}
	} catch (const Pcre::MatchError &) {
	}

	return 0;
}
