// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "RegexPointer.hxx"
#include "Error.hxx"

#include <cassert>
#include <new> // for std::bad_alloc

MatchData
RegexPointer::Match(std::string_view s, pcre2_match_data_8 *md) const
{
	assert(IsDefined());

	if (md == nullptr)
		throw std::bad_alloc{};

	/* older PCRE2 versions reject a null subject even if its
	   length is zero */
	const char *subject = s.data() != nullptr ? s.data() : "";

	MatchData match_data{md, subject};

	int n = pcre2_match_8(re, (PCRE2_SPTR8)subject, s.size(),
			      0, 0,
			      match_data.match_data, nullptr);
	if (n == PCRE2_ERROR_NOMATCH)
		return {};

	if (n < 0)
		throw Pcre::MatchError(n);

	const std::size_t ovector_count = pcre2_get_ovector_count_8(md);

	if (n == 0)
		/* the ovector is too small for all captures; all of
		   its slots are filled */
		n = ovector_count;

	match_data.n = n;

	if (n_capture >= match_data.n && ovector_count > n_capture)
		/* in its return value, PCRE omits mismatching
		   optional captures if (and only if) they are
		   the last capture; this kludge works around
		   this */
		match_data.n = n_capture + 1;

	return match_data;
}

MatchData
RegexPointer::Match(std::string_view s) const
{
	return Match(s, pcre2_match_data_create_from_pattern_8(re, nullptr));
}

bool
RegexPointer::Test(std::string_view s) const
{
	/* one slot is the minimum; the capture offsets are not
	   needed */
	return Match(s, pcre2_match_data_create_8(1, nullptr));
}
