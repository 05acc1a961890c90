// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "MatchData.hxx"

#include <pcre2.h>

#include <string_view>

class MatchStream;
class GroupMatchStream;

/**
 * A non-owning pointer to a compiled PCRE2 pattern.  It is cheap to
 * copy; the #UniqueRegex it was obtained from must outlive it.
 */
class RegexPointer {
protected:
	pcre2_code_8 *re = nullptr;

	unsigned n_capture = 0;

public:
	constexpr bool IsDefined() const noexcept {
		return re != nullptr;
	}

	/**
	 * The number of capturing groups declared by the pattern
	 * (not counting the whole match).
	 */
	constexpr unsigned GetCaptureCount() const noexcept {
		return n_capture;
	}

	/**
	 * Find the first match in the given string.  The subject
	 * is only the given string; "^" and lookbehind assertions do
	 * not see anything before it.
	 *
	 * Throws Pcre::MatchError on error.
	 *
	 * @return the match with all capture slots; a
	 * #MatchData which evaluates to false if there is no match
	 */
	MatchData Match(std::string_view s) const;

	/**
	 * Does the given string contain a match?  Unlike Match(), this
	 * does not request capture offsets.
	 *
	 * Throws Pcre::MatchError on error.
	 */
	bool Test(std::string_view s) const;

	/**
	 * Create a #MatchStream over a copy of the given input.
	 * Requires "MatchStream.hxx".
	 */
	MatchStream MatchAll(std::string_view input) const;

	/**
	 * Create a #GroupMatchStream over the given input, which must
	 * remain valid while the stream is in use.  Requires
	 * "GroupMatchStream.hxx".
	 */
	GroupMatchStream MatchAllGroups(std::string_view input) const noexcept;

private:
	MatchData Match(std::string_view s, pcre2_match_data_8 *md) const;
};
