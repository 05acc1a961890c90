// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "RegexPointer.hxx"
#include "SuffixCursor.hxx"

#include <optional>
#include <string>
#include <string_view>

/**
 * Iterate over all matches of a pattern in a buffer, from left to
 * right, yielding the whole match only (no captures).
 *
 * The input is copied, so the caller's buffer may be freed after
 * construction.  The #UniqueRegex must outlive this object.
 *
 * After each match, scanning resumes one byte after the start of
 * that match (not after its end).  Empty matches are returned, too.
 * Scanning stops at the first position where no further match is
 * found.
 */
class MatchStream {
	RegexPointer regex;

	const std::string buffer;

	SuffixCursor cursor;

public:
	MatchStream(RegexPointer _regex, std::string_view input)
		:regex(_regex), buffer(input), cursor(buffer.size()) {}

	MatchStream(const MatchStream &) = delete;
	MatchStream &operator=(const MatchStream &) = delete;

	bool IsExhausted() const noexcept {
		return cursor.IsEnd();
	}

	/**
	 * The offset where the next search begins.
	 */
	std::size_t GetPosition() const noexcept {
		return cursor.GetPosition();
	}

	/**
	 * Find the next match.
	 *
	 * Throws Pcre::MatchError on error; the stream is exhausted
	 * afterwards.
	 *
	 * @return the match (with offsets into the stream's own copy
	 * of the input; the text remains valid as long as this
	 * object exists) or std::nullopt if there are no more
	 * matches
	 */
	std::optional<MatchSpan> NextSpan();

	/**
	 * Like NextSpan(), but return only the matched text.
	 */
	std::optional<std::string_view> Next() {
		if (const auto span = NextSpan())
			return span->text;
		return std::nullopt;
	}
};
