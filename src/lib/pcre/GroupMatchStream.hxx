// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "RegexPointer.hxx"
#include "SuffixCursor.hxx"
#include "MatchRecord.hxx"

#include <string_view>

/**
 * Iterate over all matches of a pattern in a buffer, from left to
 * right, yielding the whole match and all captures of each match.
 *
 * The input is not copied; the caller must keep it (and the
 * #UniqueRegex) alive while this object is in use.
 *
 * Like #MatchStream, scanning resumes one byte after the start of
 * the previous match.  Unlike #MatchStream, an empty whole match
 * ends the iteration.
 */
class GroupMatchStream {
	RegexPointer regex;

	std::string_view buffer;

	SuffixCursor cursor;

public:
	GroupMatchStream(RegexPointer _regex, std::string_view _buffer) noexcept
		:regex(_regex), buffer(_buffer), cursor(buffer.size()) {}

	bool IsExhausted() const noexcept {
		return cursor.IsEnd();
	}

	std::size_t GetPosition() const noexcept {
		return cursor.GetPosition();
	}

	/**
	 * Find the next match.
	 *
	 * Throws Pcre::MatchError on error; the stream is exhausted
	 * afterwards.
	 *
	 * @return a record with GetCaptureCount()+1 spans pointing
	 * into the buffer, or an empty record if there are no more
	 * matches
	 */
	MatchRecord Next();
};
