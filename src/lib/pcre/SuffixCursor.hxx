// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "MatchData.hxx"
#include "MatchRecord.hxx"

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <string_view>

/**
 * The position of a global match within a buffer.  Each step
 * presents the remaining suffix to the single-shot matcher as a
 * subject of its own; this class translates the suffix-relative
 * offsets reported for it back into offsets into the whole buffer.
 *
 * The position never exceeds the buffer length; once it reaches the
 * end, the scan is finished.
 */
class SuffixCursor {
	std::size_t position = 0;
	std::size_t length;

public:
	constexpr explicit SuffixCursor(std::size_t _length) noexcept
		:length(_length) {}

	constexpr bool IsEnd() const noexcept {
		return position >= length;
	}

	constexpr std::size_t GetPosition() const noexcept {
		return position;
	}

	constexpr std::string_view Suffix(std::string_view buffer) const noexcept {
		assert(buffer.size() == length);
		assert(!IsEnd());

		return buffer.substr(position);
	}

	/**
	 * Convert capture #i of a match within Suffix() to a
	 * #MatchSpan pointing into the whole buffer.
	 */
	MatchSpan ToAbsolute(std::string_view buffer, const MatchData &m,
			     std::size_t i) const noexcept {
		const std::size_t start = m.GetCaptureStart(i);
		if (start == MatchData::npos)
			return {};

		const std::size_t end = m.GetCaptureEnd(i);
		assert(end >= start);
		assert(position + end <= length);

		return {
			position + start,
			position + end,
			buffer.substr(position + start, end - start),
		};
	}

	/**
	 * Move the cursor one byte past the start of the match which
	 * was found at the given offset within Suffix().  This
	 * advances by at least one byte even if the match was empty,
	 * and the next suffix may begin inside the previous match.
	 */
	constexpr void Advance(std::size_t relative_start) noexcept {
		position = std::min(position + relative_start + 1, length);
	}

	/**
	 * Stop scanning; IsEnd() will return true from now on.
	 */
	constexpr void Finish() noexcept {
		position = length;
	}
};
