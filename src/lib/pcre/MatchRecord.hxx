// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cassert>
#include <cstddef>
#include <string_view>
#include <vector>

/**
 * One capture of a match, with absolute offsets into the buffer
 * which was scanned.
 */
struct MatchSpan {
	static constexpr std::size_t npos = ~std::size_t{};

	std::size_t start = npos, end = npos;

	/**
	 * The matched text, pointing into the scanned buffer.  Its
	 * data() is nullptr if the capture is unset.
	 */
	std::string_view text;

	/**
	 * Did this capture participate in the match?  Optional
	 * groups which did not are "unset".
	 */
	constexpr bool IsDefined() const noexcept {
		return start != npos;
	}

	constexpr bool empty() const noexcept {
		return start == end;
	}
};

/**
 * All captures of one match: index 0 is the whole match, followed by
 * one entry per capturing group in the order of declaration.
 *
 * A default-constructed (empty) instance means "no match".
 */
class MatchRecord {
	std::vector<MatchSpan> spans;

public:
	MatchRecord() noexcept = default;

	explicit MatchRecord(std::size_t n) {
		spans.reserve(n);
	}

	operator bool() const noexcept {
		return !spans.empty();
	}

	std::size_t size() const noexcept {
		return spans.size();
	}

	const MatchSpan &operator[](std::size_t i) const noexcept {
		assert(i < spans.size());

		return spans[i];
	}

	auto begin() const noexcept {
		return spans.begin();
	}

	auto end() const noexcept {
		return spans.end();
	}

	void push_back(const MatchSpan &span) {
		spans.push_back(span);
	}
};
