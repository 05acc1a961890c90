// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <pcre2.h>

#include <cassert>
#include <cstddef>
#include <string_view>
#include <utility>

/**
 * The result of one pcre2_match() call.  Owns the
 * pcre2_match_data_8 block; all offsets are relative to the subject
 * string which was passed to RegexPointer::Match().
 */
class MatchData {
	friend class RegexPointer;

	pcre2_match_data_8 *match_data = nullptr;
	const char *s = nullptr;
	PCRE2_SIZE *ovector = nullptr;
	std::size_t n = 0;

	explicit MatchData(pcre2_match_data_8 *_md, const char *_s) noexcept
		:match_data(_md), s(_s),
		 ovector(pcre2_get_ovector_pointer_8(match_data))
	{
	}

public:
	MatchData() = default;

	MatchData(MatchData &&src) noexcept
		:match_data(std::exchange(src.match_data, nullptr)),
		 s(src.s), ovector(src.ovector), n(src.n) {}

	~MatchData() noexcept {
		if (match_data != nullptr)
			pcre2_match_data_free_8(match_data);
	}

	MatchData &operator=(MatchData &&src) noexcept {
		using std::swap;
		swap(match_data, src.match_data);
		swap(s, src.s);
		swap(ovector, src.ovector);
		swap(n, src.n);
		return *this;
	}

	/**
	 * Was there a match?
	 */
	constexpr operator bool() const noexcept {
		return match_data != nullptr && n > 0;
	}

	/**
	 * The number of capture slots, including the whole match at
	 * index 0.
	 */
	constexpr std::size_t size() const noexcept {
		assert(*this);

		return n;
	}

	static constexpr std::size_t npos = ~std::size_t{};

	static_assert(PCRE2_UNSET == npos);

	[[gnu::pure]]
	constexpr std::string_view operator[](std::size_t i) const noexcept {
		assert(*this);
		assert(i < size());

		const auto start = ovector[2 * i];
		if (start == PCRE2_UNSET)
			return {};

		const auto end = ovector[2 * i + 1];
		assert(end >= start);

		return { s + start, std::size_t(end - start) };
	}

	/**
	 * @return the start offset of the given capture or #npos if
	 * the capture did not participate in the match
	 */
	[[gnu::pure]]
	constexpr std::size_t GetCaptureStart(std::size_t i) const noexcept {
		assert(*this);
		assert(i < size());

		return ovector[2 * i];
	}

	[[gnu::pure]]
	constexpr std::size_t GetCaptureEnd(std::size_t i) const noexcept {
		assert(*this);
		assert(i < size());

		return ovector[2 * i + 1];
	}
};
