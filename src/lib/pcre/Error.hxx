// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstddef>
#include <stdexcept>

namespace Pcre {

/**
 * An error reported by libpcre2.  The message is obtained from
 * pcre2_get_error_message().
 */
class Error : public std::runtime_error {
	int code;

public:
	[[nodiscard]]
	Error(int _code, const char *msg) noexcept
		:std::runtime_error(msg), code(_code) {}

	int GetCode() const noexcept {
		return code;
	}
};

/**
 * The pattern was rejected by pcre2_compile().
 */
class CompileError final : public Error {
	std::size_t offset;

public:
	[[nodiscard]]
	CompileError(int _code, std::size_t _offset) noexcept;

	[[nodiscard]]
	CompileError(int _code, std::size_t _offset, const char *msg) noexcept
		:Error(_code, msg), offset(_offset) {}

	/**
	 * The position within the pattern where the error was
	 * detected.
	 */
	std::size_t GetOffset() const noexcept {
		return offset;
	}
};

/**
 * pcre2_match() failed for a reason other than "no match",
 * e.g. because a match limit was exceeded or memory was exhausted.
 */
class MatchError final : public Error {
public:
	[[nodiscard]]
	explicit MatchError(int _code) noexcept;
};

} // namespace Pcre
