// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

/**
 * Options for compiling a #UniqueRegex.  Each field maps to one
 * PCRE2 compile option.
 */
struct CompileOptions {
	/**
	 * Match only at the start of the subject (PCRE2_ANCHORED).
	 */
	bool anchored = false;

	/**
	 * Case-insensitive matching (PCRE2_CASELESS).
	 */
	bool caseless = false;

	/**
	 * "^" and "$" match at newlines (PCRE2_MULTILINE).
	 */
	bool multiline = false;

	/**
	 * "." matches newlines (PCRE2_DOTALL).
	 */
	bool dotall = false;

	/**
	 * Ignore white space and "#" comments in the pattern
	 * (PCRE2_EXTENDED).
	 */
	bool extended = false;

	/**
	 * Invert the greediness of quantifiers (PCRE2_UNGREEDY).
	 */
	bool ungreedy = false;

	/**
	 * Enable numbered capture groups.  If false, plain
	 * parentheses do not capture (PCRE2_NO_AUTO_CAPTURE).
	 */
	bool capture = true;

	constexpr CompileOptions Anchored(bool value=true) const noexcept {
		auto o = *this;
		o.anchored = value;
		return o;
	}

	constexpr CompileOptions Caseless(bool value=true) const noexcept {
		auto o = *this;
		o.caseless = value;
		return o;
	}

	constexpr CompileOptions Multiline(bool value=true) const noexcept {
		auto o = *this;
		o.multiline = value;
		return o;
	}

	constexpr CompileOptions DotAll(bool value=true) const noexcept {
		auto o = *this;
		o.dotall = value;
		return o;
	}

	constexpr CompileOptions Extended(bool value=true) const noexcept {
		auto o = *this;
		o.extended = value;
		return o;
	}

	constexpr CompileOptions Ungreedy(bool value=true) const noexcept {
		auto o = *this;
		o.ungreedy = value;
		return o;
	}

	constexpr CompileOptions Capture(bool value=true) const noexcept {
		auto o = *this;
		o.capture = value;
		return o;
	}

	/**
	 * Convert to a PCRE2 option bit mask.
	 */
	[[gnu::pure]]
	unsigned ToPcre() const noexcept;
};
