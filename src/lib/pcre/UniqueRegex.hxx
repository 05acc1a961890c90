// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "RegexPointer.hxx"
#include "Options.hxx"

#include <string_view>
#include <utility>

/**
 * Owns a compiled PCRE2 pattern.  This class is move-only; the
 * pattern is freed by the destructor.
 */
class UniqueRegex : public RegexPointer {
public:
	UniqueRegex() = default;

	UniqueRegex(std::string_view pattern, CompileOptions options={}) {
		Compile(pattern, options);
	}

	UniqueRegex(UniqueRegex &&src) noexcept:RegexPointer(src) {
		src.re = nullptr;
		src.n_capture = 0;
	}

	~UniqueRegex() noexcept {
		if (re != nullptr)
			pcre2_code_free_8(re);
	}

	UniqueRegex &operator=(UniqueRegex &&src) noexcept {
		using std::swap;
		swap<RegexPointer>(*this, src);
		return *this;
	}

	/**
	 * Throws Pcre::CompileError on error.  If this object
	 * already holds a pattern, it is replaced only on success.
	 */
	void Compile(std::string_view pattern, CompileOptions options={});
};
