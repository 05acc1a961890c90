// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "UniqueRegex.hxx"
#include "Error.hxx"
#include "io/Logger.hxx"

static constexpr LLogger logger{"pcre"};

using std::string_view_literals::operator""sv;

unsigned
CompileOptions::ToPcre() const noexcept
{
	unsigned result = 0;

	if (anchored)
		result |= PCRE2_ANCHORED;

	if (caseless)
		result |= PCRE2_CASELESS;

	if (multiline)
		result |= PCRE2_MULTILINE;

	if (dotall)
		result |= PCRE2_DOTALL;

	if (extended)
		result |= PCRE2_EXTENDED;

	if (ungreedy)
		result |= PCRE2_UNGREEDY;

	if (!capture)
		result |= PCRE2_NO_AUTO_CAPTURE;

	return result;
}

void
UniqueRegex::Compile(std::string_view pattern, CompileOptions options)
{
	if (pattern.empty())
		throw Pcre::CompileError(0, 0, "Empty regex");

	int error_number;
	PCRE2_SIZE error_offset;
	pcre2_code_8 *new_re = pcre2_compile_8((PCRE2_SPTR8)pattern.data(),
					       pattern.size(),
					       options.ToPcre(),
					       &error_number, &error_offset,
					       nullptr);
	if (new_re == nullptr)
		throw Pcre::CompileError(error_number, error_offset);

	uint32_t capture_count;
	if (pcre2_pattern_info_8(new_re, PCRE2_INFO_CAPTURECOUNT,
				 &capture_count) != 0)
		capture_count = 0;

	if (re != nullptr)
		pcre2_code_free_8(re);

	re = new_re;
	n_capture = capture_count;

	logger.Fmt(5, "compiled '{}' with {} captures"sv,
		   pattern, n_capture);
}
