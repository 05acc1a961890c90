// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Error.hxx"
#include "lib/fmt/ToBuffer.hxx"

#include <pcre2.h>

namespace Pcre {

static StringBuffer<256>
ErrorMessage(int code) noexcept
{
	StringBuffer<256> buffer;
	if (pcre2_get_error_message_8(code, (PCRE2_UCHAR8 *)buffer.data(),
				      buffer.capacity()) < 0)
		/* unknown error code, or the buffer was too
		   small */
		buffer = FmtBuffer<256>("PCRE error {}", code);

	return buffer;
}

CompileError::CompileError(int _code, std::size_t _offset) noexcept
	:Error(_code,
	       FmtBuffer<512>("Error in regex at offset {}: {}",
			      _offset, ErrorMessage(_code).c_str()).c_str()),
	 offset(_offset) {}

MatchError::MatchError(int _code) noexcept
	:Error(_code, ErrorMessage(_code).c_str()) {}

} // namespace Pcre
