// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "MatchStream.hxx"
#include "io/Logger.hxx"

using std::string_view_literals::operator""sv;

static constexpr LLogger logger{"pcre/stream"};

std::optional<MatchSpan>
MatchStream::NextSpan()
{
	if (cursor.IsEnd())
		return std::nullopt;

	MatchData m;

	try {
		m = regex.Match(cursor.Suffix(buffer));
	} catch (...) {
		cursor.Finish();
		throw;
	}

	if (!m) {
		logger.Fmt(6, "no match after offset {}"sv,
			   cursor.GetPosition());
		cursor.Finish();
		return std::nullopt;
	}

	const auto span = cursor.ToAbsolute(buffer, m, 0);
	cursor.Advance(m.GetCaptureStart(0));
	return span;
}

MatchStream
RegexPointer::MatchAll(std::string_view input) const
{
	return {*this, input};
}
