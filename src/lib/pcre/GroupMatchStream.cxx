// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "GroupMatchStream.hxx"
#include "io/Logger.hxx"

#include <cassert>

using std::string_view_literals::operator""sv;

static constexpr LLogger logger{"pcre/group_stream"};

MatchRecord
GroupMatchStream::Next()
{
	if (cursor.IsEnd())
		return {};

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
		return {};
	}

	const std::size_t relative_start = m.GetCaptureStart(0);
	if (relative_start == m.GetCaptureEnd(0)) {
		/* an empty whole match ends the iteration */
		logger.Fmt(6, "empty match at offset {}"sv,
			   cursor.GetPosition() + relative_start);
		cursor.Finish();
		return {};
	}

	const std::size_t n = std::size_t(regex.GetCaptureCount()) + 1;
	assert(m.size() == n);

	MatchRecord record{n};
	for (std::size_t i = 0; i < n; ++i)
		record.push_back(cursor.ToAbsolute(buffer, m, i));

	cursor.Advance(relative_start);
	return record;
}

GroupMatchStream
RegexPointer::MatchAllGroups(std::string_view input) const noexcept
{
	return {*this, input};
}
