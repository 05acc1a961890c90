// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "lib/pcre/UniqueRegex.hxx"
#include "lib/pcre/GroupMatchStream.hxx"
#include "lib/pcre/Error.hxx"

#include <gtest/gtest.h>

using std::string_view_literals::operator""sv;

TEST(GroupMatchStream, Versions)
{
	const UniqueRegex r{"(v)([0-9]+.[0-9]+.[0-9]+)"};
	static constexpr auto input =
		"Latest stable version is v1.2.2. Latest version is v1.3.0"sv;

	auto s = r.MatchAllGroups(input);

	auto m = s.Next();
	ASSERT_TRUE(m);
	ASSERT_EQ(m.size(), 3U);
	EXPECT_EQ(m[0].text, "v1.2.2"sv);
	EXPECT_EQ(m[1].text, "v"sv);
	EXPECT_EQ(m[2].text, "1.2.2"sv);
	EXPECT_EQ(m[0].start, 25U);
	EXPECT_EQ(m[0].end, 31U);
	EXPECT_EQ(m[1].start, 25U);
	EXPECT_EQ(m[1].end, 26U);
	EXPECT_EQ(m[2].start, 26U);
	EXPECT_EQ(m[2].end, 31U);

	/* the texts point into the caller's buffer */
	EXPECT_EQ(m[0].text.data(), input.data() + 25);

	m = s.Next();
	ASSERT_TRUE(m);
	ASSERT_EQ(m.size(), 3U);
	EXPECT_EQ(m[0].text, "v1.3.0"sv);
	EXPECT_EQ(m[1].text, "v"sv);
	EXPECT_EQ(m[2].text, "1.3.0"sv);
	EXPECT_EQ(m[0].start, 51U);
	EXPECT_EQ(m[0].end, 57U);

	ASSERT_FALSE(s.Next());
	ASSERT_TRUE(s.IsExhausted());
	ASSERT_FALSE(s.Next());
}

TEST(GroupMatchStream, NoCaptures)
{
	const UniqueRegex r{"[0-9]+"};
	auto s = r.MatchAllGroups("a1b22");

	auto m = s.Next();
	ASSERT_TRUE(m);
	ASSERT_EQ(m.size(), 1U);
	EXPECT_EQ(m[0].text, "1"sv);

	m = s.Next();
	ASSERT_TRUE(m);
	EXPECT_EQ(m[0].text, "22"sv);
	EXPECT_EQ(m[0].start, 3U);

	/* resumes one byte after the start of the previous match */
	m = s.Next();
	ASSERT_TRUE(m);
	EXPECT_EQ(m[0].text, "2"sv);
	EXPECT_EQ(m[0].start, 4U);

	ASSERT_TRUE(s.IsExhausted());
	ASSERT_FALSE(s.Next());
}

TEST(GroupMatchStream, UnsetCapture)
{
	const UniqueRegex r{"(a)?(b)"};
	static constexpr auto input = "b ab"sv;
	auto s = r.MatchAllGroups(input);

	auto m = s.Next();
	ASSERT_TRUE(m);
	ASSERT_EQ(m.size(), 3U);
	EXPECT_EQ(m[0].text, "b"sv);
	EXPECT_FALSE(m[1].IsDefined());
	EXPECT_EQ(m[1].start, MatchSpan::npos);
	EXPECT_EQ(m[1].text.data(), nullptr);
	EXPECT_TRUE(m[2].IsDefined());
	EXPECT_EQ(m[2].start, 0U);

	m = s.Next();
	ASSERT_TRUE(m);
	EXPECT_EQ(m[0].text, "ab"sv);
	EXPECT_EQ(m[0].start, 2U);
	EXPECT_TRUE(m[1].IsDefined());
	EXPECT_EQ(m[1].text, "a"sv);
	EXPECT_EQ(m[2].text, "b"sv);
	EXPECT_EQ(m[2].start, 3U);

	m = s.Next();
	ASSERT_TRUE(m);
	EXPECT_EQ(m[0].text, "b"sv);
	EXPECT_EQ(m[0].start, 3U);
	EXPECT_FALSE(m[1].IsDefined());

	ASSERT_FALSE(s.Next());
}

TEST(GroupMatchStream, SpanCount)
{
	const UniqueRegex r{"(x)|(y)(z)?|(w)"};
	ASSERT_EQ(r.GetCaptureCount(), 4U);

	static constexpr auto input = "x y yz w"sv;
	auto s = r.MatchAllGroups(input);

	unsigned n = 0;
	while (const auto m = s.Next()) {
		ASSERT_EQ(m.size(), 5U);
		for (const auto &i : m) {
			if (!i.IsDefined())
				continue;

			ASSERT_LE(i.start, i.end);
			ASSERT_LE(i.end, input.size());
			ASSERT_EQ(i.text, input.substr(i.start, i.end - i.start));
		}

		++n;
	}

	ASSERT_EQ(n, 4U);
}

TEST(GroupMatchStream, EmptyInput)
{
	const UniqueRegex r{"(a)"};
	auto s = r.MatchAllGroups({});
	ASSERT_TRUE(s.IsExhausted());
	ASSERT_FALSE(s.Next());
}

TEST(GroupMatchStream, NoMatch)
{
	const UniqueRegex r{"(v)([0-9]+)"};
	auto s = r.MatchAllGroups("no version here");
	ASSERT_FALSE(s.Next());
	ASSERT_TRUE(s.IsExhausted());
}

TEST(GroupMatchStream, EmptyMatch)
{
	/* an empty whole match ends the iteration, unlike
	   MatchStream */
	const UniqueRegex r{"x*"};
	auto s = r.MatchAllGroups("abcde");
	ASSERT_FALSE(s.Next());
	ASSERT_TRUE(s.IsExhausted());
}

TEST(GroupMatchStream, EmptyMatchLater)
{
	const UniqueRegex r{"(a)|x*"};
	auto s = r.MatchAllGroups("ab");

	const auto m = s.Next();
	ASSERT_TRUE(m);
	EXPECT_EQ(m[0].text, "a"sv);
	EXPECT_EQ(m[1].text, "a"sv);

	/* "x*" matches the empty string at "b" */
	ASSERT_FALSE(s.Next());
	ASSERT_TRUE(s.IsExhausted());
}

TEST(GroupMatchStream, EmptyCapture)
{
	/* only the whole match counts; empty captures are fine */
	const UniqueRegex r{"a(x*)"};
	auto s = r.MatchAllGroups("aa");

	auto m = s.Next();
	ASSERT_TRUE(m);
	EXPECT_TRUE(m[1].IsDefined());
	EXPECT_TRUE(m[1].empty());
	EXPECT_EQ(m[1].start, 1U);

	m = s.Next();
	ASSERT_TRUE(m);
	EXPECT_EQ(m[0].start, 1U);

	ASSERT_FALSE(s.Next());
}

TEST(GroupMatchStream, Error)
{
	const UniqueRegex r{"(*LIMIT_MATCH=10)(a+)+[bc]"};
	auto s = r.MatchAllGroups("aaaaaaaaaaaaaaaaaaaaaaaad");

	ASSERT_THROW(s.Next(), Pcre::MatchError);
	ASSERT_TRUE(s.IsExhausted());
	ASSERT_FALSE(s.Next());
}
