// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <fmt/core.h>

#include <string_view>
#include <utility>

namespace LoggerDetail {

extern unsigned max_level;

inline bool
CheckLevel(unsigned level) noexcept
{
	return level <= max_level;
}

/**
 * Write one line to stderr, prefixed with the domain (if not
 * empty).
 */
void
Write(std::string_view domain, std::string_view msg) noexcept;

void
Fmt(unsigned level, std::string_view domain,
    fmt::string_view format_str, fmt::format_args args) noexcept;

} /* namespace LoggerDetail */

inline void
SetLogLevel(unsigned level) noexcept
{
	LoggerDetail::max_level = level;
}

inline bool
CheckLogLevel(unsigned level) noexcept
{
	return LoggerDetail::CheckLevel(level);
}

inline void
LogWrite(unsigned level, std::string_view domain,
	 std::string_view msg) noexcept
{
	if (LoggerDetail::CheckLevel(level))
		LoggerDetail::Write(domain, msg);
}

template<typename S, typename... Args>
void
LogFmt(unsigned level, std::string_view domain,
       const S &format_str, Args&&... args) noexcept
{
	LoggerDetail::Fmt(level, domain, format_str,
			  fmt::make_format_args(args...));
}

template<typename Domain>
class BasicLogger : public Domain {
public:
	BasicLogger() = default;

	template<typename D>
	constexpr explicit BasicLogger(D &&_domain)
		:Domain(std::forward<D>(_domain)) {}

	static bool CheckLevel(unsigned level) noexcept {
		return LoggerDetail::CheckLevel(level);
	}

	void operator()(unsigned level, std::string_view msg) const noexcept {
		LogWrite(level, GetDomain(), msg);
	}

	template<typename S, typename... Args>
	void Fmt(unsigned level,  const S &format_str,
		 Args&&... args) const noexcept {
		LoggerDetail::Fmt(level, GetDomain(), format_str,
				  fmt::make_format_args(args...));
	}

	constexpr std::string_view GetDomain() const noexcept {
		return Domain::GetDomain();
	}
};

/**
 * A logger domain which is a literal string.
 */
class LiteralLoggerDomain {
	std::string_view domain;

public:
	constexpr explicit LiteralLoggerDomain(std::string_view _domain={}) noexcept
		:domain(_domain) {}

	constexpr std::string_view GetDomain() const noexcept {
		return domain;
	}
};

/**
 * A logger which uses a literal string as its domain.
 */
class LLogger : public BasicLogger<LiteralLoggerDomain> {
public:
	LLogger() = default;

	template<typename D>
	constexpr explicit LLogger(D &&_domain) noexcept
		:BasicLogger(std::forward<D>(_domain)) {}
};
