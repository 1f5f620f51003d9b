// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/core.h>

#include <exception>
#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>

class LoggerDetail {
public:
	static unsigned min_level;

	[[gnu::pure]]
	static bool CheckLevel(unsigned level) noexcept {
		return level <= min_level;
	}

	/**
	 * Write one line to the log sink.  This is the only function
	 * which performs I/O; it is safe to be called from any
	 * thread.
	 */
	static void WriteLine(unsigned level, std::string_view domain,
			      std::string_view msg) noexcept;

	static void Append(std::string &dest, std::string_view s) noexcept {
		dest.append(s);
	}

	static void Append(std::string &dest, const char *s) noexcept {
		dest.append(s != nullptr ? s : "(null)");
	}

	static void Append(std::string &dest, const std::string &s) noexcept {
		dest.append(s);
	}

	static void Append(std::string &dest, char ch) noexcept {
		dest.push_back(ch);
	}

	static void Append(std::string &dest,
			   const std::exception &e) noexcept;

	static void Append(std::string &dest,
			   const std::exception_ptr &ep) noexcept;

	template<typename T>
	static std::enable_if_t<std::is_arithmetic_v<T>>
	Append(std::string &dest, T value) noexcept {
		fmt::format_to(std::back_inserter(dest), "{}", value);
	}

	template<typename... Args>
	static std::string Concat(Args&&... args) noexcept {
		std::string result;
		(Append(result, std::forward<Args>(args)), ...);
		return result;
	}
};

/**
 * Set the global verbosity.  Messages with a higher level are
 * discarded.
 */
void
SetLogLevel(unsigned level) noexcept;

[[gnu::pure]]
static inline bool
CheckLogLevel(unsigned level) noexcept
{
	return LoggerDetail::CheckLevel(level);
}

/**
 * Log a message which is concatenated from all arguments.  Each
 * argument may be a string, a number or an exception.
 */
template<typename... Args>
void
LogConcat(unsigned level, std::string_view domain, Args&&... args) noexcept
{
	if (!LoggerDetail::CheckLevel(level))
		return;

	LoggerDetail::WriteLine(level, domain,
				LoggerDetail::Concat(std::forward<Args>(args)...));
}

template<typename... Args>
void
LogFmt(unsigned level, std::string_view domain,
       fmt::format_string<Args...> format_str, Args&&... args) noexcept
{
	if (!LoggerDetail::CheckLevel(level))
		return;

	LoggerDetail::WriteLine(level, domain,
				fmt::format(format_str,
					    std::forward<Args>(args)...));
}

/**
 * A logger which writes all messages with a fixed domain prefix.
 *
 * Levels: 1 = error, 2 = warning, 3 = notice, 4 = info,
 * 5 = debug, 6 = trace.
 */
class Logger {
	std::string domain;

public:
	Logger() = default;

	explicit Logger(std::string_view _domain) noexcept
		:domain(_domain) {}

	const std::string &GetDomain() const noexcept {
		return domain;
	}

	[[gnu::pure]]
	bool IsVisible(unsigned level) const noexcept {
		return CheckLogLevel(level);
	}

	template<typename... Args>
	void operator()(unsigned level, Args&&... args) const noexcept {
		LogConcat(level, domain, std::forward<Args>(args)...);
	}

	template<typename... Args>
	void Fmt(unsigned level, fmt::format_string<Args...> format_str,
		 Args&&... args) const noexcept {
		LogFmt(level, domain, format_str, std::forward<Args>(args)...);
	}
};

/**
 * A #Logger whose domain is a base domain plus a child name,
 * e.g. "sidecar/project-1".
 */
class ChildLogger : public Logger {
public:
	ChildLogger(std::string_view parent, std::string_view name) noexcept
		:Logger(LoggerDetail::Concat(parent, '/', name)) {}
};
