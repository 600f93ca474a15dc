// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <fmt/core.h>

#include <exception>
#include <string>
#include <string_view>

/**
 * Set the process-wide verbosity.  Messages with a level above this
 * value are discarded.  1 = fatal, 2 = error, 3/4 = warning,
 * 5 = info, 6 = debug.
 */
void
SetLogLevel(unsigned level) noexcept;

[[gnu::pure]]
unsigned
GetLogLevel() noexcept;

/**
 * Writes log lines to stderr, prefixed with a domain string.
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

	static bool CheckLevel(unsigned level) noexcept {
		return GetLogLevel() >= level;
	}

	void operator()(unsigned level, std::string_view msg) const {
		if (CheckLevel(level))
			Write(msg);
	}

	void operator()(unsigned level, std::string_view prefix,
			std::exception_ptr ep) const {
		if (CheckLevel(level))
			WriteException(prefix, ep);
	}

	template<typename... Args>
	void Fmt(unsigned level, fmt::format_string<Args...> format_str,
		 Args&&... args) const {
		if (CheckLevel(level))
			VFmt(format_str, fmt::make_format_args(args...));
	}

private:
	void Write(std::string_view msg) const;
	void WriteException(std::string_view prefix,
			    std::exception_ptr ep) const;
	void VFmt(fmt::string_view format_str, fmt::format_args args) const;
};
