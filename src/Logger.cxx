// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Logger.hxx"
#include "util/Exception.hxx"

#include <fmt/format.h>

#include <atomic>

static std::atomic_uint log_level{4};

void
SetLogLevel(unsigned level) noexcept
{
	log_level.store(level, std::memory_order_relaxed);
}

unsigned
GetLogLevel() noexcept
{
	return log_level.load(std::memory_order_relaxed);
}

void
Logger::Write(std::string_view msg) const
{
	if (domain.empty())
		fmt::print(stderr, "{}\n", msg);
	else
		fmt::print(stderr, "[{}] {}\n", domain, msg);
}

void
Logger::WriteException(std::string_view prefix, std::exception_ptr ep) const
{
	const auto msg = GetFullMessage(ep);
	if (prefix.empty())
		Write(msg);
	else
		Write(fmt::format("{}{}", prefix, msg));
}

void
Logger::VFmt(fmt::string_view format_str, fmt::format_args args) const
{
	Write(fmt::vformat(format_str, args));
}
