// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Logger.hxx"
#include "util/Exception.hxx"

#include <boost/container/static_vector.hpp>

#include <sys/uio.h>
#include <unistd.h>

unsigned LoggerDetail::max_level = 1;
bool LoggerDetail::journal_priority = false;

LoggerDetail::ParamWrapper<std::exception_ptr>::ParamWrapper(std::exception_ptr ep) noexcept
	:ParamWrapper<std::string>(GetFullMessage(std::move(ep))) {}

/**
 * Map our log level to a syslog priority as understood by
 * sd-daemon(3).
 */
static constexpr std::string_view
JournalPriority(unsigned level) noexcept
{
	switch (level) {
	case 0:
		return "<3>"; // LOG_ERR

	case 1:
		return "<5>"; // LOG_NOTICE

	case 2:
		return "<6>"; // LOG_INFO

	default:
		return "<7>"; // LOG_DEBUG
	}
}

static struct iovec
MakeIovec(std::string_view s) noexcept
{
	return {const_cast<char *>(s.data()), s.size()};
}

void
LoggerDetail::WriteV(unsigned level, std::string_view domain,
		     std::span<const std::string_view> buffers) noexcept
{
	boost::container::static_vector<struct iovec, 64> v;

	if (journal_priority)
		v.push_back(MakeIovec(JournalPriority(level)));

	if (!domain.empty()) {
		v.push_back(MakeIovec("["));
		v.push_back(MakeIovec(domain));
		v.push_back(MakeIovec("] "));
	}

	for (const auto i : buffers) {
		if (v.size() >= v.capacity() - 1)
			break;

		v.push_back(MakeIovec(i));
	}

	v.push_back(MakeIovec("\n"));

	/* there is nobody to report a stderr failure to */
	[[maybe_unused]] ssize_t nbytes = writev(STDERR_FILENO, v.data(), v.size());
}

void
LoggerDetail::Fmt(unsigned level, std::string_view domain,
		  fmt::string_view format_str, fmt::format_args args) noexcept
{
	if (!CheckLevel(level))
		return;

	fmt::memory_buffer buffer;
	try {
		fmt::vformat_to(std::back_inserter(buffer), format_str, args);
	} catch (const std::exception &e) {
		/* log the format error instead */
		const std::string_view what{e.what()};
		buffer.clear();
		buffer.append(what.data(), what.data() + what.size());
	}

	const std::string_view s[]{{buffer.data(), buffer.size()}};
	WriteV(level, domain, s);
}
