// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>

#include <sys/time.h>

namespace EventChrono {

using Clock = std::chrono::steady_clock;
using Duration = Clock::duration;

/**
 * Convert a #Duration to a struct timeval for libevent.  Negative
 * durations are clamped to zero.
 */
constexpr struct timeval
ToTimeval(Duration d) noexcept
{
	if (d.count() < 0)
		d = Duration::zero();

	const auto s = std::chrono::duration_cast<std::chrono::seconds>(d);
	const auto us = std::chrono::duration_cast<std::chrono::microseconds>(d - s);

	struct timeval tv{};
	tv.tv_sec = s.count();
	tv.tv_usec = us.count();
	return tv;
}

} // namespace EventChrono
