// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "CancellationToken.hxx"
#include "cluster/Error.hxx"

#include <algorithm>

using std::chrono_literals::operator""ms;

void
CancellationToken::Cancel() noexcept
{
	{
		const std::scoped_lock lock{mutex};
		cancelled.store(true, std::memory_order_relaxed);
	}

	cond.notify_all();
}

void
CancellationToken::ThrowIfCancelled() const
{
	if (IsCancelled())
		throw ClusterError(ResultCode::SCAN_TERMINATED,
				   "Operation cancelled");
}

bool
CancellationToken::WaitFor(std::chrono::steady_clock::duration d) const noexcept
{
	/* cancellation of the parent is not signalled to our
	   condition variable; wake up periodically to check it */
	static constexpr std::chrono::steady_clock::duration slice = 50ms;

	const auto deadline = std::chrono::steady_clock::now() + d;

	std::unique_lock lock{mutex};
	while (!IsCancelled()) {
		const auto now = std::chrono::steady_clock::now();
		if (now >= deadline)
			return true;

		cond.wait_for(lock, std::min(deadline - now, slice));
	}

	return false;
}
