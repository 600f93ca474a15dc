// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

/**
 * A flag which tells workers to stop.  A token may have a parent;
 * cancelling the parent cancels all of its children.  All methods
 * are thread-safe.
 */
class CancellationToken {
	const CancellationToken *const parent;

	std::atomic_bool cancelled{false};

	mutable std::mutex mutex;
	mutable std::condition_variable cond;

public:
	CancellationToken() noexcept
		:parent(nullptr) {}

	/**
	 * @param _parent a token which must outlive this one
	 */
	explicit CancellationToken(const CancellationToken *_parent) noexcept
		:parent(_parent) {}

	CancellationToken(const CancellationToken &) = delete;
	CancellationToken &operator=(const CancellationToken &) = delete;

	void Cancel() noexcept;

	[[gnu::pure]]
	bool IsCancelled() const noexcept {
		return cancelled.load(std::memory_order_relaxed) ||
			(parent != nullptr && parent->IsCancelled());
	}

	/**
	 * Throws #ClusterError (SCAN_TERMINATED) if cancelled.
	 */
	void ThrowIfCancelled() const;

	/**
	 * Sleep for the given duration or until cancelled.
	 *
	 * @return false if cancelled
	 */
	bool WaitFor(std::chrono::steady_clock::duration d) const noexcept;
};
