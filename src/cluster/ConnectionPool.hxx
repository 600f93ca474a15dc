// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <chrono>
#include <deque>
#include <memory>
#include <mutex>

class Connection;

/**
 * A bounded set of connections to one node.  It counts idle
 * connections and those which have been handed out; a new connection
 * may only be opened after Reserve() has succeeded.
 *
 * All methods are thread-safe.
 */
class ConnectionPool {
	mutable std::mutex mutex;

	/**
	 * Idle connections; the most recently used one is at the
	 * front.
	 */
	std::deque<std::unique_ptr<Connection>> idle;

	const unsigned min_size, max_size;

	/**
	 * Idle plus borrowed plus reserved connections.
	 */
	unsigned total = 0;

	/**
	 * The number of connections closed by this pool.
	 */
	unsigned long n_closed = 0;

	bool closed = false;

public:
	ConnectionPool(unsigned _min_size, unsigned _max_size) noexcept
		:min_size(_min_size), max_size(_max_size) {}

	~ConnectionPool() noexcept;

	ConnectionPool(const ConnectionPool &) = delete;
	ConnectionPool &operator=(const ConnectionPool &) = delete;

	unsigned GetMinSize() const noexcept {
		return min_size;
	}

	unsigned GetMaxSize() const noexcept {
		return max_size;
	}

	/**
	 * Borrow an idle connection.  Connections which have been idle
	 * for longer than #max_idle or which are not valid anymore are
	 * closed.
	 *
	 * @return an idle connection or nullptr
	 */
	std::unique_ptr<Connection> PopIdle(std::chrono::steady_clock::duration max_idle) noexcept;

	/**
	 * Reserve a slot for a new connection.
	 *
	 * @return false if the pool is full or closed
	 */
	bool Reserve() noexcept;

	/**
	 * Give back a slot obtained by Reserve() after opening the
	 * connection has failed.
	 */
	void Unreserve() noexcept;

	/**
	 * Return a borrowed connection.  If the pool has been closed,
	 * the connection is closed instead.
	 */
	void Push(std::unique_ptr<Connection> connection) noexcept;

	/**
	 * A borrowed connection will not be returned; close it and
	 * free its slot.
	 */
	void Discard(std::unique_ptr<Connection> connection) noexcept;

	/**
	 * Close invalid connections, and connections idle longer than
	 * #max_idle as long as the pool is above its minimum size.
	 *
	 * @return the number of connections missing to reach the
	 * minimum size
	 */
	unsigned Trim(std::chrono::steady_clock::duration max_idle) noexcept;

	/**
	 * Close all idle connections and refuse new ones.
	 * Connections which are currently borrowed will be closed when
	 * they are returned.
	 */
	void Close() noexcept;

	struct Stats {
		unsigned in_use, in_pool;
		unsigned long closed;
	};

	[[gnu::pure]]
	Stats GetStats() const noexcept;

private:
	void CloseConnection(std::unique_ptr<Connection> &&connection) noexcept;
};
