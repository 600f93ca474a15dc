// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "ConnectionPool.hxx"
#include "Connection.hxx"

ConnectionPool::~ConnectionPool() noexcept
{
	Close();
}

inline void
ConnectionPool::CloseConnection(std::unique_ptr<Connection> &&connection) noexcept
{
	connection->Close();
	connection.reset();
	++n_closed;
}

std::unique_ptr<Connection>
ConnectionPool::PopIdle(std::chrono::steady_clock::duration max_idle) noexcept
{
	const auto now = std::chrono::steady_clock::now();

	const std::scoped_lock lock{mutex};

	while (!idle.empty()) {
		auto connection = std::move(idle.front());
		idle.pop_front();

		if (connection->IsValid() &&
		    now - connection->GetLastUsed() <= max_idle)
			return connection;

		CloseConnection(std::move(connection));
		--total;
	}

	return nullptr;
}

bool
ConnectionPool::Reserve() noexcept
{
	const std::scoped_lock lock{mutex};

	if (closed || total >= max_size)
		return false;

	++total;
	return true;
}

void
ConnectionPool::Unreserve() noexcept
{
	const std::scoped_lock lock{mutex};
	--total;
}

void
ConnectionPool::Push(std::unique_ptr<Connection> connection) noexcept
{
	const std::scoped_lock lock{mutex};

	if (closed || !connection->IsValid()) {
		CloseConnection(std::move(connection));
		--total;
		return;
	}

	connection->UpdateLastUsed();
	idle.emplace_front(std::move(connection));
}

void
ConnectionPool::Discard(std::unique_ptr<Connection> connection) noexcept
{
	const std::scoped_lock lock{mutex};
	CloseConnection(std::move(connection));
	--total;
}

unsigned
ConnectionPool::Trim(std::chrono::steady_clock::duration max_idle) noexcept
{
	const auto now = std::chrono::steady_clock::now();

	const std::scoped_lock lock{mutex};

	if (closed)
		return 0;

	/* the least recently used connections are at the back */
	while (!idle.empty() &&
	       (!idle.back()->IsValid() ||
		(total > min_size &&
		 now - idle.back()->GetLastUsed() > max_idle))) {
		CloseConnection(std::move(idle.back()));
		idle.pop_back();
		--total;
	}

	return total < min_size ? min_size - total : 0;
}

void
ConnectionPool::Close() noexcept
{
	const std::scoped_lock lock{mutex};

	closed = true;

	for (auto &i : idle) {
		CloseConnection(std::move(i));
		--total;
	}

	idle.clear();
}

ConnectionPool::Stats
ConnectionPool::GetStats() const noexcept
{
	const std::scoped_lock lock{mutex};

	const unsigned in_pool = idle.size();
	return {
		total - in_pool,
		in_pool,
		n_closed,
	};
}
