// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "cluster/ConnectionPool.hxx"
#include "cluster/Connection.hxx"

#include <gtest/gtest.h>

using std::chrono_literals::operator""s;
using std::chrono_literals::operator""ms;

namespace {

class NullConnection final : public Connection {
public:
	bool valid = true;
	unsigned &n_closed;

	explicit NullConnection(unsigned &_n_closed) noexcept
		:n_closed(_n_closed) {}

	/* virtual methods from class Connection */
	std::string Info(std::string_view) override {
		return {};
	}

	bool IsValid() const noexcept override {
		return valid;
	}

	void Close() noexcept override {
		valid = false;
		++n_closed;
	}
};

} // anonymous namespace

TEST(TestConnectionPool, Bounded)
{
	unsigned n_closed = 0;
	ConnectionPool pool(0, 2);

	EXPECT_EQ(pool.PopIdle(10s), nullptr);

	ASSERT_TRUE(pool.Reserve());
	ASSERT_TRUE(pool.Reserve());
	EXPECT_FALSE(pool.Reserve());

	pool.Unreserve();
	EXPECT_TRUE(pool.Reserve());

	pool.Push(std::make_unique<NullConnection>(n_closed));

	auto stats = pool.GetStats();
	EXPECT_EQ(stats.in_use, 1u);
	EXPECT_EQ(stats.in_pool, 1u);
	EXPECT_EQ(stats.closed, 0u);

	/* the pool is still full */
	EXPECT_FALSE(pool.Reserve());

	auto c = pool.PopIdle(10s);
	ASSERT_NE(c, nullptr);
	EXPECT_EQ(pool.GetStats().in_use, 2u);

	pool.Discard(std::move(c));
	EXPECT_EQ(n_closed, 1u);
	EXPECT_EQ(pool.GetStats().in_use, 1u);
	EXPECT_EQ(pool.GetStats().closed, 1u);
	EXPECT_TRUE(pool.Reserve());
}

TEST(TestConnectionPool, InvalidConnections)
{
	unsigned n_closed = 0;
	ConnectionPool pool(0, 4);

	ASSERT_TRUE(pool.Reserve());
	auto c = std::make_unique<NullConnection>(n_closed);
	c->valid = false;
	pool.Push(std::move(c));

	/* an invalid connection is not kept */
	EXPECT_EQ(n_closed, 1u);
	EXPECT_EQ(pool.GetStats().in_pool, 0u);
	EXPECT_EQ(pool.GetStats().in_use, 0u);

	ASSERT_TRUE(pool.Reserve());
	auto c2 = std::make_unique<NullConnection>(n_closed);
	auto &ref = *c2;
	pool.Push(std::move(c2));
	ref.valid = false;

	EXPECT_EQ(pool.PopIdle(10s), nullptr);
	EXPECT_EQ(n_closed, 2u);
	EXPECT_EQ(pool.GetStats().in_pool, 0u);
}

TEST(TestConnectionPool, IdleTimeout)
{
	unsigned n_closed = 0;
	ConnectionPool pool(0, 4);

	ASSERT_TRUE(pool.Reserve());
	pool.Push(std::make_unique<NullConnection>(n_closed));

	EXPECT_EQ(pool.PopIdle(std::chrono::steady_clock::duration::zero() - 1ms),
		  nullptr);
	EXPECT_EQ(n_closed, 1u);
	EXPECT_EQ(pool.GetStats().in_pool, 0u);
}

TEST(TestConnectionPool, Trim)
{
	unsigned n_closed = 0;
	ConnectionPool pool(1, 4);

	EXPECT_EQ(pool.Trim(10s), 1u);

	for (unsigned i = 0; i < 3; ++i)
		ASSERT_TRUE(pool.Reserve());

	for (unsigned i = 0; i < 3; ++i)
		pool.Push(std::make_unique<NullConnection>(n_closed));

	/* nothing has expired */
	EXPECT_EQ(pool.Trim(10s), 0u);
	EXPECT_EQ(pool.GetStats().in_pool, 3u);

	/* everything has expired, but the minimum is kept */
	EXPECT_EQ(pool.Trim(std::chrono::steady_clock::duration::zero() - 1ms), 0u);
	EXPECT_EQ(pool.GetStats().in_pool, 1u);
	EXPECT_EQ(n_closed, 2u);
}

TEST(TestConnectionPool, Close)
{
	unsigned n_closed = 0;
	ConnectionPool pool(0, 4);

	ASSERT_TRUE(pool.Reserve());
	ASSERT_TRUE(pool.Reserve());
	pool.Push(std::make_unique<NullConnection>(n_closed));

	pool.Close();
	EXPECT_EQ(n_closed, 1u);
	EXPECT_FALSE(pool.Reserve());

	/* a borrowed connection is closed when it is returned */
	pool.Push(std::make_unique<NullConnection>(n_closed));
	EXPECT_EQ(n_closed, 2u);

	const auto stats = pool.GetStats();
	EXPECT_EQ(stats.in_use, 0u);
	EXPECT_EQ(stats.in_pool, 0u);
	EXPECT_EQ(stats.closed, 2u);
}
