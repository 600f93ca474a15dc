// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Partition.hxx"

#include <kvcluster/Protocol.hxx>

unsigned
GetPartitionId(const Digest &digest) noexcept
{
	/* the first four bytes are a little-endian integer */
	const uint32_t value = uint32_t(digest[0]) |
		(uint32_t(digest[1]) << 8) |
		(uint32_t(digest[2]) << 16) |
		(uint32_t(digest[3]) << 24);

	return value % KvCluster::PARTITIONS;
}
