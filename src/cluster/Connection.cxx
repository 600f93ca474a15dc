// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Connection.hxx"
#include "Config.hxx"
#include "Error.hxx"

void
Connector::Login(Connection &, const ClusterConfig &config)
{
	throw FmtClusterError(ResultCode::NOT_AUTHENTICATED,
			      "Cannot log in as '{}': the connector does not support authentication",
			      config.user);
}
