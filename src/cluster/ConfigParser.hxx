// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <boost/filesystem/path.hpp>

struct ClusterConfig;

/**
 * Load a configuration file containing one "cluster" block into the
 * given #ClusterConfig.  Settings which are not mentioned in the
 * file keep their previous values.
 *
 * Throws on error.
 */
void
LoadConfigFile(ClusterConfig &config, const boost::filesystem::path &path);
