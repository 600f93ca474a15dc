// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <chrono>

struct ClusterConfig;

struct ToolCmdLine {
	/**
	 * The configuration file; nullptr if none was specified.
	 */
	const char *config_path = nullptr;

	/**
	 * How often the cluster status is printed.
	 */
	std::chrono::seconds interval{10};

	/**
	 * If true, then the configuration is checked, and the process
	 * exits.
	 */
	bool check = false;

	/**
	 * If true, then the cluster status is printed once after the
	 * cluster has stabilized, and the process exits.
	 */
	bool once = false;
};

/**
 * Parse command line options.  The configuration file (if any) is
 * loaded first; "--seed" and "--set" options are applied on top of
 * it.
 *
 * Exits the process on usage errors.  Throws if the configuration
 * file cannot be loaded.
 */
void
ParseCommandLine(ToolCmdLine &cmdline, ClusterConfig &config,
		 int argc, char **argv);
