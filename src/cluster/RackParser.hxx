// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <map>
#include <string>
#include <string_view>

/**
 * Maps a namespace name to the rack id of a node.
 */
using RackMap = std::map<std::string, unsigned, std::less<>>;

/**
 * Parse the value of the "rack-ids" info command:
 *
 *     NS:RACK;NS:RACK;...
 *
 * Throws #ClusterError (PARSE_ERROR) on syntax errors.
 */
RackMap
ParseRacks(std::string_view value);
