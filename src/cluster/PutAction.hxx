// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

/**
 * What to do with a borrowed connection when it is returned?
 */
enum class PutAction {
	/**
	 * The connection is in a clean state and may be handed out
	 * again.
	 */
	REUSE,

	/**
	 * The connection state is unknown; close it.
	 */
	DESTROY,
};
