// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <string>
#include <utility>

#include <netdb.h>

/**
 * Owner of a getaddrinfo() result list.
 */
class AddressInfo {
	struct addrinfo *value = nullptr;

public:
	AddressInfo() = default;
	explicit AddressInfo(struct addrinfo *_value) noexcept
		:value(_value) {}

	AddressInfo(AddressInfo &&src) noexcept
		:value(std::exchange(src.value, nullptr)) {}

	~AddressInfo() noexcept {
		if (value != nullptr)
			freeaddrinfo(value);
	}

	AddressInfo &operator=(AddressInfo &&src) noexcept {
		std::swap(value, src.value);
		return *this;
	}

	bool empty() const noexcept {
		return value == nullptr;
	}

	class const_iterator {
		struct addrinfo *cursor;

	public:
		explicit constexpr const_iterator(struct addrinfo *_cursor) noexcept
			:cursor(_cursor) {}

		constexpr bool operator==(const_iterator other) const noexcept {
			return cursor == other.cursor;
		}

		constexpr bool operator!=(const_iterator other) const noexcept {
			return cursor != other.cursor;
		}

		const_iterator &operator++() noexcept {
			cursor = cursor->ai_next;
			return *this;
		}

		const struct addrinfo &operator*() const noexcept {
			return *cursor;
		}

		const struct addrinfo *operator->() const noexcept {
			return cursor;
		}
	};

	const_iterator begin() const noexcept {
		return const_iterator(value);
	}

	const_iterator end() const noexcept {
		return const_iterator(nullptr);
	}
};

/**
 * Resolve a host name to stream socket addresses.
 *
 * Throws std::runtime_error on error.
 */
AddressInfo
Resolve(const char *host_and_port, const char *service, int flags=0);

/**
 * Format the numeric host part of an address (without the port).
 */
std::string
ToNumericHost(const struct addrinfo &ai);
