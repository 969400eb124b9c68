// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <cstddef>
#include <memory>
#include <span>

/**
 * A fixed-capacity heap buffer for data which may contain private
 * key material.  It is wiped with sodium_memzero() on destruction.
 */
class SecretBuffer {
	std::unique_ptr<std::byte[]> data;
	std::size_t capacity = 0, size = 0;

public:
	SecretBuffer() noexcept = default;

	explicit SecretBuffer(std::size_t _capacity)
		:data(new std::byte[_capacity]), capacity(_capacity) {}

	SecretBuffer(SecretBuffer &&src) noexcept
		:data(std::move(src.data)),
		 capacity(src.capacity), size(src.size)
	{
		src.capacity = src.size = 0;
	}

	~SecretBuffer() noexcept {
		Wipe();
	}

	SecretBuffer &operator=(SecretBuffer &&src) noexcept {
		Wipe();
		data = std::move(src.data);
		capacity = src.capacity;
		size = src.size;
		src.capacity = src.size = 0;
		return *this;
	}

	/**
	 * The whole allocated area, to be filled by the caller
	 * followed by SetSize().
	 */
	std::span<std::byte> Write() noexcept {
		return {data.get(), capacity};
	}

	void SetSize(std::size_t _size) noexcept {
		size = _size <= capacity ? _size : capacity;
	}

	bool empty() const noexcept {
		return size == 0;
	}

	operator std::span<const std::byte>() const noexcept {
		return {data.get(), size};
	}

	std::span<const std::byte> Read() const noexcept {
		return {data.get(), size};
	}

private:
	void Wipe() noexcept;
};
