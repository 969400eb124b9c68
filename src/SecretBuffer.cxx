// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "SecretBuffer.hxx"

#include <sodium/utils.h>

void
SecretBuffer::Wipe() noexcept
{
	if (data != nullptr)
		sodium_memzero(data.get(), capacity);
}
