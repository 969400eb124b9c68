// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

/**
 * Install handlers for SIGINT, SIGTERM and SIGHUP which request
 * cancellation of the whole scan.  SIGPIPE is ignored.
 */
void
InstallCancelSignals();

/**
 * Has cancellation been requested (by a signal or by
 * RequestCancel())?  Async-signal-safe.
 */
bool
IsCancelRequested() noexcept;

void
RequestCancel() noexcept;
