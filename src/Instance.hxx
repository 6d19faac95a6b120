// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "event/Loop.hxx"
#include "event/SignalEvent.hxx"

struct StaticConfig;
struct evhttp;

struct StaticInstance {
	const StaticConfig &config;

	EventLoop event_loop;

	SignalEvent sigterm_event, sigint_event;

	struct evhttp *const http;

	/**
	 * Throws on error.
	 */
	explicit StaticInstance(const StaticConfig &_config);

	~StaticInstance() noexcept;

	StaticInstance(const StaticInstance &) = delete;
	StaticInstance &operator=(const StaticInstance &) = delete;

	/**
	 * Bind the HTTP listener to the configured address.
	 *
	 * Throws on error.
	 */
	void Listen();

	/**
	 * Run the event loop until a shutdown signal is received.
	 */
	void Run();

private:
	void ShutdownCallback(int signo) noexcept;
};
