// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * C++ wrappers for libevent.
 */

#pragma once

#include <event2/event.h>

#include <stdexcept>

/**
 * Wrapper for a struct event_base.
 */
class EventLoop {
	struct event_base *const event_base;

	static struct event_base *Create() {
		struct event_base *base = ::event_base_new();
		if (base == nullptr)
			throw std::runtime_error("event_base_new() failed");
		return base;
	}

public:
	EventLoop():event_base(Create()) {}

	~EventLoop() noexcept {
		::event_base_free(event_base);
	}

	EventLoop(const EventLoop &other) = delete;
	EventLoop &operator=(const EventLoop &other) = delete;

	struct event_base *Get() noexcept {
		return event_base;
	}

	/**
	 * Run the loop until Break() is called or no events are
	 * left.
	 *
	 * Throws on error.
	 */
	void Dispatch() {
		if (::event_base_dispatch(event_base) < 0)
			throw std::runtime_error("event_base_dispatch() failed");
	}

	void Break() noexcept {
		::event_base_loopbreak(event_base);
	}
};
