// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <functional>

#include <event2/event.h>

class EventLoop;

/**
 * Invoke a callback when the given signal is received.  The event
 * is persistent until Disable() is called or the object is
 * destroyed.
 */
class SignalEvent {
	struct event *event;

	using Callback = std::function<void(int)>;
	const Callback callback;

public:
	/**
	 * Throws on error.
	 */
	SignalEvent(EventLoop &loop, int signo, Callback _callback);

	~SignalEvent() noexcept {
		::event_free(event);
	}

	SignalEvent(const SignalEvent &) = delete;
	SignalEvent &operator=(const SignalEvent &) = delete;

	/**
	 * Throws on error.
	 */
	void Enable();

	void Disable() noexcept {
		::event_del(event);
	}

private:
	static void EventCallback(evutil_socket_t fd, short events,
				  void *ctx) noexcept;
};
