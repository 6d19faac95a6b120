// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SignalEvent.hxx"
#include "Loop.hxx"

SignalEvent::SignalEvent(EventLoop &loop, int signo, Callback _callback)
	:event(::evsignal_new(loop.Get(), signo, EventCallback, this)),
	 callback(std::move(_callback))
{
	if (event == nullptr)
		throw std::runtime_error("evsignal_new() failed");
}

void
SignalEvent::Enable()
{
	if (::event_add(event, nullptr) < 0)
		throw std::runtime_error("event_add() failed");
}

void
SignalEvent::EventCallback(evutil_socket_t signo, short, void *ctx) noexcept
{
	auto &se = *(SignalEvent *)ctx;
	se.callback(signo);
}
