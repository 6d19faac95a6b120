// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Instance.hxx"
#include "HttpGlue.hxx"
#include "Config.hxx"
#include "Logger.hxx"

#include <event2/http.h>

#include <stdexcept>

#include <signal.h>
#include <string.h>

static struct evhttp *
CreateHttp(EventLoop &event_loop)
{
	struct evhttp *http = evhttp_new(event_loop.Get());
	if (http == nullptr)
		throw std::runtime_error("evhttp_new() failed");
	return http;
}

StaticInstance::StaticInstance(const StaticConfig &_config)
	:config(_config),
	 sigterm_event(event_loop, SIGTERM,
		       [this](int signo){ ShutdownCallback(signo); }),
	 sigint_event(event_loop, SIGINT,
		      [this](int signo){ ShutdownCallback(signo); }),
	 http(CreateHttp(event_loop))
{
	RegisterHttpGlue(http, config);

	sigterm_event.Enable();
	sigint_event.Enable();
}

StaticInstance::~StaticInstance() noexcept
{
	evhttp_free(http);
}

void
StaticInstance::Listen()
{
	if (evhttp_bind_socket(http, config.listen_address.c_str(),
			       config.port) < 0)
		throw std::runtime_error(fmt::format("Failed to listen on {}:{}",
						     config.listen_address,
						     config.port));

	LogFmt(3, "main", "listening on {}:{}, document root '{}'",
	       config.listen_address, config.port, config.document_root);
}

void
StaticInstance::Run()
{
	event_loop.Dispatch();
}

void
StaticInstance::ShutdownCallback(int signo) noexcept
{
	LogFmt(3, "main", "caught signal {} ({}), shutting down",
	       signo, strsignal(signo));

	sigterm_event.Disable();
	sigint_event.Disable();
	event_loop.Break();
}
