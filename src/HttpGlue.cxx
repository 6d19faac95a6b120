// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "HttpGlue.hxx"
#include "Config.hxx"
#include "Logger.hxx"
#include "file/Handler.hxx"
#include "beng-static/Headers.hxx"
#include "version.h"

#include <event2/http.h>
#include <event2/buffer.h>
#include <event2/keyvalq_struct.h>

#include <memory>
#include <stdexcept>
#include <variant>

using namespace BengStatic;

static const Logger glue_logger("http");

namespace {

struct EvbufferDeleter {
	void operator()(struct evbuffer *buffer) const noexcept {
		evbuffer_free(buffer);
	}
};

using UniqueEvbuffer = std::unique_ptr<struct evbuffer, EvbufferDeleter>;

} // anonymous namespace

static StaticRequest
MakeStaticRequest(struct evhttp_request *req, HttpMethod method)
{
	StaticRequest request{method, {}, {}};

	const char *path = evhttp_uri_get_path(evhttp_request_get_evhttp_uri(req));
	request.uri = path != nullptr && *path != 0 ? path : "/";

	const struct evkeyvalq *input = evhttp_request_get_input_headers(req);
	for (const struct evkeyval *i = input->tqh_first; i != nullptr;
	     i = i->next.tqe_next)
		request.headers.Add(i->key, i->value);

	return request;
}

/**
 * Copy the body of the #StaticResponse into the evbuffer.
 *
 * Throws on error.
 */
static void
FillBody(struct evbuffer *buffer, ResponseBody &&body)
{
	if (auto *s = std::get_if<std::string>(&body)) {
		if (evbuffer_add(buffer, s->data(), s->size()) < 0)
			throw std::runtime_error("evbuffer_add() failed");
	} else if (auto *file = std::get_if<FileBody>(&body)) {
		if (file->size <= 0)
			return;

		if (evbuffer_add_file(buffer, file->fd.Get(),
				      0, file->size) < 0)
			throw std::runtime_error("evbuffer_add_file() failed");

		/* from here on, libevent owns the file descriptor */
		file->fd.Release();
	}
}

static void
SendStaticResponse(struct evhttp_request *req, StaticResponse &&response)
{
	const UniqueEvbuffer buffer{evbuffer_new()};
	if (!buffer)
		throw std::runtime_error("evbuffer_new() failed");

	FillBody(buffer.get(), std::move(response.body));

	struct evkeyvalq *output = evhttp_request_get_output_headers(req);
	for (const auto &[name, value] : response.headers)
		evhttp_add_header(output, name.c_str(), value.c_str());

	evhttp_add_header(output, SERVER_HEADER.data(), "beng-static/" VERSION);

	const auto status = response.status;
	evhttp_send_reply(req, (int)status, http_status_to_string(status),
			  buffer.get());
}

/**
 * Send a response without a body.  Unlike evhttp_send_error(), this
 * keeps the output headers and does not generate an HTML page.
 */
static void
SendEmptyReply(struct evhttp_request *req, HttpStatus status) noexcept
{
	evhttp_send_reply(req, (int)status, http_status_to_string(status),
			  nullptr);
}

static void
HandleHttpRequest(struct evhttp_request *req, void *ctx) noexcept
{
	const auto &config = *(const StaticConfig *)ctx;

	HttpMethod method;
	switch (evhttp_request_get_command(req)) {
	case EVHTTP_REQ_GET:
		method = HttpMethod::GET;
		break;

	case EVHTTP_REQ_HEAD:
		method = HttpMethod::HEAD;
		break;

	default:
		evhttp_add_header(evhttp_request_get_output_headers(req),
				  ALLOW_HEADER.data(), "GET, HEAD");
		SendEmptyReply(req, HttpStatus::METHOD_NOT_ALLOWED);
		return;
	}

	try {
		const auto request = MakeStaticRequest(req, method);
		SendStaticResponse(req, HandleStaticRequest(config, request));
	} catch (...) {
		glue_logger.Log(1, "Failed to send response",
				std::current_exception());
		/* discard whatever SendStaticResponse() has added */
		evhttp_clear_headers(evhttp_request_get_output_headers(req));
		SendEmptyReply(req, HttpStatus::INTERNAL_SERVER_ERROR);
	}
}

void
RegisterHttpGlue(struct evhttp *http, const StaticConfig &config) noexcept
{
	/* accept all methods libevent knows; HandleHttpRequest()
	   answers anything but GET and HEAD with "405 Method Not
	   Allowed" (libevent itself would send "501 Not
	   Implemented") */
	evhttp_set_allowed_methods(http,
				   EVHTTP_REQ_GET|EVHTTP_REQ_HEAD|
				   EVHTTP_REQ_POST|EVHTTP_REQ_PUT|
				   EVHTTP_REQ_DELETE|EVHTTP_REQ_OPTIONS|
				   EVHTTP_REQ_TRACE|EVHTTP_REQ_CONNECT|
				   EVHTTP_REQ_PATCH);

	/* the handler decides about the Content-Type */
	evhttp_set_default_content_type(http, nullptr);

	evhttp_set_gencb(http, HandleHttpRequest,
			 const_cast<StaticConfig *>(&config));
}
