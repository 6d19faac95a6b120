// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Connect the static file handler to libevent's HTTP server.
 */

#pragma once

struct StaticConfig;
struct evhttp;

/**
 * Install a generic callback which passes all GET and HEAD requests
 * to HandleStaticRequest() and answers all other methods with "405
 * Method Not Allowed".  The #StaticConfig must outlive the #evhttp
 * object.
 */
void
RegisterHttpGlue(struct evhttp *http, const StaticConfig &config) noexcept;
