// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

struct StaticConfig;

/**
 * Read configuration options from the command line.  On error, a
 * message is printed and the process exits.
 */
void
ParseCommandLine(StaticConfig &config, int argc, char **argv);
