// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The cryptseek Project

#pragma once

#include <stdio.h>

struct ConfigBlock;

/**
 * Read a configuration file consisting of "name value" lines.  Empty
 * lines and lines starting with '#' are ignored; the value may be
 * enclosed in double quotes.
 *
 * Throws on error.
 */
ConfigBlock
ReadConfigFile(const char *path);

/**
 * Same as above, but read from an already opened file.
 *
 * Throws on error.
 */
ConfigBlock
ReadConfigFile(FILE *file);
