// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <condition_variable> // IWYU pragma: export

using Cond = std::condition_variable;
