// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The cryptseek Project

#pragma once

class Domain;

extern const Domain config_domain;
