// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The cryptseek Project

#include "FillSelection.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <cassert>

#include <string.h>

FillSelectionType
ParseFillSelectionType(const char *s)
{
	if (strcmp(s, "replace_last") == 0)
		return FillSelectionType::REPLACE_LAST;
	else if (strcmp(s, "round_robin") == 0)
		return FillSelectionType::ROUND_ROBIN;
	else if (strcmp(s, "lru") == 0)
		return FillSelectionType::LEAST_RECENTLY_USED;
	else
		throw FmtInvalidArgument("Unrecognized eviction policy: \"{}\"",
					 s);
}

const char *
ToString(FillSelectionType type) noexcept
{
	switch (type) {
	case FillSelectionType::REPLACE_LAST:
		return "replace_last";

	case FillSelectionType::ROUND_ROBIN:
		return "round_robin";

	case FillSelectionType::LEAST_RECENTLY_USED:
		return "lru";
	}

	__builtin_unreachable();
}

std::size_t
LeastRecentlyUsedSelection::SelectVictim(std::size_t n) noexcept
{
	assert(n == last_use.size());

	std::size_t victim = 0;
	for (std::size_t i = 1; i < n; ++i)
		if (last_use[i] < last_use[victim])
			victim = i;

	return victim;
}

void
LeastRecentlyUsedSelection::OnUse(std::size_t i) noexcept
{
	assert(i < last_use.size());

	last_use[i] = ++clock;
}

std::unique_ptr<FillSelection>
CreateFillSelection(FillSelectionType type, std::size_t n)
{
	switch (type) {
	case FillSelectionType::REPLACE_LAST:
		return std::make_unique<ReplaceLastSelection>();

	case FillSelectionType::ROUND_ROBIN:
		return std::make_unique<RoundRobinSelection>();

	case FillSelectionType::LEAST_RECENTLY_USED:
		return std::make_unique<LeastRecentlyUsedSelection>(n);
	}

	__builtin_unreachable();
}
