// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The cryptseek Project

#include "Block.hxx"
#include "Parser.hxx"
#include "Domain.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "Log.hxx"

void
BlockParam::ThrowWithNested() const
{
	std::throw_with_nested(FmtRuntimeError("Error in setting \"{}\" on line {}",
					       name, line));
}

unsigned
BlockParam::GetUnsignedValue() const
{
	return With(ParseUnsigned);
}

unsigned
BlockParam::GetPositiveValue() const
{
	return With(ParsePositive);
}

bool
BlockParam::GetBoolValue() const
{
	return With(ParseBool);
}

std::size_t
BlockParam::GetSizeValue() const
{
	return With([](const char *s){
		return ParseSize(s);
	});
}

const BlockParam *
ConfigBlock::GetBlockParam(const char *name) const noexcept
{
	for (const auto &i : block_params) {
		if (i.name == name) {
			i.used = true;
			return &i;
		}
	}

	return nullptr;
}

const char *
ConfigBlock::GetBlockValue(const char *name,
			   const char *default_value) const noexcept
{
	const BlockParam *bp = GetBlockParam(name);
	if (bp == nullptr)
		return default_value;

	return bp->value.c_str();
}

unsigned
ConfigBlock::GetBlockValue(const char *name, unsigned default_value) const
{
	const BlockParam *bp = GetBlockParam(name);
	if (bp == nullptr)
		return default_value;

	return bp->GetUnsignedValue();
}

unsigned
ConfigBlock::GetPositiveValue(const char *name, unsigned default_value) const
{
	const auto *param = GetBlockParam(name);
	if (param == nullptr)
		return default_value;

	return param->GetPositiveValue();
}

bool
ConfigBlock::GetBlockValue(const char *name, bool default_value) const
{
	const BlockParam *bp = GetBlockParam(name);
	if (bp == nullptr)
		return default_value;

	return bp->GetBoolValue();
}

std::size_t
ConfigBlock::GetSizeValue(const char *name, std::size_t default_value) const
{
	const auto *param = GetBlockParam(name);
	if (param == nullptr)
		return default_value;

	return param->GetSizeValue();
}

void
ConfigBlock::CheckUnused() const noexcept
{
	for (const auto &i : block_params) {
		if (!i.used)
			FmtWarning(config_domain,
				   "option '{}' on line {} was not recognized",
				   i.name, i.line);
	}
}
