// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The cryptseek Project

#include "File.hxx"
#include "Block.hxx"
#include "system/Error.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/StringStrip.hxx"

#include <cstring>
#include <memory>
#include <string>
#include <string_view>

static constexpr char CONF_COMMENT = '#';

/* longer lines are rejected */
static constexpr std::size_t MAX_LINE_LENGTH = 1024;

struct FileCloser {
	void operator()(FILE *f) const noexcept {
		fclose(f);
	}
};

/**
 * Parse the value after the name; either a bare word or a string
 * enclosed in double quotes.  Throws on error.
 */
static std::string
ParseValue(std::string_view s)
{
	s = Strip(s);
	if (s.empty())
		throw std::runtime_error("Value missing");

	if (s.front() != '"') {
		const auto comment = s.find(CONF_COMMENT);
		if (comment != s.npos)
			s = StripRight(s.substr(0, comment));

		if (s.find_first_of(" \t") != s.npos)
			throw std::runtime_error("Unknown tokens after value");

		return std::string{s};
	}

	s.remove_prefix(1);
	const auto end = s.find('"');
	if (end == s.npos)
		throw std::runtime_error("Missing closing quote");

	const auto rest = StripLeft(s.substr(end + 1));
	if (!rest.empty() && rest.front() != CONF_COMMENT)
		throw std::runtime_error("Unknown tokens after value");

	return std::string{s.substr(0, end)};
}

static void
ReadNameValue(ConfigBlock &block, std::string_view line, int line_number)
{
	const auto space = line.find_first_of(" \t");
	if (space == line.npos)
		throw std::runtime_error("Value missing");

	const std::string name{line.substr(0, space)};
	auto value = ParseValue(line.substr(space));

	const BlockParam *bp = block.GetBlockParam(name.c_str());
	if (bp != nullptr)
		throw FmtRuntimeError("\"{}\" is duplicate, first defined on line {}",
				      name, bp->line);

	block.AddBlockParam(name, std::move(value), line_number);
}

ConfigBlock
ReadConfigFile(FILE *file)
{
	ConfigBlock block(0);

	char buffer[MAX_LINE_LENGTH];
	int line_number = 0;

	while (fgets(buffer, sizeof(buffer), file) != nullptr) {
		++line_number;

		std::string_view line = buffer;
		if (!line.empty() && line.back() != '\n' && !feof(file))
			throw FmtRuntimeError("Line {} is too long",
					      line_number);

		line = Strip(line);
		if (line.empty() || line.front() == CONF_COMMENT)
			continue;

		try {
			ReadNameValue(block, line, line_number);
		} catch (...) {
			std::throw_with_nested(FmtRuntimeError("Error on line {}",
							       line_number));
		}
	}

	if (ferror(file))
		throw MakeErrno("Failed to read configuration file");

	return block;
}

ConfigBlock
ReadConfigFile(const char *path)
{
	std::unique_ptr<FILE, FileCloser> file{fopen(path, "r")};
	if (!file)
		throw FmtRuntimeError("Failed to open {}: {}",
				      path, strerror(errno));

	try {
		return ReadConfigFile(file.get());
	} catch (...) {
		std::throw_with_nested(FmtRuntimeError("Error in {}", path));
	}
}
