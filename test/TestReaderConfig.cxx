// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The cryptseek Project

#include "reader/ReaderConfig.hxx"
#include "config/Block.hxx"
#include "config/File.hxx"
#include "config/Parser.hxx"

#include <gtest/gtest.h>

#include <cstdio>
#include <memory>

TEST(ConfigParser, ParseSize)
{
	EXPECT_EQ(ParseSize("0"), 0u);
	EXPECT_EQ(ParseSize("1024"), 1024u);
	EXPECT_EQ(ParseSize("4k"), 4096u);
	EXPECT_EQ(ParseSize("2M"), 2097152u);
	EXPECT_EQ(ParseSize("2 MB"), 2097152u);
	EXPECT_EQ(ParseSize("1G"), 1073741824u);
	EXPECT_EQ(ParseSize("512B"), 512u);
	EXPECT_EQ(ParseSize("16", 1024), 16384u);
	EXPECT_EQ(ParseSize("16B", 1024), 16u);

	EXPECT_THROW(ParseSize(""), std::runtime_error);
	EXPECT_THROW(ParseSize("k"), std::runtime_error);
	EXPECT_THROW(ParseSize("4x"), std::runtime_error);
	EXPECT_THROW(ParseSize("4kk"), std::runtime_error);
	EXPECT_THROW(ParseSize("-1"), std::runtime_error);
}

TEST(ConfigParser, ParseNumbers)
{
	EXPECT_EQ(ParseUnsigned("0"), 0u);
	EXPECT_EQ(ParsePositive("4"), 4u);
	EXPECT_THROW(ParsePositive("0"), std::runtime_error);
	EXPECT_THROW(ParseUnsigned("-3"), std::runtime_error);
	EXPECT_THROW(ParseLong("12a"), std::runtime_error);
	EXPECT_EQ(ParseUnsigned("4294967295"), 4294967295u);
	EXPECT_THROW(ParseUnsigned("4294967297"), std::runtime_error);
	EXPECT_THROW(ParsePositive("4294967297"), std::runtime_error);

	EXPECT_TRUE(ParseBool("yes"));
	EXPECT_TRUE(ParseBool("TRUE"));
	EXPECT_FALSE(ParseBool("0"));
	EXPECT_THROW(ParseBool("maybe"), std::runtime_error);
}

TEST(ReaderConfig, Defaults)
{
	const ReaderConfig config;
	EXPECT_EQ(config.buffer_count, 2u);
	EXPECT_EQ(config.buffer_size, 2097152u);
	EXPECT_EQ(config.threads, 1u);
	EXPECT_EQ(config.stream_offset, 262144u);
	EXPECT_EQ(config.eviction, FillSelectionType::REPLACE_LAST);
	EXPECT_EQ(config.GetStreamCount(), 1u);
	EXPECT_NO_THROW(config.Check());
}

TEST(ReaderConfig, FromBlock)
{
	ConfigBlock block;
	block.AddBlockParam("buffer_count", "3", 1);
	block.AddBlockParam("buffer_size", "4M", 2);
	block.AddBlockParam("threads", "0", 3);
	block.AddBlockParam("stream_offset", "512k", 4);
	block.AddBlockParam("eviction", "lru", 5);

	const ReaderConfig config(block);
	EXPECT_EQ(config.buffer_count, 3u);
	EXPECT_EQ(config.buffer_size, 4194304u);
	EXPECT_EQ(config.threads, 0u);
	EXPECT_EQ(config.GetStreamCount(), 1u);
	EXPECT_EQ(config.stream_offset, 524288u);
	EXPECT_EQ(config.eviction, FillSelectionType::LEAST_RECENTLY_USED);

	for (const auto &i : block.block_params)
		EXPECT_TRUE(i.used) << i.name;
}

TEST(ReaderConfig, Invalid)
{
	{
		ConfigBlock block;
		block.AddBlockParam("eviction", "random", 1);
		EXPECT_THROW(ReaderConfig{block}, std::runtime_error);
	}

	{
		ConfigBlock block;
		block.AddBlockParam("buffer_count", "0", 1);
		EXPECT_THROW(ReaderConfig{block}, std::runtime_error);
	}

	{
		ConfigBlock block;
		block.AddBlockParam("buffer_size", "256k", 1);
		EXPECT_THROW(ReaderConfig{block}, std::invalid_argument);
	}

	{
		ConfigBlock block;
		block.AddBlockParam("threads", "65", 1);
		EXPECT_THROW(ReaderConfig{block}, std::invalid_argument);
	}

	{
		/* must not wrap around to 1 */
		ConfigBlock block;
		block.AddBlockParam("threads", "4294967297", 1);
		EXPECT_THROW(ReaderConfig{block}, std::runtime_error);
	}
}

namespace {

struct TestFileCloser {
	void operator()(FILE *f) const noexcept {
		fclose(f);
	}
};

using UniqueFile = std::unique_ptr<FILE, TestFileCloser>;

} // anonymous namespace

static UniqueFile
MakeFile(const char *contents)
{
	UniqueFile file{tmpfile()};
	if (!file)
		throw std::runtime_error("tmpfile() failed");

	fputs(contents, file.get());
	rewind(file.get());
	return file;
}

TEST(ConfigFile, Read)
{
	const auto file = MakeFile("# reader settings\n"
				   "\n"
				   "buffer_size 1M\n"
				   "  threads   4   # one per core\n"
				   "eviction \"round_robin\"\n");

	const auto block = ReadConfigFile(file.get());
	ASSERT_EQ(block.block_params.size(), 3u);

	const auto *param = block.GetBlockParam("threads");
	ASSERT_NE(param, nullptr);
	EXPECT_EQ(param->value, "4");
	EXPECT_EQ(param->line, 4);

	EXPECT_STREQ(block.GetBlockValue("eviction"), "round_robin");
	EXPECT_EQ(block.GetSizeValue("buffer_size", 0), 1048576u);
	EXPECT_EQ(block.GetBlockValue("buffer_count", 2u), 2u);

	const ReaderConfig config(block);
	EXPECT_EQ(config.threads, 4u);
	EXPECT_EQ(config.eviction, FillSelectionType::ROUND_ROBIN);
}

TEST(ConfigFile, Errors)
{
	EXPECT_THROW(ReadConfigFile(MakeFile("threads\n").get()),
		     std::runtime_error);
	EXPECT_THROW(ReadConfigFile(MakeFile("threads 1 2\n").get()),
		     std::runtime_error);
	EXPECT_THROW(ReadConfigFile(MakeFile("eviction \"lru\n").get()),
		     std::runtime_error);
	EXPECT_THROW(ReadConfigFile(MakeFile("threads 1\nthreads 2\n").get()),
		     std::runtime_error);
	EXPECT_THROW(ReadConfigFile("/nonexistent/cryptseek.conf"),
		     std::runtime_error);
}
