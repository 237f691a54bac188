// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The cryptseek Project

#include "cache/CacheBufferPool.hxx"

#include <gtest/gtest.h>

#include <algorithm>

TEST(CacheBuffer, Coverage)
{
	CacheBuffer buffer(100);
	EXPECT_TRUE(buffer.IsEmpty());
	EXPECT_FALSE(buffer.Contains(0));

	buffer.Commit(1000, 50);
	EXPECT_FALSE(buffer.IsEmpty());
	EXPECT_FALSE(buffer.Contains(999));
	EXPECT_TRUE(buffer.Contains(1000));
	EXPECT_TRUE(buffer.Contains(1049));
	EXPECT_FALSE(buffer.Contains(1050));

	EXPECT_EQ(buffer.Read(1010).size(), 40u);

	buffer.Invalidate();
	EXPECT_TRUE(buffer.IsEmpty());
	EXPECT_FALSE(buffer.Contains(1000));
}

TEST(CacheBuffer, Wipe)
{
	CacheBuffer buffer(64);
	auto w = buffer.Write();
	std::fill(w.begin(), w.end(), std::byte{0xaa});
	buffer.Commit(0, 64);

	buffer.Wipe();
	EXPECT_TRUE(buffer.IsEmpty());

	const auto storage = buffer.GetStorage();
	EXPECT_TRUE(std::all_of(storage.begin(), storage.end(),
				[](std::byte b){ return b == std::byte{0}; }));
}

TEST(CacheBufferPool, FindCovering)
{
	CacheBufferPool pool(2, 100);
	EXPECT_EQ(pool.size(), 2u);
	EXPECT_EQ(pool.FindCovering(0), nullptr);

	auto &a = pool.SelectForFill();
	EXPECT_EQ(&a, &pool[0]);
	a.Commit(0, 100);

	EXPECT_EQ(pool.FindCovering(0), &pool[0]);
	EXPECT_EQ(pool.FindCovering(99), &pool[0]);
	EXPECT_EQ(pool.FindCovering(100), nullptr);
}

TEST(CacheBufferPool, FirstMatchWins)
{
	CacheBufferPool pool(2, 100);
	pool.SelectForFill().Commit(50, 100);
	pool.SelectForFill().Commit(0, 100);

	/* both cover 60; pool order decides, not recency */
	EXPECT_EQ(pool.FindCovering(60), &pool[0]);
	EXPECT_EQ(pool.FindCovering(10), &pool[1]);
}

TEST(CacheBufferPool, ReplaceLast)
{
	CacheBufferPool pool(2, 100);

	auto &first = pool.SelectForFill();
	EXPECT_EQ(&first, &pool[0]);
	first.Commit(0, 100);

	auto &second = pool.SelectForFill();
	EXPECT_EQ(&second, &pool[1]);
	second.Commit(1000, 100);

	/* all populated: the last one is overwritten, always */
	EXPECT_EQ(&pool.SelectForFill(), &pool[1]);
	second.Commit(2000, 100);
	EXPECT_EQ(&pool.SelectForFill(), &pool[1]);

	/* the first buffer keeps its contents */
	EXPECT_EQ(pool.FindCovering(50), &pool[0]);
}

TEST(CacheBufferPool, EmptyBufferPreferred)
{
	CacheBufferPool pool(3, 100);
	pool.SelectForFill().Commit(0, 100);
	auto &middle = pool.SelectForFill();
	middle.Commit(100, 100);
	pool.SelectForFill().Commit(200, 100);

	/* a failed fill leaves an empty buffer in the middle */
	middle.Invalidate();
	EXPECT_EQ(&pool.SelectForFill(), &pool[1]);
}

TEST(CacheBufferPool, RoundRobin)
{
	CacheBufferPool pool(2, 100, FillSelectionType::ROUND_ROBIN);
	pool.SelectForFill().Commit(0, 100);
	pool.SelectForFill().Commit(100, 100);

	EXPECT_EQ(&pool.SelectForFill(), &pool[0]);
	EXPECT_EQ(&pool.SelectForFill(), &pool[1]);
	EXPECT_EQ(&pool.SelectForFill(), &pool[0]);
}

TEST(CacheBufferPool, LeastRecentlyUsed)
{
	CacheBufferPool pool(2, 100, FillSelectionType::LEAST_RECENTLY_USED);
	pool.SelectForFill().Commit(0, 100);
	pool.SelectForFill().Commit(100, 100);

	ASSERT_EQ(pool.FindCovering(10), &pool[0]);
	EXPECT_EQ(&pool.SelectForFill(), &pool[1]);

	ASSERT_EQ(pool.FindCovering(110), &pool[1]);
	EXPECT_EQ(&pool.SelectForFill(), &pool[0]);
}

TEST(CacheBufferPool, Wipe)
{
	CacheBufferPool pool(2, 16);
	for (unsigned i = 0; i < 2; ++i) {
		auto &b = pool.SelectForFill();
		auto w = b.Write();
		std::fill(w.begin(), w.end(), std::byte{0x55});
		b.Commit(i * 16, 16);
	}

	pool.Wipe();

	for (const auto &b : pool) {
		EXPECT_TRUE(b.IsEmpty());
		const auto storage = b.GetStorage();
		EXPECT_EQ(std::count(storage.begin(), storage.end(),
				     std::byte{0}),
			  16);
	}
}

TEST(FillSelection, Parse)
{
	EXPECT_EQ(ParseFillSelectionType("replace_last"),
		  FillSelectionType::REPLACE_LAST);
	EXPECT_EQ(ParseFillSelectionType("round_robin"),
		  FillSelectionType::ROUND_ROBIN);
	EXPECT_EQ(ParseFillSelectionType("lru"),
		  FillSelectionType::LEAST_RECENTLY_USED);
	EXPECT_THROW(ParseFillSelectionType("random"),
		     std::invalid_argument);

	EXPECT_STREQ(ToString(FillSelectionType::LEAST_RECENTLY_USED), "lru");
}
