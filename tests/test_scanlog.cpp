/**
 * @file test_scanlog.cpp
 * @brief Unit tests for the sqlite scan history
 */

#include <gtest/gtest.h>
#include "ScanLog.h"

TEST(ScanLogTest, CountsRecordedCodes)
{
	ScanLog log;
	ASSERT_TRUE(log.open(":memory:"));
	ASSERT_TRUE(log.isOpen());

	EXPECT_EQ(0, log.count("9780132114677"));
	EXPECT_TRUE(log.record("9780132114677", "book.ppm"));
	EXPECT_EQ(1, log.count("9780132114677"));
	EXPECT_TRUE(log.record("9780132114677", "book-again.ppm"));
	EXPECT_EQ(2, log.count("9780132114677"));
	EXPECT_EQ(0, log.count("0360002914522"));
}

TEST(ScanLogTest, ClosedLogRefusesWork)
{
	ScanLog log;
	EXPECT_FALSE(log.isOpen());
	EXPECT_EQ(-1, log.count("9780132114677"));
	EXPECT_FALSE(log.record("9780132114677", "book.ppm"));

	ASSERT_TRUE(log.open(":memory:"));
	log.close();
	EXPECT_FALSE(log.isOpen());
	EXPECT_EQ(-1, log.count("9780132114677"));
}

TEST(ScanLogTest, UnopenablePathFails)
{
	ScanLog log;
	EXPECT_FALSE(log.open("/nonexistent-directory/scans.db"));
	EXPECT_FALSE(log.isOpen());
}
