/**
 * @file test_raster.cpp
 * @brief Unit tests for the P6 container decoder and encoder
 */

#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "Raster.h"

static std::vector<unsigned char> container(const std::string& header, size_t payload)
{
	std::vector<unsigned char> buffer(header.begin(), header.end());
	for (size_t i = 0; i < payload; i++)
		buffer.push_back((unsigned char) (i + 1));
	return buffer;
}

TEST(RasterTest, DecodesHeaderAndPixels)
{
	const ParseResult<Pixmap> r = decodePixmap(container("P6\n2 1\n255\n", 6));

	ASSERT_TRUE(r.ok()) << r.error().message;
	const Pixmap& p = r.value();
	EXPECT_EQ(2u, p.width());
	EXPECT_EQ(1u, p.height());

	const Pixel px = p.pixel(0, 1);
	EXPECT_EQ(4, px.r);
	EXPECT_EQ(5, px.g);
	EXPECT_EQ(6, px.b);
	EXPECT_TRUE(r.rest().atEnd());
}

TEST(RasterTest, AcceptsComments)
{
	const ParseResult<Pixmap> r = decodePixmap(container("P6 # made by hand\n2 # columns\n1 255\n", 6));

	ASSERT_TRUE(r.ok()) << r.error().message;
	EXPECT_EQ(2u, r.value().width());
	EXPECT_EQ(1u, r.value().height());
}

TEST(RasterTest, LeavesTrailingBytes)
{
	const ParseResult<Pixmap> r = decodePixmap(container("P6 1 1 255\n", 7));

	ASSERT_TRUE(r.ok()) << r.error().message;
	EXPECT_EQ(4u, r.rest().remaining());
	EXPECT_EQ(14u, r.rest().offset());
}

TEST(RasterTest, RejectsGreyscaleTag)
{
	const ParseResult<Pixmap> r = decodePixmap(container("P5\n2 1\n255\n", 2));

	ASSERT_FALSE(r.ok());
	EXPECT_EQ(0u, r.error().offset);
	EXPECT_NE(std::string::npos, r.error().message.find("P6"));
}

TEST(RasterTest, RejectsSixteenBitChannels)
{
	const ParseResult<Pixmap> r = decodePixmap(container("P6\n2 1\n65535\n", 12));

	ASSERT_FALSE(r.ok());
	EXPECT_EQ(7u, r.error().offset);
	EXPECT_NE(std::string::npos, r.error().message.find("65535"));
}

TEST(RasterTest, RequiresWhitespaceAfterTag)
{
	const ParseResult<Pixmap> r = decodePixmap(container("P61 1 255\n", 3));

	ASSERT_FALSE(r.ok());
	EXPECT_EQ(2u, r.error().offset);
	EXPECT_NE(std::string::npos, r.error().message.find("whitespace"));
}

TEST(RasterTest, CommentSeparatesTagFromWidth)
{
	const ParseResult<Pixmap> r = decodePixmap(container("P6#tag\n1 1 255\n", 3));

	ASSERT_TRUE(r.ok()) << r.error().message;
	EXPECT_EQ(1u, r.value().width());
}

TEST(RasterTest, RejectsNonNumericSize)
{
	const ParseResult<Pixmap> r = decodePixmap(container("P6\nx 1\n255\n", 3));

	ASSERT_FALSE(r.ok());
	EXPECT_EQ(3u, r.error().offset);
}

TEST(RasterTest, RejectsZeroWidth)
{
	const ParseResult<Pixmap> r = decodePixmap(container("P6 0 1 255\n", 0));

	ASSERT_FALSE(r.ok());
	EXPECT_EQ(3u, r.error().offset);
	EXPECT_NE(std::string::npos, r.error().message.find("width"));
}

TEST(RasterTest, RejectsTruncatedPayload)
{
	const ParseResult<Pixmap> r = decodePixmap(container("P6 4 2 255\n", 5));

	ASSERT_FALSE(r.ok());
	EXPECT_EQ(11u, r.error().offset);
	EXPECT_NE(std::string::npos, r.error().message.find("truncated"));
}

TEST(RasterTest, RejectsMissingDelimiter)
{
	const ParseResult<Pixmap> r = decodePixmap(container("P6 1 1 255", 0));

	ASSERT_FALSE(r.ok());
	EXPECT_EQ(10u, r.error().offset);
}

TEST(RasterTest, EncodedImageDecodesAgain)
{
	std::vector<unsigned char> rgb;
	for (int i = 0; i < 3 * 2 * 3; i++)
		rgb.push_back((unsigned char) (i * 13));
	const Pixmap original(3, 2, rgb);

	const ParseResult<Pixmap> r = decodePixmap(encodePixmap(original));

	ASSERT_TRUE(r.ok()) << r.error().message;
	EXPECT_TRUE(r.value() == original);
	EXPECT_TRUE(r.rest().atEnd());
}
