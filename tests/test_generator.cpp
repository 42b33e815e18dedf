/**
 * @file test_generator.cpp
 * @brief Unit tests for barcode encoding and rendering
 */

#include <gtest/gtest.h>
#include <numeric>
#include <string>
#include "Generator.h"
#include "Matcher.h"

TEST(GeneratorTest, AppendsCheckDigit)
{
	Ean13 code;
	ASSERT_TRUE(completeCode("978013211467", code));
	EXPECT_EQ("9780132114677", toString(code));

	ASSERT_TRUE(completeCode("003600029145", code));
	EXPECT_EQ(2u, code[12]);
}

TEST(GeneratorTest, RejectsMalformedDigits)
{
	Ean13 code;
	EXPECT_FALSE(completeCode("97801321146", code));
	EXPECT_FALSE(completeCode("9780132114677", code));
	EXPECT_FALSE(completeCode("97801321146x", code));
	EXPECT_FALSE(completeCode("", code));
}

TEST(GeneratorTest, WidthsCoverNinetyFiveModules)
{
	Ean13 code;
	ASSERT_TRUE(completeCode("978013211467", code));

	const std::vector<size_t> widths = encodeWidths(code);
	ASSERT_EQ(minimumRuns, widths.size());
	EXPECT_EQ(95u, std::accumulate(widths.begin(), widths.end(), (size_t) 0));

	const std::vector<Bit> modules = encodeModules(code);
	ASSERT_EQ(95u, modules.size());

	/* start, centre and end guards */
	const Bit start[] = { Zero, One, Zero };
	const Bit centre[] = { One, Zero, One, Zero, One };
	for (size_t i = 0; i < 3; i++) {
		EXPECT_EQ(start[i], modules[i]);
		EXPECT_EQ(start[i], modules[92 + i]);
	}
	for (size_t i = 0; i < 5; i++)
		EXPECT_EQ(centre[i], modules[45 + i]);
}

TEST(GeneratorTest, LeadingZeroUsesOnlyLCodes)
{
	Ean13 code;
	ASSERT_TRUE(completeCode("036000291452", code));

	const std::vector<size_t> widths = encodeWidths(code);
	for (size_t g = 0; g < 6; g++)
		for (size_t k = 0; k < groupRuns; k++)
			EXPECT_EQ(ReferenceTable::widths[code[1 + g]][k], widths[guardRuns + g * groupRuns + k]);
}

TEST(GeneratorTest, EvenParityGroupsAreMirrored)
{
	Ean13 code;
	ASSERT_TRUE(completeCode("978013211467", code));

	/* first digit 9 gives L G G L G L, so the second group is a G code */
	const std::vector<size_t> widths = encodeWidths(code);
	const unsigned int *w = ReferenceTable::widths[code[2]];
	for (size_t k = 0; k < groupRuns; k++)
		EXPECT_EQ(w[groupRuns - 1 - k], widths[guardRuns + groupRuns + k]);
}

TEST(GeneratorTest, RenderDimensions)
{
	Ean13 code;
	ASSERT_TRUE(completeCode("978013211467", code));

	RenderOptions options;
	Pixmap pixmap;
	ASSERT_TRUE(renderBarcode(code, options, pixmap));
	EXPECT_EQ((95 + 2 * options.quietZone) * options.moduleWidth, pixmap.width());
	EXPECT_EQ(options.height, pixmap.height());
}

TEST(GeneratorTest, CleanRenderHasEveryBar)
{
	Ean13 code;
	ASSERT_TRUE(completeCode("978013211467", code));

	RenderOptions options;
	Pixmap pixmap;
	ASSERT_TRUE(renderBarcode(code, options, pixmap));

	const RunLength runs = extractRow(pixmap, pixmap.height() / 2);
	ASSERT_EQ(minimumRuns + 2, runs.size());
	EXPECT_EQ(BarRun(options.quietZone * options.moduleWidth, One), runs.front());
	EXPECT_EQ(BarRun(options.quietZone * options.moduleWidth, One), runs.back());

	const std::vector<size_t> widths = encodeWidths(code);
	for (size_t i = 0; i < widths.size(); i++)
		EXPECT_EQ(widths[i] * options.moduleWidth, runs[i + 1].length);
}

TEST(GeneratorTest, RejectsBadOptions)
{
	Ean13 code;
	ASSERT_TRUE(completeCode("978013211467", code));
	Pixmap pixmap;

	RenderOptions collapsing;
	collapsing.moduleWidth = 2;
	collapsing.jitter = 1;
	EXPECT_FALSE(renderBarcode(code, collapsing, pixmap));

	RenderOptions flat;
	flat.height = 0;
	EXPECT_FALSE(renderBarcode(code, flat, pixmap));

	RenderOptions loud;
	loud.noise = 1.5;
	EXPECT_FALSE(renderBarcode(code, loud, pixmap));
}

TEST(GeneratorTest, SeedDeterminesNoise)
{
	Ean13 code;
	ASSERT_TRUE(completeCode("978013211467", code));

	RenderOptions options;
	options.noise = 0.2;
	options.jitter = 1;
	options.height = 5;
	options.seed = 7;

	Pixmap a, b, c;
	ASSERT_TRUE(renderBarcode(code, options, a));
	ASSERT_TRUE(renderBarcode(code, options, b));
	options.seed = 8;
	ASSERT_TRUE(renderBarcode(code, options, c));

	EXPECT_TRUE(a == b);
	EXPECT_FALSE(a == c);
}
