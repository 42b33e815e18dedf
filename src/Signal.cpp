#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <math.h>
#include <algorithm>
#include "Signal.h"

std::vector<unsigned char> luminance(const Pixmap& pixmap, size_t row)
{
	std::vector<unsigned char> luma;
	if (row >= pixmap.height())
		return luma;

	luma.resize(pixmap.width());

	const unsigned char *src = pixmap.row(row);
	for (size_t x = 0; x < luma.size(); x++, src += 3)
		luma[x] = (unsigned char) floor(0.30 * src[0] + 0.59 * src[1] + 0.11 * src[2] + 0.5);

	return luma;
}

std::vector<Bit> threshold(const std::vector<unsigned char>& luma, double ratio)
{
	std::vector<Bit> bits;
	if (luma.empty())
		return bits;

	const unsigned char lo = *std::min_element(luma.begin(), luma.end());
	const unsigned char hi = *std::max_element(luma.begin(), luma.end());
	const double pivot = lo + (hi - lo) * ratio;

	bits.reserve(luma.size());
	for (size_t i = 0; i < luma.size(); i++)
		bits.push_back(luma[i] < pivot ? Zero : One);

	return bits;
}

RunLength runLengthEncode(const std::vector<Bit>& bits)
{
	RunLength runs;

	for (size_t i = 0; i < bits.size(); i++) {
		if (!runs.empty() && runs.back().bit == bits[i])
			runs.back().length++;
		else
			runs.push_back(BarRun(1, bits[i]));
	}

	return runs;
}

RunLength extractRow(const Pixmap& pixmap, size_t row, double ratio)
{
	return runLengthEncode(threshold(luminance(pixmap, row), ratio));
}
