#ifndef EANSCAN_SIGNAL_H
#define EANSCAN_SIGNAL_H

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <vector>
#include "Raster.h"

#ifndef BARCODE_THRESHOLD
#define BARCODE_THRESHOLD 0.4
#endif

enum Bit {
	Zero, // dark (bar)
	One // light (space)
};

struct BarRun {
	BarRun(size_t length_, Bit bit_) : length(length_), bit(bit_) {}

	bool operator==(const BarRun& other) const { return length == other.length && bit == other.bit; }

	size_t length;
	Bit bit;
};

typedef std::vector<BarRun> RunLength; // neighbouring runs never share a bit

std::vector<unsigned char> luminance(const Pixmap& pixmap, size_t row); // 0.30 R + 0.59 G + 0.11 B
std::vector<Bit> threshold(const std::vector<unsigned char>& luma, double ratio = BARCODE_THRESHOLD);
RunLength runLengthEncode(const std::vector<Bit>& bits);

/*
 * thresholds one row against a pivot placed at ratio between its darkest and
 * brightest luminance, then run-length encodes it. only that row is read.
 * returns no runs if row is outside the image.
 */
RunLength extractRow(const Pixmap& pixmap, size_t row, double ratio = BARCODE_THRESHOLD);

#endif
