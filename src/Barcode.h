#ifndef EANSCAN_BARCODE_H
#define EANSCAN_BARCODE_H

#include <string>
#include <vector>
#include "Raster.h"
#include "Signal.h"
#include "Solver.h"

enum DecodeStatus {
	DecodeOk,
	DecodeParseError, // malformed image container, never retried
	DecodeNotFound // no checksum consistent code at any offset of the scanned row
};

struct DecodeOptions {
	DecodeOptions() : threshold(BARCODE_THRESHOLD), row(-1), verbose(false) {}

	double threshold; // pivot ratio between darkest and brightest luminance
	long row; // scanned row, negative selects the vertical centre
	bool verbose; // trace candidates of every offset to stderr
};

struct DecodeResult {
	DecodeResult() : status(DecodeNotFound), offset(0) { digits.assign(0); }

	bool ok() const { return status == DecodeOk; }

	DecodeStatus status;
	Ean13 digits;
	std::string message;
	size_t offset; // byte offset of a parse error
};

/*
 * tries every run of the row as the start of the barcode, left to right, and
 * stops at the first offset that solves.
 */
bool scanRow(const RunLength& runs, Ean13& code, bool verbose = false);

DecodeResult decodePixmapBarcode(const Pixmap& pixmap, const DecodeOptions& options = DecodeOptions());
DecodeResult decodeBarcode(const std::vector<unsigned char>& raw, const DecodeOptions& options = DecodeOptions());

#endif
