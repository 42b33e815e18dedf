#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <iostream>
#include <boost/format.hpp>
#include "console.h"
#include "Barcode.h"

static void traceCandidates(size_t offset, const CandidateGrid& grid)
{
	std::cerr << KCYN << "offset " << offset << ":";
	for (size_t i = 0; i < grid.size(); i++) {
		std::cerr << " [";
		for (size_t j = 0; j < grid[i].size(); j++) {
			const ParityCandidate& c = grid[i][j];
			if (j)
				std::cerr << ' ';
			std::cerr << c.value.digit << (c.parity == Odd ? "o" : c.parity == Even ? "e" : "");
		}
		std::cerr << ']';
	}
	std::cerr << RESET << "\n";
}

bool scanRow(const RunLength& runs, Ean13& code, bool verbose)
{
	CandidateGrid grid;

	for (RunLength::const_iterator first = runs.begin(); first != runs.end(); ++first) {
		if (!candidateDigits(first, runs.end(), grid))
			continue;
		if (verbose)
			traceCandidates(first - runs.begin(), grid);
		if (solve(grid, code))
			return true;
	}

	return false;
}

DecodeResult decodePixmapBarcode(const Pixmap& pixmap, const DecodeOptions& options)
{
	DecodeResult result;

	const size_t row = options.row < 0 ? pixmap.height() / 2 : (size_t) options.row;
	if (row >= pixmap.height()) {
		result.message = (boost::format("row %1% outside image of height %2%") % row % pixmap.height()).str();
		return result;
	}

	if (scanRow(extractRow(pixmap, row, options.threshold), result.digits, options.verbose))
		result.status = DecodeOk;
	else
		result.message = "no barcode found";

	return result;
}

DecodeResult decodeBarcode(const std::vector<unsigned char>& raw, const DecodeOptions& options)
{
	const ParseResult<Pixmap> image = decodePixmap(raw);

	if (!image.ok()) {
		DecodeResult result;
		result.status = DecodeParseError;
		result.message = image.error().message;
		result.offset = image.error().offset;
		return result;
	}

	return decodePixmapBarcode(image.value(), options);
}
