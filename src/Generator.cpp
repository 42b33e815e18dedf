#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <math.h>
#include <iostream>
#include <gsl/gsl_errno.h>
#include <gsl/gsl_rng.h>
#include "console.h"
#include "Matcher.h"
#include "Generator.h"

static void gsl_error_handler(const char *reason, const char *file, int line, int gsl_errno)
{
	std::cerr << KRED << "gsl: " << reason << " (" << file << ":" << line << ", error " << gsl_errno << ")" << RESET
	        << "\n";
}

bool completeCode(const std::string& text, Ean13& code)
{
	if (text.size() != 12)
		return false;

	for (size_t i = 0; i < 12; i++) {
		if (text[i] < '0' || text[i] > '9')
			return false;
		code[i] = text[i] - '0';
	}
	code[12] = checkDigit(code);

	return true;
}

std::vector<size_t> encodeWidths(const Ean13& code)
{
	std::vector<size_t> runs(guardRuns, 1);

	/* left half: L or G codes as selected by the first digit */
	const Parity *parity = firstDigitParity[code[0]];
	for (size_t i = 0; i < 6; i++) {
		const unsigned int *w = ReferenceTable::widths[code[1 + i]];
		for (size_t k = 0; k < groupRuns; k++)
			runs.push_back(parity[i] == Even ? w[groupRuns - 1 - k] : w[k]);
	}

	runs.insert(runs.end(), centreRuns, 1);

	for (size_t i = 0; i < 6; i++) {
		const unsigned int *w = ReferenceTable::widths[code[7 + i]];
		runs.insert(runs.end(), w, w + groupRuns);
	}

	runs.insert(runs.end(), guardRuns, 1);
	return runs;
}

std::vector<Bit> encodeModules(const Ean13& code)
{
	const std::vector<size_t> runs = encodeWidths(code);

	std::vector<Bit> modules;
	for (size_t i = 0; i < runs.size(); i++)
		modules.insert(modules.end(), runs[i], i % 2 ? One : Zero);
	return modules;
}

bool renderBarcode(const Ean13& code, const RenderOptions& options, Pixmap& pixmap)
{
	if (!options.moduleWidth || !options.height || options.moduleWidth <= 2 * options.jitter)
		return false;
	if (options.noise < 0 || options.noise > 1)
		return false;

	const std::vector<size_t> runs = encodeWidths(code);
	const long margin = options.quietZone * options.moduleWidth;
	const long width = 2 * margin + 95 * options.moduleWidth;

	gsl_error_handler_t *previous = gsl_set_error_handler(gsl_error_handler);
	gsl_rng *rng = gsl_rng_alloc(gsl_rng_mt19937);
	gsl_set_error_handler(previous);
	if (!rng)
		return false;
	gsl_rng_set(rng, options.seed);

	/* edges[i] is the first column of run i, edges[runs.size()] the end of the last bar */
	std::vector<long> edges;
	for (size_t i = 0, x = margin; i <= runs.size(); i++) {
		long shift = 0;
		if (options.jitter)
			shift = (long) gsl_rng_uniform_int(rng, 2 * options.jitter + 1) - (long) options.jitter;
		long edge = (long) x + shift;
		edges.push_back(edge < 0 ? 0 : edge > width ? width : edge);
		if (i < runs.size())
			x += runs[i] * options.moduleWidth;
	}

	std::vector<unsigned char> line(width, 255);
	for (size_t i = 0; i < runs.size(); i += 2) // even runs are bars
		for (long x = edges[i]; x < edges[i + 1]; x++)
			line[x] = 0;

	std::vector<unsigned char> rgb(width * options.height * 3);
	unsigned char *dst = rgb.empty() ? 0 : &rgb[0];
	for (size_t y = 0; y < options.height; y++) {
		for (long x = 0; x < width; x++) {
			for (int channel = 0; channel < 3; channel++) {
				double v = line[x];
				if (options.noise > 0)
					v += (2 * gsl_rng_uniform(rng) - 1) * options.noise * 255;
				*dst++ = (unsigned char) (v < 0 ? 0 : v > 255 ? 255 : floor(v + 0.5));
			}
		}
	}

	gsl_rng_free(rng);

	pixmap = Pixmap(width, options.height, rgb);
	return true;
}
