#ifndef EANSCAN_GENERATOR_H
#define EANSCAN_GENERATOR_H

#include <string>
#include <vector>
#include "Raster.h"
#include "Signal.h"
#include "Solver.h"

struct RenderOptions {
	RenderOptions() : moduleWidth(3), quietZone(10), height(60), noise(0), jitter(0), seed(1) {}

	size_t moduleWidth; // [px]
	size_t quietZone; // blank margin on either side [modules]
	size_t height; // [px]
	double noise; // maximum luminance jitter as a fraction of full scale
	unsigned int jitter; // maximum displacement of a bar edge [px]
	unsigned long seed; // noise generator seed
};

/* accepts twelve decimal digits and appends the check digit */
bool completeCode(const std::string& text, Ean13& code);

std::vector<size_t> encodeWidths(const Ean13& code); // 59 alternating module widths, bar first
std::vector<Bit> encodeModules(const Ean13& code); // 95 modules

/*
 * draws the code as dark bars on a light background. noise and jitter are
 * drawn from a Mersenne twister seeded with options.seed, so equal options
 * give equal images. fails if a bar could collapse under the jitter.
 */
bool renderBarcode(const Ean13& code, const RenderOptions& options, Pixmap& pixmap);

#endif
