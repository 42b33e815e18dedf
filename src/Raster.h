#ifndef EANSCAN_RASTER_H
#define EANSCAN_RASTER_H

#include <vector>
#include "Parser.h"

struct Pixel {
	unsigned char r, g, b;
};

/* 8-bit RGB image, rows stored top to bottom without padding */
class Pixmap {
public:
	Pixmap();
	Pixmap(size_t width, size_t height, const unsigned char *rgb); // copies width * height * 3 bytes
	Pixmap(size_t width, size_t height, const std::vector<unsigned char>& rgb);

	size_t width() const { return width_; }
	size_t height() const { return height_; }

	Pixel pixel(size_t row, size_t col) const;
	const unsigned char *row(size_t y) const { return &rgb_[y * width_ * 3]; } // width * 3 bytes
	const std::vector<unsigned char>& data() const { return rgb_; }

	bool operator==(const Pixmap& other) const;

private:
	size_t width_, height_;
	std::vector<unsigned char> rgb_;
};

/*
 * decodes a binary "P6" container: tag, width, height and maximum channel
 * value separated by whitespace (comments allowed), one delimiter byte, then
 * width * height RGB triples. only 8-bit channels (maximum value 255) are
 * accepted. bytes after the pixel payload are left to the caller.
 */
ParseResult<Pixmap> decodePixmap(const ByteCursor& in);
ParseResult<Pixmap> decodePixmap(const std::vector<unsigned char>& buffer);

std::vector<unsigned char> encodePixmap(const Pixmap& pixmap);

#endif
