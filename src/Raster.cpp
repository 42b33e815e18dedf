#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <limits>
#include <boost/bind/bind.hpp>
#include <boost/format.hpp>
#include "Raster.h"

using namespace boost::placeholders;

Pixmap::Pixmap()
		: width_(0), height_(0)
{
}

Pixmap::Pixmap(size_t width, size_t height, const unsigned char *rgb)
		: width_(width), height_(height), rgb_(rgb, rgb + width * height * 3)
{
}

Pixmap::Pixmap(size_t width, size_t height, const std::vector<unsigned char>& rgb)
		: width_(width), height_(height), rgb_(rgb)
{
	rgb_.resize(width * height * 3);
}

Pixel Pixmap::pixel(size_t row, size_t col) const
{
	const unsigned char *p = &rgb_[(row * width_ + col) * 3];
	Pixel px = { p[0], p[1], p[2] };
	return px;
}

bool Pixmap::operator==(const Pixmap& other) const
{
	return width_ == other.width_ && height_ == other.height_ && rgb_ == other.rgb_;
}

static const size_t maxChannelValue = 255; // 16-bit samples are not supported

static ParseResult<size_t> checkField(size_t value, const ByteCursor& rest, size_t offset, const char *field,
        size_t required)
{
	if (!value)
		return ParseError((boost::format("%1% must be positive at offset %2%") % field % offset).str(), offset);
	if (required && value != required)
		return ParseError((boost::format("unsupported %1% %2% at offset %3%, expected %4%") % field % value % offset
		        % required).str(), offset);
	return ParseResult<size_t>(value, rest);
}

// at least one whitespace or comment byte separates the number from what precedes it
static ParseResult<size_t> parseField(const ByteCursor& in, const char *field, size_t required)
{
	const ParseResult<size_t> gap = skipWhitespace(in);
	if (!gap.value())
		return ParseError((boost::format("expected whitespace before %1% at offset %2%") % field % in.offset()).str(),
		        in.offset());

	const ByteCursor start = gap.rest();
	return chain<size_t>(parseNatural(start), boost::bind(&checkField, _1, _2, start.offset(), field, required));
}

static Pixmap toPixmap(const ByteRange& payload, size_t width, size_t height)
{
	return Pixmap(width, height, payload.data);
}

static ParseResult<Pixmap> readPixels(const ByteCursor& in, size_t width, size_t height)
{
	if (width > std::numeric_limits<size_t>::max() / 3 / height)
		return ParseError((boost::format("image size %1%x%2% too large at offset %3%") % width % height % in.offset()).str(),
		        in.offset());

	return fmap<Pixmap>(parseBytes(in, width * height * 3), boost::bind(&toPixmap, _1, width, height));
}

static ParseResult<Pixmap> afterMaxValue(const ByteCursor& in, size_t width, size_t height)
{
	return chain<Pixmap>(parseSpace(in), boost::bind(&readPixels, _2, width, height));
}

static ParseResult<Pixmap> afterHeight(const ByteCursor& in, size_t width, size_t height)
{
	return chain<Pixmap>(parseField(in, "maximum channel value", maxChannelValue),
	        boost::bind(&afterMaxValue, _2, width, height));
}

static ParseResult<Pixmap> afterWidth(const ByteCursor& in, size_t width)
{
	return chain<Pixmap>(parseField(in, "height", 0), boost::bind(&afterHeight, _2, width, _1));
}

static ParseResult<Pixmap> afterTag(const ByteCursor& in)
{
	return chain<Pixmap>(parseField(in, "width", 0), boost::bind(&afterWidth, _2, _1));
}

ParseResult<Pixmap> decodePixmap(const ByteCursor& in)
{
	return chain<Pixmap>(parseLiteral(in, "P6"), boost::bind(&afterTag, _2));
}

ParseResult<Pixmap> decodePixmap(const std::vector<unsigned char>& buffer)
{
	return decodePixmap(ByteCursor(buffer.empty() ? 0 : &buffer[0], buffer.size()));
}

std::vector<unsigned char> encodePixmap(const Pixmap& pixmap)
{
	const std::string header = (boost::format("P6\n%1% %2%\n%3%\n") % pixmap.width() % pixmap.height()
	        % maxChannelValue).str();

	std::vector<unsigned char> out(header.begin(), header.end());
	out.insert(out.end(), pixmap.data().begin(), pixmap.data().end());
	return out;
}
