#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <limits>
#include <boost/bind/bind.hpp>
#include <boost/format.hpp>
#include "Parser.h"

using namespace boost::placeholders;

bool isSpace(unsigned char c)
{
	return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

ParseResult<unsigned char> parseByte(const ByteCursor& in)
{
	if (in.atEnd())
		return ParseError((boost::format("unexpected end of input at offset %1%") % in.offset()).str(), in.offset());
	return ParseResult<unsigned char>(in.peek(), in.advance(1));
}

static char toChar(unsigned char c)
{
	return (char) c;
}

ParseResult<char> parseChar(const ByteCursor& in)
{
	return fmap<char>(parseByte(in), toChar);
}

ParseResult<ByteRange> parseBytes(const ByteCursor& in, size_t count)
{
	if (in.remaining() < count)
		return ParseError((boost::format("truncated data: expected %1% bytes but only %2% remain at offset %3%") % count
		        % in.remaining() % in.offset()).str(), in.offset());
	return ParseResult<ByteRange>(ByteRange(in.current(), count), in.advance(count));
}

ParseResult<std::string> parseLiteral(const ByteCursor& in, const std::string& tag)
{
	if (in.remaining() < tag.size() || tag.compare(0, tag.size(), (const char *) in.current(), tag.size()) != 0)
		return ParseError((boost::format("expected \"%1%\" at offset %2%") % tag % in.offset()).str(), in.offset());
	return ParseResult<std::string>(tag, in.advance(tag.size()));
}

ParseResult<size_t> parseNatural(const ByteCursor& in)
{
	const size_t limit = std::numeric_limits<size_t>::max();
	size_t value = 0, digits = 0;

	for (ByteCursor c = in; !c.atEnd() && '0' <= c.peek() && c.peek() <= '9'; c = c.advance(1), digits++) {
		const size_t d = c.peek() - '0';
		if (value > (limit - d) / 10)
			return ParseError((boost::format("number too large at offset %1%") % in.offset()).str(), in.offset());
		value = value * 10 + d;
	}

	if (!digits)
		return ParseError((boost::format("expected decimal number at offset %1%") % in.offset()).str(), in.offset());

	return ParseResult<size_t>(value, in.advance(digits));
}

ParseResult<size_t> skipWhitespace(const ByteCursor& in)
{
	ByteCursor c = in;

	while (!c.atEnd()) {
		if (isSpace(c.peek())) {
			c = c.advance(1);
		} else if (c.peek() == '#') { /* comment runs to the end of the line */
			while (!c.atEnd() && c.peek() != '\n' && c.peek() != '\r')
				c = c.advance(1);
		} else
			break;
	}

	return ParseResult<size_t>(c.offset() - in.offset(), c);
}

static ParseResult<char> expectSpace(char c, const ByteCursor& rest, size_t offset)
{
	if (!isSpace((unsigned char) c))
		return ParseError((boost::format("expected whitespace at offset %1%") % offset).str(), offset);
	return ParseResult<char>(c, rest);
}

ParseResult<char> parseSpace(const ByteCursor& in)
{
	return chain<char>(parseChar(in), boost::bind(&expectSpace, _1, _2, in.offset()));
}
