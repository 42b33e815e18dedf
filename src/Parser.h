#ifndef EANSCAN_PARSER_H
#define EANSCAN_PARSER_H

#include <string>
#include <boost/optional.hpp>
#include "ByteCursor.h"

struct ParseError {
	ParseError() : offset(0) {}
	ParseError(const std::string& message_, size_t offset_) : message(message_), offset(offset_) {}

	std::string message; // includes the offset in readable form
	size_t offset; // byte offset at which parsing failed
};

/*
 * outcome of one parsing step: either a value together with the cursor just
 * past it, or the error that stopped the parse.
 */
template <typename T>
class ParseResult {
public:
	ParseResult(const T& value, const ByteCursor& rest)
			: value_(value), rest_(rest)
	{
	}

	ParseResult(const ParseError& error)
			: rest_(0, 0), error_(error)
	{
	}

	bool ok() const { return value_.is_initialized(); }

	const T& value() const { return *value_; }
	const ByteCursor& rest() const { return rest_; }
	const ParseError& error() const { return error_; }

private:
	boost::optional<T> value_;
	ByteCursor rest_;
	ParseError error_;
};

/*
 * runs f(value, rest) on a successful result. an error is passed on as is and
 * f is never called, so the first failure decides the outcome of a chain.
 */
template <typename B, typename A, typename F>
ParseResult<B> chain(const ParseResult<A>& r, F f)
{
	if (!r.ok())
		return ParseResult<B>(r.error());
	return f(r.value(), r.rest());
}

// converts the value of a successful result, leaving its cursor untouched
template <typename B, typename A, typename F>
ParseResult<B> fmap(const ParseResult<A>& r, F f)
{
	if (!r.ok())
		return ParseResult<B>(r.error());
	return ParseResult<B>(f(r.value()), r.rest());
}

ParseResult<unsigned char> parseByte(const ByteCursor& in);
ParseResult<char> parseChar(const ByteCursor& in);
ParseResult<ByteRange> parseBytes(const ByteCursor& in, size_t count);
ParseResult<std::string> parseLiteral(const ByteCursor& in, const std::string& tag);
ParseResult<size_t> parseNatural(const ByteCursor& in);
ParseResult<size_t> skipWhitespace(const ByteCursor& in); // never fails; value is the number of bytes skipped
ParseResult<char> parseSpace(const ByteCursor& in); // exactly one whitespace byte

bool isSpace(unsigned char c);

#endif
