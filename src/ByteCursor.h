#ifndef EANSCAN_BYTECURSOR_H
#define EANSCAN_BYTECURSOR_H

#include <stddef.h>

/* span of bytes handed out by parseBytes(); points into the parsed buffer */
struct ByteRange {
	ByteRange() : data(0), size(0) {}
	ByteRange(const unsigned char *data_, size_t size_) : data(data_), size(size_) {}

	const unsigned char *data;
	size_t size;
};

/*
 * read-only view of a caller owned buffer plus the current scanning offset.
 * a cursor is never modified, advancing it yields a new one.
 */
class ByteCursor {
public:
	ByteCursor(const unsigned char *data, size_t size, size_t offset = 0)
			: data_(data), size_(size), offset_(offset > size ? size : offset)
	{
	}

	size_t offset() const { return offset_; }
	size_t size() const { return size_; }
	size_t remaining() const { return size_ - offset_; }
	bool atEnd() const { return offset_ == size_; }

	unsigned char peek() const { return data_[offset_]; } // only valid if !atEnd()
	const unsigned char *current() const { return data_ + offset_; }

	ByteCursor advance(size_t n) const
	{
		return ByteCursor(data_, size_, n > remaining() ? size_ : offset_ + n);
	}

private:
	const unsigned char *data_;
	size_t size_;
	size_t offset_;
};

#endif
