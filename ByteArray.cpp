#include "ByteArray.hpp"

#include "err.hpp"

#include <string.h>

namespace tabwright {

ByteArray::ByteArray() {}
ByteArray::ByteArray(const ByteArray &rhs)
{
	add(rhs.data(), rhs.size());
	at_ = 0;
}
ByteArray::~ByteArray()
{
	Clear();
}

ByteArray& ByteArray::operator = (const ByteArray &rhs)
{
	if (this == &rhs)
		return *this;
	Clear();
	add(rhs.data(), rhs.size());
	at_ = 0;
	return *this;
}

bool ByteArray::operator == (const ByteArray &rhs) const
{
	if (size_ != rhs.size_)
		return false;
	
	return size_ == 0 || (memcmp(data_, rhs.data(), size_) == 0);
}

void ByteArray::Clear() {
	delete[] data_;
	data_ = nullptr;
	size_ = heap_size_ = at_ = 0;
}

void ByteArray::add(const ByteArray *ba, const From from)
{
	if (!ba)
		return; // checking is a must
	
	char *buf;
	i8 buf_len;
	if (from == From::CurrentPosition)
	{
		buf = ba->data() + ba->at();
		buf_len = ba->size() - ba->at();
	} else {
		buf = ba->data();
		buf_len = ba->size();
	}
	
	add(buf, buf_len, ExactSize::Yes);
}

void ByteArray::add(const char *p, const isize size, const ExactSize es)
{
	if (size <= 0)
		return;
	MakeSure(size, es);
	memcpy(data_ + at_, p, size);
	at_ += size;
	size_ += size;
}

void ByteArray::add_i1(const i1 n) {
	add(reinterpret_cast<const char*>(&n), sizeof n);
}

void ByteArray::add_i2(const i2 n) {
	add(reinterpret_cast<const char*>(&n), sizeof n);
}

void ByteArray::add_u2(const u2 n) {
	add(reinterpret_cast<const char*>(&n), sizeof n);
}

void ByteArray::add_i4(const i4 n) {
	add(reinterpret_cast<const char*>(&n), sizeof n);
}

void ByteArray::add_u8(const u8 n) {
	add(reinterpret_cast<const char*>(&n), sizeof n);
}

void ByteArray::add_f4(const f4 n)
{
	add(reinterpret_cast<const char*>(&n), sizeof n);
}

void ByteArray::add_string(const QString &s)
{
	auto ba = s.toUtf8();
	ci4 size = ba.size();
	add(reinterpret_cast<const char*>(&size), sizeof size);
	add(ba.data(), size);
}

void ByteArray::MakeSure(isize more, const ExactSize es)
{
	if (heap_size_ >= at_ + more)
		return;
	
	heap_size_ = at_ + more;
	if (es != ExactSize::Yes)
		heap_size_ *= 1.3;
	
	char *p = new char[heap_size_];
	if (data_ != nullptr)
	{
		memcpy(p, data_, size_);
		delete[] data_;
	}
	
	data_ = p;
}

bool ByteArray::next(char *p, const isize sz) {
	if (!has_more(sz)) {
		/// Truncated record: hand out zeroes and stay at the end.
		memset(p, 0, sz);
		at_ = size_;
		return false;
	}
	memcpy(p, data_ + at_, sz);
	at_ += sz;
	return true;
}

i1 ByteArray::next_i1() {
	i1 n;
	next(reinterpret_cast<char*>(&n), sizeof n);
	return n;
}

i2 ByteArray::next_i2() {
	i2 n;
	next(reinterpret_cast<char*>(&n), sizeof n);
	return n;
}

u2 ByteArray::next_u2() {
	u2 n;
	next(reinterpret_cast<char*>(&n), sizeof n);
	return n;
}

i4 ByteArray::next_i4() {
	i4 n;
	next(reinterpret_cast<char*>(&n), sizeof n);
	return n;
}

u8 ByteArray::next_u8() {
	u8 n;
	next(reinterpret_cast<char*>(&n), sizeof n);
	return n;
}

f4 ByteArray::next_f4()
{
	f4 n;
	next(reinterpret_cast<char*>(&n), sizeof n);
	return n;
}

QString ByteArray::next_string()
{
	ci4 size = next_i4();
	if (size <= 0)
		return QString();
	if (!has_more(size)) {
		tw_warn("String of %d bytes past the end", size);
		at_ = size_;
		return QString();
	}
	auto s = QString::fromUtf8(data_ + at_, size);
	at_ += size;
	return s;
}

}
