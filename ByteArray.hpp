#pragma once

#include "decl.hxx"

#include <QString>

namespace tabwright {

/// Growable byte buffer with a read/write cursor, used for the binary
/// prefs and session records.
class ByteArray {
public:
	ByteArray();
	ByteArray(const ByteArray &rhs);
	ByteArray& operator = (const ByteArray &rhs);
	bool operator == (const ByteArray &rhs) const;
	virtual ~ByteArray();
	
	void add(const ByteArray *ba, const From from);
	void add(const char *p, const isize size, const ExactSize es = ExactSize::No);
	void add_i1(const i1 n);
	void add_i2(const i2 n);
	void add_u2(const u2 n);
	void add_i4(const i4 n);
	void add_u8(const u8 n);
	void add_f4(const f4 n);
	void add_string(const QString &s);
	isize at() const { return at_; }
	void Clear();
	char *data() const { return data_; }
	
	bool has_more(const isize n) const { return at_ + n <= size_; }
	bool has_more() const { return at_ < size_; }
	bool is_empty() const { return size_ == 0; }
	bool next(char *p, const isize sz);
	i1 next_i1();
	i2 next_i2();
	u2 next_u2();
	i4 next_i4();
	u8 next_u8();
	f4 next_f4();
	QString next_string();
	
	isize size() const { return size_; }
	void size(isize n) { size_ = n; } // called from inside io::ReadFile(..);
	void MakeSure(isize more_bytes, const ExactSize es = ExactSize::No);
	inline void to(isize n) { at_ = n; }

private:
	isize size_ = 0;
	isize heap_size_ = 0;
	isize at_ = 0;
	char *data_ = nullptr;
};

}
