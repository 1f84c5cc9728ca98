#pragma once

#include <cstddef>	// size_t
#include <cstdint>

// ----------------------------------------------------------------------------
// Decoding contract
//
// A fixed-format protocol unit T provides
//   static bool T::decode(const uint8_t* buf, size_t len, T& out, DecodeError* err);
//   size_t T::size() const;   // wire size of the decoded value
// decode never reads past len; on failure out is left untouched.
// ----------------------------------------------------------------------------
struct DecodeError final {
	enum Kind : uint8_t {
		None = 0,
		TooShort
	};

	Kind kind_;
	size_t required_;
	size_t available_;

	DecodeError() : kind_(None), required_(0), available_(0) {}
};

// fill err (if any) and fail when len cannot hold required bytes
inline bool checkLength(size_t required, size_t len, DecodeError* err) {
	if(len >= required) return true;

	if(err != nullptr) {
		err->kind_      = DecodeError::TooShort;
		err->required_  = required;
		err->available_ = len;
	}

	return false;
}

inline uint16_t readBE16(const uint8_t* buf) {
	return static_cast<uint16_t>((buf[0] << 8) bitor buf[1]);
}

inline void writeBE16(uint8_t* buf, const uint16_t value) {
	buf[0] = (value >> 8) bitand 0xFF;
	buf[1] = value bitand 0xFF;
}

// ----------------------------------------------------------------------------
// PacketCursor
// walks one received buffer layer by layer
// ----------------------------------------------------------------------------
class PacketCursor final {
public:
	PacketCursor(const uint8_t* buf, const size_t len) : buf_(buf), len_(len), offset_(0) {}

	// decode the next unit and step over its wire size
	template<typename T>
	bool pull(T& out, DecodeError* err = nullptr) {
		T unit;

		if(not T::decode(buf_ + offset_, remaining(), unit, err)) return false;

		offset_ += unit.size();
		out = unit;

		return true;
	}

	const uint8_t* rest() const { return buf_ + offset_; }
	size_t remaining() const { return len_ - offset_; }
	size_t consumed() const { return offset_; }

private:
	const uint8_t* buf_;
	size_t len_;
	size_t offset_;
};
