#pragma once

#include <iostream>
#include <sstream>
#include <cstdint>
#include <string>

class IPv4 final {
public:
	static const int SIZE = 4;

	// constructor
	IPv4() : ip_(0) {}
	IPv4(const uint32_t r) : ip_(r) {}
	IPv4(const std::string r);

	// casting operator
	operator uint32_t() const { return ip_; } // default
	explicit operator std::string() const;

	// comparison operator
	bool operator == (const IPv4& r) const { return ip_ == r.ip_; }
	bool operator != (const IPv4& r) const { return ip_ != r.ip_; }
	bool operator <  (const IPv4& r) const { return ip_ <  r.ip_; }

	// big-endian wire bytes, caller guarantees SIZE bytes
	void read(const uint8_t* buf) {
		ip_ = (uint32_t(buf[0]) << 24) bitor (uint32_t(buf[1]) << 16) bitor
		      (uint32_t(buf[2]) << 8)  bitor  uint32_t(buf[3]);
	}

	void write(uint8_t* buf) const {
		buf[0] = (ip_ >> 24) bitand 0xFF;
		buf[1] = (ip_ >> 16) bitand 0xFF;
		buf[2] = (ip_ >> 8)  bitand 0xFF;
		buf[3] =  ip_        bitand 0xFF;
	}

	bool isNull() const { return ip_ == 0; }

	bool isLocalHost() const { // 127.*.*.*
		uint8_t prefix = (ip_ & 0xFF000000) >> 24;
		return prefix == 0x7F;
	}

	bool isBroadcast() const { // 255.255.255.255
		return ip_ == 0xFFFFFFFF;
	}

	bool isMulticast() const { // 224.0.0.0 ~ 239.255.255.255
		uint8_t prefix = (ip_ bitand 0xFF000000) >> 24;
		return prefix >= 0xE0 and prefix < 0xF0;
	}

protected:
	uint32_t ip_;
};

std::ostream& operator << (std::ostream& os, const IPv4& ip);
