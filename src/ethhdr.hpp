#pragma once

#include <arpa/inet.h>
#include <string>

#include "mac.hpp"
#include "buffer.hpp"

// what to do with an ethertype outside the known set
enum class EtherTypePolicy : uint8_t {
	Strict,	// classify as Unknown
	Legacy	// classify as Ipv6
};

#pragma pack(push, 1)
struct EthHdr final {
	Mac dmac_;
	Mac smac_;
	uint16_t type_;	// network byte order

	static constexpr size_t SIZE = 14;

	Mac dmac() const { return dmac_; }
	Mac smac() const { return smac_; }
	uint16_t type() const { return ntohs(type_); }

	// Type(type_)
	enum Mode : uint16_t {
		Ipv4 = 0x0800,
		Arp = 0x0806,
		WakeOnLan = 0x0842,
		Rarp = 0x8035,
		Slpp = 0x8103,
		Ipv6 = 0x86DD
	};

	// classified payload type
	enum class Type : uint8_t {
		Ipv4,
		Arp,
		WakeOnLan,
		Rarp,
		Slpp,
		Ipv6,
		Unknown
	};

	Type etherType(const EtherTypePolicy policy = EtherTypePolicy::Strict) const {
		return classify(type(), policy);
	}

	size_t size() const { return SIZE; }

	static Type classify(const uint16_t raw, const EtherTypePolicy policy = EtherTypePolicy::Strict);
	static const char* typeName(const Type type);

	static bool decode(const uint8_t* buf, const size_t len, EthHdr& out, DecodeError* err = nullptr);
	bool encode(uint8_t* buf, const size_t len, DecodeError* err = nullptr) const;

	static EthHdr make(const Mac& dmac, const Mac& smac, const uint16_t type);

	explicit operator std::string() const;
};
#pragma pack(pop)

static_assert(sizeof(EthHdr) == EthHdr::SIZE, "Ethernet header must be 14 bytes on the wire");
