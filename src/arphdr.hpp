#pragma once

#include <arpa/inet.h>
#include <string>

#include "mac.hpp"
#include "ip.hpp"
#include "buffer.hpp"

#pragma pack(push, 1)
struct ArpHdr final {
	uint16_t hrd_;	// hardware type, network byte order
	uint16_t pro_;	// protocol type, network byte order
	uint8_t hln_;	// hardware address length
	uint8_t pln_;	// protocol address length
	uint16_t op_;	// operation, network byte order
	Mac smac_;
	uint32_t sip_;	// network byte order
	Mac tmac_;
	uint32_t tip_;	// network byte order

	static constexpr size_t SIZE = 28;

	uint16_t hrd() const { return ntohs(hrd_); }
	uint16_t pro() const { return ntohs(pro_); }
	uint8_t hln() const { return hln_; }
	uint8_t pln() const { return pln_; }
	uint16_t op() const { return ntohs(op_); }
	Mac smac() const { return smac_; }
	IPv4 sip() const { return IPv4(ntohl(sip_)); }
	Mac tmac() const { return tmac_; }
	IPv4 tip() const { return IPv4(ntohl(tip_)); }

	// HardwareType(hrd_)
	enum : uint16_t {
		ETHER = 1
	};

	// ProtocolType(pro_), same numbering as ethertype
	enum : uint16_t {
		IPV4 = 0x0800
	};

	// Operation(op_)
	enum : uint16_t {
		Request = 1,
		Reply = 2
	};

	enum class Hardware : uint8_t {
		Ethernet,
		Unknown
	};

	enum class Protocol : uint8_t {
		Ipv4,
		Unknown
	};

	enum class Opcode : uint8_t {
		Request,
		Reply,
		Unknown
	};

	Hardware hardwareType() const { return classifyHardware(hrd()); }
	Protocol protocolType() const { return classifyProtocol(pro()); }
	Opcode operation() const { return classifyOperation(op()); }

	// Ethernet hardware carrying IPv4 with 6/4 byte addresses
	bool isEthernetIpv4() const {
		return hardwareType() == Hardware::Ethernet and protocolType() == Protocol::Ipv4 and
		       hln_ == Mac::SIZE and pln_ == IPv4::SIZE;
	}

	size_t size() const { return SIZE; }

	static Hardware classifyHardware(const uint16_t raw);
	static Protocol classifyProtocol(const uint16_t raw);
	static Opcode classifyOperation(const uint16_t raw);
	static const char* operationName(const Opcode op);

	static bool decode(const uint8_t* buf, const size_t len, ArpHdr& out, DecodeError* err = nullptr);
	bool encode(uint8_t* buf, const size_t len, DecodeError* err = nullptr) const;

	static ArpHdr make(const uint16_t op,
	                   const Mac& smac, const IPv4& sip,
	                   const Mac& tmac, const IPv4& tip);
	static ArpHdr buildReply(const ArpHdr& request, const Mac& myMAC);

	explicit operator std::string() const;
};
#pragma pack(pop)

static_assert(sizeof(ArpHdr) == ArpHdr::SIZE, "ARP packet must be 28 bytes on the wire");
