#pragma once

#include <iostream>
#include <cstdint>

#include "mac.hpp"
#include "ip.hpp"
#include "buffer.hpp"
#include "ethhdr.hpp"
#include "arphdr.hpp"
#include "arp-cache.hpp"

#pragma pack(push, 1)
struct EthArpPacket final {
	EthHdr eth_;
	ArpHdr arp_;
};
#pragma pack(pop)

static_assert(sizeof(EthArpPacket) == EthHdr::SIZE + ArpHdr::SIZE, "Ethernet + ARP frame must be 42 bytes");

// handed to the protocol that owns header.etherType()
struct FrameView final {
	EthHdr header_;
	EthHdr::Type type_;
	const uint8_t* payload_;
	size_t payloadLength_;
	size_t consumed_;
};

enum class ArpAction : uint8_t {
	Ignored,	// truncated, not Ethernet/IPv4, or not ARP at all
	Learned,	// sender binding stored in ArpCache
	Replied		// learned, and reply holds a frame to transmit
};

// ----------------------------------------------------------------------------
// FrameDispatcher
// ----------------------------------------------------------------------------
class FrameDispatcher final {
public:
	struct Stats {
		uint64_t frames_;
		uint64_t truncated_;
		uint64_t ipv4_;
		uint64_t arp_;
		uint64_t ipv6_;
		uint64_t other_;
		uint64_t unknown_;
		uint64_t replies_;
	};

	FrameDispatcher(const Mac& myMAC, const IPv4& myIP,
	                const EtherTypePolicy policy = EtherTypePolicy::Strict);

	bool dispatch(const uint8_t* frame, const size_t len, FrameView& view, DecodeError* err = nullptr);
	ArpAction handleArp(const FrameView& view, EthArpPacket& reply);

	const Stats& stats() const { return stats_; }
	const Mac& myMAC() const { return myMAC_; }
	const IPv4& myIP() const { return myIP_; }

private:
	Mac myMAC_;
	IPv4 myIP_;
	EtherTypePolicy policy_;
	Stats stats_;
};

void printFrame(std::ostream& os, const FrameView& view);
void printStats(std::ostream& os, const FrameDispatcher::Stats& stats);
void printCache(std::ostream& os, const ArpCache& cache);
