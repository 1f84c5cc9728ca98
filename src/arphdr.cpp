#include "arphdr.hpp"

constexpr size_t ArpHdr::SIZE;

ArpHdr::Hardware ArpHdr::classifyHardware(const uint16_t raw) {
    switch(raw) {
        case ETHER: return Hardware::Ethernet;
        default:    return Hardware::Unknown;
    }
}

ArpHdr::Protocol ArpHdr::classifyProtocol(const uint16_t raw) {
    switch(raw) {
        case IPV4: return Protocol::Ipv4;
        default:   return Protocol::Unknown;
    }
}

ArpHdr::Opcode ArpHdr::classifyOperation(const uint16_t raw) {
    switch(raw) {
        case Request: return Opcode::Request;
        case Reply:   return Opcode::Reply;
        default:      return Opcode::Unknown;
    }
}

const char* ArpHdr::operationName(const Opcode op) {
    switch(op) {
        case Opcode::Request: return "Request";
        case Opcode::Reply:   return "Reply";
        case Opcode::Unknown: break;
    }

    return "Unknown";
}

/**
 * @brief decode ARP packet from buffer
 * hrd [0, 2), pro [2, 4), hln [4], pln [5], op [6, 8),
 * smac [8, 14), sip [14, 18), tmac [18, 24), tip [24, 28)
 * unrecognized hrd/pro/op values are kept and classify as Unknown
 *
 * @param buf : start of ARP payload (frame + 14)
 * @param len : bytes available from buf
 * @param out : decoded packet
 * @param err : filled with required/available length on failure, may be nullptr
 *
 * @return true : success
 * @return false : buffer shorter than 28 bytes
 */
bool ArpHdr::decode(const uint8_t* buf, const size_t len, ArpHdr& out, DecodeError* err) {
    if(not checkLength(SIZE, len, err)) return false;

    IPv4 sip, tip;

    sip.read(buf + 14);
    tip.read(buf + 24);

    out.hrd_  = htons(readBE16(buf));
    out.pro_  = htons(readBE16(buf + 2));
    out.hln_  = buf[4];
    out.pln_  = buf[5];
    out.op_   = htons(readBE16(buf + 6));
    out.smac_.read(buf + 8);
    out.sip_  = htonl(sip);
    out.tmac_.read(buf + 18);
    out.tip_  = htonl(tip);

    return true;
}

/**
 * @brief write packet in wire order
 *
 * @return true : success
 * @return false : buffer shorter than 28 bytes
 */
bool ArpHdr::encode(uint8_t* buf, const size_t len, DecodeError* err) const {
    if(not checkLength(SIZE, len, err)) return false;

    writeBE16(buf,     hrd());
    writeBE16(buf + 2, pro());
    buf[4] = hln_;
    buf[5] = pln_;
    writeBE16(buf + 6, op());
    smac_.write(buf + 8);
    sip().write(buf + 14);
    tmac_.write(buf + 18);
    tip().write(buf + 24);

    return true;
}

/**
 * @brief build Ethernet/IPv4 ARP packet
 *
 * @param op : ArpHdr::Request or ArpHdr::Reply
 * @param smac : sender MAC address
 * @param sip : sender IP address
 * @param tmac : target MAC address
 * @param tip : target IP address
 *
 * @return ArpHdr
 */
ArpHdr ArpHdr::make(const uint16_t op,
                    const Mac& smac, const IPv4& sip,
                    const Mac& tmac, const IPv4& tip) {
    ArpHdr packet;

    packet.hrd_  = htons(ETHER);
    packet.pro_  = htons(IPV4);
    packet.hln_  = Mac::SIZE;
    packet.pln_  = IPv4::SIZE;
    packet.op_   = htons(op);
    packet.smac_ = smac;
    packet.sip_  = htonl(sip);
    packet.tmac_ = tmac;
    packet.tip_  = htonl(tip);

    return packet;
}

/**
 * @brief build reply for a request
 * we claim the address the requester asked about:
 * sender = (myMAC, requested IP), target = original sender
 *
 * @param request : received ARP request
 * @param myMAC : local MAC address
 *
 * @return ArpHdr : new reply packet, request is not modified
 */
ArpHdr ArpHdr::buildReply(const ArpHdr& request, const Mac& myMAC) {
    return make(Reply, myMAC, request.tip(), request.smac(), request.sip());
}

ArpHdr::operator std::string() const {
    std::stringstream ss;

    ss << "[ARP] " << operationName(operation());
    if(operation() == Opcode::Unknown) ss << '(' << op() << ')';
    ss << " hrd " << hrd() << " pro 0x" << std::hex << std::setw(4) << std::setfill('0') << pro();
    ss << std::dec << " hln " << (int)hln_ << " pln " << (int)pln_ << '\n';
    ss << "      sender " << std::string(smac()) << ' ' << std::string(sip()) << '\n';
    ss << "      target " << std::string(tmac()) << ' ' << std::string(tip());

    return ss.str();
}

#ifdef GTEST
#include <gtest/gtest.h>

// who-has 10.0.0.2 tell 10.0.0.1
static const uint8_t _request[] = {
    0x00, 0x01, 0x08, 0x00, 0x06, 0x04, 0x00, 0x01,
    0xAA, 0xBB, 0xCC, 0xDD, 0xEE, 0xFF,     // sender MAC
    0x0A, 0x00, 0x00, 0x01,                 // sender IP
    0x00, 0x00, 0x00, 0x00, 0x00, 0x00,     // target MAC
    0x0A, 0x00, 0x00, 0x02                  // target IP
};

TEST(ArpHdr, decodeRequestTest) {
    ArpHdr packet;

    ASSERT_TRUE(ArpHdr::decode(_request, sizeof(_request), packet));

    EXPECT_EQ(packet.hardwareType(), ArpHdr::Hardware::Ethernet);
    EXPECT_EQ(packet.protocolType(), ArpHdr::Protocol::Ipv4);
    EXPECT_EQ(packet.operation(), ArpHdr::Opcode::Request);
    EXPECT_EQ(packet.hln(), 6);
    EXPECT_EQ(packet.pln(), 4);
    EXPECT_EQ(packet.smac(), Mac("AA:BB:CC:DD:EE:FF"));
    EXPECT_EQ(packet.sip(), IPv4("10.0.0.1"));
    EXPECT_TRUE(packet.tmac().isNull());
    EXPECT_EQ(packet.tip(), IPv4("10.0.0.2"));
    EXPECT_TRUE(packet.isEthernetIpv4());
    EXPECT_EQ(packet.size(), 28u);
}

TEST(ArpHdr, decodeDeterminismTest) {
    ArpHdr packet1, packet2;

    ASSERT_TRUE(ArpHdr::decode(_request, sizeof(_request), packet1));
    ASSERT_TRUE(ArpHdr::decode(_request, sizeof(_request), packet2));

    EXPECT_TRUE(memcmp(&packet1, &packet2, ArpHdr::SIZE) == 0);
}

TEST(ArpHdr, tooShortTest) {
    ArpHdr packet;
    DecodeError err;

    EXPECT_FALSE(ArpHdr::decode(_request, 27, packet, &err));
    EXPECT_EQ(err.kind_, DecodeError::TooShort);
    EXPECT_EQ(err.required_, 28u);
    EXPECT_EQ(err.available_, 27u);
}

TEST(ArpHdr, buildReplyTest) {
    ArpHdr request;
    ASSERT_TRUE(ArpHdr::decode(_request, sizeof(_request), request));

    Mac myMAC("11:22:33:44:55:66");
    ArpHdr reply = ArpHdr::buildReply(request, myMAC);

    EXPECT_EQ(reply.operation(), ArpHdr::Opcode::Reply);
    EXPECT_EQ(reply.hardwareType(), ArpHdr::Hardware::Ethernet);
    EXPECT_EQ(reply.protocolType(), ArpHdr::Protocol::Ipv4);
    EXPECT_EQ(reply.hln(), 6);
    EXPECT_EQ(reply.pln(), 4);
    EXPECT_EQ(reply.smac(), myMAC);
    EXPECT_EQ(reply.sip(), IPv4("10.0.0.2"));
    EXPECT_EQ(reply.tmac(), Mac("AA:BB:CC:DD:EE:FF"));
    EXPECT_EQ(reply.tip(), IPv4("10.0.0.1"));

    // request left as it was
    EXPECT_EQ(request.operation(), ArpHdr::Opcode::Request);
    EXPECT_EQ(request.smac(), Mac("AA:BB:CC:DD:EE:FF"));
}

TEST(ArpHdr, buildReplyFieldsTest) {
    const Mac myMAC("02:00:00:00:00:01");
    const Mac macs[] = { Mac("00:00:00:00:00:00"), Mac("01:02:03:04:05:06"), Mac("FF:FF:FF:FF:FF:FF") };
    const IPv4 ips[] = { IPv4("0.0.0.0"), IPv4("192.168.0.1"), IPv4("255.255.255.255") };

    for(auto& smac : macs) for(auto& sip : ips) for(auto& tip : ips) {
        ArpHdr request = ArpHdr::make(ArpHdr::Request, smac, sip, Mac::nullMac(), tip);
        ArpHdr reply = ArpHdr::buildReply(request, myMAC);

        EXPECT_EQ(reply.smac(), myMAC);
        EXPECT_EQ(reply.sip(), request.tip());
        EXPECT_EQ(reply.tmac(), request.smac());
        EXPECT_EQ(reply.tip(), request.sip());
        EXPECT_EQ(reply.operation(), ArpHdr::Opcode::Reply);
    }
}

TEST(ArpHdr, classifyTest) {
    EXPECT_EQ(ArpHdr::classifyHardware(0x0001), ArpHdr::Hardware::Ethernet);
    EXPECT_EQ(ArpHdr::classifyHardware(0x0006), ArpHdr::Hardware::Unknown);

    EXPECT_EQ(ArpHdr::classifyProtocol(0x0800), ArpHdr::Protocol::Ipv4);
    EXPECT_EQ(ArpHdr::classifyProtocol(0x86DD), ArpHdr::Protocol::Unknown);

    EXPECT_EQ(ArpHdr::classifyOperation(1), ArpHdr::Opcode::Request);
    EXPECT_EQ(ArpHdr::classifyOperation(2), ArpHdr::Opcode::Reply);
    EXPECT_EQ(ArpHdr::classifyOperation(3), ArpHdr::Opcode::Unknown);
    EXPECT_EQ(ArpHdr::classifyOperation(0), ArpHdr::Opcode::Unknown);
}

TEST(ArpHdr, classifyTotalTest) {
    int hardware = 0, protocol = 0, operation = 0;
    uint32_t raw;

    for(raw = 0; raw <= 0xFFFF; raw++) {
        if(ArpHdr::classifyHardware(raw) != ArpHdr::Hardware::Unknown) hardware++;
        if(ArpHdr::classifyProtocol(raw) != ArpHdr::Protocol::Unknown) protocol++;
        if(ArpHdr::classifyOperation(raw) != ArpHdr::Opcode::Unknown) operation++;
    }

    EXPECT_EQ(hardware, 1);
    EXPECT_EQ(protocol, 1);
    EXPECT_EQ(operation, 2);
}

TEST(ArpHdr, unknownFieldsTest) {
    uint8_t buf[ArpHdr::SIZE];
    ArpHdr packet;

    memcpy(buf, _request, sizeof(buf));
    buf[1] = 0x06;  // IEEE 802
    buf[2] = 0x86; buf[3] = 0xDD;
    buf[7] = 0x09;

    ASSERT_TRUE(ArpHdr::decode(buf, sizeof(buf), packet));
    EXPECT_EQ(packet.hardwareType(), ArpHdr::Hardware::Unknown);
    EXPECT_EQ(packet.protocolType(), ArpHdr::Protocol::Unknown);
    EXPECT_EQ(packet.operation(), ArpHdr::Opcode::Unknown);
    EXPECT_FALSE(packet.isEthernetIpv4());

    // raw values survive re-encoding
    uint8_t out[ArpHdr::SIZE];
    ASSERT_TRUE(packet.encode(out, sizeof(out)));
    EXPECT_TRUE(memcmp(out, buf, ArpHdr::SIZE) == 0);
}

TEST(ArpHdr, encodeTest) {
    ArpHdr packet = ArpHdr::make(ArpHdr::Request, Mac("AA:BB:CC:DD:EE:FF"), IPv4("10.0.0.1"),
                                 Mac::nullMac(), IPv4("10.0.0.2"));
    uint8_t out[ArpHdr::SIZE];
    DecodeError err;

    ASSERT_TRUE(packet.encode(out, sizeof(out)));
    EXPECT_TRUE(memcmp(out, _request, ArpHdr::SIZE) == 0);

    EXPECT_FALSE(packet.encode(out, 10, &err));
    EXPECT_EQ(err.required_, 28u);
}

TEST(ArpHdr, stringTest) {
    ArpHdr packet;
    ASSERT_TRUE(ArpHdr::decode(_request, sizeof(_request), packet));

    std::string s = std::string(packet);
    EXPECT_NE(s.find("Request"), std::string::npos);
    EXPECT_NE(s.find("10.0.0.2"), std::string::npos);
    EXPECT_NE(s.find("AA:BB:CC:DD:EE:FF"), std::string::npos);
}

#endif // GTEST
