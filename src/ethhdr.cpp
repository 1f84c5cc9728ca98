#include "ethhdr.hpp"

constexpr size_t EthHdr::SIZE;

/**
 * @brief map a wire ethertype to its payload type
 *
 * @param raw : ethertype in host byte order
 * @param policy : classification of values outside the known set
 *
 * @return EthHdr::Type
 */
EthHdr::Type EthHdr::classify(const uint16_t raw, const EtherTypePolicy policy) {
    switch(raw) {
        case Ipv4:      return Type::Ipv4;
        case Arp:       return Type::Arp;
        case WakeOnLan: return Type::WakeOnLan;
        case Rarp:      return Type::Rarp;
        case Slpp:      return Type::Slpp;
        case Ipv6:      return Type::Ipv6;
        default: break;
    }

    return policy == EtherTypePolicy::Legacy ? Type::Ipv6 : Type::Unknown;
}

const char* EthHdr::typeName(const Type type) {
    switch(type) {
        case Type::Ipv4:      return "IPv4";
        case Type::Arp:       return "ARP";
        case Type::WakeOnLan: return "Wake-on-LAN";
        case Type::Rarp:      return "RARP";
        case Type::Slpp:      return "SLPP";
        case Type::Ipv6:      return "IPv6";
        case Type::Unknown:   break;
    }

    return "Unknown";
}

/**
 * @brief decode Ethernet header from received buffer
 * destination [0, 6), source [6, 12), ethertype [12, 14)
 *
 * @param buf : start of frame
 * @param len : captured length of frame
 * @param out : decoded header
 * @param err : filled with required/available length on failure, may be nullptr
 *
 * @return true : success
 * @return false : buffer shorter than 14 bytes
 */
bool EthHdr::decode(const uint8_t* buf, const size_t len, EthHdr& out, DecodeError* err) {
    if(not checkLength(SIZE, len, err)) return false;

    out.dmac_.read(buf);
    out.smac_.read(buf + Mac::SIZE);
    out.type_ = htons(readBE16(buf + Mac::SIZE * 2));

    return true;
}

/**
 * @brief write header in wire order
 *
 * @return true : success
 * @return false : buffer shorter than 14 bytes
 */
bool EthHdr::encode(uint8_t* buf, const size_t len, DecodeError* err) const {
    if(not checkLength(SIZE, len, err)) return false;

    dmac_.write(buf);
    smac_.write(buf + Mac::SIZE);
    writeBE16(buf + Mac::SIZE * 2, type());

    return true;
}

EthHdr EthHdr::make(const Mac& dmac, const Mac& smac, const uint16_t type) {
    EthHdr hdr;

    hdr.dmac_ = dmac;
    hdr.smac_ = smac;
    hdr.type_ = htons(type);

    return hdr;
}

EthHdr::operator std::string() const {
    std::stringstream ss;

    ss << "[ETH] " << std::string(smac()) << " -> " << std::string(dmac());
    ss << " type " << typeName(etherType());
    ss << " (0x" << std::hex << std::setw(4) << std::setfill('0') << type() << ')';

    return ss.str();
}

#ifdef GTEST
#include <gtest/gtest.h>

static const uint8_t _frame[] = {
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,     // destination
    0xAA, 0xBB, 0xCC, 0xDD, 0xEE, 0xFF,     // source
    0x08, 0x06,                             // ethertype
    0x00, 0x01                              // start of payload
};

TEST(EthHdr, decodeTest) {
    EthHdr hdr;

    ASSERT_TRUE(EthHdr::decode(_frame, sizeof(_frame), hdr));

    EXPECT_TRUE(hdr.dmac().isBroadcast());
    EXPECT_EQ(hdr.smac(), Mac("AA:BB:CC:DD:EE:FF"));
    EXPECT_EQ(hdr.type(), EthHdr::Arp);
    EXPECT_EQ(hdr.etherType(), EthHdr::Type::Arp);
    EXPECT_EQ(hdr.size(), 14u);
}

TEST(EthHdr, decodeDeterminismTest) {
    EthHdr hdr1, hdr2;

    ASSERT_TRUE(EthHdr::decode(_frame, sizeof(_frame), hdr1));
    ASSERT_TRUE(EthHdr::decode(_frame, sizeof(_frame), hdr2));

    EXPECT_EQ(hdr1.dmac(), hdr2.dmac());
    EXPECT_EQ(hdr1.smac(), hdr2.smac());
    EXPECT_EQ(hdr1.type(), hdr2.type());
}

TEST(EthHdr, tooShortTest) {
    EthHdr hdr;
    DecodeError err;

    EXPECT_FALSE(EthHdr::decode(_frame, 13, hdr, &err));
    EXPECT_EQ(err.kind_, DecodeError::TooShort);
    EXPECT_EQ(err.required_, 14u);
    EXPECT_EQ(err.available_, 13u);

    EXPECT_FALSE(EthHdr::decode(_frame, 0, hdr));
}

TEST(EthHdr, classifyKnownTest) {
    EXPECT_EQ(EthHdr::classify(0x0800), EthHdr::Type::Ipv4);
    EXPECT_EQ(EthHdr::classify(0x0806), EthHdr::Type::Arp);
    EXPECT_EQ(EthHdr::classify(0x0842), EthHdr::Type::WakeOnLan);
    EXPECT_EQ(EthHdr::classify(0x8035), EthHdr::Type::Rarp);
    EXPECT_EQ(EthHdr::classify(0x8103), EthHdr::Type::Slpp);
    EXPECT_EQ(EthHdr::classify(0x86DD), EthHdr::Type::Ipv6);
}

TEST(EthHdr, classifyUnassignedTest) {
    // FF FF is not an assigned ethertype
    EXPECT_EQ(EthHdr::classify(0xFFFF), EthHdr::Type::Unknown);
    EXPECT_EQ(EthHdr::classify(0xFFFF, EtherTypePolicy::Strict), EthHdr::Type::Unknown);
    EXPECT_EQ(EthHdr::classify(0xFFFF, EtherTypePolicy::Legacy), EthHdr::Type::Ipv6);

    // known values do not depend on policy
    EXPECT_EQ(EthHdr::classify(0x0806, EtherTypePolicy::Legacy), EthHdr::Type::Arp);
}

TEST(EthHdr, classifyFromBytesTest) {
    uint8_t frame[EthHdr::SIZE];
    EthHdr hdr;

    memcpy(frame, _frame, EthHdr::SIZE);

    frame[12] = 0x08; frame[13] = 0x00;
    ASSERT_TRUE(EthHdr::decode(frame, sizeof(frame), hdr));
    EXPECT_EQ(hdr.etherType(), EthHdr::Type::Ipv4);

    frame[12] = 0xFF; frame[13] = 0xFF;
    ASSERT_TRUE(EthHdr::decode(frame, sizeof(frame), hdr));
    EXPECT_EQ(hdr.etherType(), EthHdr::Type::Unknown);
    EXPECT_EQ(hdr.etherType(EtherTypePolicy::Legacy), EthHdr::Type::Ipv6);
}

TEST(EthHdr, encodeTest) {
    EthHdr hdr = EthHdr::make(Mac::broadcastMac(), Mac("AA:BB:CC:DD:EE:FF"), EthHdr::Arp);
    uint8_t buf[EthHdr::SIZE];

    ASSERT_TRUE(hdr.encode(buf, sizeof(buf)));
    EXPECT_TRUE(memcmp(buf, _frame, EthHdr::SIZE) == 0);

    EXPECT_FALSE(hdr.encode(buf, EthHdr::SIZE - 1));
}

TEST(EthHdr, cursorTest) {
    PacketCursor cursor(_frame, sizeof(_frame));
    EthHdr hdr;

    ASSERT_TRUE(cursor.pull(hdr));
    EXPECT_EQ(cursor.consumed(), EthHdr::SIZE);
    EXPECT_EQ(cursor.remaining(), 2u);
    EXPECT_EQ(readBE16(cursor.rest()), 0x0001);

    // nothing left for a second header
    DecodeError err;
    EXPECT_FALSE(cursor.pull(hdr, &err));
    EXPECT_EQ(err.available_, 2u);
    EXPECT_EQ(cursor.consumed(), EthHdr::SIZE);
}

TEST(EthHdr, stringTest) {
    EthHdr hdr;
    ASSERT_TRUE(EthHdr::decode(_frame, sizeof(_frame), hdr));

    std::string s = std::string(hdr);
    EXPECT_NE(s.find("AA:BB:CC:DD:EE:FF"), std::string::npos);
    EXPECT_NE(s.find("ARP"), std::string::npos);
    EXPECT_NE(s.find("0806"), std::string::npos);
}

#endif // GTEST
