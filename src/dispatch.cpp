#include "dispatch.hpp"

FrameDispatcher::FrameDispatcher(const Mac& myMAC, const IPv4& myIP, const EtherTypePolicy policy)
    : myMAC_(myMAC), myIP_(myIP), policy_(policy), stats_() {}

/**
 * @brief decode Ethernet header of received frame and prepare handoff
 * payload starts right after the header
 *
 * @param frame : received frame from driver
 * @param len : captured length
 * @param view : header, classified type, remaining payload and consumed size
 * @param err : filled on truncated frame, may be nullptr
 *
 * @return true : success
 * @return false : frame shorter than Ethernet header, drop it
 */
bool FrameDispatcher::dispatch(const uint8_t* frame, const size_t len, FrameView& view, DecodeError* err) {
    PacketCursor cursor(frame, len);
    EthHdr header;

    stats_.frames_++;

    if(not cursor.pull(header, err)) {
        stats_.truncated_++;
#ifdef DEBUG
        std::cout << "[DEBUG] drop truncated frame of " << len << " bytes\n";
#endif
        return false;
    }

    view.header_        = header;
    view.type_          = header.etherType(policy_);
    view.payload_       = cursor.rest();
    view.payloadLength_ = cursor.remaining();
    view.consumed_      = cursor.consumed();

    switch(view.type_) {
        case EthHdr::Type::Ipv4:    stats_.ipv4_++;    break;
        case EthHdr::Type::Arp:     stats_.arp_++;     break;
        case EthHdr::Type::Ipv6:    stats_.ipv6_++;    break;
        case EthHdr::Type::Unknown: stats_.unknown_++; break;
        default:                    stats_.other_++;   break;
    }

    return true;
}

/**
 * @brief handle ARP payload of a dispatched frame
 * Ethernet/IPv4 packets teach ArpCache the sender binding
 * a request for our IP gets a reply addressed to the requester
 *
 * @param view : frame dispatched by FrameDispatcher::dispatch
 * @param reply : frame to transmit, only valid when ArpAction::Replied
 *
 * @return ArpAction
 */
ArpAction FrameDispatcher::handleArp(const FrameView& view, EthArpPacket& reply) {
    ArpHdr packet;

    if(view.type_ != EthHdr::Type::Arp) return ArpAction::Ignored;

    if(not ArpHdr::decode(view.payload_, view.payloadLength_, packet)) {
        stats_.truncated_++;
#ifdef DEBUG
        std::cout << "[DEBUG] drop truncated ARP payload of " << view.payloadLength_ << " bytes\n";
#endif
        return ArpAction::Ignored;
    }

    if(not packet.isEthernetIpv4()) return ArpAction::Ignored;

    // probes carry 0.0.0.0 as sender, nothing to learn
    if(not packet.sip().isNull()) ArpCache::instance().insert(packet.smac(), packet.sip());

    if(packet.operation() != ArpHdr::Opcode::Request or
       myIP_.isNull() or packet.tip() != myIP_) return ArpAction::Learned;

    reply.eth_ = EthHdr::make(packet.smac(), myMAC_, EthHdr::Arp);
    reply.arp_ = ArpHdr::buildReply(packet, myMAC_);

    stats_.replies_++;

#ifdef DEBUG
    std::cout << "[DEBUG] reply to " << packet.sip() << " at " << packet.smac() << '\n';
#endif

    return ArpAction::Replied;
}

void printFrame(std::ostream& os, const FrameView& view) {
    ArpHdr packet;

    os << std::string(view.header_) << '\n';

    if(view.type_ != EthHdr::Type::Arp) return;

    if(ArpHdr::decode(view.payload_, view.payloadLength_, packet)) os << std::string(packet) << '\n';
    else os << "[ARP] truncated (" << view.payloadLength_ << " bytes)\n";
}

void printStats(std::ostream& os, const FrameDispatcher::Stats& stats) {
    os << "========================================\n";
    os << "[frames]    " << stats.frames_    << '\n';
    os << "[truncated] " << stats.truncated_ << '\n';
    os << "[IPv4]      " << stats.ipv4_      << '\n';
    os << "[ARP]       " << stats.arp_       << '\n';
    os << "[IPv6]      " << stats.ipv6_      << '\n';
    os << "[other]     " << stats.other_     << '\n';
    os << "[unknown]   " << stats.unknown_   << '\n';
    os << "[replies]   " << stats.replies_   << '\n';
    os << "========================================\n";
}

void printCache(std::ostream& os, const ArpCache& cache) {
    os << "[[ARP cache]]\n";
    for(auto& entry : cache.snapshot()) {
        os << "[MAC] " << std::string(entry.first) << "  [IP] " << std::string(entry.second) << '\n';
    }
}

#ifdef GTEST
#include <gtest/gtest.h>
#include <sstream>

// who-has 10.0.0.2 tell 10.0.0.1, broadcast
static const uint8_t _arpFrame[] = {
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xAA, 0xBB, 0xCC, 0xDD, 0xEE, 0xFF,
    0x08, 0x06,
    0x00, 0x01, 0x08, 0x00, 0x06, 0x04, 0x00, 0x01,
    0xAA, 0xBB, 0xCC, 0xDD, 0xEE, 0xFF,
    0x0A, 0x00, 0x00, 0x01,
    0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x0A, 0x00, 0x00, 0x02
};

TEST(FrameDispatcher, dispatchArpTest) {
    FrameDispatcher dispatcher(Mac("11:22:33:44:55:66"), IPv4("10.0.0.2"));
    FrameView view;

    ASSERT_TRUE(dispatcher.dispatch(_arpFrame, sizeof(_arpFrame), view));

    EXPECT_EQ(view.type_, EthHdr::Type::Arp);
    EXPECT_EQ(view.consumed_, EthHdr::SIZE);
    EXPECT_EQ(view.payload_, _arpFrame + EthHdr::SIZE);
    EXPECT_EQ(view.payloadLength_, ArpHdr::SIZE);
    EXPECT_EQ(dispatcher.stats().frames_, 1u);
    EXPECT_EQ(dispatcher.stats().arp_, 1u);
}

TEST(FrameDispatcher, dispatchTruncatedTest) {
    FrameDispatcher dispatcher(Mac("11:22:33:44:55:66"), IPv4("10.0.0.2"));
    FrameView view;
    DecodeError err;

    EXPECT_FALSE(dispatcher.dispatch(_arpFrame, 10, view, &err));
    EXPECT_EQ(err.kind_, DecodeError::TooShort);
    EXPECT_EQ(err.required_, EthHdr::SIZE);
    EXPECT_EQ(dispatcher.stats().truncated_, 1u);
}

TEST(FrameDispatcher, policyTest) {
    uint8_t frame[EthHdr::SIZE];
    FrameView view;

    memcpy(frame, _arpFrame, sizeof(frame));
    frame[12] = 0xFF; frame[13] = 0xFF;

    FrameDispatcher strict(Mac::nullMac(), IPv4());
    ASSERT_TRUE(strict.dispatch(frame, sizeof(frame), view));
    EXPECT_EQ(view.type_, EthHdr::Type::Unknown);
    EXPECT_EQ(view.payloadLength_, 0u);
    EXPECT_EQ(strict.stats().unknown_, 1u);

    FrameDispatcher legacy(Mac::nullMac(), IPv4(), EtherTypePolicy::Legacy);
    ASSERT_TRUE(legacy.dispatch(frame, sizeof(frame), view));
    EXPECT_EQ(view.type_, EthHdr::Type::Ipv6);
    EXPECT_EQ(legacy.stats().ipv6_, 1u);
}

TEST(FrameDispatcher, replyTest) {
    Mac myMAC("11:22:33:44:55:66");
    FrameDispatcher dispatcher(myMAC, IPv4("10.0.0.2"));
    FrameView view;
    EthArpPacket reply;

    ASSERT_TRUE(dispatcher.dispatch(_arpFrame, sizeof(_arpFrame), view));
    ASSERT_EQ(dispatcher.handleArp(view, reply), ArpAction::Replied);

    EXPECT_EQ(reply.eth_.dmac(), Mac("AA:BB:CC:DD:EE:FF"));
    EXPECT_EQ(reply.eth_.smac(), myMAC);
    EXPECT_EQ(reply.eth_.type(), EthHdr::Arp);

    EXPECT_EQ(reply.arp_.operation(), ArpHdr::Opcode::Reply);
    EXPECT_EQ(reply.arp_.smac(), myMAC);
    EXPECT_EQ(reply.arp_.sip(), IPv4("10.0.0.2"));
    EXPECT_EQ(reply.arp_.tmac(), Mac("AA:BB:CC:DD:EE:FF"));
    EXPECT_EQ(reply.arp_.tip(), IPv4("10.0.0.1"));
    EXPECT_EQ(dispatcher.stats().replies_, 1u);

    IPv4 IP;
    ASSERT_TRUE(ArpCache::instance().lookup(Mac("AA:BB:CC:DD:EE:FF"), IP));
    EXPECT_EQ(IP, IPv4("10.0.0.1"));

    // reply goes out as bytes the driver can send
    uint8_t out[sizeof(EthArpPacket)];
    ASSERT_TRUE(reply.eth_.encode(out, sizeof(out)));
    ASSERT_TRUE(reply.arp_.encode(out + EthHdr::SIZE, sizeof(out) - EthHdr::SIZE));
    EXPECT_TRUE(memcmp(out, &reply, sizeof(out)) == 0);
}

TEST(FrameDispatcher, notForUsTest) {
    FrameDispatcher dispatcher(Mac("11:22:33:44:55:66"), IPv4("10.0.0.3"));
    FrameView view;
    EthArpPacket reply;

    ASSERT_TRUE(dispatcher.dispatch(_arpFrame, sizeof(_arpFrame), view));
    EXPECT_EQ(dispatcher.handleArp(view, reply), ArpAction::Learned);
    EXPECT_EQ(dispatcher.stats().replies_, 0u);
}

TEST(FrameDispatcher, truncatedArpTest) {
    FrameDispatcher dispatcher(Mac("11:22:33:44:55:66"), IPv4("10.0.0.2"));
    FrameView view;
    EthArpPacket reply;

    ASSERT_TRUE(dispatcher.dispatch(_arpFrame, sizeof(_arpFrame) - 1, view));
    EXPECT_EQ(view.payloadLength_, ArpHdr::SIZE - 1);
    EXPECT_EQ(dispatcher.handleArp(view, reply), ArpAction::Ignored);
    EXPECT_EQ(dispatcher.stats().truncated_, 1u);
}

TEST(FrameDispatcher, nonArpTest) {
    uint8_t frame[sizeof(_arpFrame)];
    FrameDispatcher dispatcher(Mac("11:22:33:44:55:66"), IPv4("10.0.0.2"));
    FrameView view;
    EthArpPacket reply;

    memcpy(frame, _arpFrame, sizeof(frame));
    frame[13] = 0x00;   // IPv4

    ASSERT_TRUE(dispatcher.dispatch(frame, sizeof(frame), view));
    EXPECT_EQ(view.type_, EthHdr::Type::Ipv4);
    EXPECT_EQ(dispatcher.handleArp(view, reply), ArpAction::Ignored);
}

TEST(FrameDispatcher, printFrameTest) {
    FrameDispatcher dispatcher(Mac("11:22:33:44:55:66"), IPv4("10.0.0.2"));
    FrameView view;
    std::ostringstream os;

    ASSERT_TRUE(dispatcher.dispatch(_arpFrame, sizeof(_arpFrame), view));
    printFrame(os, view);

    EXPECT_NE(os.str().find("[ETH]"), std::string::npos);
    EXPECT_NE(os.str().find("[ARP] Request"), std::string::npos);
}

#endif // GTEST
