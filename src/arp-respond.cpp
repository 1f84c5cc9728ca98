/**
 * @file arp-respond.cpp
 *
 * @brief frame driver side of arp-respond
 * pcap supplies received frames to FrameDispatcher and transmits replies
 *
 */
#include "arp-respond.hpp"

/**
 * @brief Get local MAC address and IP address of interface
 * get MAC address in system directory
 * get IP address using socket and I/O control
 *
 * @param interface : interface want to get information
 * @param MAC : MAC address of interface
 * @param IP : IP address of interface
 *
 * @return true : success
 * @return false : failure
 */
bool getMyInfo(const std::string& interface, Mac& MAC, IPv4& IP) {
    int sockfd;
    struct ifreq ifr;

    // struct initialization
    memset(&ifr, 0, sizeof(struct ifreq));

#ifdef DEBUG
    std::cout << "[DEBUG] Successfully get into function 'getMyInfo'\n";
#endif

    // Find local MAC address ==================================================
    std::ifstream iface("/sys/class/net/" + interface + "/address");
    std::string tempMAC((std::istreambuf_iterator<char>(iface)),
                        std::istreambuf_iterator<char>());

    if(tempMAC.length() == 0) {
        std::cerr << GET_MAC_ERROR_MSG;
        return false;
    }

    MAC = Mac(tempMAC);
    // =========================================================================

    // Find Local IP address ===================================================
    // Make socket which domain is IPv4 and type is UDP
    sockfd = socket(AF_INET, SOCK_DGRAM, IPPROTO_IP);

    if(sockfd == -1) {
        std::cerr << CREATE_SOCKET_ERROR_MSG;
        return false;
    }

#ifdef DEBUG
    std::cout << "[DEBUG] Successfully open socket\n";
#endif
    // Set protocol to IPv4
    ifr.ifr_addr.sa_family = AF_INET;

    // Put interface name to ifreq
    strncpy(ifr.ifr_name, interface.c_str(), IFNAMSIZ - 1);

    // IO control to get IP
    if(ioctl(sockfd, SIOCGIFADDR, &ifr)) {
        std::cerr << IOCTL_ERROR_MSG;
        close(sockfd);
        return false;
    }

#ifdef DEBUG
    std::cout << "[DEBUG] Successfully process ioctl\n";
#endif
    IP = IPv4(ntohl(((sockaddr_in *)&ifr.ifr_addr)->sin_addr.s_addr));

    // Socket close
    if(close(sockfd)) {
        std::cerr << CLOSE_ERROR_MSG;
        return false;
    }
    // =========================================================================

#ifdef DEBUG
    std::cout << "[DEBUG] Successfully close file descriptor\n";
#endif

    return true;
}

/**
 * @brief Send one Ethernet + ARP frame using pcap
 *
 * @param pcap : pcap object for sending packet
 * @param packet : frame want to send
 *
 * @return true : success
 * @return false : failure
 */
bool sendPacket(pcap_t* pcap, const EthArpPacket& packet) {
    uint8_t buf[sizeof(EthArpPacket)];

    if(not packet.eth_.encode(buf, sizeof(buf)) or
       not packet.arp_.encode(buf + EthHdr::SIZE, sizeof(buf) - EthHdr::SIZE)) {
        std::cerr << ENCODE_PACKET_ERROR_MSG;
        return false;
    }

#ifdef DEBUG
    std::cout << "[DEBUG] 'sendPacket' get lock of mPcap\n";
#endif
    mPcap.lock();
    int res = pcap_sendpacket(pcap, reinterpret_cast<const u_char*>(buf), sizeof(buf));
    mPcap.unlock();
#ifdef DEBUG
    std::cout << "[DEBUG] 'sendPacket' did unlock of mPcap\n";
#endif

    if( res ) {
        std::cerr << SEND_PACKET_ERROR_MSG;
        std::cerr << pcap_geterr(pcap) << std::endl;

        return false;
    }

    return true;
}

/**
 * @brief receive frames and hand them to dispatcher
 * truncated frames are dropped, ARP requests for our IP are answered
 * replies are only sent on a live interface
 *
 * @param pcap : pcap object for sending/receiving packet
 * @param dispatcher : decodes frames and keeps statistics
 * @param option : command line options
 *
 * @return true : capture ended normally (signal, end of file, count reached)
 * @return false : pcap failure
 */
bool manageFrames(pcap_t* pcap, FrameDispatcher& dispatcher, const respondOption& option) {
    struct pcap_pkthdr* header;
    const u_char* packet;
    int res;
    long received = 0;

    FrameView view;
    EthArpPacket reply;
    DecodeError err;

    const bool live = option.file.empty();

    while(not isEnd) {
        res = pcap_next_ex(pcap, &header, &packet);

        if (res == 0) continue;
        // PCAP_ERROR_BREAK : end of capture file or pcap_breakloop
        if (res == PCAP_ERROR_BREAK) break;
        // PCAP_ERROR : When interface is down
        if (res == PCAP_ERROR) {
            std::cerr << PCAP_RECEIVE_PACKET_ERROR;
            std::cerr << pcap_geterr(pcap) << std::endl;

            return false;
        }

        if(packet == NULL) continue;

        received++;

        if(not dispatcher.dispatch(packet, header->caplen, view, &err)) {
            if(not option.quiet) {
                std::cout << "[ETH] truncated frame (" << err.available_ << " of "
                          << err.required_ << " bytes)\n";
            }
        }
        else {
            if(not option.quiet) printFrame(std::cout, view);

            switch(dispatcher.handleArp(view, reply)) {
                case ArpAction::Replied:
                    if(live and not sendPacket(pcap, reply)) return false;
                    if(not option.quiet) std::cout << std::string(reply.arp_) << '\n';
                    break;
                case ArpAction::Learned:
                case ArpAction::Ignored:
                    break;
            }
        }

        if(option.count > 0 and received >= option.count) break;
    }

    return true;
}

/**
 * @brief print local information
 *
 * @param interface : capture source
 * @param myMAC : local MAC address
 * @param myIP : local IP address
 */
void printInfo(const std::string& interface, const Mac& myMAC, const IPv4& myIP) {
    std::cout << "========================================\n";
    std::cout << "[[Local Info]]\n";
    std::cout << "[IF]  " << interface << '\n';
    std::cout << "[MAC] " << std::string(myMAC) << '\n';
    std::cout << "[IP]  " << std::string(myIP) << '\n';
    std::cout << "========================================\n";
}
