#pragma once

#include <iostream>             // std::cout
#include <fstream>              // std::ifstream
#include <unistd.h>             // close
#include <sys/socket.h>         // socket, AF_INET
#include <sys/types.h>          // some historical (BSD) implementations required
                                //      this header file, and portable applications are
                                //      probably wise to include it.
#include <arpa/inet.h>          // inet_ntoa
#include <sys/ioctl.h>          // ioctl
#include <net/if.h>             // ifreq
#include <netinet/in.h>         // sockaddr_in
#include <cstdint>              // uint8_t
#include <cstring>              // strncpy, memset
#include <pcap.h>               // pcap

#include <mutex>                // std::mutex

#include "mac.hpp"
#include "ip.hpp"
#include "ethhdr.hpp"
#include "arphdr.hpp"
#include "arp-cache.hpp"
#include "dispatch.hpp"

#define CREATE_SOCKET_ERROR_MSG "Error: Error while create socket\n"
#define IOCTL_ERROR_MSG "Error: Error while ioctl\n"
#define SEND_PACKET_ERROR_MSG "Error: Error while send packet\n"
#define CLOSE_ERROR_MSG "Error: Error while close file descriptor\n"
#define GET_MAC_ERROR_MSG "Error: Error while get local MAC address\n"
#define ENCODE_PACKET_ERROR_MSG "Error: Error while encode packet\n"

#define PCAP_RECEIVE_PACKET_ERROR "Error : Error while pcap_next_ex: "

struct respondOption final {
    std::string interface;
    std::string file;           // read frames from capture file instead of interface
    EtherTypePolicy policy;
    bool quiet;
    long count;                 // stop after count frames, 0 = no limit
};

extern volatile bool isEnd;
extern std::mutex mPcap;

bool getMyInfo(const std::string& interface, Mac& MAC, IPv4& IP);
bool sendPacket(pcap_t* pcap, const EthArpPacket& packet);

bool manageFrames(pcap_t* pcap, FrameDispatcher& dispatcher, const respondOption& option);

void printInfo(const std::string& interface, const Mac& myMAC, const IPv4& myIP);
