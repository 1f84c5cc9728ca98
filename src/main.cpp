#include <iostream>
#include <csignal>
#include <cstdlib>
#include <unistd.h>     // getopt
#include <pcap.h>

#include "arp-respond.hpp"

using namespace std;

pcap_t* pcap;

// for communicating between signal handler and capture loop
volatile bool isEnd;

mutex mPcap;

/*
 * Keyboard interrupt handler
*/
void InterruptHandler(const int signo) {
    if(signo == SIGINT or signo == SIGTERM) {
        isEnd = true;

        if(pcap != NULL) pcap_breakloop(pcap);
    }
}

void usage() {
    cerr << "syntax : arp-respond [-l] [-q] [-n <count>] [-m <mac>] [-a <ip>] <interface>\n";
    cerr << "         arp-respond [-l] [-q] [-n <count>] [-m <mac>] [-a <ip>] -r <file.pcap>\n";
    cerr << "  -l : classify unknown ethertypes as IPv6\n";
    cerr << "  -q : do not dump frames\n";
    cerr << "  -n : stop after <count> frames\n";
    cerr << "  -m, -a : local MAC / IP, overrides the interface address\n";
    cerr << "sample : arp-respond eth0" << endl;
}

int main(int argc, char* argv[]) {
    respondOption option{"", "", EtherTypePolicy::Strict, false, 0};
    char errbuf[PCAP_ERRBUF_SIZE];
    Mac myMAC;
    IPv4 myIP;
    string optMAC, optIP;
    int opt;

    while((opt = getopt(argc, argv, "lqn:m:a:r:")) != -1) {
        switch(opt) {
            case 'l': option.policy = EtherTypePolicy::Legacy; break;
            case 'q': option.quiet = true; break;
            case 'n': option.count = strtol(optarg, NULL, 10); break;
            case 'm': optMAC = optarg; break;
            case 'a': optIP = optarg; break;
            case 'r': option.file = optarg; break;
            default:
                usage();
                return 1;
        }
    }

    if(optind < argc) option.interface = argv[optind];

    // Wrong parameter
    if(option.interface.empty() == option.file.empty() or option.count < 0) {
        cerr << "Error: Wrong parameters are given\n";
        usage();

        return 1;
    }

    signal(SIGINT, InterruptHandler);
    signal(SIGTERM, InterruptHandler);

    if(option.file.empty()) {
        // Turn promiscuous mode on to receive others' packet by give third parameter 1
        pcap = pcap_open_live(option.interface.c_str(), BUFSIZ, 1, 1, errbuf);

        if(pcap == NULL) {
            cerr << "Error: Error while open device " << option.interface << '\n';
            cerr << errbuf << endl;

            return 1;
        }

        // Get my IP and MAC address
        if(not getMyInfo(option.interface, myMAC, myIP)) {
            pcap_close(pcap);
            return 1;
        }
    }
    else {
        pcap = pcap_open_offline(option.file.c_str(), errbuf);

        if(pcap == NULL) {
            cerr << "Error: Error while open file " << option.file << '\n';
            cerr << errbuf << endl;

            return 1;
        }
    }

#ifdef DEBUG
    cout << "[DEBUG] Successfully open pcap\n";
#endif

    if(not optMAC.empty()) myMAC = Mac(optMAC);
    if(not optIP.empty()) myIP = IPv4(optIP);

    if(pcap_datalink(pcap) != DLT_EN10MB) {
        cerr << "Error: " << (option.file.empty() ? option.interface : option.file)
             << " is not an Ethernet capture\n";
        pcap_close(pcap);

        return 1;
    }

    printInfo(option.file.empty() ? option.interface : option.file, myMAC, myIP);

    FrameDispatcher dispatcher(myMAC, myIP, option.policy);

    bool res = manageFrames(pcap, dispatcher, option);

    printStats(cout, dispatcher.stats());
    printCache(cout, ArpCache::instance());

    pcap_close(pcap);

    return res ? 0 : 1;
}
