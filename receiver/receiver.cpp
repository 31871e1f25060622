#include <iostream>
#include <string>
#include <pcap.h>
#include <arpa/inet.h>
#include <netinet/ip.h>
#include <netinet/udp.h>
#include <net/ethernet.h>   // for struct ether_header

#include "wol/mac.h"
#include "wol/magic_packet.h"
#include "wol/status.h"

using namespace std;

// Linux cooked capture (the "any" device): protocol at offset 14, 16-byte header.
static const size_t SLL_HEADER_LEN = 16;

struct CaptureState {
    int linktype;
    uint64_t magicCount;
};

// 取得 link header 之後的 network protocol 與 header 長度
static bool linkPayload(int linktype, const unsigned char* packet, size_t caplen,
                        uint16_t& proto, size_t& hdrLen) {
    if (linktype == DLT_EN10MB) {
        if (caplen < sizeof(ether_header)) return false;
        proto = ntohs(((const ether_header*)packet)->ether_type);
        hdrLen = sizeof(ether_header);
        return true;
    }
    if (linktype == DLT_LINUX_SLL) {
        if (caplen < SLL_HEADER_LEN) return false;
        proto = (uint16_t)((packet[14] << 8) | packet[15]);
        hdrLen = SLL_HEADER_LEN;
        return true;
    }
    return false;
}

// 處理每個捕獲的封包
void packetHandler(unsigned char *userData,
                   const struct pcap_pkthdr *pkthdr,
                   const unsigned char *packet) {
    auto* state = (CaptureState*)userData;

    // 1) Link header
    uint16_t proto;
    size_t linkLen;
    if (!linkPayload(state->linktype, packet, pkthdr->caplen, proto, linkLen)) {
        cout << "Packet too short for link header" << endl;
        return;
    }
    if (proto != ETHERTYPE_IP) {
        cout << "Not IPv4 (proto=0x" << hex << proto << dec << ")" << endl;
        return;
    }

    // 2) IP header
    const unsigned char* ip_start = packet + linkLen;
    if (pkthdr->caplen < linkLen + sizeof(struct ip)) {
        cout << "Packet too short for IP header" << endl;
        return;
    }

    auto* ip_hdr = (const struct ip*)ip_start;
    size_t ip_hdr_len = ip_hdr->ip_hl * 4;
    if (ip_hdr->ip_p != IPPROTO_UDP) {
        cout << "Not a UDP (ip_p=" << (int)ip_hdr->ip_p << ")" << endl;
        return;
    }

    // 3) UDP header
    const unsigned char* udp_start = ip_start + ip_hdr_len;
    if (pkthdr->caplen < linkLen + ip_hdr_len + sizeof(struct udphdr)) {
        cout << "Packet too short for UDP header" << endl;
        return;
    }
    auto* udp_hdr = (const struct udphdr*)udp_start;

    // 4) payload: trust the UDP length, bounded by what was captured
    const unsigned char* payload = udp_start + sizeof(struct udphdr);
    size_t udpLen = ntohs(udp_hdr->len);
    if (udpLen < sizeof(struct udphdr)) {
        cout << "Bad UDP length " << udpLen << endl;
        return;
    }
    size_t payloadLen = udpLen - sizeof(struct udphdr);
    size_t captured = pkthdr->caplen - (linkLen + ip_hdr_len + sizeof(struct udphdr));
    if (payloadLen > captured) {
        cout << "Truncated capture (" << captured << " of " << payloadLen << " bytes)" << endl;
        return;
    }

    char src[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &ip_hdr->ip_src, src, sizeof(src));

    wol::mac_address mac;
    wol::status st = wol::parse_magic_packet(payload, payloadLen, mac);
    if (!st.ok()) {
        cout << "Datagram from " << src << ":" << ntohs(udp_hdr->source)
             << " ignored: " << wol::to_string(st) << endl;
        return;
    }

    ++state->magicCount;
    cout << "Magic packet for " << wol::format_mac(mac)
         << " from " << src << ":" << ntohs(udp_hdr->source)
         << " (#" << state->magicCount << ")" << endl;
}

int main(int argc, char* argv[]) {
    // Usage: sudo ./receiver [iface] [port]
    string iface = (argc >= 2) ? argv[1] : "any";
    string port = (argc >= 3) ? argv[2] : "9";
    char errBuf[PCAP_ERRBUF_SIZE];

    pcap_t *handle = pcap_open_live(iface.c_str(), BUFSIZ, 1, 1000, errBuf);
    if (handle == nullptr) {
        cerr << "Error opening device: " << errBuf << endl;
        return 1;
    }

    CaptureState state{pcap_datalink(handle), 0};
    if (state.linktype != DLT_EN10MB && state.linktype != DLT_LINUX_SLL) {
        cerr << "Unsupported link type: " << pcap_datalink_val_to_name(state.linktype) << endl;
        pcap_close(handle);
        return 1;
    }

    // 只接收 WOL UDP port 的封包
    struct bpf_program fp;
    string filter_exp = "udp port " + port;
    if (pcap_compile(handle, &fp, filter_exp.c_str(), 0, PCAP_NETMASK_UNKNOWN) == -1) {
        cerr << "Error compiling filter: " << pcap_geterr(handle) << endl;
        pcap_close(handle);
        return 1;
    }

    if (pcap_setfilter(handle, &fp) == -1) {
        cerr << "Error setting filter: " << pcap_geterr(handle) << endl;
        pcap_freecode(&fp);
        pcap_close(handle);
        return 1;
    }
    pcap_freecode(&fp);

    cout << "Listening on " << iface << " for magic packets (" << filter_exp << ")..." << endl;

    if (pcap_loop(handle, 0, packetHandler, (unsigned char*)&state) < 0) {
        cerr << "Error capturing packets: " << pcap_geterr(handle) << endl;
        pcap_close(handle);
        return 1;
    }

    pcap_close(handle);
    return 0;
}
