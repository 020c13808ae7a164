#include "clock-node.hpp"
#include "entropy.hpp"
#include "../uuid/uuid-errors.hpp"
#include <cerrno>
#include <cstring>
#include <ctime>
#include <iostream>
#include <system_error>
#ifdef __linux__
#include <ifaddrs.h>
#include <net/if.h>
#include <netpacket/packet.h>
#endif

namespace UUID{
    SystemClockNodeProvider::SystemClockNodeProvider(NodeFallback fallback)
      : fallback_{fallback},
        mtx_{},
        resolved_{false},
        node_{}
    {}

    std::uint64_t SystemClockNodeProvider::now_100ns_intervals(boost::system::error_code& ec){
        ec.clear();
        struct timespec ts = {};
        if(clock_gettime(CLOCK_REALTIME, &ts) == -1){
            std::cerr << "clock-node.cpp:clock_gettime failed:" << std::make_error_code(std::errc(errno)).message() << std::endl;
            ec = make_error_code(errc::provider_unavailable);
            return 0;
        }
        return GREGORIAN_OFFSET
            + static_cast<std::uint64_t>(ts.tv_sec)*10000000ULL
            + static_cast<std::uint64_t>(ts.tv_nsec)/100;
    }

    Node SystemClockNodeProvider::node_id(boost::system::error_code& ec){
        ec.clear();
        std::lock_guard<std::mutex> lk(mtx_);
        if(resolved_){
            return node_;
        }
        Node node = {};
        if(hardware_node(node)){
            node_ = node;
            resolved_ = true;
            return node_;
        }
        if(fallback_ == NodeFallback::RANDOM && random_node(node)){
            node_ = node;
            resolved_ = true;
            return node_;
        }
        std::cerr << "clock-node.cpp:no hardware address available for the uuid node." << std::endl;
        ec = make_error_code(errc::provider_unavailable);
        return Node{};
    }

    bool SystemClockNodeProvider::hardware_node(Node& node){
#ifdef __linux__
        struct ifaddrs* ifah;
        if(getifaddrs(&ifah) == -1){
            std::cerr << "clock-node.cpp:getifaddrs failed:" << std::make_error_code(std::errc(errno)).message() << std::endl;
            return false;
        }
        const unsigned char zeros[Node::length] = {};
        bool found = false;
        for(struct ifaddrs* ifa = ifah; ifa != nullptr; ifa = ifa->ifa_next){
            if(ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_PACKET){
                continue;
            }
            if(ifa->ifa_flags & IFF_LOOPBACK){
                continue;
            }
            struct sockaddr_ll* sll = reinterpret_cast<struct sockaddr_ll*>(ifa->ifa_addr);
            if(sll->sll_halen != Node::length || std::memcmp(sll->sll_addr, zeros, Node::length) == 0){
                continue;
            }
            std::memcpy(node.bytes, sll->sll_addr, Node::length);
            found = true;
            break;
        }
        freeifaddrs(ifah);
        return found;
#else
        // Only Linux has a hardware address path, everywhere else the fallback decides.
        (void)node;
        return false;
#endif
    }

    bool SystemClockNodeProvider::random_node(Node& node){
        OsEntropy entropy;
        Uuid::bytes_type buf{};
        boost::system::error_code ec;
        entropy.fill_random(buf, ec);
        if(ec){
            return false;
        }
        std::memcpy(node.bytes, buf.data(), Node::length);
        // RFC 4122 section 4.5: a random node has the multicast bit set so it
        // can never collide with a real IEEE 802 address.
        node.bytes[0] |= 0x01;
        return true;
    }
}
