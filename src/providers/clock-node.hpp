#ifndef UUIDLIB_CLOCK_NODE_HPP
#define UUIDLIB_CLOCK_NODE_HPP
#include "../uuid/uuid.hpp"
#include <boost/system/error_code.hpp>
#include <cstdint>
#include <mutex>

namespace UUID{
    // Number of 100ns intervals between the start of the Gregorian calendar
    // (1582-10-15 00:00:00) and the unix epoch.
    constexpr std::uint64_t GREGORIAN_OFFSET = 0x01B21DD213814000ULL;

    // A version 1 timestamp together with a caller chosen clock sequence.
    struct Timestamp
    {
        std::uint64_t ticks; // 100ns intervals since 1582-10-15.
        std::uint16_t counter;

        constexpr static Timestamp from_parts(std::uint64_t ticks, std::uint16_t counter){
            return Timestamp{ticks, counter};
        }

        constexpr static Timestamp from_unix(std::uint64_t seconds, std::uint32_t nanoseconds){
            return Timestamp{GREGORIAN_OFFSET + seconds*10000000ULL + nanoseconds/100, 0};
        }

        constexpr Timestamp with_counter(std::uint16_t c) const {
            return Timestamp{ticks, c};
        }
    };

    class ClockNodeProvider
    {
    public:
        virtual ~ClockNodeProvider() = default;
        virtual std::uint64_t now_100ns_intervals(boost::system::error_code& ec) = 0;
        virtual Node node_id(boost::system::error_code& ec) = 0;
    };

    // What to do when no interface exposes a hardware address.
    enum class NodeFallback
    {
        FAIL,
        RANDOM
    };

    // Wall clock time and the hardware address of the first non loopback
    // network interface. The node is looked up once and then cached.
    class SystemClockNodeProvider: public ClockNodeProvider
    {
    public:
        explicit SystemClockNodeProvider(NodeFallback fallback = NodeFallback::FAIL);

        std::uint64_t now_100ns_intervals(boost::system::error_code& ec) override;
        Node node_id(boost::system::error_code& ec) override;

    private:
        bool hardware_node(Node& node);
        bool random_node(Node& node);

        NodeFallback fallback_;
        std::mutex mtx_;
        bool resolved_;
        Node node_;
    };
}
#endif
