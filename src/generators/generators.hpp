#ifndef UUIDLIB_GENERATORS_HPP
#define UUIDLIB_GENERATORS_HPP
#include "clock-sequence.hpp"
#include "../uuid/uuid.hpp"
#include "../providers/clock-node.hpp"
#include "../providers/entropy.hpp"
#include "../providers/hash.hpp"
#include <boost/system/error_code.hpp>
#include <string_view>

namespace UUID{
    /* Version 1 */
    // Packs a 60 bit timestamp, a 14 bit clock sequence and a node id
    // (RFC 4122 section 4.2.2). Bits of ticks above 60 and of clock_seq above 14 are dropped.
    Uuid make_v1(std::uint64_t ticks, std::uint16_t clock_seq, const Node& node);
    Uuid make_v1(const Timestamp& ts, const Node& node);

    // Binds a clock/node source to a shared clock sequence. Several generators
    // may share one ClockSequence, and one generator may be used from many threads.
    class TimeGenerator
    {
    public:
        TimeGenerator(ClockNodeProvider& provider, ClockSequence& sequence);

        // errc::provider_unavailable if the clock or the node could not be read, or if
        // the clock sequence ran out of values before the clock advanced.
        Uuid operator()(boost::system::error_code& ec);
        Uuid operator()();

    private:
        ClockNodeProvider& provider_;
        ClockSequence& sequence_;
    };

    /* Versions 3 and 5 */
    // First 16 bytes of hash(namespace ++ name), stamped with hash.version().
    // Throws std::invalid_argument if the hash digest is shorter than 16 bytes.
    Uuid generate_name_based(const HashProvider& hash, const Uuid& ns, const unsigned char* name, std::size_t len);
    Uuid generate_name_based(const HashProvider& hash, const Uuid& ns, std::string_view name);
    Uuid generate_v3(const Uuid& ns, std::string_view name);
    Uuid generate_v5(const Uuid& ns, std::string_view name);

    /* Version 4 */
    Uuid generate_v4(EntropyProvider& entropy, boost::system::error_code& ec);
    Uuid generate_v4(EntropyProvider& entropy);
}
#endif
