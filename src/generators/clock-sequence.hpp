#ifndef UUIDLIB_CLOCK_SEQUENCE_HPP
#define UUIDLIB_CLOCK_SEQUENCE_HPP
#include "../uuid/uuid.hpp"
#include <boost/system/error_code.hpp>
#include <cstdint>
#include <mutex>

namespace UUID{
    // The 14 bit clock sequence of version 1 uuids.
    //
    // One ClockSequence is meant to be shared by every TimeGenerator of a process
    // (or of whatever scope must never repeat an id). next() is the only mutator,
    // and the compare against the previous timestamp and node plus the increment
    // happen under a single lock, so two concurrent callers can never both leave
    // with the same (timestamp, clock sequence) pair.
    class ClockSequence
    {
    public:
        constexpr static std::uint16_t mask = 0x3FFF;

        ClockSequence(); // random initial value.
        explicit ClockSequence(std::uint16_t initial);

        ClockSequence(const ClockSequence&) = delete;
        ClockSequence& operator=(const ClockSequence&) = delete;

        // Returns the clock sequence to stamp on an id made from ticks and node.
        // The sequence is incremented when ticks did not move forward since the
        // last call or when the node changed. Once all 16384 values have been
        // handed out since the clock last advanced, ec is errc::provider_unavailable
        // and the state is left untouched until a later tick is observed.
        std::uint16_t next(std::uint64_t ticks, const Node& node, boost::system::error_code& ec);
        std::uint16_t current() const;

    private:
        mutable std::mutex mtx_;
        bool primed_;
        std::uint64_t last_ticks_;
        Node last_node_;
        std::uint16_t seq_;
        std::uint16_t advanced_seq_; // value of seq_ when the clock last moved forward.
    };
}
#endif
