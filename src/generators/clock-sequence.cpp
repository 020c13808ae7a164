#include "clock-sequence.hpp"
#include "../uuid/uuid-errors.hpp"
#include <iostream>
#include <random>

namespace UUID{
    ClockSequence::ClockSequence()
      : ClockSequence(static_cast<std::uint16_t>(std::random_device{}()))
    {}

    ClockSequence::ClockSequence(std::uint16_t initial)
      : mtx_{},
        primed_{false},
        last_ticks_{0},
        last_node_{},
        seq_{static_cast<std::uint16_t>(initial & mask)},
        advanced_seq_{seq_}
    {}

    std::uint16_t ClockSequence::next(std::uint64_t ticks, const Node& node, boost::system::error_code& ec){
        ec.clear();
        std::lock_guard<std::mutex> lk(mtx_);
        if(!primed_ || ticks > last_ticks_){
            advanced_seq_ = seq_;
        }
        if(primed_ && (ticks <= last_ticks_ || node != last_node_)){
            std::uint16_t seq = static_cast<std::uint16_t>((seq_ + 1) & mask);
            if(seq == advanced_seq_){
                std::cerr << "clock-sequence.cpp:clock sequence exhausted at tick " << last_ticks_ << "." << std::endl;
                ec = make_error_code(errc::provider_unavailable);
                return 0;
            }
            seq_ = seq;
        }
        primed_ = true;
        last_ticks_ = ticks;
        last_node_ = node;
        return seq_;
    }

    std::uint16_t ClockSequence::current() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return seq_;
    }
}
