#include "generators.hpp"
#include "../uuid/uuid-tagging.hpp"
#include "../uuid/uuid-errors.hpp"
#include <boost/system/system_error.hpp>
#include <cstring>
#include <stdexcept>

namespace UUID{
    Uuid make_v1(std::uint64_t ticks, std::uint16_t clock_seq, const Node& node){
        std::uint32_t time_low = static_cast<std::uint32_t>(ticks & 0xFFFFFFFF);
        std::uint16_t time_mid = static_cast<std::uint16_t>((ticks >> 32) & 0xFFFF);
        std::uint16_t time_hi = static_cast<std::uint16_t>((ticks >> 48) & 0x0FFF);
        Uuid::bytes_type bytes = {
            static_cast<unsigned char>(time_low >> 24),
            static_cast<unsigned char>(time_low >> 16),
            static_cast<unsigned char>(time_low >> 8),
            static_cast<unsigned char>(time_low),
            static_cast<unsigned char>(time_mid >> 8),
            static_cast<unsigned char>(time_mid),
            static_cast<unsigned char>(time_hi >> 8),
            static_cast<unsigned char>(time_hi),
            static_cast<unsigned char>((clock_seq & ClockSequence::mask) >> 8),
            static_cast<unsigned char>(clock_seq & 0xFF),
            node.bytes[0], node.bytes[1], node.bytes[2], node.bytes[3], node.bytes[4], node.bytes[5]
        };
        tag(bytes, Version::MAC);
        return Uuid(bytes);
    }

    Uuid make_v1(const Timestamp& ts, const Node& node){
        return make_v1(ts.ticks, ts.counter, node);
    }

    TimeGenerator::TimeGenerator(ClockNodeProvider& provider, ClockSequence& sequence)
      : provider_(provider),
        sequence_(sequence)
    {}

    Uuid TimeGenerator::operator()(boost::system::error_code& ec){
        Node node = provider_.node_id(ec);
        if(ec){
            return Uuid();
        }
        std::uint64_t ticks = provider_.now_100ns_intervals(ec);
        if(ec){
            return Uuid();
        }
        std::uint16_t clock_seq = sequence_.next(ticks, node, ec);
        if(ec){
            return Uuid();
        }
        return make_v1(ticks, clock_seq, node);
    }

    Uuid TimeGenerator::operator()(){
        boost::system::error_code ec;
        Uuid uuid = (*this)(ec);
        if(ec){
            throw boost::system::system_error(ec, "generators.cpp:TimeGenerator");
        }
        return uuid;
    }

    Uuid generate_name_based(const HashProvider& hash, const Uuid& ns, const unsigned char* name, std::size_t len){
        if(hash.digest_size() < Uuid::size){
            throw std::invalid_argument("generators.cpp:generate_name_based:digest is shorter than a uuid.");
        }
        HashProvider::digest_type digest = hash.digest({
            boost::asio::buffer(ns.data(), Uuid::size),
            boost::asio::buffer(name, len)
        });
        Uuid::bytes_type bytes{};
        std::memcpy(bytes.data(), digest.data(), Uuid::size);
        tag(bytes, hash.version());
        return Uuid(bytes);
    }

    Uuid generate_name_based(const HashProvider& hash, const Uuid& ns, std::string_view name){
        return generate_name_based(hash, ns, reinterpret_cast<const unsigned char*>(name.data()), name.size());
    }

    Uuid generate_v3(const Uuid& ns, std::string_view name){
        return generate_name_based(Md5Hash(), ns, name);
    }

    Uuid generate_v5(const Uuid& ns, std::string_view name){
        return generate_name_based(Sha1Hash(), ns, name);
    }

    Uuid generate_v4(EntropyProvider& entropy, boost::system::error_code& ec){
        Uuid::bytes_type bytes{};
        entropy.fill_random(bytes, ec);
        if(ec){
            return Uuid();
        }
        tag(bytes, Version::RANDOM);
        return Uuid(bytes);
    }

    Uuid generate_v4(EntropyProvider& entropy){
        boost::system::error_code ec;
        Uuid uuid = generate_v4(entropy, ec);
        if(ec){
            throw boost::system::system_error(ec, "generators.cpp:generate_v4");
        }
        return uuid;
    }
}
