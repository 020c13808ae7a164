#include "uuid.hpp"
#include "uuid-tagging.hpp"
#include "../codec/uuid-codec.hpp"
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <stdexcept>

namespace UUID{
    /*UUID.Node POD*/
    bool operator==(const Node& lhs, const Node& rhs){
        return std::memcmp(lhs.bytes, rhs.bytes, Node::length) == 0;
    }

    bool operator!=(const Node& lhs, const Node& rhs){
        return !(lhs == rhs);
    }

    std::ostream& operator<<(std::ostream& os, const Node& node) {
        std::ios::fmtflags flags(os.flags());
        char fill = os.fill();
        for(std::size_t i=0; i < Node::length; ++i){
            os << std::setfill('0') << std::setw(2) << std::hex << static_cast<std::uint16_t>(node.bytes[i]);
        }
        os.fill(fill);
        os.flags(flags);
        return os;
    }

    /*UUID*/
    Uuid Uuid::from_slice(const unsigned char* data, std::size_t len){
        if(len != Uuid::size){
            throw std::length_error("uuid.cpp:from_slice:a uuid is exactly 16 bytes, got " + std::to_string(len));
        }
        bytes_type bytes{};
        std::memcpy(bytes.data(), data, Uuid::size);
        return Uuid(bytes);
    }

    Uuid Uuid::from_fields(std::uint32_t d1, std::uint16_t d2, std::uint16_t d3, const unsigned char (&d4)[8]){
        bytes_type bytes = {
            static_cast<unsigned char>(d1 >> 24),
            static_cast<unsigned char>(d1 >> 16),
            static_cast<unsigned char>(d1 >> 8),
            static_cast<unsigned char>(d1),
            static_cast<unsigned char>(d2 >> 8),
            static_cast<unsigned char>(d2),
            static_cast<unsigned char>(d3 >> 8),
            static_cast<unsigned char>(d3),
            d4[0], d4[1], d4[2], d4[3], d4[4], d4[5], d4[6], d4[7]
        };
        return Uuid(bytes);
    }

    std::uint32_t Uuid::time_low() const {
        return (static_cast<std::uint32_t>(bytes_[0]) << 24)
            | (static_cast<std::uint32_t>(bytes_[1]) << 16)
            | (static_cast<std::uint32_t>(bytes_[2]) << 8)
            | static_cast<std::uint32_t>(bytes_[3]);
    }
    std::uint16_t Uuid::time_mid() const {
        return static_cast<std::uint16_t>((bytes_[4] << 8) | bytes_[5]);
    }
    std::uint16_t Uuid::time_hi_and_version() const {
        return static_cast<std::uint16_t>((bytes_[6] << 8) | bytes_[7]);
    }
    unsigned char Uuid::clock_seq_hi_and_reserved() const {
        return bytes_[8];
    }
    unsigned char Uuid::clock_seq_low() const {
        return bytes_[9];
    }
    Node Uuid::node() const {
        Node tmp = {};
        std::memcpy(tmp.bytes, &bytes_[10], Node::length);
        return tmp;
    }

    std::uint16_t Uuid::clock_seq() const {
        return static_cast<std::uint16_t>(((clock_seq_hi_and_reserved() & 0x3F) << 8) | clock_seq_low());
    }

    std::uint64_t Uuid::timestamp() const {
        return (static_cast<std::uint64_t>(time_hi_and_version() & 0x0FFF) << 48)
            | (static_cast<std::uint64_t>(time_mid()) << 32)
            | static_cast<std::uint64_t>(time_low());
    }

    bool Uuid::is_nil() const {
        return std::all_of(bytes_.cbegin(), bytes_.cend(), [](unsigned char b){ return b == 0; });
    }

    Version Uuid::version() const {
        return static_cast<Version>(bytes_[6] >> 4);
    }

    bool Uuid::is_version(Version v) const {
        return version() == v;
    }

    Variant Uuid::variant() const {
        unsigned char v = bytes_[8];
        if((v & 0x80) == 0x00){
            return Variant::NCS;
        } else if((v & 0xC0) == 0x80){
            return Variant::RFC4122;
        } else if((v & 0xE0) == 0xC0){
            return Variant::MICROSOFT;
        }
        return Variant::FUTURE;
    }

    bool Uuid::is_variant() const {
        return variant() == Variant::RFC4122;
    }

    Uuid Uuid::with_version(Version v) const {
        bytes_type tmp(bytes_);
        tag_version(tmp, v);
        return Uuid(tmp);
    }

    Uuid Uuid::with_variant() const {
        bytes_type tmp(bytes_);
        tag_variant(tmp);
        return Uuid(tmp);
    }

    std::string Uuid::str() const {
        std::array<char, TEXT_LENGTH> text = encode(*this);
        return std::string(text.data(), text.size());
    }

    bool operator==(const Uuid& lhs, const Uuid& rhs){
        return lhs.bytes() == rhs.bytes();
    }

    bool operator!=(const Uuid& lhs, const Uuid& rhs){
        return !(lhs == rhs);
    }

    // Ordering is lexicographic over the network byte order representation,
    // which matches the ordering of the canonical text.
    bool operator<(const Uuid& lhs, const Uuid& rhs){
        return lhs.bytes() < rhs.bytes();
    }

    bool operator<=(const Uuid& lhs, const Uuid& rhs){
        return !(rhs < lhs);
    }

    bool operator>(const Uuid& lhs, const Uuid& rhs){
        return rhs < lhs;
    }

    bool operator>=(const Uuid& lhs, const Uuid& rhs){
        return !(lhs < rhs);
    }
}

namespace std{
    std::size_t hash<UUID::Uuid>::operator()(const UUID::Uuid& uuid) const noexcept {
        std::uint64_t hi = 0;
        std::uint64_t lo = 0;
        std::memcpy(&hi, uuid.data(), sizeof(hi));
        std::memcpy(&lo, uuid.data() + sizeof(hi), sizeof(lo));
        std::size_t h = std::hash<std::uint64_t>{}(hi);
        h ^= std::hash<std::uint64_t>{}(lo) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        return h;
    }
}
