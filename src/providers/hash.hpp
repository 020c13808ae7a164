#ifndef UUIDLIB_HASH_HPP
#define UUIDLIB_HASH_HPP
#include "../uuid/uuid.hpp"
#include <boost/asio/buffer.hpp>
#include <array>
#include <initializer_list>

namespace UUID{
    // A keyed hash used by the name based generators. digest() hashes the
    // concatenation of every buffer in input, so callers never have to build
    // namespace ++ name in a temporary.
    class HashProvider
    {
    public:
        constexpr static std::size_t max_digest_size = 20;
        using digest_type = std::array<unsigned char, max_digest_size>;

        virtual ~HashProvider() = default;

        // Number of meaningful leading bytes in the digest_type returned by digest().
        virtual std::size_t digest_size() const = 0;
        // The uuid version stamped onto ids derived from this hash.
        virtual Version version() const = 0;
        virtual digest_type digest(std::initializer_list<boost::asio::const_buffer> input) const = 0;
    };

    class Md5Hash: public HashProvider
    {
    public:
        std::size_t digest_size() const override { return 16; }
        Version version() const override { return Version::MD5; }
        digest_type digest(std::initializer_list<boost::asio::const_buffer> input) const override;
    };

    class Sha1Hash: public HashProvider
    {
    public:
        std::size_t digest_size() const override { return 20; }
        Version version() const override { return Version::SHA1; }
        digest_type digest(std::initializer_list<boost::asio::const_buffer> input) const override;
    };
}
#endif
