#include "hash.hpp"
#include <boost/uuid/detail/md5.hpp>
#include <boost/uuid/detail/sha1.hpp>
#include <cstring>
#include <type_traits>

namespace UUID{
    namespace {
        template<class Hasher>
        void process(Hasher& hasher, std::initializer_list<boost::asio::const_buffer> input){
            for(const boost::asio::const_buffer& buf: input){
                hasher.process_bytes(buf.data(), buf.size());
            }
        }

        // boost::uuids::detail hashers changed their digest_type between releases:
        //   up to Boost 1.85  unsigned int[4] (md5) / unsigned int[5] (sha1), where each
        //                     native word holds 4 digest bytes, most significant first.
        //   Boost 1.86 on     unsigned char[16] / unsigned char[20], digest bytes in order.
        // Both layouts are serialized to plain digest bytes here.
        template<class Digest>
        void copy_words(const Digest& digest, std::size_t len, HashProvider::digest_type& out){
            using element_type = std::remove_extent_t<Digest>;
            if constexpr (sizeof(element_type) == 1){
                std::memcpy(out.data(), digest, len);
            } else {
                for(std::size_t i=0; i < len; ++i){
                    out[i] = static_cast<unsigned char>(digest[i/4] >> (24 - (i%4)*8));
                }
            }
        }
    }

    HashProvider::digest_type Md5Hash::digest(std::initializer_list<boost::asio::const_buffer> input) const {
        boost::uuids::detail::md5 hasher;
        process(hasher, input);
        boost::uuids::detail::md5::digest_type digest;
        hasher.get_digest(digest);
        digest_type out{};
        copy_words(digest, digest_size(), out);
        return out;
    }

    HashProvider::digest_type Sha1Hash::digest(std::initializer_list<boost::asio::const_buffer> input) const {
        boost::uuids::detail::sha1 hasher;
        process(hasher, input);
        boost::uuids::detail::sha1::digest_type digest;
        hasher.get_digest(digest);
        digest_type out{};
        copy_words(digest, digest_size(), out);
        return out;
    }
}
