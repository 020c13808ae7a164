#ifndef UUIDLIB_ENTROPY_HPP
#define UUIDLIB_ENTROPY_HPP
#include "../uuid/uuid.hpp"
#include <boost/system/error_code.hpp>
#include <cstdint>
#include <mutex>
#include <random>

namespace UUID{
    class EntropyProvider
    {
    public:
        virtual ~EntropyProvider() = default;
        // Fills every byte of buf. On failure ec is set and the contents of buf are unspecified.
        virtual void fill_random(Uuid::bytes_type& buf, boost::system::error_code& ec) = 0;
    };

    // Cryptographically secure bytes from getrandom(2).
    class OsEntropy: public EntropyProvider
    {
    public:
        void fill_random(Uuid::bytes_type& buf, boost::system::error_code& ec) override;
    };

    // Predictable but well distributed bytes. Two instances built from the same
    // seed produce the same sequence. Safe to share between threads, never fails.
    class PseudoEntropy: public EntropyProvider
    {
    public:
        PseudoEntropy(); // seeded from the wall clock.
        explicit PseudoEntropy(std::uint64_t seed);

        void fill_random(Uuid::bytes_type& buf, boost::system::error_code& ec) override;

    private:
        std::mutex mtx_;
        std::mt19937_64 gen_;
    };
}
#endif
