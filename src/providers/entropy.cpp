#include "entropy.hpp"
#include "../uuid/uuid-errors.hpp"
#include <sys/random.h>
#include <cerrno>
#include <chrono>
#include <iostream>
#include <system_error>

namespace UUID{
    void OsEntropy::fill_random(Uuid::bytes_type& buf, boost::system::error_code& ec){
        ec.clear();
        std::size_t filled = 0;
        // getrandom() may return less than requested, or be interrupted by a signal
        // before any bytes are copied. Both cases are retried, everything else is fatal.
        while(filled < buf.size()){
            ssize_t length = getrandom(buf.data() + filled, buf.size() - filled, 0);
            if(length == -1){
                if(errno == EINTR){
                    continue;
                }
                std::cerr << "entropy.cpp:getrandom failed:" << std::make_error_code(std::errc(errno)).message() << std::endl;
                ec = make_error_code(errc::entropy_unavailable);
                return;
            }
            filled += static_cast<std::size_t>(length);
        }
    }

    PseudoEntropy::PseudoEntropy()
      : gen_(static_cast<std::uint64_t>(std::chrono::system_clock::now().time_since_epoch().count()))
    {}

    PseudoEntropy::PseudoEntropy(std::uint64_t seed)
      : gen_(seed)
    {}

    void PseudoEntropy::fill_random(Uuid::bytes_type& buf, boost::system::error_code& ec){
        ec.clear();
        std::uint64_t words[2] = {};
        {
            std::lock_guard<std::mutex> lk(mtx_);
            words[0] = gen_();
            words[1] = gen_();
        }
        for(std::size_t i=0; i < buf.size(); ++i){
            buf[i] = static_cast<unsigned char>(words[i/8] >> ((i%8)*8));
        }
    }
}
