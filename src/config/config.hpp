#ifndef UUIDLIB_CONFIG_HPP
#define UUIDLIB_CONFIG_HPP
#include "../codec/uuid-codec.hpp"
#include "../providers/clock-node.hpp"
#include "../providers/entropy.hpp"
#include <memory>

namespace UUID{
    enum class EntropySource
    {
        OS,
        PSEUDO
    };

    // Selects the text case and the provider implementations used by a program.
    struct Config
    {
        Case text_case = Case::LOWER;
        EntropySource entropy = EntropySource::OS;
        NodeFallback node_fallback = NodeFallback::FAIL;

        // Reads UUIDLIB_CASE (lower|upper), UUIDLIB_ENTROPY (os|pseudo) and
        // UUIDLIB_NODE_FALLBACK (fail|random). Unset variables keep the defaults,
        // unknown values are reported on stderr and ignored.
        static Config from_env();
    };

    std::unique_ptr<EntropyProvider> make_entropy_provider(const Config& config);
    std::unique_ptr<ClockNodeProvider> make_clock_node_provider(const Config& config);
}
#endif
