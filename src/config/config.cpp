#include "config.hpp"
#include <cstdlib>
#include <iostream>
#include <string_view>

namespace UUID{
    Config Config::from_env(){
        Config config;
        const char* text_case = getenv("UUIDLIB_CASE");
        if(text_case != nullptr){
            std::string_view value(text_case);
            if(value == "lower"){
                config.text_case = Case::LOWER;
            } else if(value == "upper"){
                config.text_case = Case::UPPER;
            } else {
                std::cerr << "config.cpp:UUIDLIB_CASE must be lower or upper, ignoring:" << value << std::endl;
            }
        }
        const char* entropy = getenv("UUIDLIB_ENTROPY");
        if(entropy != nullptr){
            std::string_view value(entropy);
            if(value == "os"){
                config.entropy = EntropySource::OS;
            } else if(value == "pseudo"){
                config.entropy = EntropySource::PSEUDO;
            } else {
                std::cerr << "config.cpp:UUIDLIB_ENTROPY must be os or pseudo, ignoring:" << value << std::endl;
            }
        }
        const char* fallback = getenv("UUIDLIB_NODE_FALLBACK");
        if(fallback != nullptr){
            std::string_view value(fallback);
            if(value == "fail"){
                config.node_fallback = NodeFallback::FAIL;
            } else if(value == "random"){
                config.node_fallback = NodeFallback::RANDOM;
            } else {
                std::cerr << "config.cpp:UUIDLIB_NODE_FALLBACK must be fail or random, ignoring:" << value << std::endl;
            }
        }
        return config;
    }

    std::unique_ptr<EntropyProvider> make_entropy_provider(const Config& config){
        switch(config.entropy)
        {
            case EntropySource::PSEUDO:
                return std::make_unique<PseudoEntropy>();
            case EntropySource::OS:
            default:
                return std::make_unique<OsEntropy>();
        }
    }

    std::unique_ptr<ClockNodeProvider> make_clock_node_provider(const Config& config){
        return std::make_unique<SystemClockNodeProvider>(config.node_fallback);
    }
}
