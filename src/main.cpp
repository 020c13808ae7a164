#include "config/config.hpp"
#include "codec/uuid-codec.hpp"
#include "generators/generators.hpp"
#include "json/uuid-json.hpp"
#include <boost/system/system_error.hpp>
#include <unistd.h>
#include <array>
#include <charconv>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string_view>
#include <system_error>

static void usage(){
    std::cerr << "Usage: uuidgen [-v 1|3|4|5] [-n namespace] [-s name] [-c count] [-u] [-r] [-S] [-j]" << std::endl;
    exit(EXIT_FAILURE);
}

static UUID::Uuid parse_namespace(std::string_view ns){
    if(ns == "dns"){
        return UUID::NAMESPACE_DNS;
    } else if(ns == "url"){
        return UUID::NAMESPACE_URL;
    } else if(ns == "oid"){
        return UUID::NAMESPACE_OID;
    } else if(ns == "x500"){
        return UUID::NAMESPACE_X500;
    }
    boost::system::error_code ec;
    std::size_t pos = 0;
    UUID::Uuid uuid = UUID::decode(ns, ec, pos);
    if(ec){
        std::cerr << "main.cpp:namespace " << ns << " is not a uuid:" << ec.message() << " at position " << pos << std::endl;
        exit(EXIT_FAILURE);
    }
    return uuid;
}

int main(int argc, char* argv[])
{
    UUID::Config config = UUID::Config::from_env();
    int opt;
    int version = 4;
    std::size_t count = 1;
    const char* ns = nullptr;
    const char* name = nullptr;
    bool simple = false;
    bool json = false;
    while((opt = getopt(argc, argv, "v:n:s:c:urSj")) != -1){
        switch(opt)
        {
            case 'v':
            {
                std::string_view arg(optarg);
                std::from_chars_result res = std::from_chars(arg.data(), arg.data()+arg.size(), version, 10);
                if(res.ec != std::errc() || res.ptr != arg.data()+arg.size()){
                    usage();
                }
                break;
            }
            case 'n':
                ns = optarg;
                break;
            case 's':
                name = optarg;
                break;
            case 'c':
            {
                std::string_view arg(optarg);
                std::from_chars_result res = std::from_chars(arg.data(), arg.data()+arg.size(), count, 10);
                if(res.ec != std::errc() || res.ptr != arg.data()+arg.size()){
                    usage();
                }
                break;
            }
            case 'u':
                config.text_case = UUID::Case::UPPER;
                break;
            case 'r':
                config.entropy = UUID::EntropySource::PSEUDO;
                break;
            case 'S':
                simple = true;
                break;
            case 'j':
                json = true;
                break;
            default:
                usage();
        }
    }
    if((version == 3 || version == 5) && (ns == nullptr || name == nullptr)){
        std::cerr << "main.cpp:versions 3 and 5 need a namespace (-n) and a name (-s)." << std::endl;
        usage();
    }

    std::unique_ptr<UUID::EntropyProvider> entropy = UUID::make_entropy_provider(config);
    std::unique_ptr<UUID::ClockNodeProvider> clock = UUID::make_clock_node_provider(config);
    UUID::ClockSequence sequence;
    UUID::TimeGenerator time_generator(*clock, sequence);

    boost::json::array ja;
    for(std::size_t i=0; i < count; ++i){
        UUID::Uuid uuid;
        try{
            switch(version)
            {
                case 1:
                    uuid = time_generator();
                    break;
                case 3:
                    uuid = UUID::generate_v3(parse_namespace(ns), name);
                    break;
                case 4:
                    uuid = UUID::generate_v4(*entropy);
                    break;
                case 5:
                    uuid = UUID::generate_v5(parse_namespace(ns), name);
                    break;
                default:
                    std::cerr << "main.cpp:unsupported uuid version " << version << std::endl;
                    usage();
            }
        } catch(boost::system::system_error& e){
            std::cerr << "main.cpp:uuid generation failed:" << e.what() << std::endl;
            return EXIT_FAILURE;
        }
        if(json){
            ja.push_back(boost::json::value_from(uuid));
        } else if(simple){
            std::array<char, UUID::SIMPLE_TEXT_LENGTH> text = UUID::encode_simple(uuid, config.text_case);
            std::cout.write(text.data(), text.size()) << '\n';
        } else {
            std::array<char, UUID::TEXT_LENGTH> text = UUID::encode(uuid, config.text_case);
            std::cout.write(text.data(), text.size()) << '\n';
        }
    }
    if(json){
        std::cout << boost::json::serialize(ja) << std::endl;
    }
    return 0;
}
