#include "generators-tests.hpp"
#include "../../src/codec/uuid-codec.hpp"
#include "../../src/uuid/uuid-errors.hpp"
#include <boost/system/system_error.hpp>
#include <iostream>
#include <set>
#include <thread>

namespace tests{
    namespace {
        const UUID::Node MAC = {{1, 2, 3, 4, 5, 6}};

        bool is_tagged(const UUID::Uuid& uuid, UUID::Version v){
            return uuid.is_version(v) && uuid.is_variant();
        }
    }

    ScriptedClockNode::ScriptedClockNode(std::vector<std::uint64_t> ticks, UUID::Node node)
      : mtx_{},
        ticks_(std::move(ticks)),
        next_{0},
        node_(node),
        clock_fails_{false},
        node_fails_{false}
    {}

    std::uint64_t ScriptedClockNode::now_100ns_intervals(boost::system::error_code& ec){
        ec.clear();
        if(clock_fails_){
            ec = UUID::make_error_code(UUID::errc::provider_unavailable);
            return 0;
        }
        std::lock_guard<std::mutex> lk(mtx_);
        // Once the script runs out the clock stops advancing.
        std::uint64_t ticks = ticks_[next_];
        if(next_ + 1 < ticks_.size()){
            ++next_;
        }
        return ticks;
    }

    UUID::Node ScriptedClockNode::node_id(boost::system::error_code& ec){
        ec.clear();
        if(node_fails_){
            ec = UUID::make_error_code(UUID::errc::provider_unavailable);
            return UUID::Node{};
        }
        return node_;
    }

    GeneratorsTests::GeneratorsTests(PackV1)
      : passed_{false},
        uuid_()
    {
        UUID::Timestamp ts = UUID::Timestamp::from_unix(1496854535, 812946000);
        uuid_ = UUID::make_v1(ts, MAC);
        if(!is_tagged(uuid_, UUID::Version::MAC) || uuid_.is_version(UUID::Version::SHA1)){
            return;
        }
        if(uuid_.str() != "20616934-4ba2-11e7-8000-010203040506"){
            return;
        }
        UUID::Uuid next = UUID::make_v1(ts.with_counter(1), MAC);
        if(next.str() != "20616934-4ba2-11e7-8001-010203040506"){
            return;
        }
        if(uuid_.timestamp() != ts.ticks || next.clock_seq() != 1 || next.node() != MAC){
            return;
        }
        // Only the low 14 bits of the clock sequence are kept.
        UUID::Uuid wrapped = UUID::make_v1(ts.ticks, 0xFFFF, MAC);
        if(wrapped.clock_seq() != 0x3FFF || !wrapped.is_variant()){
            return;
        }
        passed_ = true;
    }

    GeneratorsTests::GeneratorsTests(ClockRegression)
      : passed_{false},
        uuid_()
    {
        ScriptedClockNode clock({1000, 2000, 1500, 1500, 3000, 4000}, MAC);
        UUID::ClockSequence sequence(7);
        UUID::TimeGenerator generate(clock, sequence);

        UUID::Uuid a = generate();       // 1000
        UUID::Uuid b = generate();       // 2000, clock moved forward
        UUID::Uuid c = generate();       // 1500, clock moved backward
        UUID::Uuid d = generate();       // 1500, clock did not advance
        if(a.clock_seq() != 7 || b.clock_seq() != 7 || c.clock_seq() != 8 || d.clock_seq() != 9){
            return;
        }
        if(a.timestamp() != 1000 || b.timestamp() != 2000 || c.timestamp() != 1500){
            return;
        }
        const UUID::Node other = {{0xaa, 0xbb, 0xcc, 0xdd, 0xee, 0xff}};
        clock.set_node(other);
        UUID::Uuid e = generate();       // 3000, node changed
        if(e.clock_seq() != 10 || e.node() != other){
            return;
        }
        UUID::Uuid f = generate();       // 4000
        if(f.clock_seq() != 10 || sequence.current() != 10){
            return;
        }
        std::set<UUID::Uuid> unique = {a, b, c, d, e, f};
        if(unique.size() != 6){
            return;
        }
        // The counter wraps within 14 bits.
        UUID::ClockSequence top(0x3FFF);
        boost::system::error_code ec;
        top.next(10, MAC, ec);
        if(ec || top.next(10, MAC, ec) != 0 || ec){
            return;
        }
        passed_ = true;
    }

    GeneratorsTests::GeneratorsTests(ClockExhaustion)
      : passed_{false},
        uuid_()
    {
        ScriptedClockNode stuck({1000}, MAC);
        UUID::ClockSequence sequence(0);
        UUID::TimeGenerator generate(stuck, sequence);
        boost::system::error_code ec;
        // Every 14 bit value can be used once within a single tick.
        std::set<UUID::Uuid> unique;
        for(std::size_t i=0; i <= UUID::ClockSequence::mask; ++i){
            uuid_ = generate(ec);
            if(ec){
                std::cerr << "generators-tests.cpp:clock sequence failed early at " << i << std::endl;
                return;
            }
            unique.insert(uuid_);
        }
        if(unique.size() != UUID::ClockSequence::mask + 1u || sequence.current() != UUID::ClockSequence::mask){
            return;
        }
        // The next id would repeat the first one.
        uuid_ = generate(ec);
        if(ec != UUID::errc::provider_unavailable || !uuid_.is_nil() || sequence.current() != UUID::ClockSequence::mask){
            return;
        }
        try{
            generate();
            return;
        } catch(boost::system::system_error& e){
            if(e.code() != UUID::errc::provider_unavailable){
                return;
            }
        }
        // Generation resumes once the clock moves forward.
        ScriptedClockNode later({2000}, MAC);
        UUID::TimeGenerator resumed(later, sequence);
        uuid_ = resumed(ec);
        if(ec || uuid_.timestamp() != 2000 || uuid_.clock_seq() != UUID::ClockSequence::mask || unique.count(uuid_) != 0){
            return;
        }
        uuid_ = resumed(ec);
        if(ec || uuid_.clock_seq() != 0 || unique.count(uuid_) != 0){
            return;
        }
        passed_ = true;
    }

    GeneratorsTests::GeneratorsTests(ConcurrentV1)
      : passed_{false},
        uuid_()
    {
        // The clock never advances, so uniqueness rests on the clock sequence alone.
        ScriptedClockNode clock({0x1E74BA22061A934ULL}, MAC);
        UUID::ClockSequence sequence(0);
        UUID::TimeGenerator generate(clock, sequence);
        const std::size_t num_threads = 8;
        const std::size_t per_thread = 1000;
        std::vector<std::vector<UUID::Uuid> > results(num_threads);
        std::vector<std::thread> threads;
        for(std::size_t t=0; t < num_threads; ++t){
            threads.emplace_back([&, t](){
                for(std::size_t i=0; i < per_thread; ++i){
                    results[t].push_back(generate());
                }
            });
        }
        for(std::thread& thread: threads){
            thread.join();
        }
        std::set<UUID::Uuid> unique;
        for(const std::vector<UUID::Uuid>& result: results){
            for(const UUID::Uuid& uuid: result){
                if(!is_tagged(uuid, UUID::Version::MAC)){
                    return;
                }
                unique.insert(uuid);
            }
        }
        if(unique.size() != num_threads*per_thread){
            std::cerr << "generators-tests.cpp:" << (num_threads*per_thread - unique.size()) << " duplicate v1 uuids." << std::endl;
            return;
        }
        passed_ = true;
    }

    GeneratorsTests::GeneratorsTests(ProviderUnavailable)
      : passed_{false},
        uuid_()
    {
        ScriptedClockNode clock({1000}, MAC);
        UUID::ClockSequence sequence(0);
        UUID::TimeGenerator generate(clock, sequence);
        boost::system::error_code ec;

        clock.fail_node(true);
        uuid_ = generate(ec);
        if(ec != UUID::errc::provider_unavailable){
            return;
        }
        clock.fail_node(false);
        clock.fail_clock(true);
        uuid_ = generate(ec);
        if(ec != UUID::errc::provider_unavailable){
            return;
        }
        try{
            generate();
            return;
        } catch(boost::system::system_error& e){
            if(e.code() != UUID::errc::provider_unavailable){
                return;
            }
        }
        clock.fail_clock(false);
        uuid_ = generate(ec);
        if(ec || !is_tagged(uuid_, UUID::Version::MAC)){
            return;
        }
        passed_ = true;
    }

    GeneratorsTests::GeneratorsTests(NameBasedV3)
      : passed_{false},
        uuid_()
    {
        struct { UUID::Uuid ns; const char* name; const char* expected; } cases[] = {
            {UUID::NAMESPACE_DNS, "example.org", "04738bdf-b25a-3829-a801-b21a1d25095b"},
            {UUID::NAMESPACE_DNS, "rust-lang.org", "c6db027c-615c-3b4d-959e-1a917747ca5a"},
            {UUID::NAMESPACE_URL, "rust-lang.org", "7ed45aaf-e75b-3130-8e33-ee4d9253b19f"},
            {UUID::NAMESPACE_OID, "rust-lang.org", "6506a0ec-4d79-3e18-8c2b-f2b6b34f2b6d"},
            {UUID::NAMESPACE_X500, "rust-lang.org", "bcee7a9c-52f1-30c6-a3cc-8c72ba634990"},
            {UUID::NAMESPACE_DNS, "python.org", "6fa459ea-ee8a-3ca4-894e-db77e160355e"}
        };
        for(const auto& c: cases){
            uuid_ = UUID::generate_v3(c.ns, c.name);
            if(!is_tagged(uuid_, UUID::Version::MD5) || uuid_.str() != c.expected){
                std::cerr << "generators-tests.cpp:v3 " << c.name << " gave " << uuid_ << std::endl;
                return;
            }
            // Same inputs, same id.
            if(UUID::generate_v3(c.ns, c.name) != uuid_){
                return;
            }
        }
        UUID::Md5Hash md5;
        if(UUID::generate_name_based(md5, UUID::NAMESPACE_DNS, "example.org") != UUID::generate_v3(UUID::NAMESPACE_DNS, "example.org")){
            return;
        }
        passed_ = true;
    }

    GeneratorsTests::GeneratorsTests(NameBasedV5)
      : passed_{false},
        uuid_()
    {
        struct { UUID::Uuid ns; const char* name; const char* expected; } cases[] = {
            {UUID::NAMESPACE_DNS, "example.com", "cfbff0d1-9375-5685-968c-48ce8b15ae17"},
            {UUID::NAMESPACE_DNS, "example.org", "aad03681-8b63-5304-89e0-8ca8f49461b5"},
            {UUID::NAMESPACE_DNS, "rust-lang.org", "c66bbb60-d62e-5f17-a399-3a0bd237c503"},
            {UUID::NAMESPACE_URL, "rust-lang.org", "c48d927f-4122-5413-968c-598b1780e749"},
            {UUID::NAMESPACE_OID, "rust-lang.org", "8ef61ecb-977a-5844-ab0f-c25ef9b8d5d6"},
            {UUID::NAMESPACE_X500, "rust-lang.org", "26c9c3e9-49b7-56da-8b9f-a0fb916a71a3"},
            {UUID::NAMESPACE_DNS, "python.org", "886313e1-3b8a-5372-9b90-0c9aee199e5d"}
        };
        for(const auto& c: cases){
            uuid_ = UUID::generate_v5(c.ns, c.name);
            if(!is_tagged(uuid_, UUID::Version::SHA1) || uuid_.str() != c.expected){
                std::cerr << "generators-tests.cpp:v5 " << c.name << " gave " << uuid_ << std::endl;
                return;
            }
            if(UUID::generate_v5(c.ns, c.name) != uuid_){
                return;
            }
        }
        // The namespace takes part in the hash.
        if(UUID::generate_v5(UUID::NAMESPACE_DNS, "") == UUID::generate_v5(UUID::NAMESPACE_URL, "")){
            return;
        }
        passed_ = true;
    }

    GeneratorsTests::GeneratorsTests(RandomV4)
      : passed_{false},
        uuid_()
    {
        UUID::OsEntropy os;
        uuid_ = UUID::generate_v4(os);
        UUID::Uuid other = UUID::generate_v4(os);
        if(!is_tagged(uuid_, UUID::Version::RANDOM) || !is_tagged(other, UUID::Version::RANDOM) || uuid_ == other){
            return;
        }
        // Pseudo random ids repeat for a repeated seed and never repeat within a sequence.
        UUID::PseudoEntropy first(9);
        UUID::PseudoEntropy second(9);
        std::set<UUID::Uuid> seen;
        for(int i=0; i < 100; ++i){
            UUID::Uuid a = UUID::generate_v4(first);
            UUID::Uuid b = UUID::generate_v4(second);
            if(a != b || !is_tagged(a, UUID::Version::RANDOM)){
                return;
            }
            seen.insert(a);
        }
        if(seen.size() != 100){
            return;
        }
        UUID::PseudoEntropy clock_seeded;
        if(!is_tagged(UUID::generate_v4(clock_seeded), UUID::Version::RANDOM)){
            return;
        }
        passed_ = true;
    }

    GeneratorsTests::GeneratorsTests(SystemV1)
      : passed_{false},
        uuid_()
    {
        UUID::SystemClockNodeProvider provider(UUID::NodeFallback::RANDOM);
        UUID::ClockSequence sequence;
        UUID::TimeGenerator generate(provider, sequence);
        boost::system::error_code ec;
        uuid_ = generate(ec);
        if(ec){
            std::cerr << "generators-tests.cpp:system v1 failed:" << ec.message() << std::endl;
            return;
        }
        UUID::Uuid after = generate(ec);
        if(ec || after == uuid_ || !is_tagged(after, UUID::Version::MAC)){
            return;
        }
        // Both ids come from the same cached node.
        if(after.node() != uuid_.node()){
            return;
        }
        // 2017-01-01 in 100ns intervals since 1582-10-15.
        if(uuid_.timestamp() < UUID::Timestamp::from_unix(1483228800, 0).ticks){
            return;
        }
        passed_ = true;
    }
}
