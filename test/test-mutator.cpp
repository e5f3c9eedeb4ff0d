#include "JsonMutator.hpp"
#include "emit.hpp"
#include "test-util.hpp"

#include <catch2/catch.hpp>

#include <array>
#include <functional>
#include <numeric>
#include <stdexcept>
#include <string_view>

using namespace JsonMut;

static std::optional<Bytes> throwingOp(const Bytes &, const Bytes &, size_t,
                                       std::mt19937 &)
{
    throw std::runtime_error("operator failure");
}

static std::optional<Bytes> throwingIntOp(const Bytes &, const Bytes &,
                                          size_t, std::mt19937 &)
{
    throw 42;
}

// fails before any operator runs
class BrokenMutator : public JsonMutator {
  public:
    explicit BrokenMutator(const MutatorConfig &config, bool standard)
        : JsonMutator(config), standard_(standard) {}

  protected:
    Bytes mutateOnce(const Bytes &, const Bytes &, size_t) override
    {
        if (standard_)
            throw std::runtime_error("scheduler state corrupted");
        throw "not a std::exception";
    }

  private:
    bool standard_;
};

static MutatorConfig seeded(uint32_t seed)
{
    MutatorConfig config;
    config.seed = seed;
    return config;
}


TEST_CASE( "Throwing operators yield the clipped seed" )
{
    static constexpr std::array<OperatorEntry, 2> failing = {
        OperatorEntry{OpIndex::Identity, "boom-0", throwingOp},
        OperatorEntry{OpIndex::BoolFlip, "boom-1", throwingOp},
    };
    JsonMutator mutator(seeded(1), failing);

    const Bytes seed = B("{\"abcdefghij\":12345}");
    for (int i = 0; i < 20; ++i) {
        Bytes out;
        REQUIRE_NOTHROW( out = mutator.mutate(seed, {}, 10) );
        REQUIRE( out == clip(seed, 10) );
    }
    REQUIRE( mutator.placeholders() == 0 );
    REQUIRE( mutator.trials() == 20 );
}


TEST_CASE( "Non-standard exceptions from operators yield the clipped seed" )
{
    static constexpr std::array<OperatorEntry, 2> failing = {
        OperatorEntry{OpIndex::Identity, "int-0", throwingIntOp},
        OperatorEntry{OpIndex::BoolFlip, "int-1", throwingIntOp},
    };
    JsonMutator mutator(seeded(8), failing);

    const Bytes seed = B("{\"x\":1}");
    for (size_t maxSize : {0, 3, 64}) {
        Bytes out;
        REQUIRE_NOTHROW( out = mutator.mutate(seed, {}, maxSize) );
        REQUIRE( out == clip(seed, maxSize) );
    }
    REQUIRE( mutator.placeholders() == 0 );

    std::mt19937 rng(8);
    REQUIRE( applyOperator(failing[0], seed, {}, 4, rng) == clip(seed, 4) );
}


TEST_CASE( "Failures outside the operators yield the placeholder" )
{
    const Bytes seed = B("[1,2,3]");
    for (bool standard : {true, false}) {
        BrokenMutator mutator(seeded(9), standard);
        for (size_t maxSize : {0, 1, 2, 64}) {
            const uint64_t before = mutator.placeholders();
            Bytes out;
            REQUIRE_NOTHROW( out = mutator.mutate(seed, seed, maxSize) );
            REQUIRE( out == placeholder(maxSize) );
            REQUIRE( mutator.placeholders() == before + 1 );
        }
        REQUIRE( S(mutator.mutate(seed, seed, 64)) == "{}" );
        REQUIRE( mutator.trials() == 5 );
    }
}


TEST_CASE( "Output never exceeds max_size" )
{
    JsonMutator mutator(seeded(2));
    // start in phase C so every operator runs
    mutator.curriculum().parseOk = 1000;
    mutator.curriculum().parseAll = 1000;

    const std::vector<Bytes> seeds = {
        B("{\"a\":[1,2,{\"b\":true}],\"c\":\"str\"}"),
        B("[1,2,3]"),
        Bytes{0xff, 0x00, 0x80},
        Bytes{},
        B("{\"a\":"),
    };
    for (size_t maxSize : {0, 1, 5, 32, 4096}) {
        for (int i = 0; i < 200; ++i) {
            const Bytes &seed = seeds[i % seeds.size()];
            const Bytes &aux = seeds[(i + 1) % seeds.size()];
            REQUIRE( mutator.mutate(seed, aux, maxSize).size() <= maxSize );
        }
    }
}


TEST_CASE( "Every trial is counted and attributed" )
{
    JsonMutator mutator(seeded(3));
    REQUIRE_FALSE( mutator.lastOperator().has_value() );
    REQUIRE( mutator.describeLast() == "jsonmut" );

    const Bytes seed = B("{\"on\":true}");
    for (int i = 0; i < 25; ++i)
        mutator.mutate(seed, seed, 1024);

    REQUIRE( mutator.trials() == 25 );
    REQUIRE( mutator.curriculum().parseAll == 25 );
    const auto &picks = mutator.pickCounts();
    REQUIRE( std::accumulate(picks.begin(), picks.end(), uint64_t{0}) == 25 );

    REQUIRE( mutator.lastOperator().has_value() );
    const size_t op = *mutator.lastOperator();
    REQUIRE( mutator.describeLast() ==
             "jsonmut-" + std::string(mutator.registry()[op].name) );

    mutator.rewardLast(0.0, false, true);
    REQUIRE( mutator.scheduler().score(op) > 0.0 );
}


TEST_CASE( "Valid seeds walk the curriculum up to phase C" )
{
    JsonMutator mutator(seeded(4));
    const Bytes seed = B("{\"a\":true,\"b\":[false,1]}");

    // phase A operators keep this seed valid
    mutator.mutate(seed, seed, 4096);
    REQUIRE( mutator.curriculum().rate() == 1.0 );
    REQUIRE( mutator.curriculum().computedPhase() == Phase::C );

    for (int i = 0; i < 200; ++i)
        mutator.mutate(seed, seed, 4096);
    const auto &picks = mutator.pickCounts();
    REQUIRE( std::accumulate(picks.begin() + 3, picks.end(), uint64_t{0}) >
             0 );
}


TEST_CASE( "Cold mutator only uses phase A operators" )
{
    JsonMutator mutator(seeded(5));
    const Bytes broken = B("{{{");
    for (int i = 0; i < 50; ++i)
        mutator.mutate(broken, broken, 64);

    REQUIRE( mutator.curriculum().computedPhase() == Phase::A );
    const auto &picks = mutator.pickCounts();
    REQUIRE( picks[0] + picks[1] == 50 );
}


TEST_CASE( "Same seed, same outputs" )
{
    JsonMutator first(seeded(6));
    JsonMutator second(seeded(6));
    const Bytes seed = B("{\"n\":1,\"t\":true,\"s\":\"x\"}");
    for (int i = 0; i < 100; ++i)
        REQUIRE( first.mutate(seed, seed, 512) ==
                 second.mutate(seed, seed, 512) );
}


TEST_CASE( "Empty registry passes the seed through" )
{
    JsonMutator mutator(seeded(7), OperatorRegistry{});
    REQUIRE( S(mutator.mutate(B("[1,2]"), {}, 3)) == "[1," );
    REQUIRE_FALSE( mutator.lastOperator().has_value() );
}


TEST_CASE( "Seed directory is loaded in path order" )
{
    TempDir dir;
    writeFile(dir.file("b.json"), "[2]");
    writeFile(dir.file("a.json"), "[1]");
    fs::create_directories(dir.path / "sub");

    auto seeds = loadSeeds(dir.path.string());
    REQUIRE( seeds.size() == 2 );
    REQUIRE( S(seeds[0]) == "[1]" );
    REQUIRE( S(seeds[1]) == "[2]" );

    REQUIRE( loadSeeds(dir.file("missing")).empty() );
}


TEST_CASE( "Output hash keys on the bytes" )
{
    const Bytes a = B("{\"k\":[1,2,3]}");
    REQUIRE( outputHash(a) == outputHash(B("{\"k\":[1,2,3]}")) );
    REQUIRE( outputHash(a) ==
             std::hash<std::string_view>{}("{\"k\":[1,2,3]}") );
    REQUIRE( outputHash(Bytes{}) == std::hash<std::string_view>{}("") );

    const Bytes big(1 << 20, 'x');
    Bytes other = big;
    other.back() = 'y';
    REQUIRE( outputHash(big) == outputHash(Bytes(1 << 20, 'x')) );
    REQUIRE( outputHash(big) != outputHash(other) );
}


TEST_CASE( "Outputs are emitted as files" )
{
    TempDir dir;
    const auto out = dir.file("queue");
    REQUIRE( emitOutputs(out, {B("{}"), B("[1]"), B("null")}) == 3 );

    auto written = loadSeeds(out);
    REQUIRE( written.size() == 3 );
    REQUIRE( fs::is_empty(fs::path(out) / ".tmp") );
}
