#include "config.hpp"
#include "test-util.hpp"

#include <catch2/catch.hpp>

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>

using namespace JsonMut;

static const char *const VARIABLES[] = {
    "JSONMUT_LAM",          "JSONMUT_TAU",       "JSONMUT_EPS",
    "JSONMUT_PLATEAU_FILE", "JSONMUT_PLATEAU_POLL_MS",
    "JSONMUT_SEED",         "JSONMUT_FUZZ_COUNT", "JSONMUT_LOG_FILE",
};

// clears the JSONMUT_* variables and keeps the log quiet
class EnvGuard {
  public:
    EnvGuard() { clear(); }
    ~EnvGuard() { clear(); }

  private:
    static void clear() {
        for (const char *name : VARIABLES)
            unsetenv(name);
        setenv("JSONMUT_LOG_LEVEL", "off", 1);
    }
};


TEST_CASE( "Defaults without environment" )
{
    EnvGuard env;
    auto config = MutatorConfig::fromEnv();

    REQUIRE( config.lam == EMAScheduler::DEFAULT_LAM );
    REQUIRE( config.tau == EMAScheduler::DEFAULT_TAU );
    REQUIRE( config.eps == EMAScheduler::DEFAULT_EPS );
    REQUIRE( config.plateauFile.empty() );
    REQUIRE( config.plateauPoll.count() == 500 );
    REQUIRE_FALSE( config.seed.has_value() );
    REQUIRE( config.fuzzCount == 4 );
}


TEST_CASE( "Environment overrides" )
{
    EnvGuard env;
    setenv("JSONMUT_LAM", "0.5", 1);
    setenv("JSONMUT_TAU", "1.25", 1);
    setenv("JSONMUT_EPS", "0", 1);
    setenv("JSONMUT_PLATEAU_FILE", "/tmp/plateau.json", 1);
    setenv("JSONMUT_PLATEAU_POLL_MS", "50", 1);
    setenv("JSONMUT_SEED", "42", 1);
    setenv("JSONMUT_FUZZ_COUNT", "16", 1);

    auto config = MutatorConfig::fromEnv();
    REQUIRE( config.lam == 0.5 );
    REQUIRE( config.tau == 1.25 );
    REQUIRE( config.eps == 0.0 );
    REQUIRE( config.plateauFile == "/tmp/plateau.json" );
    REQUIRE( config.plateauPoll.count() == 50 );
    REQUIRE( config.seed == 42u );
    REQUIRE( config.fuzzCount == 16 );
}


TEST_CASE( "Bad values keep the defaults" )
{
    EnvGuard env;
    setenv("JSONMUT_LAM", "1.5", 1);
    setenv("JSONMUT_TAU", "fast", 1);
    setenv("JSONMUT_EPS", "-0.1", 1);
    setenv("JSONMUT_PLATEAU_POLL_MS", "-5", 1);
    setenv("JSONMUT_SEED", "12abc", 1);
    setenv("JSONMUT_FUZZ_COUNT", "0", 1);

    auto config = MutatorConfig::fromEnv();
    REQUIRE( config.lam == EMAScheduler::DEFAULT_LAM );
    REQUIRE( config.tau == EMAScheduler::DEFAULT_TAU );
    REQUIRE( config.eps == EMAScheduler::DEFAULT_EPS );
    REQUIRE( config.plateauPoll.count() == 500 );
    REQUIRE_FALSE( config.seed.has_value() );
    REQUIRE( config.fuzzCount == 4 );
}


TEST_CASE( "Rejected values are reported as warnings in the log file" )
{
    EnvGuard env;
    TempDir dir;
    const auto logPath = dir.file("jsonmut.log");
    setenv("JSONMUT_LOG_LEVEL", "warn", 1);
    setenv("JSONMUT_LOG_FILE", logPath.c_str(), 1);
    setenv("JSONMUT_LAM", "1.5", 1);
    setenv("JSONMUT_FUZZ_COUNT", "0", 1);

    auto config = MutatorConfig::fromEnv();
    REQUIRE( config.lam == EMAScheduler::DEFAULT_LAM );

    std::ifstream in(logPath);
    const std::string text((std::istreambuf_iterator<char>(in)),
                           std::istreambuf_iterator<char>());
    REQUIRE( text.find("[jsonmut] warning: JSONMUT_LAM=1.5 out of (0, 1]") !=
             std::string::npos );
    REQUIRE( text.find("warning: JSONMUT_FUZZ_COUNT=0 out of range") !=
             std::string::npos );
    // below the threshold
    REQUIRE( text.find("config:") == std::string::npos );

    // park the sink before the directory goes away
    MutatorConfig quiet;
    quiet.logLevel = "off";
    quiet.logFile = "/dev/null";
    applyLogging(quiet);
}
