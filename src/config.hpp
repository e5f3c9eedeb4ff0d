#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "EMAScheduler.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace JsonMut {

// The host engine hands plugin settings over through the environment.
class MutatorConfig {
  public:
    double lam = EMAScheduler::DEFAULT_LAM;
    double tau = EMAScheduler::DEFAULT_TAU;
    double eps = EMAScheduler::DEFAULT_EPS;
    RewardWeights reward = {};

    // empty: no plateau override
    std::string plateauFile;
    std::chrono::milliseconds plateauPoll{500};

    // overrides the seed the host passes to init
    std::optional<uint32_t> seed;
    uint32_t fuzzCount = 4;

    std::string logLevel = "warn";
    // empty: stderr
    std::string logFile;

    // JSONMUT_* variables; bad values are logged and left at the default
    static MutatorConfig fromEnv();
};

void applyLogging(const MutatorConfig &config);

} // namespace JsonMut

#endif // CONFIG_HPP
