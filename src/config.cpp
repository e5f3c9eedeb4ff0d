#include "config.hpp"
#include "log.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>

using namespace JsonMut;

static const char *envValue(const char *name) {
    const char *v = std::getenv(name);
    if (v == nullptr || *v == '\0')
        return nullptr;
    return v;
}

static std::optional<double> envDouble(const char *name) {
    const char *v = envValue(name);
    if (!v)
        return std::nullopt;
    char *end = nullptr;
    errno = 0;
    const double d = std::strtod(v, &end);
    if (errno != 0 || end == v || *end != '\0' || !std::isfinite(d)) {
        Log::warn("ignoring {}={}: not a number", name, v);
        return std::nullopt;
    }
    return d;
}

static std::optional<uint64_t> envUnsigned(const char *name) {
    const char *v = envValue(name);
    if (!v)
        return std::nullopt;
    char *end = nullptr;
    errno = 0;
    const unsigned long long u = std::strtoull(v, &end, 10);
    if (errno != 0 || end == v || *end != '\0' || *v == '-') {
        Log::warn("ignoring {}={}: not an unsigned integer", name, v);
        return std::nullopt;
    }
    return static_cast<uint64_t>(u);
}

MutatorConfig JsonMut::MutatorConfig::fromEnv() {
    MutatorConfig config;

    // logging first, so the warnings below land in the right place
    if (const char *v = envValue("JSONMUT_LOG_LEVEL"))
        config.logLevel = v;
    if (const char *v = envValue("JSONMUT_LOG_FILE"))
        config.logFile = v;
    applyLogging(config);

    if (auto lam = envDouble("JSONMUT_LAM")) {
        if (*lam > 0.0 && *lam <= 1.0)
            config.lam = *lam;
        else
            Log::warn("JSONMUT_LAM={} out of (0, 1]", *lam);
    }
    if (auto tau = envDouble("JSONMUT_TAU")) {
        if (*tau > 0.0)
            config.tau = *tau;
        else
            Log::warn("JSONMUT_TAU={} must be positive", *tau);
    }
    if (auto eps = envDouble("JSONMUT_EPS")) {
        if (*eps >= 0.0 && *eps <= 1.0)
            config.eps = *eps;
        else
            Log::warn("JSONMUT_EPS={} out of [0, 1]", *eps);
    }

    if (const char *v = envValue("JSONMUT_PLATEAU_FILE"))
        config.plateauFile = v;
    if (auto ms = envUnsigned("JSONMUT_PLATEAU_POLL_MS"))
        config.plateauPoll = std::chrono::milliseconds(*ms);

    if (auto seed = envUnsigned("JSONMUT_SEED"))
        config.seed = static_cast<uint32_t>(*seed);
    if (auto count = envUnsigned("JSONMUT_FUZZ_COUNT")) {
        if (*count > 0 && *count <= UINT32_MAX)
            config.fuzzCount = static_cast<uint32_t>(*count);
        else
            Log::warn("JSONMUT_FUZZ_COUNT={} out of range", *count);
    }

    INFO("config: lam={} tau={} eps={} plateau='{}' poll={}ms fuzz_count={}",
         config.lam, config.tau, config.eps, config.plateauFile,
         config.plateauPoll.count(), config.fuzzCount);
    return config;
}

void JsonMut::applyLogging(const MutatorConfig &config) {
    if (!Log::setLevel(config.logLevel))
        Log::warn("unknown log level '{}'", config.logLevel);
    if (!config.logFile.empty() && !Log::openFile(config.logFile))
        Log::warn("cannot open log file {}, logging to stderr",
                  config.logFile);
}
