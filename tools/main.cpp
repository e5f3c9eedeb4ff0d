#include "JsonMutator.hpp"
#include "PlateauSignal.hpp"
#include "UI.hpp"
#include "config.hpp"
#include "emit.hpp"
#include "log.hpp"
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <random>
#include <string>
#include <unordered_set>

using namespace JsonMut;

/*
Offline driver for the mutation core:
  jsonmut-replay <seed-dir> [-n trials] [-max-size bytes] [-out dir]
                 [-plateau file] [-seed n] [-tui]
  jsonmut-replay -write-plateau <file> <true|false>
Outputs that parse and were not produced before count as new paths.
 */

static void usage(const char *argv0) {
    std::cerr << "usage: " << argv0
              << " <seed-dir> [-n trials] [-max-size bytes] [-out dir]"
                 " [-plateau file] [-seed n] [-tui]\n"
              << "       " << argv0
              << " -write-plateau <file> <true|false>\n";
}

static uint64_t parseCount(const char *flag, const char *v) {
    char *end = nullptr;
    const unsigned long long n = std::strtoull(v, &end, 10);
    if (end == v || *end != '\0' || *v == '-')
        PANIC("{} expects an unsigned integer, got '{}'", flag, v);
    return n;
}

int main(int argc, char **argv) {
    if (argc == 4 && std::strcmp(argv[1], "-write-plateau") == 0) {
        const std::string value = argv[3];
        if (value != "true" && value != "false") {
            usage(argv[0]);
            return 1;
        }
        return writePlateauFile(argv[2], value == "true") ? 0 : 1;
    }
    if (argc < 2 || argv[1][0] == '-') {
        usage(argv[0]);
        return 1;
    }

    MutatorConfig config = MutatorConfig::fromEnv();
    const std::string seedDir = argv[1];
    uint64_t trials = 10000;
    size_t maxSize = 1 << 20;
    std::string outDir;
    bool tui = false;
    for (int i = 2; i < argc; ++i) {
        const bool hasValue = i + 1 < argc;
        if (std::strcmp(argv[i], "-n") == 0 && hasValue) {
            trials = parseCount("-n", argv[++i]);
        } else if (std::strcmp(argv[i], "-max-size") == 0 && hasValue) {
            maxSize = parseCount("-max-size", argv[++i]);
        } else if (std::strcmp(argv[i], "-out") == 0 && hasValue) {
            outDir = argv[++i];
        } else if (std::strcmp(argv[i], "-plateau") == 0 && hasValue) {
            config.plateauFile = argv[++i];
        } else if (std::strcmp(argv[i], "-seed") == 0 && hasValue) {
            config.seed = static_cast<uint32_t>(parseCount("-seed", argv[++i]));
        } else if (std::strcmp(argv[i], "-tui") == 0) {
            tui = true;
        } else {
            usage(argv[0]);
            return 1;
        }
    }

    const auto seeds = loadSeeds(seedDir);
    if (seeds.empty())
        PANIC("no seeds found in {}", seedDir);
    INFO("loaded {} seeds from {}", seeds.size(), seedDir);

    JsonMutator mutator(config);
    std::mt19937 pickAux(config.seed ? *config.seed + 1 : std::random_device{}());
    std::uniform_int_distribution<size_t> auxDist(0, seeds.size() - 1);

    std::unordered_set<size_t> seen;
    std::vector<Bytes> cache;
    cache.reserve(MAX_CACHE_SIZE);
    size_t emitted = 0;
    const auto start = std::chrono::steady_clock::now();

    for (uint64_t t = 0; t < trials; ++t) {
        const Bytes &seed = seeds[t % seeds.size()];
        const Bytes &aux = seeds[auxDist(pickAux)];
        Bytes out = mutator.mutate(seed, aux, maxSize);

        if (isValidJson(out) && seen.insert(outputHash(out)).second) {
            mutator.rewardLast(0.0, false, true);
            if (!outDir.empty()) {
                cache.push_back(std::move(out));
                if (cache.size() >= MAX_CACHE_SIZE) {
                    emitted += emitOutputs(outDir, cache);
                    cache.clear();
                }
            }
        }
    }
    if (!outDir.empty() && !cache.empty())
        emitted += emitOutputs(outDir, cache);

    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - start);
    if (tui)
        TUI::writeTUI(mutator, elapsed);
    else
        TUI::writePlain(std::cout, mutator, elapsed);
    std::cout << seen.size() << " distinct valid outputs";
    if (!outDir.empty())
        std::cout << ", " << emitted << " written to " << outDir;
    std::cout << std::endl;
    return 0;
}
