#include "JsonMutator.hpp"
#include "config.hpp"
#include "log.hpp"
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <memory>

/*
AFL++ custom mutator hooks. Load with
  AFL_CUSTOM_MUTATOR_LIBRARY=/path/to/libjsonmut.so
Nothing thrown in here may cross into the fuzzer's C code.
 */

using namespace JsonMut;

namespace {
class PluginState {
  public:
    explicit PluginState(const MutatorConfig &config)
        : mutator(config), fuzzCount(config.fuzzCount) {}

    JsonMutator mutator;
    uint32_t fuzzCount;
    // returned buffers stay valid until the next call
    Bytes out;
    std::string description;
};

uint8_t placeholderBytes[] = {'{', '}'};
} // namespace

extern "C" {

void *afl_custom_init(void * /*afl*/, unsigned int seed) {
    try {
        const MutatorConfig config = MutatorConfig::fromEnv();
        auto state = std::make_unique<PluginState>(config);
        state->mutator.reseed(config.seed ? *config.seed : seed);
        INFO("initialized, {} operators", state->mutator.registry().size());
        // released to the host until afl_custom_deinit
        return state.release();
    } catch (const std::exception &e) {
        ERROR("init failed: {}", e.what());
    } catch (...) {
        ERROR("init failed: unknown exception");
    }
    return nullptr;
}

size_t afl_custom_fuzz(void *data, uint8_t *buf, size_t buf_size,
                       uint8_t **out_buf, uint8_t *add_buf,
                       size_t add_buf_size, size_t max_size) {
    auto *state = static_cast<PluginState *>(data);
    if (state == nullptr) {
        *out_buf = buf;
        return std::min(buf_size, max_size);
    }
    try {
        const Bytes seed(buf, buf + buf_size);
        const Bytes aux = add_buf ? Bytes(add_buf, add_buf + add_buf_size)
                                  : Bytes();
        state->out = state->mutator.mutate(seed, aux, max_size);
        *out_buf = state->out.empty() ? buf : state->out.data();
        return state->out.size();
    } catch (const std::exception &e) {
        ERROR("fuzz: {}", e.what());
    } catch (...) {
        ERROR("fuzz: unknown exception");
    }
    *out_buf = placeholderBytes;
    return std::min(sizeof(placeholderBytes), max_size);
}

uint32_t afl_custom_fuzz_count(void *data, const uint8_t * /*buf*/,
                               size_t /*buf_size*/) {
    auto *state = static_cast<PluginState *>(data);
    return state ? state->fuzzCount : 1;
}

size_t afl_custom_post_process(void * /*data*/, uint8_t *buf,
                               size_t buf_size, uint8_t **out_buf) {
    *out_buf = buf;
    return buf_size;
}

uint8_t afl_custom_queue_new_entry(void *data,
                                   const uint8_t * /*filename_new_queue*/,
                                   const uint8_t * /*filename_orig_queue*/) {
    auto *state = static_cast<PluginState *>(data);
    if (state)
        state->mutator.rewardLast(0.0, false, true);
    // queue file not modified
    return 0;
}

const char *afl_custom_describe(void *data, size_t max_description_len) {
    auto *state = static_cast<PluginState *>(data);
    if (state == nullptr)
        return "jsonmut";
    try {
        state->description = state->mutator.describeLast();
        if (state->description.size() > max_description_len)
            state->description.resize(max_description_len);
        return state->description.c_str();
    } catch (const std::exception &e) {
        ERROR("describe: {}", e.what());
    }
    return "jsonmut";
}

void afl_custom_deinit(void *data) {
    std::unique_ptr<PluginState> state(static_cast<PluginState *>(data));
    if (!state)
        return;
    const auto &curriculum = state->mutator.curriculum();
    INFO("deinit: {} trials, parse rate {}/{}, {} placeholders",
         state->mutator.trials(), curriculum.parseOk, curriculum.parseAll,
         state->mutator.placeholders());
    state.reset();
    Log::closeFile();
}

} // extern "C"
