#include "mutators.hpp"
#include "log.hpp"
#include <algorithm>

using namespace JsonMut;

std::vector<size_t> JsonMut::allowedOps(Phase phase, size_t registrySize) {
    const size_t end =
        std::min(PHASE_END[static_cast<size_t>(phase)], registrySize);
    std::vector<size_t> allowed(end);
    for (size_t i = 0; i < end; ++i)
        allowed[i] = i;
    return allowed;
}

Phase JsonMut::phaseOf(size_t index) {
    if (index < PHASE_END[0])
        return Phase::A;
    if (index < PHASE_END[1])
        return Phase::B;
    return Phase::C;
}

const char *JsonMut::phaseName(Phase phase) {
    switch (phase) {
    case Phase::A:
        return "A";
    case Phase::B:
        return "B";
    case Phase::C:
        return "C";
    }
    return "?";
}

Bytes JsonMut::applyOperator(const OperatorEntry &op, const Bytes &seed,
                             const Bytes &aux, size_t maxSize,
                             std::mt19937 &rng) {
    try {
        auto out = op.fn(seed, aux, maxSize, rng);
        if (!out)
            return clip(seed, maxSize);
        if (out->size() > maxSize)
            out->resize(maxSize);
        return std::move(*out);
    } catch (const std::exception &e) {
        Log::debug("operator {} failed: {}", op.name, e.what());
    } catch (...) {
        Log::debug("operator {} failed: unknown exception", op.name);
    }
    return clip(seed, maxSize);
}

size_t JsonMut::pickIndex(size_t n, std::mt19937 &rng) {
    if (n <= 1)
        return 0;
    return std::uniform_int_distribution<size_t>(0, n - 1)(rng);
}

bool JsonMut::chance(double p, std::mt19937 &rng) {
    return std::bernoulli_distribution(p)(rng);
}
