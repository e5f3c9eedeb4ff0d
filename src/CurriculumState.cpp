#include "CurriculumState.hpp"
#include "log.hpp"
#include <algorithm>

using namespace JsonMut;

JsonMut::CurriculumState::CurriculumState(size_t registrySize,
                                          PlateauSignal plateau)
    : registrySize_(registrySize), plateau_(std::move(plateau)) {}

Phase JsonMut::phaseForRate(uint64_t parseOk, uint64_t parseAll) {
    if (parseAll == 0)
        return Phase::A;
    const double rate =
        static_cast<double>(parseOk) / static_cast<double>(parseAll);
    if (rate >= CurriculumState::PHASE_C_RATE)
        return Phase::C;
    if (rate >= CurriculumState::PHASE_B_RATE)
        return Phase::B;
    return Phase::A;
}

double JsonMut::CurriculumState::rate() const {
    return static_cast<double>(parseOk) /
           static_cast<double>(std::max<uint64_t>(parseAll, 1));
}

Phase JsonMut::CurriculumState::computedPhase() const {
    return phaseForRate(parseOk, parseAll);
}

Decision JsonMut::CurriculumState::decide(EMAScheduler &scheduler) {
    Decision d;
    d.computed = computedPhase();
    d.phase = d.computed;

    if (d.computed != Phase::C && plateau_.poll()) {
        d.phase = d.computed == Phase::A ? Phase::B : Phase::C;
        d.forced = true;
        if (lastPhase_ != d.phase)
            INFO("plateau: forcing phase {} -> {} (rate {:.3f})",
                 phaseName(d.computed), phaseName(d.phase), rate());
        // every forced decision starts the unlocked set from a clean slate
        scheduler.reset();
    } else if (lastPhase_ && *lastPhase_ != d.phase) {
        INFO("phase {} -> {} (rate {:.3f})", phaseName(*lastPhase_),
             phaseName(d.phase), rate());
    }

    lastPhase_ = d.phase;
    d.allowed = allowedOps(d.phase, registrySize_);
    return d;
}

void JsonMut::CurriculumState::recordTrial(const Bytes &out) {
    ++parseAll;
    try {
        if (isValidJson(out))
            ++parseOk;
    } catch (const std::exception &e) {
        Log::debug("parse check failed: {}", e.what());
    }
}
