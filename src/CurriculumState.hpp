#ifndef CURRICULUMSTATE_HPP
#define CURRICULUMSTATE_HPP

#include "EMAScheduler.hpp"
#include "PlateauSignal.hpp"
#include "jsontext.hpp"
#include "mutators.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace JsonMut {

class Decision {
  public:
    // phase from the parse rate alone
    Phase computed = Phase::A;
    // phase actually used, after the plateau override
    Phase phase = Phase::A;
    bool forced = false;
    std::vector<size_t> allowed;
};

/*
Curriculum over the operator registry. The phase is recomputed from the
cumulative parse rate on every decision, so it can move backwards when the
rate dips.
 */
class CurriculumState {
  public:
    static constexpr double PHASE_B_RATE = 0.50;
    static constexpr double PHASE_C_RATE = 0.90;

    // only ever incremented
    uint64_t parseOk = 0;
    uint64_t parseAll = 0;

    explicit CurriculumState(size_t registrySize, PlateauSignal plateau = {});

    double rate() const;
    Phase computedPhase() const;

    // A plateau signal pushes a phase below C one step forward and resets
    // the scheduler.
    Decision decide(EMAScheduler &scheduler);

    // best-effort parse statistics for one produced buffer
    void recordTrial(const Bytes &out);

    std::optional<Phase> lastPhase() const { return lastPhase_; }
    const PlateauSignal &plateau() const { return plateau_; }

  private:
    size_t registrySize_;
    PlateauSignal plateau_;
    std::optional<Phase> lastPhase_;
};

Phase phaseForRate(uint64_t parseOk, uint64_t parseAll);

} // namespace JsonMut

#endif // CURRICULUMSTATE_HPP
