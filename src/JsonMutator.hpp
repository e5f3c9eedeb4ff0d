#ifndef JSONMUTATOR_HPP
#define JSONMUTATOR_HPP

#include "CurriculumState.hpp"
#include "EMAScheduler.hpp"
#include "config.hpp"
#include "jsontext.hpp"
#include "mutators.hpp"
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace JsonMut {

/*
One instance per fuzzing process. mutate() is the per-trial entry point:
it never throws and always returns at most maxSize bytes. Rewards arrive
later, out of band, through reward()/rewardLast().
 */
class JsonMutator {
  public:
    explicit JsonMutator(const MutatorConfig &config = {},
                         OperatorRegistry registry = defaultRegistry());
    virtual ~JsonMutator() = default;

    Bytes mutate(const Bytes &seed, const Bytes &aux, size_t maxSize);

    void reward(size_t op, double dCov, bool uniqCrash, bool newPath);
    // credits the operator used by the latest mutate(), if any
    void rewardLast(double dCov, bool uniqCrash, bool newPath);

    void reseed(uint32_t seed) { rng_.seed(seed); }

    std::optional<size_t> lastOperator() const { return lastOp_; }
    std::string describeLast() const;

    OperatorRegistry registry() const { return registry_; }
    EMAScheduler &scheduler() { return scheduler_; }
    const EMAScheduler &scheduler() const { return scheduler_; }
    CurriculumState &curriculum() { return curriculum_; }
    const CurriculumState &curriculum() const { return curriculum_; }

    const std::vector<uint64_t> &pickCounts() const { return picks_; }
    uint64_t trials() const { return trials_; }
    uint64_t placeholders() const { return placeholders_; }

  protected:
    // one decide/pick/apply/record round; mutate() contains what it throws
    virtual Bytes mutateOnce(const Bytes &seed, const Bytes &aux,
                             size_t maxSize);

  private:

    OperatorRegistry registry_;
    std::mt19937 rng_;
    EMAScheduler scheduler_;
    CurriculumState curriculum_;
    std::optional<size_t> lastOp_;
    std::vector<uint64_t> picks_;
    uint64_t trials_ = 0;
    uint64_t placeholders_ = 0;
};

} // namespace JsonMut

#endif // JSONMUTATOR_HPP
