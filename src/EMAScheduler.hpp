#ifndef EMASCHEDULER_HPP
#define EMASCHEDULER_HPP

#include <cstddef>
#include <random>
#include <span>
#include <vector>

namespace JsonMut {

class RewardWeights {
  public:
    double newPath = 1.0;
    double uniqueCrash = 2.0;
    // per unit of coverage delta
    double coverage = 0.1;
    // rewards are clamped to [-limit, limit]
    double limit = 10.0;
};

/*
Softmax-with-exploration operator picker. One EMA score per operator index;
scores start at 0, so a cold scheduler picks uniformly.
 */
class EMAScheduler {
  public:
    static constexpr double DEFAULT_LAM = 0.2;
    static constexpr double DEFAULT_TAU = 0.8;
    static constexpr double DEFAULT_EPS = 0.02;

    // out-of-range parameters are replaced by the defaults
    EMAScheduler(size_t nOps, double lam = DEFAULT_LAM,
                 double tau = DEFAULT_TAU, double eps = DEFAULT_EPS,
                 RewardWeights weights = {});

    // Never returns an index outside `allowed`; 0 if `allowed` is empty.
    // Indices without a score count as 0.
    size_t pick(std::span<const size_t> allowed, std::mt19937 &rng) const;

    double reward(double dCov, bool uniqCrash, bool newPath) const;
    // no-op for indices outside the catalogue
    void rewardUpdate(size_t op, double dCov, bool uniqCrash, bool newPath);
    void updateScore(size_t op, double reward);
    void reset();

    double score(size_t op) const;
    const std::vector<double> &scores() const { return scores_; }
    size_t size() const { return scores_.size(); }

    double lam() const { return lam_; }
    double tau() const { return tau_; }
    double eps() const { return eps_; }

  private:
    size_t pickUniform(std::span<const size_t> allowed,
                       std::mt19937 &rng) const;

    std::vector<double> scores_;
    double lam_;
    double tau_;
    double eps_;
    RewardWeights weights_;
};
} // namespace JsonMut

#endif // EMASCHEDULER_HPP
