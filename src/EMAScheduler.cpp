#include "EMAScheduler.hpp"
#include "log.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

using namespace JsonMut;

JsonMut::EMAScheduler::EMAScheduler(size_t nOps, double lam, double tau,
                                    double eps, RewardWeights weights)
    : scores_(nOps, 0.0), lam_(lam), tau_(tau), eps_(eps), weights_(weights) {
    if (!(lam_ > 0.0 && lam_ <= 1.0)) {
        Log::warn("lam={} out of (0, 1], using {}", lam_, DEFAULT_LAM);
        lam_ = DEFAULT_LAM;
    }
    if (!(tau_ > 0.0) || !std::isfinite(tau_)) {
        Log::warn("tau={} must be positive, using {}", tau_,
                  DEFAULT_TAU);
        tau_ = DEFAULT_TAU;
    }
    if (!(eps_ >= 0.0 && eps_ <= 1.0)) {
        Log::warn("eps={} out of [0, 1], using {}", eps_, DEFAULT_EPS);
        eps_ = DEFAULT_EPS;
    }
}

size_t JsonMut::EMAScheduler::pickUniform(std::span<const size_t> allowed,
                                          std::mt19937 &rng) const {
    return allowed[std::uniform_int_distribution<size_t>(
        0, allowed.size() - 1)(rng)];
}

size_t JsonMut::EMAScheduler::pick(std::span<const size_t> allowed,
                                   std::mt19937 &rng) const {
    if (allowed.empty())
        return 0;
    if (allowed.size() == 1)
        return allowed[0];

    // explore
    if (std::bernoulli_distribution(eps_)(rng))
        return pickUniform(allowed, rng);

    std::vector<double> weights(allowed.size());
    double maxLogit = -std::numeric_limits<double>::infinity();
    for (size_t i = 0; i < allowed.size(); ++i) {
        weights[i] = score(allowed[i]) / tau_;
        if (!std::isfinite(weights[i])) {
            Log::debug("non-finite logit for op {}, picking uniformly",
                       allowed[i]);
            return pickUniform(allowed, rng);
        }
        maxLogit = std::max(maxLogit, weights[i]);
    }

    double sum = 0.0;
    for (auto &w : weights) {
        w = std::exp(w - maxLogit);
        sum += w;
    }
    if (!std::isfinite(sum) || sum <= 0.0)
        return pickUniform(allowed, rng);

    std::discrete_distribution<size_t> dist(weights.begin(), weights.end());
    return allowed[dist(rng)];
}

double JsonMut::EMAScheduler::reward(double dCov, bool uniqCrash,
                                     bool newPath) const {
    if (!std::isfinite(dCov))
        dCov = 0.0;
    double r = weights_.coverage * dCov;
    if (newPath)
        r += weights_.newPath;
    if (uniqCrash)
        r += weights_.uniqueCrash;
    return std::clamp(r, -weights_.limit, weights_.limit);
}

void JsonMut::EMAScheduler::rewardUpdate(size_t op, double dCov,
                                         bool uniqCrash, bool newPath) {
    updateScore(op, reward(dCov, uniqCrash, newPath));
}

void JsonMut::EMAScheduler::updateScore(size_t op, double reward) {
    if (op >= scores_.size()) {
        Log::debug("reward for unknown op {} dropped", op);
        return;
    }
    if (!std::isfinite(reward))
        return;
    scores_[op] = (1.0 - lam_) * scores_[op] + lam_ * reward;
}

void JsonMut::EMAScheduler::reset() {
    std::fill(scores_.begin(), scores_.end(), 0.0);
}

double JsonMut::EMAScheduler::score(size_t op) const {
    return op < scores_.size() ? scores_[op] : 0.0;
}
