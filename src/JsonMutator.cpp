#include "JsonMutator.hpp"
#include "log.hpp"
#include <algorithm>

using namespace JsonMut;

JsonMut::JsonMutator::JsonMutator(const MutatorConfig &config,
                                  OperatorRegistry registry)
    : registry_(registry),
      rng_(config.seed ? *config.seed : std::random_device{}()),
      scheduler_(registry.size(), config.lam, config.tau, config.eps,
                 config.reward),
      curriculum_(registry.size(),
                  config.plateauFile.empty()
                      ? PlateauSignal()
                      : PlateauSignal(config.plateauFile, config.plateauPoll)),
      picks_(registry.size(), 0) {}

Bytes JsonMut::JsonMutator::mutateOnce(const Bytes &seed, const Bytes &aux,
                                       size_t maxSize) {
    if (registry_.empty())
        return clip(seed, maxSize);

    const Decision decision = curriculum_.decide(scheduler_);
    size_t op = scheduler_.pick(decision.allowed, rng_);
    if (std::find(decision.allowed.begin(), decision.allowed.end(), op) ==
        decision.allowed.end()) {
        Log::debug("scheduler returned op {} outside the allowed set",
                   op);
        op = decision.allowed.empty() ? 0 : decision.allowed.front();
    }
    lastOp_ = op;
    ++picks_[op];

    Bytes out = applyOperator(registry_[op], seed, aux, maxSize, rng_);
    curriculum_.recordTrial(out);
    return out;
}

Bytes JsonMut::JsonMutator::mutate(const Bytes &seed, const Bytes &aux,
                                   size_t maxSize) {
    ++trials_;
    try {
        return mutateOnce(seed, aux, maxSize);
    } catch (const std::exception &e) {
        ++placeholders_;
        ERROR("mutation failed, emitting placeholder: {}", e.what());
    } catch (...) {
        ++placeholders_;
        ERROR("mutation failed, emitting placeholder: unknown exception");
    }
    return placeholder(maxSize);
}

void JsonMut::JsonMutator::reward(size_t op, double dCov, bool uniqCrash,
                                  bool newPath) {
    scheduler_.rewardUpdate(op, dCov, uniqCrash, newPath);
}

void JsonMut::JsonMutator::rewardLast(double dCov, bool uniqCrash,
                                      bool newPath) {
    if (lastOp_)
        reward(*lastOp_, dCov, uniqCrash, newPath);
}

std::string JsonMut::JsonMutator::describeLast() const {
    if (!lastOp_ || *lastOp_ >= registry_.size())
        return "jsonmut";
    return "jsonmut-" + std::string(registry_[*lastOp_].name);
}
