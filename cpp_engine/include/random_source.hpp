/**
 * Pokemon Battle Engine - Random Source
 *
 * Every random branch in a battle (accuracy, crit, status chance, paralysis,
 * confusion, thaw, status duration) draws from a RandomSource so that a fixed
 * seed, or a scripted sequence in tests, reproduces the same battle log.
 */

#pragma once

#include <cstdint>
#include <deque>
#include <random>
#include <vector>

namespace pokebattle {

/**
 * RandomSource - single "next uniform in [0, 1)" operation.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    virtual double next_uniform() = 0;

    /**
     * True with probability p (draws exactly once).
     */
    bool chance(double p) { return next_uniform() < p; }

    /**
     * Uniform integer in [lo, hi] (draws exactly once).
     */
    int next_int(int lo, int hi) {
        int span = hi - lo + 1;
        int offset = static_cast<int>(next_uniform() * span);
        if (offset >= span) offset = span - 1;
        return lo + offset;
    }
};

/**
 * Production source backed by std::mt19937.
 */
class Mt19937RandomSource : public RandomSource {
public:
    explicit Mt19937RandomSource(uint64_t seed) {
        // Both halves of the seed reach the generator state
        std::seed_seq seq{static_cast<uint32_t>(seed), static_cast<uint32_t>(seed >> 32)};
        rng_.seed(seq);
    }

    double next_uniform() override {
        // 32 random bits mapped to [0, 1); avoids implementation-defined
        // std::uniform_real_distribution output so logs match across toolchains.
        return static_cast<double>(rng_()) / 4294967296.0;
    }

private:
    std::mt19937 rng_;
};

/**
 * Test source: returns queued values in order, then `fallback` forever.
 *
 * The default fallback (0.99) means "hit, no crit, no secondary status,
 * no paralysis skip, no thaw, no confusion self-hit".
 */
class ScriptedRandomSource : public RandomSource {
public:
    explicit ScriptedRandomSource(std::vector<double> values = {}, double fallback = 0.99)
        : values_(values.begin(), values.end())
        , fallback_(fallback) {}

    double next_uniform() override {
        ++draws_;
        if (values_.empty()) {
            return fallback_;
        }
        double v = values_.front();
        values_.pop_front();
        return v;
    }

    void push(double value) { values_.push_back(value); }

    size_t remaining() const { return values_.size(); }
    size_t draws() const { return draws_; }

private:
    std::deque<double> values_;
    double fallback_;
    size_t draws_ = 0;
};

} // namespace pokebattle
