#pragma once
#include <cstdint>
#include <optional>
#include <random>
#include <string>

#include "errors.hpp"

namespace bj {

    // The one random source of a session: shuffles, random strategy picks and
    // the random strategy's decisions all draw from it.
    class Rng {
    public:
        using result_type = std::mt19937::result_type;

        explicit Rng(std::optional<uint64_t> seed = std::nullopt)
            : seed_(seed), draws_(0), claimed_(false) {
            if (seed_) {
                std::seed_seq seq{static_cast<uint32_t>(*seed_ & 0xffffffffu),
                                  static_cast<uint32_t>(*seed_ >> 32)};
                engine_.seed(seq);
            } else {
                engine_.seed(std::random_device{}());
            }
        }

        Rng(const Rng&) = delete;
        Rng& operator=(const Rng&) = delete;

        static constexpr result_type min() { return std::mt19937::min(); }
        static constexpr result_type max() { return std::mt19937::max(); }

        result_type operator()() {
            ++draws_;
            return engine_();
        }

        int uniform_int(int lo, int hi) {
            std::uniform_int_distribution<int> dist(lo, hi);
            return dist(*this);
        }

        bool seeded() const { return seed_.has_value(); }
        std::optional<uint64_t> seed() const { return seed_; }
        uint64_t draws() const { return draws_; }
        bool claimed() const { return claimed_; }

        // A generator belongs to exactly one session. A seeded one must also be
        // untouched, otherwise a rerun with the same seed would diverge.
        void claim(const std::string& owner) {
            if (claimed_) {
                throw GeneratorMisuse("generator already owned by another session (requested by " + owner + ")");
            }
            if (seed_ && draws_ > 0) {
                throw GeneratorMisuse("seeded generator advanced " + std::to_string(draws_) +
                                      " times before session " + owner + " claimed it");
            }
            claimed_ = true;
        }

    private:
        std::mt19937 engine_;
        std::optional<uint64_t> seed_;
        uint64_t draws_;
        bool claimed_;
    };
}
