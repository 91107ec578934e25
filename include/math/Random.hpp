#pragma once

#include <cstdint>
#include <random>

namespace optionlab::math {

class RandomNumberGenerator {
private:
    std::mt19937_64 generator_;
    std::normal_distribution<double> normal_dist_;
    std::uniform_real_distribution<double> uniform_dist_;

public:
    explicit RandomNumberGenerator(std::seed_seq& sequence)
        : generator_(sequence), normal_dist_(0.0, 1.0), uniform_dist_(0.0, 1.0) {}

    // Stream `stream_id` of the family rooted at `seed`. Both words go through
    // seed_seq, so neighbouring ids give decorrelated engine states.
    static RandomNumberGenerator for_stream(std::uint64_t seed, std::uint64_t stream_id) {
        std::seed_seq sequence{
            static_cast<std::uint32_t>(seed & 0xffffffffu),
            static_cast<std::uint32_t>(seed >> 32),
            static_cast<std::uint32_t>(stream_id & 0xffffffffu),
            static_cast<std::uint32_t>(stream_id >> 32)
        };
        return RandomNumberGenerator(sequence);
    }

    static std::uint64_t entropy_seed() {
        std::random_device device;
        return (static_cast<std::uint64_t>(device()) << 32) ^ static_cast<std::uint64_t>(device());
    }

    double normal() {
        return normal_dist_(generator_);
    }

    double uniform() {
        return uniform_dist_(generator_);
    }
};

}
