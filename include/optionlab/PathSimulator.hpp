#pragma once

#include "../types/Errors.hpp"
#include "../types/Market.hpp"
#include "../types/PricePath.hpp"
#include "../math/Random.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>

namespace optionlab {

struct SimulationConfig {
    std::size_t steps = 252;
    std::size_t paths = 10000;
    std::optional<std::uint64_t> seed;
    std::size_t block_size = 4096;

    void validate() const {
        if (steps < 1) {
            throw InvalidParameter("steps", "must be >= 1");
        }
        if (paths < 1) {
            throw InvalidParameter("paths", "must be >= 1");
        }
        if (block_size < 1) {
            throw InvalidParameter("block_size", "must be >= 1");
        }
    }
};

class PathSequence;

// Risk-neutral GBM paths
//   S(t+dt) = S(t) * exp((r - q - sigma^2/2) dt + sigma sqrt(dt) Z).
// Path k lives in block k / block_size; every block is driven by its own
// stream of the seed family, so a block produces the same paths whichever
// thread generates it and in whatever order.
class PathSimulator {
public:
    PathSimulator(const MarketParameters& market, const SimulationConfig& config)
        : market_(market), config_(config) {

        market_.validate();
        config_.validate();

        seed_ = config_.seed ? *config_.seed : math::RandomNumberGenerator::entropy_seed();
        dt_ = market_.time_to_expiry / static_cast<double>(config_.steps);
        drift_ = market_.log_drift() * dt_;
        vol_sqrt_dt_ = market_.volatility * std::sqrt(dt_);
    }

    const MarketParameters& market() const noexcept { return market_; }
    std::size_t steps() const noexcept { return config_.steps; }
    std::size_t path_count() const noexcept { return config_.paths; }
    std::uint64_t seed() const noexcept { return seed_; }
    double time_step() const noexcept { return dt_; }

    std::size_t block_count() const noexcept {
        return (config_.paths + config_.block_size - 1) / config_.block_size;
    }

    std::size_t block_size(std::size_t block) const noexcept {
        const std::size_t first = block * config_.block_size;
        if (first >= config_.paths) return 0;
        return std::min(config_.block_size, config_.paths - first);
    }

    math::RandomNumberGenerator block_generator(std::size_t block) const {
        return math::RandomNumberGenerator::for_stream(seed_, block);
    }

    // One path from a caller-owned generator. `path` keeps its capacity so a
    // loop can reuse a single buffer.
    void simulate(math::RandomNumberGenerator& rng, PricePath& path) const {
        prepare(path);
        double S = market_.spot_price;
        for (std::size_t step = 1; step <= config_.steps; ++step) {
            S *= std::exp(drift_ + vol_sqrt_dt_ * rng.normal());
            path.prices_[step] = S;
        }
    }

    PricePath simulate(math::RandomNumberGenerator& rng) const {
        PricePath path;
        simulate(rng, path);
        return path;
    }

    // Antithetic pair: `mirror` is driven by the negated normals of `path`.
    void simulate_antithetic(math::RandomNumberGenerator& rng, PricePath& path, PricePath& mirror) const {
        prepare(path);
        prepare(mirror);
        double S = market_.spot_price;
        double S_mirror = market_.spot_price;
        for (std::size_t step = 1; step <= config_.steps; ++step) {
            const double shock = vol_sqrt_dt_ * rng.normal();
            S *= std::exp(drift_ + shock);
            S_mirror *= std::exp(drift_ - shock);
            path.prices_[step] = S;
            mirror.prices_[step] = S_mirror;
        }
    }

    // Generates the paths of `block` in order, handing each to visitor(const PricePath&).
    template<typename Visitor>
    void for_each_path(std::size_t block, Visitor&& visitor) const {
        auto rng = block_generator(block);
        PricePath path;
        const std::size_t n = block_size(block);
        for (std::size_t i = 0; i < n; ++i) {
            simulate(rng, path);
            visitor(static_cast<const PricePath&>(path));
        }
    }

    // Lazy view over all configured paths; iterating it again replays the
    // same paths. The view points at this simulator, so temporaries have none.
    PathSequence paths() const&;
    PathSequence paths() const&& = delete;

private:
    MarketParameters market_;
    SimulationConfig config_;
    std::uint64_t seed_ = 0;
    double dt_ = 0.0;
    double drift_ = 0.0;
    double vol_sqrt_dt_ = 0.0;

    void prepare(PricePath& path) const {
        path.prices_.resize(config_.steps + 1);
        path.prices_[0] = market_.spot_price;
        path.time_step_ = dt_;
    }
};

class PathSequence {
public:
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = PricePath;
        using difference_type = std::ptrdiff_t;
        using pointer = const PricePath*;
        using reference = const PricePath&;

        Iterator() = default;

        reference operator*() const noexcept { return path_; }
        pointer operator->() const noexcept { return &path_; }

        Iterator& operator++() {
            advance();
            return *this;
        }

        bool operator==(const Iterator& other) const noexcept {
            return simulator_ == other.simulator_ && index_ == other.index_;
        }

        bool operator!=(const Iterator& other) const noexcept { return !(*this == other); }

        std::size_t index() const noexcept { return index_; }

    private:
        friend class PathSequence;

        const PathSimulator* simulator_ = nullptr;
        std::size_t index_ = 0;
        std::size_t block_ = 0;
        std::size_t remaining_in_block_ = 0;
        std::optional<math::RandomNumberGenerator> rng_;
        PricePath path_;

        Iterator(const PathSimulator* simulator, std::size_t index)
            : simulator_(simulator), index_(index) {}

        void start() {
            block_ = 0;
            rng_.emplace(simulator_->block_generator(block_));
            remaining_in_block_ = simulator_->block_size(block_);
            generate();
        }

        void advance() {
            ++index_;
            if (index_ >= simulator_->path_count()) {
                index_ = simulator_->path_count();
                return;
            }
            if (--remaining_in_block_ == 0) {
                ++block_;
                rng_.emplace(simulator_->block_generator(block_));
                remaining_in_block_ = simulator_->block_size(block_);
            }
            generate();
        }

        void generate() {
            simulator_->simulate(*rng_, path_);
        }
    };

    explicit PathSequence(const PathSimulator& simulator) : simulator_(&simulator) {}

    Iterator begin() const {
        Iterator it(simulator_, 0);
        it.start();
        return it;
    }

    Iterator end() const {
        return Iterator(simulator_, simulator_->path_count());
    }

    std::size_t size() const noexcept { return simulator_->path_count(); }

private:
    const PathSimulator* simulator_;
};

inline PathSequence PathSimulator::paths() const& {
    return PathSequence(*this);
}

}
