#pragma once

#include "PathSimulator.hpp"
#include "../types/Errors.hpp"
#include "../types/Market.hpp"
#include "../types/PricePath.hpp"
#include "../math/NormalDistribution.hpp"
#include "../math/Statistics.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace optionlab {

// Cross-section of the simulated prices at one time index.
struct EnsembleSnapshot {
    double time = 0.0;
    double mean = 0.0;
    double decile_1 = 0.0;
    double quartile_1 = 0.0;
    double median = 0.0;
    double quartile_3 = 0.0;
    double decile_9 = 0.0;
};

// Compares a simulated ensemble with the lognormal law of GBM:
//   ln S_t ~ N(ln S0 + (r - q - sigma^2/2) t, sigma^2 t).
class PathStatistics {
public:
    static std::vector<EnsembleSnapshot> ensemble(const PathSimulator& simulator) {
        std::vector<PricePath> paths;
        paths.reserve(simulator.path_count());
        for (const auto& path : simulator.paths()) {
            paths.push_back(path);
        }
        return ensemble(paths);
    }

    // All paths must share one time grid.
    static std::vector<EnsembleSnapshot> ensemble(const std::vector<PricePath>& paths) {
        if (paths.empty()) {
            throw InvalidParameter("paths", "need at least one path");
        }
        const std::size_t points = paths.front().size();
        for (const auto& path : paths) {
            if (path.size() != points) {
                throw InvalidParameter("paths", "paths have different lengths");
            }
        }

        std::vector<EnsembleSnapshot> snapshots(points);
        std::vector<double> column(paths.size());

        for (std::size_t k = 0; k < points; ++k) {
            for (std::size_t j = 0; j < paths.size(); ++j) {
                column[j] = paths[j][k];
            }
            std::sort(column.begin(), column.end());

            auto& snap = snapshots[k];
            snap.time = paths.front().time_at(k);
            snap.mean = math::FastStatistics<double>::mean(column);
            snap.decile_1 = math::FastStatistics<double>::sorted_percentile(column, 0.1);
            snap.quartile_1 = math::FastStatistics<double>::sorted_percentile(column, 0.25);
            snap.median = math::FastStatistics<double>::sorted_percentile(column, 0.5);
            snap.quartile_3 = math::FastStatistics<double>::sorted_percentile(column, 0.75);
            snap.decile_9 = math::FastStatistics<double>::sorted_percentile(column, 0.9);
        }
        return snapshots;
    }

    static double lognormal_density(double S, const MarketParameters& market, double t) {
        require_positive_time(t);
        if (S <= 0.0) return 0.0;

        const double s = market.volatility * std::sqrt(t);
        const double z = (std::log(S / market.spot_price) - market.log_drift() * t) / s;
        return math::NormalDistribution::pdf(z) / (S * s);
    }

    static double lognormal_mean(const MarketParameters& market, double t) {
        require_non_negative_time(t);
        return market.spot_price * std::exp((market.risk_free_rate - market.dividend_yield) * t);
    }

    static double lognormal_variance(const MarketParameters& market, double t) {
        require_non_negative_time(t);
        const double m = lognormal_mean(market, t);
        return m * m * std::expm1(market.volatility * market.volatility * t);
    }

    static double lognormal_quantile(double p, const MarketParameters& market, double t) {
        require_non_negative_time(t);
        if (!(p > 0.0 && p < 1.0)) {
            throw InvalidParameter("p", "must lie in (0, 1)");
        }
        const double s = market.volatility * std::sqrt(t);
        return market.spot_price * std::exp(market.log_drift() * t + s * math::NormalDistribution::inverse_cdf(p));
    }

private:
    static void require_positive_time(double t) {
        if (!std::isfinite(t) || t <= 0.0) {
            throw InvalidParameter("t", "must be finite and > 0");
        }
    }

    static void require_non_negative_time(double t) {
        if (!std::isfinite(t) || t < 0.0) {
            throw InvalidParameter("t", "must be finite and >= 0");
        }
    }
};

}
