#pragma once

#include <cmath>
#include <cstddef>
#include <vector>

namespace optionlab::math {

// Thomas algorithm for
//   diag[0]x[0] + upper[0]x[1] = rhs[0]
//   lower[i]x[i-1] + diag[i]x[i] + upper[i]x[i+1] = rhs[i]
//   lower[n-1]x[n-2] + diag[n-1]x[n-1] = rhs[n-1]
// All four inputs have length n; lower[0] and upper[n-1] are ignored.
// The scratch buffers are kept between calls so a time-stepping loop does not
// allocate.
class TridiagonalSolver {
public:
    static constexpr double PIVOT_TOLERANCE = 1e-14;

    explicit TridiagonalSolver(std::size_t n = 0) : c_prime_(n), d_prime_(n) {}

    // Returns false on a (near) zero pivot; `x` is then left unspecified.
    bool solve(const std::vector<double>& lower,
               const std::vector<double>& diag,
               const std::vector<double>& upper,
               const std::vector<double>& rhs,
               std::vector<double>& x) {
        const std::size_t n = diag.size();
        if (lower.size() != n || upper.size() != n || rhs.size() != n) {
            return false;
        }
        if (n == 0) {
            x.clear();
            return true;
        }

        c_prime_.resize(n);
        d_prime_.resize(n);
        x.resize(n);

        double denom = diag[0];
        if (std::abs(denom) < PIVOT_TOLERANCE) {
            return false;
        }
        c_prime_[0] = (n > 1) ? upper[0] / denom : 0.0;
        d_prime_[0] = rhs[0] / denom;

        for (std::size_t i = 1; i < n; ++i) {
            denom = diag[i] - lower[i] * c_prime_[i - 1];
            if (std::abs(denom) < PIVOT_TOLERANCE) {
                return false;
            }
            c_prime_[i] = (i == n - 1) ? 0.0 : upper[i] / denom;
            d_prime_[i] = (rhs[i] - lower[i] * d_prime_[i - 1]) / denom;
        }

        x[n - 1] = d_prime_[n - 1];
        for (std::size_t i = n - 1; i-- > 0;) {
            x[i] = d_prime_[i] - c_prime_[i] * x[i + 1];
        }
        return true;
    }

private:
    std::vector<double> c_prime_;
    std::vector<double> d_prime_;
};

}
