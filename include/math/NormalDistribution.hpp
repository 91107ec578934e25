#pragma once

#include <cmath>
#include <limits>

namespace optionlab::math {

class NormalDistribution {
public:
    static constexpr double SQRT_2_PI = 2.506628274631000502;
    static constexpr double INV_SQRT_2_PI = 0.3989422804014326779;
    static constexpr double INV_SQRT_2 = 0.7071067811865475244;

    static double pdf(double x) noexcept {
        return INV_SQRT_2_PI * std::exp(-0.5 * x * x);
    }

    // erfc keeps full relative precision in both tails, so N(x) + N(-x) == 1
    // to rounding and put-call parity holds to machine precision.
    static double cdf(double x) noexcept {
        return 0.5 * std::erfc(-x * INV_SQRT_2);
    }

    static double inverse_cdf(double p) noexcept {
        if (p <= 0.0) return -std::numeric_limits<double>::infinity();
        if (p >= 1.0) return std::numeric_limits<double>::infinity();

        const double x = rational_approximation(p);

        // One Halley step against the exact cdf.
        const double e = cdf(x) - p;
        const double u = e * SQRT_2_PI * std::exp(0.5 * x * x);
        return x - u / (1.0 + 0.5 * x * u);
    }

    static double d1(double S, double K, double T, double r, double vol, double q = 0.0) noexcept {
        const double vol_sqrt_T = vol * std::sqrt(T);
        return (std::log(S / K) + (r - q + 0.5 * vol * vol) * T) / vol_sqrt_T;
    }

    static double d2(double S, double K, double T, double r, double vol, double q = 0.0) noexcept {
        return d1(S, K, T, r, vol, q) - vol * std::sqrt(T);
    }

private:
    // Acklam's rational approximation of the probit function.
    static double rational_approximation(double p) noexcept {
        static const double a[] = {
            -3.969683028665376e+01,  2.209460984245205e+02,
            -2.759285104469687e+02,  1.383577518672690e+02,
            -3.066479806614716e+01,  2.506628277459239e+00
        };

        static const double b[] = {
            -5.447609879822406e+01,  1.615858368580409e+02,
            -1.556989798598866e+02,  6.680131188771972e+01,
            -1.328068155288572e+01
        };

        static const double c[] = {
            -7.784894002430293e-03, -3.223964580411365e-01,
            -2.400758277161838e+00, -2.549732539343734e+00,
             4.374664141464968e+00,  2.938163982698783e+00
        };

        static const double d[] = {
            7.784695709041462e-03,  3.224671290700398e-01,
            2.445134137142996e+00,  3.754408661907416e+00
        };

        if (p < 0.02425) {
            const double q = std::sqrt(-2.0 * std::log(p));
            return (((((c[0] * q + c[1]) * q + c[2]) * q + c[3]) * q + c[4]) * q + c[5]) /
                   ((((d[0] * q + d[1]) * q + d[2]) * q + d[3]) * q + 1.0);
        }

        if (p > 0.97575) {
            return -rational_approximation(1.0 - p);
        }

        const double q = p - 0.5;
        const double r = q * q;
        return (((((a[0] * r + a[1]) * r + a[2]) * r + a[3]) * r + a[4]) * r + a[5]) * q /
               (((((b[0] * r + b[1]) * r + b[2]) * r + b[3]) * r + b[4]) * r + 1.0);
    }
};

}
