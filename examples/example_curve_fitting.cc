// SPDX-License-Identifier: MIT
// Fits and interpolates a few small instrument tables and prints the results.

#include "interpfit/interpfit.hpp"
#include <iostream>
#include <vector>

int main() {
    using namespace interpfit;

    // Polynomial: y = 1 + x + x²
    std::vector<double> x = {0.0, 1.0, 2.0, 3.0, 4.0, 5.0};
    std::vector<double> y = {1.0, 3.0, 7.0, 13.0, 21.0, 31.0};

    auto poly = fit_polynomial(x, y, 2);
    if (!poly) {
        std::cerr << "Polynomial fit failed: " << poly.error() << "\n";
        return 1;
    }
    std::cout << "Polynomial coefficients:";
    for (double c : *poly) std::cout << " " << c;
    std::cout << "\n";

    auto poly_metrics = polynomial_error_metrics(x, y, *poly);
    if (poly_metrics) {
        std::cout << "  " << *poly_metrics << "\n";
    }

    // Rational: samples of 3/(1+x)
    std::vector<double> x2 = {0.5, 1.0, 1.5, 2.0, 2.5, 3.0, 3.5, 4.0};
    std::vector<double> y2 = {2.0, 1.5, 1.2, 1.0, 0.857, 0.75, 0.667, 0.6};

    auto rational = fit_rational(x2, y2, 1, 1);
    if (!rational) {
        std::cerr << "Rational fit failed: " << rational.error() << "\n";
        return 1;
    }
    std::cout << "Rational fit: " << rational->iterations << " iterations, "
              << (rational->converged ? "converged" : "not converged") << "\n";
    std::cout << "  P:";
    for (double c : rational->numerator) std::cout << " " << c;
    std::cout << "\n  Q:";
    for (double c : rational->denominator) std::cout << " " << c;
    std::cout << "\n";

    auto rational_metrics = rational_error_metrics(x2, y2, *rational);
    if (rational_metrics) {
        std::cout << "  " << *rational_metrics << "\n";
    }

    // Vector: a 3D trajectory (t, t², t³)
    std::vector<double> t = {0.0, 1.0, 2.0, 3.0};
    std::vector<std::vector<double>> path;
    for (double ti : t) path.push_back({ti, ti * ti, ti * ti * ti});

    auto trajectory = fit_vector(t, path, 2);
    if (!trajectory) {
        std::cerr << "Vector fit failed: " << trajectory.error() << "\n";
        return 1;
    }
    auto p = evaluate_vector(*trajectory, 1.5);
    std::cout << "Trajectory at t=1.5: (" << p[0] << ", " << p[1] << ", " << p[2] << ")\n";

    auto vector_metrics = vector_error_metrics(t, path, *trajectory);
    if (vector_metrics) {
        std::cout << "  " << *vector_metrics << "\n";
    }

    // Interpolation: filter response in dB vs frequency
    std::vector<double> freq = {1e6, 1e7, 1e8, 1e9, 1e10};
    std::vector<double> gain_db = {0.0, -0.5, -3.0, -20.0, -40.0};

    auto g = log_linear(freq, gain_db, 3e8);
    auto spline = AkimaSpline::create(freq, gain_db);
    if (g && spline) {
        std::cout << "Gain at 300 MHz: log-linear " << *g
                  << " dB, Akima " << spline->eval(3e8) << " dB\n";
    }

    std::vector<double> steps = {0.0, 0.5, 1.0, 1.5, 2.0, 2.5, 3.0, 3.5, 4.0, 4.5, 5.0};
    auto step = nearest(steps, steps, 4.3);
    if (step) {
        std::cout << "Nearest attenuator step to 4.3 dB: " << *step << " dB\n";
    }

    return 0;
}
