// SPDX-License-Identifier: MIT
/**
 * @file interpolation_benchmark.cc
 * @brief Query and fit throughput for the interpolation and fitting routines
 */

#include "interpfit/interpfit.hpp"
#include <benchmark/benchmark.h>
#include <cmath>
#include <random>
#include <vector>

using namespace interpfit;

namespace {

constexpr size_t kQueries = 1000;

// Smooth response curve used for every table
double response(double x) {
    return std::sin(0.7 * x) + 0.1 * x;
}

struct Table {
    std::vector<double> x;
    std::vector<double> y;
};

Table make_table(size_t n) {
    Table t;
    t.x.resize(n);
    t.y.resize(n);
    for (size_t i = 0; i < n; ++i) {
        t.x[i] = 10.0 * static_cast<double>(i) / static_cast<double>(n - 1);
        t.y[i] = response(t.x[i]);
    }
    return t;
}

std::vector<double> make_queries(double lo, double hi) {
    std::mt19937 gen(42);
    std::uniform_real_distribution<> dist(lo, hi);
    std::vector<double> q(kQueries);
    for (auto& v : q) v = dist(gen);
    return q;
}

}  // namespace

static void BM_Linear(benchmark::State& state) {
    const auto table = make_table(static_cast<size_t>(state.range(0)));
    const auto queries = make_queries(0.0, 10.0);

    size_t idx = 0;
    for (auto _ : state) {
        auto result = linear(table.x, table.y, queries[idx]);
        benchmark::DoNotOptimize(result);
        idx = (idx + 1) % kQueries;
    }

    state.SetItemsProcessed(state.iterations());
    state.counters["table_size"] = static_cast<double>(table.x.size());
}

static void BM_LinearBatch(benchmark::State& state) {
    const auto table = make_table(static_cast<size_t>(state.range(0)));
    const auto queries = make_queries(0.0, 10.0);

    for (auto _ : state) {
        auto result = linear_batch(table.x, table.y, queries);
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations() * kQueries);
}

static void BM_AkimaEval(benchmark::State& state) {
    const auto table = make_table(static_cast<size_t>(state.range(0)));
    const auto queries = make_queries(0.0, 10.0);

    auto spline = AkimaSpline::create(table.x, table.y);
    if (!spline) {
        state.SkipWithError("Failed to build spline");
        return;
    }

    size_t idx = 0;
    for (auto _ : state) {
        double result = spline->eval(queries[idx]);
        benchmark::DoNotOptimize(result);
        idx = (idx + 1) % kQueries;
    }

    state.SetItemsProcessed(state.iterations());
}

static void BM_AkimaBuild(benchmark::State& state) {
    const auto table = make_table(static_cast<size_t>(state.range(0)));

    for (auto _ : state) {
        auto spline = AkimaSpline::create(table.x, table.y);
        benchmark::DoNotOptimize(spline);
    }

    state.SetItemsProcessed(state.iterations());
}

static void BM_Bilinear(benchmark::State& state) {
    const size_t n = static_cast<size_t>(state.range(0));
    const auto axis = make_table(n).x;

    std::vector<std::vector<double>> grid(n, std::vector<double>(n));
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < n; ++j) {
            grid[i][j] = response(axis[i]) * response(axis[j]);
        }
    }

    const auto qx = make_queries(0.0, 10.0);
    const auto qy = make_queries(0.5, 9.5);

    size_t idx = 0;
    for (auto _ : state) {
        auto result = bilinear(axis, axis, grid, qx[idx], qy[idx]);
        benchmark::DoNotOptimize(result);
        idx = (idx + 1) % kQueries;
    }

    state.SetItemsProcessed(state.iterations());
}

static void BM_PolynomialFit(benchmark::State& state) {
    const auto table = make_table(static_cast<size_t>(state.range(0)));
    const size_t degree = static_cast<size_t>(state.range(1));

    for (auto _ : state) {
        auto coeffs = fit_polynomial(table.x, table.y, degree);
        benchmark::DoNotOptimize(coeffs);
    }

    state.SetItemsProcessed(state.iterations());
}

static void BM_RationalFit(benchmark::State& state) {
    const size_t n = static_cast<size_t>(state.range(0));
    std::vector<double> x(n), y(n);
    for (size_t i = 0; i < n; ++i) {
        x[i] = 0.5 + 4.0 * static_cast<double>(i) / static_cast<double>(n - 1);
        y[i] = (1.0 + 2.0 * x[i]) / (1.0 + 0.5 * x[i] + 0.1 * x[i] * x[i]);
    }

    size_t iterations = 0;
    for (auto _ : state) {
        auto fit = fit_rational(x, y, 1, 2);
        if (fit) iterations = fit->iterations;
        benchmark::DoNotOptimize(fit);
    }

    state.SetItemsProcessed(state.iterations());
    state.counters["fit_iterations"] = static_cast<double>(iterations);
}

BENCHMARK(BM_Linear)->Arg(16)->Arg(256)->Arg(4096)->Unit(benchmark::kNanosecond);
BENCHMARK(BM_LinearBatch)->Arg(256)->Unit(benchmark::kMicrosecond);
BENCHMARK(BM_AkimaEval)->Arg(16)->Arg(256)->Arg(4096)->Unit(benchmark::kNanosecond);
BENCHMARK(BM_AkimaBuild)->Arg(16)->Arg(256)->Arg(4096)->Unit(benchmark::kMicrosecond);
BENCHMARK(BM_Bilinear)->Arg(10)->Arg(50)->Unit(benchmark::kNanosecond);
BENCHMARK(BM_PolynomialFit)->Args({100, 3})->Args({1000, 5})->Unit(benchmark::kMicrosecond);
BENCHMARK(BM_RationalFit)->Arg(50)->Arg(500)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
