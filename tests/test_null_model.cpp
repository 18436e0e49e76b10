// tests/test_null_model.cpp
//
// Permutation null model and significance:
//   - fixed seed and R reproduce the distribution exactly, for any thread count
//   - larger R narrows the standard error of the null mean
//   - compliant data sits in the lower tail (negative Z, small p)
//   - Z / p formulas on hand-built distributions
//   - degenerate null distributions raise DegenerateNullError

#include "fixtures.hpp"
#include "fcaudit/errors.hpp"
#include "fcaudit/fc_aggregate.hpp"
#include "fcaudit/null_model.hpp"
#include "fcaudit/significance.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <set>
#include <string>
#include <vector>

using fixtures::expect;

namespace {

fcaudit::NullDistribution from_samples(std::vector<double> samples, uint64_t seed = 1) {
    fcaudit::NullDistribution d;
    d.samples = std::move(samples);
    d.seed = seed;
    for (double s : d.samples) {
        if (!std::isfinite(s)) ++d.invalid_trials;
    }
    return d;
}

bool degenerate(double observed, const fcaudit::NullDistribution& null) {
    try {
        (void)fcaudit::assess_significance(observed, null);
    } catch (const fcaudit::DegenerateNullError&) {
        return true;
    }
    return false;
}

int test_reproducibility() {
    std::cout << "[null] fixed seed reproduces the distribution\n";
    int failed = 0;
    const auto map = fixtures::standard_map();
    const fcaudit::InMemorySource data(fixtures::synthetic_dataset(map, 25, 0.3, 4242));
    const auto observed = fcaudit::aggregate_source(data, map, fcaudit::StatisticParams());

    fcaudit::NullModelParams p;
    p.repetitions = 100;
    p.seed = 42;

    const auto a = fcaudit::sample_null_distribution(data, map, fcaudit::StatisticParams(), p);
    const auto b = fcaudit::sample_null_distribution(data, map, fcaudit::StatisticParams(), p);
    expect(a.samples == b.samples, "same seed, same samples", failed);
    expect(a.seed == 42 && a.repetitions() == 100, "seed and R recorded", failed);
    expect(a.invalid_trials == 0, "all trials valid", failed);

    const auto ra = fcaudit::assess_significance(observed.central_ratio, a);
    const auto rb = fcaudit::assess_significance(observed.central_ratio, b);
    expect(ra.z == rb.z && ra.p_value == rb.p_value, "identical Z and p", failed);
    expect(ra.seed == 42, "report carries the seed", failed);

    fcaudit::NullModelParams one_thread = p;
    one_thread.num_threads = 1;
    fcaudit::NullModelParams four_threads = p;
    four_threads.num_threads = 4;
    const auto t1 = fcaudit::sample_null_distribution(data, map, fcaudit::StatisticParams(), one_thread);
    const auto t4 = fcaudit::sample_null_distribution(data, map, fcaudit::StatisticParams(), four_threads);
    expect(t1.samples == t4.samples, "thread count does not change samples", failed);

    fcaudit::NullModelParams other = p;
    other.seed = 43;
    const auto c = fcaudit::sample_null_distribution(data, map, fcaudit::StatisticParams(), other);
    expect(c.samples != a.samples, "different seed, different samples", failed);

    std::set<uint64_t> seeds;
    for (uint32_t t = 0; t < 1000; ++t) seeds.insert(fcaudit::trial_seed(42, t));
    expect(seeds.size() == 1000, "trial seeds are distinct", failed);
    expect(fcaudit::resolve_seed(std::optional<uint64_t>(7)) == 7, "explicit seed kept", failed);

    uint32_t last = 0;
    uint32_t calls = 0;
    bool total_ok = true;
    fcaudit::NullModelParams small = p;
    small.repetitions = 12;
    (void)fcaudit::sample_null_distribution(data, map, fcaudit::StatisticParams(), small,
        [&](uint32_t done, uint32_t total) {
            ++calls;
            last = std::max(last, done);
            total_ok = total_ok && total == 12;
        });
    expect(calls == 12 && last == 12 && total_ok, "progress reported once per trial", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_compliant_data_in_lower_tail() {
    std::cout << "[null] compliant data beats relabelings\n";
    int failed = 0;
    const auto map = fixtures::standard_map();
    const fcaudit::InMemorySource data(fixtures::synthetic_dataset(map, 30, 0.15, 8));
    const auto observed = fcaudit::aggregate_source(data, map, fcaudit::StatisticParams());

    fcaudit::NullModelParams p;
    p.repetitions = 100;
    p.seed = 42;
    const auto null = fcaudit::sample_null_distribution(data, map, fcaudit::StatisticParams(), p);
    const auto rep = fcaudit::assess_significance(observed.central_ratio, null);

    expect(rep.z < -2.0, "observed ratio far below the null mean (z=" + std::to_string(rep.z) + ")", failed);
    expect(rep.null_at_or_below == 0, "no relabeling as compliant as the real map", failed);
    expect(rep.p_value == 1.0 / 101.0, "p is the add-one floor", failed);
    expect(rep.valid_trials == 100, "valid trials", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_standard_error_narrows() {
    std::cout << "[null] larger R narrows the standard error\n";
    int failed = 0;
    const auto map = fixtures::standard_map();
    const fcaudit::InMemorySource data(fixtures::synthetic_dataset(map, 10, 0.3, 31));
    const auto observed = fcaudit::aggregate_source(data, map, fcaudit::StatisticParams());

    fcaudit::NullModelParams p;
    p.seed = 42;
    p.repetitions = 25;
    const auto small = fcaudit::assess_significance(
        observed.central_ratio,
        fcaudit::sample_null_distribution(data, map, fcaudit::StatisticParams(), p));
    p.repetitions = 400;
    const auto large = fcaudit::assess_significance(
        observed.central_ratio,
        fcaudit::sample_null_distribution(data, map, fcaudit::StatisticParams(), p));

    expect(large.null_se < small.null_se, "SE(R=400) < SE(R=25)", failed);
    expect(std::abs(large.null_se - large.null_sd / 20.0) < 1e-15, "SE = SD / sqrt(R)", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_significance_formulas() {
    std::cout << "[sig] Z and p on hand-built distributions\n";
    int failed = 0;
    const double nan = std::numeric_limits<double>::quiet_NaN();

    const auto r = fcaudit::assess_significance(2.5, from_samples({1.0, 2.0, 3.0, 4.0}, 9));
    expect(r.null_mean == 2.5, "null mean", failed);
    expect(std::abs(r.null_sd - std::sqrt(1.25)) < 1e-12, "population SD", failed);
    expect(r.z == 0.0, "z at the mean", failed);
    expect(r.null_at_or_below == 2 && r.p_value == 3.0 / 5.0, "p = (2+1)/(4+1)", failed);
    expect(r.seed == 9 && r.repetitions == 4, "seed and R carried", failed);

    const auto low = fcaudit::assess_significance(0.5, from_samples({1.0, 2.0, 3.0, 4.0}));
    expect(low.p_value == 1.0 / 5.0 && low.z < 0.0, "observed below every sample", failed);

    const auto tie = fcaudit::assess_significance(1.0, from_samples({1.0, 2.0, 3.0, 4.0}));
    expect(tie.null_at_or_below == 1, "ties count as at-or-below", failed);

    const auto gaps = fcaudit::assess_significance(0.0, from_samples({1.0, nan, 3.0}));
    expect(gaps.valid_trials == 2 && gaps.repetitions == 3, "invalid trials skipped", failed);
    expect(gaps.p_value == 1.0 / 3.0, "p over valid trials", failed);

    expect(degenerate(1.0, from_samples({2.0, 2.0, 2.0})), "zero-variance null", failed);

    // Small but nonzero spread is a usable null: offsets 0, 1, -1, 2 (x1e-7)
    const auto narrow = from_samples({1.0, 1.0 + 1e-7, 1.0 - 1e-7, 1.0 + 2e-7});
    expect(!degenerate(0.5, narrow), "narrow null accepted", failed);
    if (!degenerate(0.5, narrow)) {
        const auto n = fcaudit::assess_significance(0.5, narrow);
        const double expected_sd = std::sqrt(1.25e-14);
        expect(std::abs(n.null_sd - expected_sd) < 1e-6 * expected_sd, "narrow null SD", failed);
        expect(n.z < 0.0 && n.p_value == 1.0 / 5.0, "observed below a narrow null", failed);
    }

    expect(degenerate(1.0, from_samples({0.1, 0.1, 0.1, 0.1})), "constant inexact null", failed);
    expect(degenerate(1.0, from_samples({nan, nan})), "no valid null samples", failed);
    expect(degenerate(1.0, from_samples({})), "empty null", failed);

    bool threw = false;
    try {
        (void)fcaudit::assess_significance(nan, from_samples({1.0, 2.0}));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    expect(threw, "undefined observed ratio rejected", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_degenerate_data() {
    std::cout << "[null] uniform data gives an all-invalid null\n";
    int failed = 0;
    const auto map = fixtures::standard_map();
    std::vector<fcaudit::OrganismRecord> flat;
    for (int i = 0; i < 5; ++i) flat.push_back(fixtures::uniform_organism("u" + std::to_string(i)));
    const fcaudit::InMemorySource data(flat);

    fcaudit::NullModelParams p;
    p.repetitions = 20;
    p.seed = 1;
    const auto null = fcaudit::sample_null_distribution(data, map, fcaudit::StatisticParams(), p);
    expect(null.invalid_trials == 20, "every trial invalid", failed);
    expect(degenerate(1.0, null), "significance refuses an all-invalid null", failed);

    fcaudit::CancelToken cancel;
    cancel.request();
    bool cancelled = false;
    try {
        (void)fcaudit::sample_null_distribution(data, map, fcaudit::StatisticParams(), p,
                                                fcaudit::TrialProgressFn(), &cancel);
    } catch (const fcaudit::RunCancelled&) {
        cancelled = true;
    }
    expect(cancelled, "cancelled sampling throws RunCancelled", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

}  // namespace

int main() {
    int total = 0;
    total += test_reproducibility();
    total += test_compliant_data_in_lower_tail();
    total += test_standard_error_narrows();
    total += test_significance_formulas();
    total += test_degenerate_data();

    if (total == 0) {
        std::cout << "\nAll null model tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " test(s) FAILED.\n";
    return 1;
}
