#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "chanloop/v1/averaging.hpp"
#include "chanloop/v1/simulation.hpp"
#include "chanloop/v1/waveform.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>
#include <numbers>
#include <vector>

using namespace chanloop::v1;
using Catch::Approx;

namespace {

ModelParameters make_params(int cycles = 3) {
    ModelParameters p;
    p.saturation_flux_density = 1.5;
    p.remanence = 0.3;
    p.coercive_field = 50.0;
    p.field_amplitude = 100.0;
    p.frequency = 50.0;
    p.samples_per_cycle = 200;
    p.num_cycles = cycles;
    p.discard_cycles = 0;
    return p;
}

std::vector<LoopSample> cycle_of(const std::vector<LoopSample>& samples, int cycle) {
    std::vector<LoopSample> out;
    std::copy_if(samples.begin(), samples.end(), std::back_inserter(out),
                 [cycle](const LoopSample& s) { return s.cycle == cycle; });
    return out;
}

/// Sample a periodic winding current over one period and convert it to H.
template <typename Current>
ExcitationWaveform sampled_current(const ModelParameters& params, Current current) {
    const int n = params.samples_per_cycle;
    const Real period = params.period();
    std::vector<Real> time(static_cast<std::size_t>(n));
    std::vector<Real> amps(static_cast<std::size_t>(n));
    for (int k = 0; k < n; ++k) {
        const Real phase = 2.0 * std::numbers::pi * static_cast<Real>(k) / static_cast<Real>(n);
        time[static_cast<std::size_t>(k)] = period * static_cast<Real>(k) / static_cast<Real>(n);
        amps[static_cast<std::size_t>(k)] = current(phase);
    }
    return excitation_from_current(time, amps, period, params);
}

void check_settled_and_bounded(const ModelParameters& params,
                               const std::vector<LoopSample>& samples) {
    REQUIRE(samples.size() ==
            static_cast<std::size_t>(params.num_cycles * params.samples_per_cycle));
    for (const auto& s : samples) {
        CHECK(std::abs(s.b) <= params.saturation_flux_density);
    }
    CHECK(cycle_to_cycle_change(samples) < 1e-9);

    const auto second = cycle_of(samples, 1);
    const auto last = cycle_of(samples, params.num_cycles - 1);
    for (std::size_t k = 0; k < last.size(); ++k) {
        CHECK(last[k].b == Approx(second[k].b).margin(1e-9));
    }
}

}  // namespace

TEST_CASE("Excitation covers one period without its end point", "[waveform]") {
    const ModelParameters params = make_params();
    const ExcitationWaveform wf = make_excitation(params);

    REQUIRE(wf.size() == 200);
    CHECK(wf.period == Approx(0.02));
    CHECK(wf.time.front() == 0.0);
    CHECK(wf.time.back() < wf.period);
    CHECK(wf.field[50] == Approx(100.0));
    CHECK(wf.field[150] == Approx(-100.0));
    REQUIRE_NOTHROW(validate_waveform(wf));
}

TEST_CASE("Triangle excitation peaks at the quarter periods", "[waveform]") {
    ModelParameters params = make_params();
    params.waveform = WaveformShape::Triangle;
    const ExcitationWaveform wf = make_excitation(params);

    CHECK(wf.field[0] == Approx(0.0).margin(1e-12));
    CHECK(wf.field[25] == Approx(50.0));
    CHECK(wf.field[50] == Approx(100.0));
    CHECK(wf.field[100] == Approx(0.0).margin(1e-9));
    CHECK(wf.field[150] == Approx(-100.0));
}

TEST_CASE("Waveform validation rejects non-increasing time", "[waveform][validation]") {
    ExcitationWaveform wf;
    wf.period = 1.0;
    wf.time = {0.0, 0.5, 0.5};
    wf.field = {0.0, 1.0, 0.0};
    CHECK_THROWS_AS(validate_waveform(wf), InvalidParameterError);

    wf.time = {0.0, 0.5, 0.7};
    wf.field = {0.0, std::numeric_limits<Real>::quiet_NaN(), 0.0};
    CHECK_THROWS_AS(validate_waveform(wf), InvalidParameterError);

    wf.field = {0.0, 1.0, 0.0};
    wf.period = 0.6;
    CHECK_THROWS_AS(validate_waveform(wf), InvalidParameterError);

    wf.time = {0.0};
    wf.field = {0.0};
    wf.period = 1.0;
    CHECK_THROWS_AS(validate_waveform(wf), InvalidParameterError);
}

TEST_CASE("Current excitation scales by turns over path length", "[waveform]") {
    ModelParameters params = make_params();
    params.turns = 20;
    params.path_length = 0.2;

    const ExcitationWaveform wf =
        excitation_from_current({0.0, 0.25, 0.5, 0.75}, {0.0, 1.0, 0.0, -1.0}, 1.0, params);
    CHECK(wf.field[1] == Approx(100.0));
    CHECK(wf.field[3] == Approx(-100.0));

    CHECK_THROWS_AS(excitation_from_current({0.0, 0.5}, {0.0}, 1.0, params), InvalidParameterError);
}

TEST_CASE("Simulation emits one sample per waveform point per cycle", "[simulation]") {
    const ModelParameters params = make_params(4);
    const auto samples = simulate(params, make_excitation(params));

    REQUIRE(samples.size() == 800);
    CHECK(samples.front().cycle == 0);
    CHECK(samples.back().cycle == 3);
    CHECK(samples.back().phase == 199);
    for (std::size_t i = 1; i < samples.size(); ++i) {
        CHECK(samples[i].time > samples[i - 1].time);
    }
    CHECK(samples[200].time == Approx(0.02));
}

TEST_CASE("Simulation starts on the initial magnetisation curve", "[simulation]") {
    const ModelParameters params = make_params(1);
    const ChanCore core(params);
    const auto samples = simulate(params, make_excitation(params));

    CHECK(samples[0].b == 0.0);
    for (int k = 0; k <= 50; ++k) {
        CHECK(samples[k].b == core.initial(samples[k].h));
    }
}

TEST_CASE("Steady-state ungapped loop follows the static branches", "[simulation][branches]") {
    const ModelParameters params = make_params(3);
    const ChanCore core(params);
    const Real shift = core.minor_loop_shift(params.field_amplitude);

    const auto last = cycle_of(simulate(params, make_excitation(params)), 2);
    REQUIRE(last.size() == 200);

    for (const auto& s : last) {
        const bool descending = s.phase > 50 && s.phase <= 150;
        const Real expected = descending ? core.descending(s.h) - shift
                                         : core.ascending(s.h) + shift;
        CHECK(s.b == Approx(expected).margin(1e-12));
    }
}

TEST_CASE("Cycles carry state forward and settle after the first", "[simulation][steady]") {
    const ModelParameters params = make_params(4);
    const auto samples = simulate(params, make_excitation(params));

    const auto first = cycle_of(samples, 0);
    const auto second = cycle_of(samples, 1);
    const auto fourth = cycle_of(samples, 3);

    // The first quarter of cycle 0 is on the initial curve, so it differs.
    CHECK(std::abs(first[25].b - second[25].b) > 1e-3);
    for (std::size_t k = 0; k < fourth.size(); ++k) {
        CHECK(fourth[k].b == Approx(second[k].b).margin(1e-12));
    }
}

TEST_CASE("Simulator run continues from its previous state", "[simulation][steady]") {
    ModelParameters one = make_params(1);
    const ExcitationWaveform wf = make_excitation(one);

    Simulator sim(one);
    const auto first = sim.run(wf);
    const auto resumed = sim.run(wf);

    ModelParameters two = make_params(2);
    const auto reference = cycle_of(simulate(two, wf), 1);

    REQUIRE(resumed.size() == reference.size());
    for (std::size_t k = 0; k < resumed.size(); ++k) {
        CHECK(resumed[k].b == reference[k].b);
    }
    CHECK(sim.state().branch == Branch::Ascending);

    sim.reset();
    CHECK(sim.state().b == 0.0);
    CHECK(sim.state().branch == Branch::Initial);
    CHECK(first.size() == 200);
}

TEST_CASE("Zero gap gives identical output on every geometry", "[simulation][gap]") {
    ModelParameters a = make_params(3);
    ModelParameters b = a;
    b.path_length = 0.7;
    b.cross_section = 3e-3;
    b.turns = 7;
    REQUIRE(a.gap_length == 0.0);

    const auto sa = simulate(a, make_excitation(a));
    const auto sb = simulate(b, make_excitation(b));
    REQUIRE(sa.size() == sb.size());
    for (std::size_t i = 0; i < sa.size(); ++i) {
        CHECK(sa[i].b == sb[i].b);
        CHECK(sa[i].h_core == sa[i].h);
    }
}

TEST_CASE("Gapped core shears the loop", "[simulation][gap]") {
    ModelParameters ungapped = make_params(3);
    ModelParameters gapped = ungapped;
    gapped.gap_length = 1e-5;

    const ChanCore core(gapped);
    const Real g = core.demagnetizing_factor();

    const auto su = simulate(ungapped, make_excitation(ungapped));
    const auto sg = simulate(gapped, make_excitation(gapped));

    Real peak_u = 0.0;
    Real peak_g = 0.0;
    for (std::size_t i = 0; i < sg.size(); ++i) {
        CHECK(sg[i].h_core == Approx(sg[i].h - g * sg[i].b).margin(1e-9));
        peak_u = std::max(peak_u, std::abs(su[i].b));
        peak_g = std::max(peak_g, std::abs(sg[i].b));
    }
    CHECK(peak_g < peak_u);
    CHECK(peak_g > 0.0);

    // Still a closed, origin-symmetric steady state
    const auto last = cycle_of(sg, 2);
    for (int k = 0; k < 100; ++k) {
        CHECK(last[k].b == Approx(-last[k + 100].b).margin(1e-9));
    }
}

TEST_CASE("Negative gap is rejected before simulating", "[simulation][validation]") {
    ModelParameters params = make_params();
    params.gap_length = -1e-3;

    CHECK_THROWS_AS(Simulator(params), InvalidParameterError);

    ExcitationWaveform wf;
    wf.period = 0.02;
    wf.time = {0.0, 0.01};
    wf.field = {0.0, 1.0};
    CHECK_THROWS_AS(simulate(params, wf), InvalidParameterError);
}

TEST_CASE("Invalid material constants are rejected", "[simulation][validation]") {
    ModelParameters params = make_params();

    SECTION("remanence at saturation") {
        params.remanence = params.saturation_flux_density;
    }
    SECTION("non-positive saturation") {
        params.saturation_flux_density = 0.0;
    }
    SECTION("zero frequency") {
        params.frequency = 0.0;
    }
    SECTION("too few samples") {
        params.samples_per_cycle = 3;
    }
    SECTION("no cycles") {
        params.num_cycles = 0;
    }
    SECTION("non-finite coercivity") {
        params.coercive_field = std::numeric_limits<Real>::infinity();
    }

    CHECK_THROWS_AS(validate_parameters(params), InvalidParameterError);
    CHECK_THROWS_AS(Simulator(params), InvalidParameterError);
}

TEST_CASE("Biased excitation settles to a closed minor loop", "[simulation][steady]") {
    // 100 turns on 0.1 m: H = 1000 * i, so this is H = 150 + 30 sin(wt)
    ModelParameters params = make_params(12);
    const ExcitationWaveform wf =
        sampled_current(params, [](Real phase) { return 0.15 + 0.03 * std::sin(phase); });
    REQUIRE(wf.field[0] == Approx(150.0));

    std::vector<LoopSample> samples;
    REQUIRE_NOTHROW(samples = simulate(params, wf));
    check_settled_and_bounded(params, samples);

    // Phase 0 of cycle 0 is on the initial curve: (f(100) + f(200)) / 2
    CHECK(samples[0].b == Approx(0.625));
    CHECK(cycle_of(samples, params.num_cycles - 1)[0].b == Approx(0.645706).margin(1e-6));
}

TEST_CASE("Biased excitation on a gapped core settles", "[simulation][steady][gap]") {
    ModelParameters params = make_params(12);
    params.gap_length = 1e-5;
    const ExcitationWaveform wf =
        sampled_current(params, [](Real phase) { return 0.15 + 0.03 * std::sin(phase); });

    std::vector<LoopSample> samples;
    REQUIRE_NOTHROW(samples = simulate(params, wf));
    check_settled_and_bounded(params, samples);
}

TEST_CASE("Excitation with interior reversals settles", "[simulation][steady]") {
    ModelParameters params = make_params(12);
    const ExcitationWaveform wf = sampled_current(params, [](Real phase) {
        return 0.1 * std::sin(phase) + 0.06 * std::sin(3.0 * phase);
    });

    std::vector<LoopSample> samples;
    REQUIRE_NOTHROW(samples = simulate(params, wf));
    check_settled_and_bounded(params, samples);
}

TEST_CASE("Closing a minor loop returns to the outer curve", "[simulation][reversal]") {
    const ModelParameters params = make_params(1);

    Simulator outer(params);
    for (Real h : {200.0, 0.0, 100.0}) outer.step(h);
    const Real b_at_100 = outer.state().b;
    outer.step(150.0);
    const Real b_at_150 = outer.state().b;

    Simulator inner(params);
    for (Real h : {200.0, 0.0, 100.0}) inner.step(h);
    CHECK(inner.state().b == b_at_100);

    // Minor loop 100 -> 50 -> 100
    inner.step(50.0);
    CHECK(inner.state().b < b_at_100);
    CHECK(inner.state().reversals.size() == 3);
    inner.step(100.0);
    CHECK(inner.state().b == Approx(b_at_100).margin(1e-12));
    CHECK(inner.state().reversals.size() == 2);

    inner.step(150.0);
    CHECK(inner.state().b == Approx(b_at_150).margin(1e-12));
    CHECK(inner.state().branch == Branch::Ascending);
}

TEST_CASE("Going past the first reversal resumes the initial curve", "[simulation][reversal]") {
    const ModelParameters params = make_params(1);
    const ChanCore core(params);

    Simulator sim(params);
    for (Real h : {100.0, 20.0, 120.0}) sim.step(h);

    CHECK(sim.state().reversals.empty());
    CHECK(sim.state().branch == Branch::Initial);
    CHECK(sim.state().b == Approx(core.initial(120.0)).margin(1e-12));
}
