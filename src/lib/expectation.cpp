/*
# Copyright (c) 2022 Reed A. Cartwright <racartwright@gmail.com>
#
# This file is part of the Ultimate Source Code Project.
#
# Permission is hereby granted, free of charge, to any person obtaining a copy
# of this software and associated documentation files (the "Software"), to deal
# in the Software without restriction, including without limitation the rights
# to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
# copies of the Software, and to permit persons to whom the Software is
# furnished to do so, subject to the following conditions:
#
# The above copyright notice and this permission notice shall be included in all
# copies or substantial portions of the Software.
#
# THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
# IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
# FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
# AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
# LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
# OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
# SOFTWARE.
*/

#include "unit_testing.hpp"
#include "em_testing.hpp"

#include <vstruct/expectation.hpp>
#include <vstruct/utility.hpp>

#include <algorithm>
#include <cassert>
#include <cmath>

using vstruct::SufficientStatistics;
using vstruct::responsibility_t;
using vstruct::real_t;
using vstruct::Observed;
using vstruct::Missing;
using vstruct::utility::overloaded;

// Q(a,b) = P(X=a,Y=b|observed parents,z)
//
// When a parent is observed, the entries of Q that disagree with it are
// structurally zero and the factor for the observed parent cancels out.
responsibility_t vstruct::Responsibilities(const Parameters &params, const Observation &obs) {
    const auto &qx = params.qx();
    const auto &qy = params.qy();
    const auto &qz = params.qz();
    const int z = obs.z();

    auto q = make_responsibility();

    std::visit(overloaded{
        [&](Observed x, Observed y) {
            q(x.value(), y.value()) = 1.0;
        },
        [&](Missing, Observed y) {
            for(int a = 0; a < 2; ++a) {
                q(a, y.value()) = qx(a) * qz(a, y.value(), z);
            }
        },
        [&](Observed x, Missing) {
            for(int b = 0; b < 2; ++b) {
                q(x.value(), b) = qy(b) * qz(x.value(), b, z);
            }
        },
        [&](Missing, Missing) {
            for(int a = 0; a < 2; ++a) {
                for(int b = 0; b < 2; ++b) {
                    q(a, b) = qx(a) * qy(b) * qz(a, b, z);
                }
            }
        }
    }, obs.x(), obs.y());

    real_t total = xt::sum(q)();
    if(!(total > 0.0) || !std::isfinite(total)) {
        throw DegenerateParameterError("posterior", "an observation with Z="
            + std::to_string(z) + " has zero probability under every completion"
            " of its missing parents.");
    }
    q /= total;

    real_t check = xt::sum(q)();
    if(std::fabs(check - 1.0) > Parameters::DEFAULT_TOLERANCE) {
        throw ValidationError("posterior", "responsibilities sum to "
            + std::to_string(check) + " instead of 1.");
    }
    return q;
}

void vstruct::Accumulate(const Parameters &params, const Observation &obs,
    SufficientStatistics *stats) {
    assert(stats != nullptr);

    auto q = Responsibilities(params, obs);

    // Observed parents are counted exactly; missing ones receive the
    // marginal of their posterior.
    std::visit(overloaded{
        [&](Observed x) { stats->mx(x.value()) += 1.0; },
        [&](Missing) { stats->mx += xt::sum(q, {1}); }
    }, obs.x());

    std::visit(overloaded{
        [&](Observed y) { stats->my(y.value()) += 1.0; },
        [&](Missing) { stats->my += xt::sum(q, {0}); }
    }, obs.y());

    xt::view(stats->mz, xt::all(), xt::all(), obs.z()) += q;
}

SufficientStatistics vstruct::ExpectPartitioned(const Parameters &params, const Dataset &data,
    std::size_t num_partitions) {
    if(num_partitions == 0) {
        throw std::invalid_argument("The number of partitions must be positive.");
    }
    const std::size_t block = (data.size() + num_partitions - 1) / num_partitions;

    SufficientStatistics stats;
    auto first = data.begin();
    while(first != data.end()) {
        auto last = first + std::min<std::size_t>(block, data.end() - first);
        stats += Expect(params, first, last);
        first = last;
    }
    return stats;
}

void vstruct::CheckStatistics(const SufficientStatistics &stats, std::size_t n, real_t tol) {
    const real_t slack = tol * std::max<real_t>(static_cast<real_t>(n), 1.0);

    auto check_entries = [](const auto &m, const std::string &name) {
        for(auto v : m) {
            if(!std::isfinite(v) || v < 0.0) {
                throw ValidationError(name, "expected count " + std::to_string(v)
                    + " is negative or not finite.");
            }
        }
    };
    check_entries(stats.mx, "Mx");
    check_entries(stats.my, "My");
    check_entries(stats.mz, "Mz");

    auto check_mass = [&](real_t observed, real_t expected, const std::string &name,
        const std::string &what) {
        if(!(std::fabs(observed - expected) <= slack)) {
            throw ValidationError(name, what + " is " + std::to_string(observed)
                + " instead of " + std::to_string(expected) + ".");
        }
    };

    check_mass(xt::sum(stats.mx)(), static_cast<real_t>(n), "Mx", "total mass");
    check_mass(xt::sum(stats.my)(), static_cast<real_t>(n), "My", "total mass");
    for(table_size_t a = 0; a < num_states; ++a) {
        real_t mass = xt::sum(xt::view(stats.mz, a, xt::all(), xt::all()))();
        check_mass(mass, stats.mx(a), "Mz", "mass of Mz(" + std::to_string(a) + ",:,:)");
    }
    for(table_size_t b = 0; b < num_states; ++b) {
        real_t mass = xt::sum(xt::view(stats.mz, xt::all(), b, xt::all()))();
        check_mass(mass, stats.my(b), "Mz", "mass of Mz(:," + std::to_string(b) + ",:)");
    }
}

// LCOV_EXCL_START
TEST_CASE("Responsibilities") {
    auto params = vstruct::CanonicalParameters();

    SUBCASE("Both parents observed") {
        auto q = vstruct::Responsibilities(params, make_test_observation(1, 0, 1));
        CHECK_EQ_RANGES(q, responsibility_t({{0.0, 0.0}, {1.0, 0.0}}));
    }
    SUBCASE("X missing") {
        // Q(a,1) ~ qx(a) qz(a,1,1) = {0.48, 0.08}
        auto q = vstruct::Responsibilities(params, make_test_observation(-1, 1, 1));
        CHECK(q(0,0) == 0.0);
        CHECK(q(1,0) == 0.0);
        CHECK(q(0,1) == doctest::Approx(6.0/7.0));
        CHECK(q(1,1) == doctest::Approx(1.0/7.0));
    }
    SUBCASE("Y missing") {
        // Q(0,b) ~ qy(b) qz(0,b,0) = {0.27, 0.14}
        auto q = vstruct::Responsibilities(params, make_test_observation(0, -1, 0));
        CHECK(q(1,0) == 0.0);
        CHECK(q(1,1) == 0.0);
        CHECK(q(0,0) == doctest::Approx(27.0/41.0));
        CHECK(q(0,1) == doctest::Approx(14.0/41.0));
    }
    SUBCASE("Both parents missing") {
        auto q = vstruct::Responsibilities(params, make_test_observation(-1, -1, 1));
        CHECK(q(0,0) == doctest::Approx(0.018/0.494));
        CHECK(q(0,1) == doctest::Approx(0.336/0.494));
        CHECK(q(1,0) == doctest::Approx(0.084/0.494));
        CHECK(q(1,1) == doctest::Approx(0.056/0.494));
    }
    SUBCASE("Zero probability observation") {
        // Z is always 0
        vstruct::Parameters degenerate{{0.5, 0.5}, {0.5, 0.5},
            {{{1.0, 0.0}, {1.0, 0.0}}, {{1.0, 0.0}, {1.0, 0.0}}}};
        CHECK_THROWS_AS(vstruct::Responsibilities(degenerate, make_test_observation(-1, 0, 1)),
            vstruct::DegenerateParameterError);
        CHECK_THROWS_AS(vstruct::Responsibilities(degenerate, make_test_observation(1, -1, 1)),
            vstruct::DegenerateParameterError);
        CHECK_THROWS_AS(vstruct::Responsibilities(degenerate, make_test_observation(-1, -1, 1)),
            vstruct::DegenerateParameterError);
        // complete observations need no posterior
        CHECK_NOTHROW(vstruct::Responsibilities(degenerate, make_test_observation(1, 1, 1)));
        CHECK_NOTHROW(vstruct::Responsibilities(degenerate, make_test_observation(-1, -1, 0)));
    }
}

TEST_CASE("Expect") {
    auto params = vstruct::CanonicalParameters();

    SUBCASE("Empty dataset") {
        auto stats = vstruct::Expect(params, vstruct::Dataset{});
        CHECK(xt::sum(stats.mx)() == 0.0);
        CHECK(xt::sum(stats.my)() == 0.0);
        CHECK(xt::sum(stats.mz)() == 0.0);
    }
    SUBCASE("Observed parents are counted exactly") {
        vstruct::Dataset data = {
            make_test_observation(-1, 1, 1),
            make_test_observation(0, -1, 0)
        };
        auto stats = vstruct::Expect(params, data);

        // X is observed once (as 0) and inferred once
        CHECK(stats.mx(0) == doctest::Approx(1.0 + 6.0/7.0));
        CHECK(stats.mx(1) == doctest::Approx(1.0/7.0));
        // Y is observed once (as 1) and inferred once
        CHECK(stats.my(0) == doctest::Approx(27.0/41.0));
        CHECK(stats.my(1) == doctest::Approx(1.0 + 14.0/41.0));

        CHECK(stats.mz(0,1,1) == doctest::Approx(6.0/7.0));
        CHECK(stats.mz(1,1,1) == doctest::Approx(1.0/7.0));
        CHECK(stats.mz(0,0,0) == doctest::Approx(27.0/41.0));
        CHECK(stats.mz(0,1,0) == doctest::Approx(14.0/41.0));
        CHECK(stats.mz(0,0,1) == 0.0);
        CHECK(stats.mz(1,0,1) == 0.0);
        CHECK(stats.mz(1,0,0) == 0.0);
        CHECK(stats.mz(1,1,0) == 0.0);
    }
    SUBCASE("Observed counts are integral") {
        vstruct::Dataset data = {
            make_test_observation(1, -1, 1),
            make_test_observation(1, -1, 0),
            make_test_observation(-1, 0, 1),
        };
        auto stats = vstruct::Expect(params, data);
        CHECK(stats.mx(1) >= 2.0);
        CHECK(stats.my(0) >= 1.0);
        CHECK(stats.mx(0) + stats.mx(1) == doctest::Approx(3.0));
    }
}

TEST_CASE("Expect on complete data gives empirical counts") {
    vstruct::random_engine_t rng{2022};
    auto truth = vstruct::CanonicalParameters();
    auto data = vstruct::Simulate(truth, 500, vstruct::MissingPolicy{false, false}, rng);
    empirical_counts_t counts{data};

    // the current parameters are irrelevant for complete data
    for(auto params : {truth, vstruct::Parameters::Create(vstruct::InitMode::Random, rng)}) {
        auto stats = vstruct::Expect(params, data);
        CHECK_EQ_RANGES(stats.mx, counts.mx);
        CHECK_EQ_RANGES(stats.my, counts.my);
        CHECK_EQ_RANGES(stats.mz, counts.mz);
    }
}

TEST_CASE("Expect conserves mass") {
    auto test = [](std::size_t n, vstruct::MissingPolicy policy, int seed) {
        CAPTURE(n);
        CAPTURE(policy.partially_observed);
        CAPTURE(policy.never_coobserved);
        CAPTURE(seed);

        vstruct::random_engine_t rng(seed);
        auto data = vstruct::Simulate(vstruct::CanonicalParameters(), n, policy, rng);
        auto params = vstruct::Parameters::Create(vstruct::InitMode::Random, rng);

        auto stats = vstruct::Expect(params, data);
        CHECK(xt::sum(stats.mx)() == doctest::Approx(n));
        CHECK(xt::sum(stats.my)() == doctest::Approx(n));
        for(int a = 0; a < 2; ++a) {
            real_t mass = xt::sum(xt::view(stats.mz, a, xt::all(), xt::all()))();
            CHECK(mass == doctest::Approx(stats.mx(a)));
        }
        for(int b = 0; b < 2; ++b) {
            real_t mass = xt::sum(xt::view(stats.mz, xt::all(), b, xt::all()))();
            CHECK(mass == doctest::Approx(stats.my(b)));
        }
        CHECK_NOTHROW(vstruct::CheckStatistics(stats, n, 1e-9));

        // every observation of Z is accounted for
        std::size_t z1 = std::count_if(data.begin(), data.end(),
            [](const auto &o) { return o.z() == 1; });
        real_t mass_z1 = xt::sum(xt::view(stats.mz, xt::all(), xt::all(), 1))();
        CHECK(mass_z1 == doctest::Approx(z1));
    };
    run_policy_tests(test);
}

TEST_CASE("Expect is order independent") {
    vstruct::random_engine_t rng{7};
    auto data = vstruct::Simulate(vstruct::CanonicalParameters(), 300,
        vstruct::MissingPolicy{true, false}, rng);
    auto params = vstruct::Parameters::Create(vstruct::InitMode::Random, rng);

    auto forward = vstruct::Expect(params, data);
    auto backward = vstruct::Expect(params, data.rbegin(), data.rend());

    CHECK_APPROX_RANGES(forward.mx, backward.mx, 1e-9);
    CHECK_APPROX_RANGES(forward.my, backward.my, 1e-9);
    CHECK_APPROX_RANGES(forward.mz, backward.mz, 1e-9);
}

TEST_CASE("ExpectPartitioned") {
    vstruct::random_engine_t rng{8};
    auto data = vstruct::Simulate(vstruct::CanonicalParameters(), 101,
        vstruct::MissingPolicy{true, false}, rng);
    auto params = vstruct::Parameters::Create(vstruct::InitMode::Random, rng);

    auto serial = vstruct::Expect(params, data);

    for(std::size_t k : {1, 2, 3, 7, 101, 150}) {
        CAPTURE(k);
        auto stats = vstruct::ExpectPartitioned(params, data, k);
        CHECK_APPROX_RANGES(stats.mx, serial.mx, 1e-9);
        CHECK_APPROX_RANGES(stats.my, serial.my, 1e-9);
        CHECK_APPROX_RANGES(stats.mz, serial.mz, 1e-9);

        // the same partitioning reproduces the same bits
        auto again = vstruct::ExpectPartitioned(params, data, k);
        CHECK_EQ_RANGES(stats.mz, again.mz);
    }
    auto single = vstruct::ExpectPartitioned(params, data, 1);
    CHECK_EQ_RANGES(single.mz, serial.mz);

    CHECK_THROWS_AS(vstruct::ExpectPartitioned(params, data, 0), std::invalid_argument);
}

TEST_CASE("CheckStatistics") {
    vstruct::random_engine_t rng{9};
    auto data = vstruct::Simulate(vstruct::CanonicalParameters(), 50,
        vstruct::MissingPolicy{true, false}, rng);
    auto stats = vstruct::Expect(vstruct::CanonicalParameters(), data);

    REQUIRE_NOTHROW(vstruct::CheckStatistics(stats, 50, 1e-9));
    CHECK_THROWS_AS(vstruct::CheckStatistics(stats, 51, 1e-9), vstruct::ValidationError);

    SUBCASE("Mz does not match Mx") {
        auto bad = stats;
        bad.mz(0,0,0) += 0.5;
        bad.mz(0,1,0) -= 0.5;
        bad.mz(1,1,0) += 0.5;
        bad.mz(1,0,0) -= 0.5;
        // marginals over Y still agree, but not over X
        bad.mz(0,1,1) += 0.25;
        bad.mz(1,1,1) -= 0.25;
        CHECK_THROWS_AS(vstruct::CheckStatistics(bad, 50, 1e-9), vstruct::ValidationError);
    }
    SUBCASE("Negative count") {
        auto bad = stats;
        bad.mx(0) = -bad.mx(0);
        CHECK_THROWS_AS(vstruct::CheckStatistics(bad, 50, 1e-9), vstruct::ValidationError);
    }
}
// LCOV_EXCL_STOP
