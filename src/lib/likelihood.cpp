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

#include <vstruct/likelihood.hpp>
#include <vstruct/maximization.hpp>

#include <cmath>
#include <limits>

using vstruct::real_t;

real_t vstruct::Probability(const Parameters &params, const Observation &obs) {
    auto [x_first, x_last] = candidate_values(obs.x());
    auto [y_first, y_last] = candidate_values(obs.y());

    real_t p = 0.0;
    for(int a = x_first; a < x_last; ++a) {
        for(int b = y_first; b < y_last; ++b) {
            p += params.Joint(a, b, obs.z());
        }
    }
    return p;
}

real_t vstruct::LogLikelihood(const Parameters &params, const Dataset &data) {
    real_t ll = 0.0;
    for(auto && obs : data) {
        real_t p = Probability(params, obs);
        if(p <= 0.0) {
            return -std::numeric_limits<real_t>::infinity();
        }
        ll += std::log(p);
    }
    return ll;
}

namespace {
// sum m*log(q) with 0*log(0) = 0
template<typename M, typename Q>
real_t weighted_log_sum(const M &m, const Q &q) {
    real_t ret = 0.0;
    auto qit = q.begin();
    for(auto mit = m.begin(); mit != m.end(); ++mit, ++qit) {
        if(*mit == 0.0) {
            continue;
        }
        if(*qit <= 0.0) {
            return -std::numeric_limits<real_t>::infinity();
        }
        ret += *mit * std::log(*qit);
    }
    return ret;
}
} // anon namespace

real_t vstruct::ExpectedLogLikelihood(const Parameters &params, const SufficientStatistics &stats) {
    return weighted_log_sum(stats.mx, params.qx())
         + weighted_log_sum(stats.my, params.qy())
         + weighted_log_sum(stats.mz, params.qz());
}

// LCOV_EXCL_START
TEST_CASE("Probability") {
    auto params = vstruct::CanonicalParameters();

    CHECK(vstruct::Probability(params, make_test_observation(0, 1, 1))
        == doctest::Approx(0.6*0.7*0.8));
    CHECK(vstruct::Probability(params, make_test_observation(-1, 1, 1))
        == doctest::Approx(0.6*0.7*0.8 + 0.4*0.7*0.2));
    CHECK(vstruct::Probability(params, make_test_observation(0, -1, 0))
        == doctest::Approx(0.6*0.3*0.9 + 0.6*0.7*0.2));
    CHECK(vstruct::Probability(params, make_test_observation(-1, -1, 1))
        == doctest::Approx(0.494));

    // Z is a proper distribution after marginalizing both parents
    real_t total = vstruct::Probability(params, make_test_observation(-1, -1, 0))
                 + vstruct::Probability(params, make_test_observation(-1, -1, 1));
    CHECK(total == doctest::Approx(1.0));
}

TEST_CASE("LogLikelihood") {
    auto params = vstruct::CanonicalParameters();

    CHECK(vstruct::LogLikelihood(params, vstruct::Dataset{}) == 0.0);

    vstruct::Dataset data = {
        make_test_observation(0, 1, 1),
        make_test_observation(-1, -1, 1)
    };
    CHECK(vstruct::LogLikelihood(params, data)
        == doctest::Approx(std::log(0.6*0.7*0.8) + std::log(0.494)));

    vstruct::Parameters degenerate{{0.5, 0.5}, {0.5, 0.5},
        {{{1.0, 0.0}, {1.0, 0.0}}, {{1.0, 0.0}, {1.0, 0.0}}}};
    real_t ll = vstruct::LogLikelihood(degenerate, data);
    CHECK(std::isinf(ll));
    CHECK(ll < 0.0);
}

TEST_CASE("ExpectedLogLikelihood") {
    vstruct::random_engine_t rng{41};
    auto truth = vstruct::CanonicalParameters();

    SUBCASE("Equals the log-likelihood on complete data") {
        auto data = vstruct::Simulate(truth, 250, vstruct::MissingPolicy{false, false}, rng);
        auto stats = vstruct::Expect(truth, data);
        CHECK(vstruct::ExpectedLogLikelihood(truth, stats)
            == doctest::Approx(vstruct::LogLikelihood(truth, data)));
    }
    SUBCASE("Maximized by the M-step") {
        auto data = vstruct::Simulate(truth, 250, vstruct::MissingPolicy{true, false}, rng);
        auto stats = vstruct::Expect(truth, data);
        auto best = vstruct::Maximize(stats);
        real_t q_best = vstruct::ExpectedLogLikelihood(best, stats);
        for(int i = 0; i < 25; ++i) {
            CAPTURE(i);
            auto other = vstruct::Parameters::Create(vstruct::InitMode::Random, rng);
            CHECK(vstruct::ExpectedLogLikelihood(other, stats) <= q_best);
        }
        CHECK(vstruct::ExpectedLogLikelihood(truth, stats) <= q_best);
    }
    SUBCASE("Zero counts ignore zero probabilities") {
        vstruct::Parameters degenerate{{1.0, 0.0}, {0.5, 0.5},
            {{{1.0, 0.0}, {1.0, 0.0}}, {{1.0, 0.0}, {1.0, 0.0}}}};
        vstruct::SufficientStatistics stats;
        stats.mx(0) = 2.0;
        stats.my(0) = 1.0;
        stats.my(1) = 1.0;
        stats.mz(0,0,0) = 1.0;
        stats.mz(0,1,0) = 1.0;
        CHECK(vstruct::ExpectedLogLikelihood(degenerate, stats)
            == doctest::Approx(2.0*std::log(0.5)));

        stats.mz(0,1,1) = 0.5;
        CHECK(std::isinf(vstruct::ExpectedLogLikelihood(degenerate, stats)));
    }
}
// LCOV_EXCL_STOP
