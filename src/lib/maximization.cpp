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

#include <vstruct/maximization.hpp>

#include <cmath>

using vstruct::Parameters;
using vstruct::SufficientStatistics;
using vstruct::marginal_t;
using vstruct::conditional_t;

namespace {
marginal_t normalize_marginal(const marginal_t &m, const std::string &name) {
    vstruct::real_t total = xt::sum(m)();
    if(!(total > 0.0)) {
        throw vstruct::DegenerateParameterError(name, "expected counts sum to "
            + std::to_string(total) + ".");
    }
    return m / total;
}
} // anon namespace

Parameters vstruct::Maximize(const SufficientStatistics &stats) {
    auto qx = normalize_marginal(stats.mx, "qx");
    auto qy = normalize_marginal(stats.my, "qy");

    auto qz = make_conditional();
    for(table_size_t a = 0; a < num_states; ++a) {
        for(table_size_t b = 0; b < num_states; ++b) {
            real_t total = stats.mz(a,b,0) + stats.mz(a,b,1);
            if(!(total > 0.0)) {
                throw DegenerateParameterError("qz", "parent configuration (X="
                    + std::to_string(a) + ", Y=" + std::to_string(b)
                    + ") has no expected observations.");
            }
            for(table_size_t c = 0; c < num_states; ++c) {
                qz(a,b,c) = stats.mz(a,b,c) / total;
            }
        }
    }
    return {std::move(qx), std::move(qy), std::move(qz)};
}

// LCOV_EXCL_START
TEST_CASE("Maximize") {
    SUBCASE("Hand computed") {
        SufficientStatistics stats;
        stats.mx = marginal_t{3.0, 1.0};
        stats.my = marginal_t{1.5, 2.5};
        stats.mz = conditional_t{
            {{0.5, 0.5}, {2.0, 0.0}},
            {{0.25, 0.75}, {0.0, 0.0001}}
        };
        auto params = vstruct::Maximize(stats);
        CHECK_APPROX_RANGES(params.qx(), marginal_t({0.75, 0.25}), 1e-12);
        CHECK_APPROX_RANGES(params.qy(), marginal_t({0.375, 0.625}), 1e-12);
        CHECK(params.qz()(0,0,0) == doctest::Approx(0.5));
        CHECK(params.qz()(0,1,0) == 1.0);
        CHECK(params.qz()(0,1,1) == 0.0);
        CHECK(params.qz()(1,0,1) == doctest::Approx(0.75));
        CHECK(params.qz()(1,1,1) == 1.0);
    }
    SUBCASE("Complete data gives empirical frequencies") {
        vstruct::random_engine_t rng{31};
        auto data = vstruct::Simulate(vstruct::CanonicalParameters(), 400,
            vstruct::MissingPolicy{false, false}, rng);
        empirical_counts_t counts{data};
        auto params = vstruct::Maximize(vstruct::Expect(vstruct::CanonicalParameters(), data));
        CHECK(params.qx()(1) == doctest::Approx(counts.mx(1)/400.0));
        CHECK(params.qy()(0) == doctest::Approx(counts.my(0)/400.0));
        for(int a = 0; a < 2; ++a) {
            for(int b = 0; b < 2; ++b) {
                CAPTURE(a);
                CAPTURE(b);
                vstruct::real_t n_ab = counts.mz(a,b,0) + counts.mz(a,b,1);
                CHECK(params.qz()(a,b,1) == doctest::Approx(counts.mz(a,b,1)/n_ab));
            }
        }
    }
    SUBCASE("Unvisited parent configuration") {
        SufficientStatistics stats;
        stats.mx = marginal_t{2.0, 0.0};
        stats.my = marginal_t{1.0, 1.0};
        stats.mz(0,0,1) = 1.0;
        stats.mz(0,1,0) = 1.0;
        CHECK_THROWS_AS(vstruct::Maximize(stats), vstruct::DegenerateParameterError);
        try {
            auto params = vstruct::Maximize(stats);
            FAIL("expected a DegenerateParameterError");
        } catch(const vstruct::DegenerateParameterError &e) {
            CHECK(e.table() == "qz");
            CHECK(e.detail().find("(X=1, Y=0)") != std::string::npos);
        }
    }
    SUBCASE("Empty statistics") {
        SufficientStatistics stats;
        CHECK_THROWS_AS(vstruct::Maximize(stats), vstruct::DegenerateParameterError);
    }
    SUBCASE("NaN statistics are not coerced") {
        SufficientStatistics stats;
        stats.mx = marginal_t{1.0, 1.0};
        stats.my = marginal_t{1.0, 1.0};
        stats.mz.fill(0.5);
        stats.mz(1,1,0) = std::nan("");
        stats.mz(1,1,1) = std::nan("");
        CHECK_THROWS_AS(vstruct::Maximize(stats), vstruct::DegenerateParameterError);
    }
}
// LCOV_EXCL_STOP
