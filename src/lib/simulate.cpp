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

#include <vstruct/simulate.hpp>

using vstruct::Dataset;
using vstruct::Parameters;

Parameters vstruct::CanonicalParameters() {
    marginal_t qx = {0.6, 0.4};
    marginal_t qy = {0.3, 0.7};
    conditional_t qz = {
        {{0.9, 0.1}, {0.2, 0.8}},
        {{0.3, 0.7}, {0.8, 0.2}}
    };
    return {std::move(qx), std::move(qy), std::move(qz)};
}

Dataset vstruct::Simulate(const Parameters &truth, std::size_t n, MissingPolicy policy,
    random_engine_t &rng) {
    // draw 1 with probability p
    auto draw = [&rng](real_t p) -> int {
        return std::bernoulli_distribution(p)(rng) ? 1 : 0;
    };

    Dataset ret;
    ret.reserve(n);
    for(std::size_t i = 0; i < n; ++i) {
        int x = draw(truth.qx()(1));
        int y = draw(truth.qy()(1));
        int z = draw(truth.qz()(x, y, 1));

        parent_value_t px = Observed{x};
        parent_value_t py = Observed{y};
        if(policy.partially_observed) {
            if(policy.never_coobserved) {
                if(draw(0.5)) {
                    px = Missing{};
                } else {
                    py = Missing{};
                }
            } else {
                if(draw(0.5)) {
                    px = Missing{};
                }
                if(draw(0.5)) {
                    py = Missing{};
                }
            }
        }
        ret.emplace_back(std::move(px), std::move(py), z);
    }
    return ret;
}

// LCOV_EXCL_START
TEST_CASE("CanonicalParameters") {
    auto truth = vstruct::CanonicalParameters();
    CHECK(truth.qx()(0) == doctest::Approx(0.6));
    CHECK(truth.qy()(1) == doctest::Approx(0.7));
    CHECK(truth.qz()(0,0,1) == doctest::Approx(0.1));
    CHECK(truth.qz()(0,1,1) == doctest::Approx(0.8));
    CHECK(truth.qz()(1,0,1) == doctest::Approx(0.7));
    CHECK(truth.qz()(1,1,1) == doctest::Approx(0.2));
}

TEST_CASE("Simulate") {
    using vstruct::MissingPolicy;
    using vstruct::is_missing;

    auto truth = vstruct::CanonicalParameters();

    SUBCASE("Fully observed") {
        vstruct::random_engine_t rng{11};
        auto data = vstruct::Simulate(truth, 5000, MissingPolicy{false, false}, rng);
        REQUIRE(data.size() == 5000);
        for(auto && o : data) {
            REQUIRE_FALSE(is_missing(o.x()));
            REQUIRE_FALSE(is_missing(o.y()));
        }
        // frequencies are close to the generating distribution
        empirical_counts_t counts{data};
        CHECK(counts.mx(0)/5000.0 == doctest::Approx(0.6).epsilon(0.05));
        CHECK(counts.my(1)/5000.0 == doctest::Approx(0.7).epsilon(0.05));
        vstruct::real_t p11 = counts.mz(0,1,1)/(counts.mz(0,1,0) + counts.mz(0,1,1));
        CHECK(p11 == doctest::Approx(0.8).epsilon(0.05));
    }
    SUBCASE("never_coobserved is ignored when partially_observed is false") {
        vstruct::random_engine_t rng{12};
        auto data = vstruct::Simulate(truth, 200, MissingPolicy{false, true}, rng);
        for(auto && o : data) {
            CHECK_FALSE(is_missing(o.x()));
            CHECK_FALSE(is_missing(o.y()));
        }
    }
    SUBCASE("Never co-observed") {
        vstruct::random_engine_t rng{13};
        auto data = vstruct::Simulate(truth, 1000, MissingPolicy{true, true}, rng);
        int x_missing = 0;
        for(auto && o : data) {
            CAPTURE(o);
            CHECK(is_missing(o.x()) != is_missing(o.y()));
            x_missing += is_missing(o.x());
        }
        CHECK(x_missing > 400);
        CHECK(x_missing < 600);
    }
    SUBCASE("Independent missingness") {
        vstruct::random_engine_t rng{14};
        auto data = vstruct::Simulate(truth, 4000, MissingPolicy{true, false}, rng);
        int both = 0, neither = 0, x_missing = 0, y_missing = 0;
        for(auto && o : data) {
            x_missing += is_missing(o.x());
            y_missing += is_missing(o.y());
            both += is_missing(o.x()) && is_missing(o.y());
            neither += !is_missing(o.x()) && !is_missing(o.y());
        }
        CHECK(x_missing > 1800);
        CHECK(x_missing < 2200);
        CHECK(y_missing > 1800);
        CHECK(y_missing < 2200);
        CHECK(both > 850);
        CHECK(both < 1150);
        CHECK(neither > 850);
        CHECK(neither < 1150);
    }
    SUBCASE("Same seed, same data") {
        vstruct::random_engine_t rng1{15}, rng2{15};
        auto a = vstruct::Simulate(truth, 300, MissingPolicy{true, false}, rng1);
        auto b = vstruct::Simulate(truth, 300, MissingPolicy{true, false}, rng2);
        CHECK(a == b);
    }
}
// LCOV_EXCL_STOP
