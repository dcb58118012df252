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

#include <vstruct/observation.hpp>

#include <stdexcept>
#include <string>

using vstruct::Observed;
using vstruct::Missing;
using vstruct::Observation;

vstruct::Observed::Observed(int value) : value_{value} {
    if(value != 0 && value != 1) {
        throw std::invalid_argument("Parent value " + std::to_string(value) + " is not binary.");
    }
}

vstruct::Observation::Observation(parent_value_t x, parent_value_t y, int z) :
    x_{std::move(x)}, y_{std::move(y)}, z_{z} {
    if(z != 0 && z != 1) {
        throw std::invalid_argument("Child value " + std::to_string(z) + " is not binary.");
    }
}

vstruct::parent_value_t vstruct::make_parent_value(std::optional<int> v) {
    if(!v) {
        return Missing{};
    }
    return Observed{*v};
}

Observation vstruct::make_observation(std::optional<int> x, std::optional<int> y, int z) {
    return {make_parent_value(x), make_parent_value(y), z};
}

// LCOV_EXCL_START
TEST_CASE("Observed.Constructor") {
    CHECK(Observed{0}.value() == 0);
    CHECK(Observed{1}.value() == 1);
    CHECK_THROWS_AS(Observed{2}, std::invalid_argument);
    CHECK_THROWS_AS(Observed{-1}, std::invalid_argument);
}

TEST_CASE("Observation.Constructor") {
    Observation obs{Observed{1}, Missing{}, 0};
    CHECK(obs.x() == vstruct::parent_value_t{Observed{1}});
    CHECK(vstruct::is_missing(obs.y()));
    CHECK(obs.z() == 0);

    CHECK_THROWS_AS(Observation(Observed{0}, Missing{}, 3), std::invalid_argument);
    CHECK_THROWS_AS(Observation(Missing{}, Missing{}, -1), std::invalid_argument);
    CHECK_THROWS_AS(Observation(Observed{2}, Missing{}, 3), std::invalid_argument);

    // out-of-range values never reach the E-step
    CHECK_THROWS_AS(vstruct::Dataset({Observation(Observed{0}, Observed{1}, 2)}),
        std::invalid_argument);
}

TEST_CASE("make_observation") {
    CHECK(vstruct::make_observation(0, std::nullopt, 1)
        == Observation(Observed{0}, Missing{}, 1));
    CHECK(vstruct::is_missing(vstruct::make_parent_value(std::nullopt)));
    CHECK_THROWS_AS(vstruct::make_observation(3, 0, 1), std::invalid_argument);
    CHECK_THROWS_AS(vstruct::make_observation(0, 7, 1), std::invalid_argument);
    CHECK_THROWS_AS(vstruct::make_observation(0, 1, 5), std::invalid_argument);
}

TEST_CASE("candidate_values") {
    CHECK(vstruct::candidate_values(Observed{0}) == std::make_pair(0, 1));
    CHECK(vstruct::candidate_values(Observed{1}) == std::make_pair(1, 2));
    CHECK(vstruct::candidate_values(Missing{}) == std::make_pair(0, 2));
}
// LCOV_EXCL_STOP
