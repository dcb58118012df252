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

#include <vstruct/parameters.hpp>

#include <cmath>

using vstruct::Parameters;
using vstruct::marginal_t;
using vstruct::conditional_t;
using vstruct::real_t;

const std::map<std::string, vstruct::InitMode> vstruct::detail::INIT_MODE_MAP = {
    {"uniform", InitMode::Uniform},
    {"random", InitMode::Random}
};

namespace {
std::string format_row(const std::string &name, vstruct::table_size_t a, vstruct::table_size_t b) {
    return name + "(" + std::to_string(a) + "," + std::to_string(b) + ",:)";
}

void check_simplex(real_t p0, real_t p1, const std::string &table,
    const std::string &row, real_t tol) {
    if(!std::isfinite(p0) || !std::isfinite(p1)) {
        throw vstruct::ValidationError(table, row + " has a non-finite entry.");
    }
    if(p0 < 0.0 || p1 < 0.0) {
        throw vstruct::ValidationError(table, row + " has a negative entry.");
    }
    real_t sum = p0 + p1;
    if(std::fabs(sum - 1.0) > tol) {
        throw vstruct::ValidationError(table, row + " sums to "
            + std::to_string(sum) + " instead of 1.");
    }
}
} // anon namespace

void vstruct::CheckMarginal(const marginal_t &q, const std::string &name, real_t tol) {
    if(q.shape(0) != num_states) {
        throw ValidationError(name, "table has " + std::to_string(q.shape(0))
            + " entries instead of " + std::to_string(num_states) + ".");
    }
    check_simplex(q(0), q(1), name, name, tol);
}

void vstruct::CheckConditional(const conditional_t &q, const std::string &name, real_t tol) {
    for(auto d : q.shape()) {
        if(d != num_states) {
            throw ValidationError(name, "table is not 2x2x2.");
        }
    }
    for(table_size_t a = 0; a < num_states; ++a) {
        for(table_size_t b = 0; b < num_states; ++b) {
            check_simplex(q(a,b,0), q(a,b,1), name, format_row(name, a, b), tol);
        }
    }
}

void vstruct::CheckParameters(const Parameters &params, real_t tol) {
    CheckMarginal(params.qx(), "qx", tol);
    CheckMarginal(params.qy(), "qy", tol);
    CheckConditional(params.qz(), "qz", tol);
}

Parameters::Parameters(marginal_t qx, marginal_t qy, conditional_t qz) :
    qx_{std::move(qx)}, qy_{std::move(qy)}, qz_{std::move(qz)} {
    CheckParameters(*this, DEFAULT_TOLERANCE);
}

Parameters Parameters::Create(InitMode mode, random_engine_t &rng) {
    auto qx = make_marginal();
    auto qy = make_marginal();
    auto qz = make_conditional();

    if(mode == InitMode::Uniform) {
        qx.fill(1.0);
        qy.fill(1.0);
        qz.fill(1.0);
    } else {
        std::uniform_real_distribution<real_t> unif(0.0, 1.0);
        for(auto && v : qx) {
            v = unif(rng);
        }
        for(auto && v : qy) {
            v = unif(rng);
        }
        for(auto && v : qz) {
            v = unif(rng);
        }
    }

    // normalize each table and each row of qz
    qx /= xt::sum(qx)();
    qy /= xt::sum(qy)();
    for(table_size_t a = 0; a < num_states; ++a) {
        for(table_size_t b = 0; b < num_states; ++b) {
            auto row = xt::view(qz, a, b, xt::all());
            real_t total = xt::sum(row)();
            row /= total;
        }
    }

    return {std::move(qx), std::move(qy), std::move(qz)};
}

// LCOV_EXCL_START
TEST_CASE("detail::INIT_MODE_MAP") {
    const auto &map = vstruct::detail::INIT_MODE_MAP;
    REQUIRE(map.size() == 2);
    CHECK(map.at("uniform") == vstruct::InitMode::Uniform);
    CHECK(map.at("random") == vstruct::InitMode::Random);
}

TEST_CASE("Parameters::Parameters") {
    marginal_t qx = {0.6, 0.4};
    marginal_t qy = {0.3, 0.7};
    conditional_t qz = {{{0.9, 0.1}, {0.2, 0.8}}, {{0.3, 0.7}, {0.8, 0.2}}};

    CHECK_NOTHROW(Parameters(qx, qy, qz));

    Parameters params{qx, qy, qz};
    CHECK(params.Joint(0, 1, 1) == doctest::Approx(0.6*0.7*0.8));
    CHECK(params.Joint(1, 0, 0) == doctest::Approx(0.4*0.3*0.3));

    SUBCASE("qx does not sum to 1") {
        marginal_t bad = {0.6, 0.6};
        CHECK_THROWS_AS(Parameters(bad, qy, qz), vstruct::ValidationError);
        try {
            Parameters p{bad, qy, qz};
            FAIL("expected a ValidationError");
        } catch(const vstruct::ValidationError &e) {
            CHECK(e.table() == "qx");
            CHECK(e.iteration() == std::nullopt);
        }
    }
    SUBCASE("qy has a negative entry") {
        marginal_t bad = {1.5, -0.5};
        CHECK_THROWS_AS(Parameters(qx, bad, qz), vstruct::ValidationError);
    }
    SUBCASE("qy has three entries") {
        marginal_t bad = {0.2, 0.3, 0.5};
        CHECK_THROWS_AS(Parameters(qx, bad, qz), vstruct::ValidationError);
    }
    SUBCASE("qz row does not sum to 1") {
        conditional_t bad = qz;
        bad(1,0,1) = 0.8;
        CHECK_THROWS_AS(Parameters(qx, qy, bad), vstruct::ValidationError);
        try {
            Parameters p{qx, qy, bad};
            FAIL("expected a ValidationError");
        } catch(const vstruct::ValidationError &e) {
            CHECK(e.table() == "qz");
            CHECK(e.detail().find("qz(1,0,:)") != std::string::npos);
        }
    }
    SUBCASE("qz has a NaN") {
        conditional_t bad = qz;
        bad(0,0,0) = std::nan("");
        CHECK_THROWS_AS(Parameters(qx, qy, bad), vstruct::ValidationError);
    }
}

TEST_CASE("Parameters::Create") {
    vstruct::random_engine_t rng{1234};

    SUBCASE("Uniform") {
        auto params = Parameters::Create(vstruct::InitMode::Uniform, rng);
        CHECK_EQ_RANGES(params.qx(), marginal_t({0.5, 0.5}));
        CHECK_EQ_RANGES(params.qy(), marginal_t({0.5, 0.5}));
        for(auto v : params.qz()) {
            CHECK(v == 0.5);
        }
    }
    SUBCASE("Uniform does not consume random numbers") {
        vstruct::random_engine_t copy = rng;
        Parameters::Create(vstruct::InitMode::Uniform, rng);
        CHECK(copy == rng);
    }
    SUBCASE("Random") {
        for(int i = 0; i < 20; ++i) {
            CAPTURE(i);
            auto params = Parameters::Create(vstruct::InitMode::Random, rng);
            CHECK_NOTHROW(vstruct::CheckParameters(params, 1e-12));
            CHECK(xt::sum(params.qx())() == doctest::Approx(1.0));
            CHECK(xt::sum(params.qy())() == doctest::Approx(1.0));
            CHECK(xt::sum(params.qz())() == doctest::Approx(4.0));
        }
    }
    SUBCASE("Random is reproducible") {
        vstruct::random_engine_t rng1{99}, rng2{99};
        auto p1 = Parameters::Create(vstruct::InitMode::Random, rng1);
        auto p2 = Parameters::Create(vstruct::InitMode::Random, rng2);
        CHECK_EQ_RANGES(p1.qx(), p2.qx());
        CHECK_EQ_RANGES(p1.qy(), p2.qy());
        CHECK_EQ_RANGES(p1.qz(), p2.qz());
    }
}
// LCOV_EXCL_STOP
