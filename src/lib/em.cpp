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

#include <vstruct/em.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

using vstruct::FitResult;
using vstruct::FitOptions;
using vstruct::Parameters;
using vstruct::real_t;

FitResult vstruct::Fit(const Dataset &data, const FitOptions &options, random_engine_t &rng) {
    if(options.iterations <= 0) {
        throw std::invalid_argument("The number of iterations must be positive.");
    }
    auto initial = Parameters::Create(options.init, rng);
    return Fit(data, initial, options);
}

FitResult vstruct::Fit(const Dataset &data, const Parameters &initial, const FitOptions &options) {
    if(options.iterations <= 0) {
        throw std::invalid_argument("The number of iterations must be positive.");
    }
    if(options.tolerance < 0.0) {
        throw std::invalid_argument("The convergence tolerance must not be negative.");
    }
    if(data.empty()) {
        throw std::invalid_argument("Unable to fit parameters to an empty dataset.");
    }

    FitResult result{initial, initial, 0.0, false, {}};
    result.history.reserve(options.iterations);

    Parameters params = initial;
    real_t previous_ll = 0.0;
    for(int t = 0; t < options.iterations; ++t) {
        real_t ll = LogLikelihood(params, data);
        if(options.tolerance > 0.0 && t > 0 && ll - previous_ll < options.tolerance) {
            result.converged = true;
            break;
        }
        previous_ll = ll;

        try {
            // E-step
            auto stats = Expect(params, data);
            CheckStatistics(stats, data.size(), options.check_tolerance);

            // M-step
            auto next = Maximize(stats);
            CheckParameters(next, options.check_tolerance);

            real_t q_before = ExpectedLogLikelihood(params, stats);
            real_t q_after = ExpectedLogLikelihood(next, stats);

            if(options.log != nullptr) {
                *options.log << "iteration " << t << "\tloglik " << ll
                             << "\tQ " << q_before << " -> " << q_after << "\n";
            }

            result.history.push_back({t, next, ll, q_before, q_after});
            params = std::move(next);
        } catch(const ValidationError &e) {
            throw e.AtIteration(t);
        } catch(const DegenerateParameterError &e) {
            throw e.AtIteration(t);
        }
    }

    result.parameters = params;
    result.log_likelihood = LogLikelihood(params, data);
    return result;
}

// LCOV_EXCL_START
namespace {
real_t max_abs_difference(const vstruct::conditional_t &a, const vstruct::conditional_t &b) {
    return xt::amax(xt::abs(a - b))();
}
} // anon namespace

TEST_CASE("Fit.Options") {
    vstruct::random_engine_t rng{51};
    auto data = vstruct::Simulate(vstruct::CanonicalParameters(), 20,
        vstruct::MissingPolicy{true, false}, rng);

    FitOptions options;
    options.iterations = 0;
    CHECK_THROWS_AS(vstruct::Fit(data, options, rng), std::invalid_argument);
    options.iterations = -3;
    CHECK_THROWS_AS(vstruct::Fit(data, options, rng), std::invalid_argument);

    options.iterations = 5;
    CHECK_THROWS_AS(vstruct::Fit(vstruct::Dataset{}, options, rng), std::invalid_argument);

    options.tolerance = -1.0;
    CHECK_THROWS_AS(vstruct::Fit(data, options, rng), std::invalid_argument);
}

TEST_CASE("Fit runs a fixed number of iterations") {
    vstruct::random_engine_t rng{52};
    auto data = vstruct::Simulate(vstruct::CanonicalParameters(), 200,
        vstruct::MissingPolicy{true, false}, rng);

    for(int iterations : {1, 3, 10, 25}) {
        CAPTURE(iterations);
        FitOptions options;
        options.iterations = iterations;
        auto result = vstruct::Fit(data, options, rng);
        REQUIRE(result.history.size() == static_cast<std::size_t>(iterations));
        CHECK_FALSE(result.converged);
        for(int t = 0; t < iterations; ++t) {
            CHECK(result.history[t].iteration == t);
        }
        CHECK_EQ_RANGES(result.parameters.qz(), result.history.back().parameters.qz());
    }
}

TEST_CASE("Fit recovers the MLE from complete data") {
    vstruct::random_engine_t rng{53};
    auto truth = vstruct::CanonicalParameters();
    auto data = vstruct::Simulate(truth, 500, vstruct::MissingPolicy{false, false}, rng);
    empirical_counts_t counts{data};

    FitOptions options;
    options.iterations = 10;
    options.init = vstruct::InitMode::Uniform;
    auto result = vstruct::Fit(data, options, rng);

    auto mle_qx = counts.mx / 500.0;
    auto mle_qy = counts.my / 500.0;
    CHECK_APPROX_RANGES(result.parameters.qx(), mle_qx, 0.05);
    CHECK_APPROX_RANGES(result.parameters.qy(), mle_qy, 0.05);
    for(int a = 0; a < 2; ++a) {
        for(int b = 0; b < 2; ++b) {
            CAPTURE(a);
            CAPTURE(b);
            real_t n_ab = counts.mz(a,b,0) + counts.mz(a,b,1);
            CHECK(std::fabs(result.parameters.qz()(a,b,1) - counts.mz(a,b,1)/n_ab) < 0.05);
        }
    }

    // the closed form is reached after a single iteration
    auto first = result.history.front().parameters;
    CHECK_APPROX_RANGES(first.qx(), mle_qx, 1e-12);
    CHECK_APPROX_RANGES(first.qy(), mle_qy, 1e-12);
    CHECK_APPROX_RANGES(first.qz(), result.parameters.qz(), 1e-12);

    // and the MLE is close to the truth for parameters with many samples
    CHECK_APPROX_RANGES(result.parameters.qx(), truth.qx(), 0.1);
    CHECK_APPROX_RANGES(result.parameters.qy(), truth.qy(), 0.1);
}

TEST_CASE("Fit keeps parameters on the simplex and ascends") {
    auto test = [](std::size_t n, vstruct::MissingPolicy policy, int seed) {
        CAPTURE(n);
        CAPTURE(policy.partially_observed);
        CAPTURE(policy.never_coobserved);
        CAPTURE(seed);

        vstruct::random_engine_t rng(seed);
        auto data = vstruct::Simulate(vstruct::CanonicalParameters(), n, policy, rng);

        for(auto init : {vstruct::InitMode::Uniform, vstruct::InitMode::Random}) {
            FitOptions options;
            options.iterations = 15;
            options.init = init;
            auto result = vstruct::Fit(data, options, rng);
            REQUIRE(result.history.size() == 15);

            real_t previous = -std::numeric_limits<real_t>::infinity();
            for(auto && record : result.history) {
                CAPTURE(record.iteration);
                CHECK_NOTHROW(vstruct::CheckParameters(record.parameters, 1e-9));

                // EM never decreases the log-likelihood
                real_t slack = 1e-9 * std::max(1.0, std::fabs(record.log_likelihood));
                CHECK(record.log_likelihood >= previous - slack);
                previous = record.log_likelihood;

                // The M-step never decreases the expected log-likelihood
                real_t q_slack = 1e-9 * std::max(1.0, std::fabs(record.expected_log_likelihood_before));
                CHECK(record.expected_log_likelihood_after
                    >= record.expected_log_likelihood_before - q_slack);
            }
            real_t slack = 1e-9 * std::max(1.0, std::fabs(result.log_likelihood));
            CHECK(result.log_likelihood >= previous - slack);
        }
    };
    run_policy_tests(test);
}

TEST_CASE("Fit on small samples keeps its invariants") {
    // Accuracy is not expected here. Either every iteration produces valid
    // parameters or the failure is reported with its iteration.
    for(int seed = 1; seed <= 30; ++seed) {
        for(bool never_coobserved : {false, true}) {
            CAPTURE(seed);
            CAPTURE(never_coobserved);
            vstruct::random_engine_t rng(seed);
            auto data = vstruct::Simulate(vstruct::CanonicalParameters(), 10,
                vstruct::MissingPolicy{true, never_coobserved}, rng);

            FitOptions options;
            options.iterations = 10;
            try {
                auto result = vstruct::Fit(data, options, rng);
                for(auto && record : result.history) {
                    CHECK_NOTHROW(vstruct::CheckParameters(record.parameters, 1e-9));
                    CHECK_FALSE(std::isnan(record.log_likelihood));
                }
                CHECK_NOTHROW(vstruct::CheckParameters(result.parameters, 1e-9));
            } catch(const vstruct::Error &e) {
                CHECK(e.iteration().has_value());
            }
        }
    }
}

TEST_CASE("Fit does not recover never co-observed parents") {
    vstruct::random_engine_t rng{54};
    auto truth = vstruct::CanonicalParameters();
    auto data = vstruct::Simulate(truth, 500, vstruct::MissingPolicy{true, true}, rng);

    FitOptions options;
    options.iterations = 10;
    auto result = vstruct::Fit(data, options, rng);

    // The joint distribution of X, Y and Z is not identifiable when X and Y
    // are never seen together, so some conditional probability stays far
    // from the truth.
    CHECK(max_abs_difference(result.parameters.qz(), truth.qz()) > 0.15);
}

TEST_CASE("Fit is reproducible") {
    vstruct::random_engine_t data_rng{55};
    auto data = vstruct::Simulate(vstruct::CanonicalParameters(), 300,
        vstruct::MissingPolicy{true, false}, data_rng);

    SUBCASE("Uniform") {
        FitOptions options;
        options.iterations = 10;
        options.init = vstruct::InitMode::Uniform;
        vstruct::random_engine_t rng1{1}, rng2{2};
        auto r1 = vstruct::Fit(data, options, rng1);
        auto r2 = vstruct::Fit(data, options, rng2);
        REQUIRE(r1.history.size() == r2.history.size());
        for(std::size_t t = 0; t < r1.history.size(); ++t) {
            CAPTURE(t);
            CHECK_EQ_RANGES(r1.history[t].parameters.qx(), r2.history[t].parameters.qx());
            CHECK_EQ_RANGES(r1.history[t].parameters.qy(), r2.history[t].parameters.qy());
            CHECK_EQ_RANGES(r1.history[t].parameters.qz(), r2.history[t].parameters.qz());
            CHECK(r1.history[t].log_likelihood == r2.history[t].log_likelihood);
        }
    }
    SUBCASE("Random with the same seed") {
        FitOptions options;
        options.iterations = 10;
        options.init = vstruct::InitMode::Random;
        vstruct::random_engine_t rng1{77}, rng2{77};
        auto r1 = vstruct::Fit(data, options, rng1);
        auto r2 = vstruct::Fit(data, options, rng2);
        CHECK_EQ_RANGES(r1.initial.qz(), r2.initial.qz());
        CHECK_EQ_RANGES(r1.parameters.qz(), r2.parameters.qz());
    }
}

TEST_CASE("Fit stops early with a tolerance") {
    vstruct::random_engine_t rng{56};
    auto data = vstruct::Simulate(vstruct::CanonicalParameters(), 200,
        vstruct::MissingPolicy{false, false}, rng);

    FitOptions options;
    options.iterations = 10;
    options.tolerance = 1e-6;
    auto result = vstruct::Fit(data, options, rng);

    // complete data reaches the MLE in one step; the next step confirms it
    CHECK(result.converged);
    CHECK(result.history.size() == 2);
}

TEST_CASE("Fit reports the failing iteration") {
    // X is always 0, so the configurations with X=1 are never visited
    vstruct::Dataset data = {
        make_test_observation(0, 0, 1),
        make_test_observation(0, 1, 0),
        make_test_observation(0, 1, 1)
    };
    FitOptions options;
    options.iterations = 5;
    vstruct::random_engine_t rng{57};

    CHECK_THROWS_AS(vstruct::Fit(data, options, rng), vstruct::DegenerateParameterError);
    try {
        auto result = vstruct::Fit(data, options, rng);
        FAIL("expected a DegenerateParameterError");
    } catch(const vstruct::DegenerateParameterError &e) {
        CHECK(e.table() == "qz");
        REQUIRE(e.iteration().has_value());
        CHECK(*e.iteration() == 0);
        CHECK(std::string(e.what()).find("iteration 0") != std::string::npos);
    }
}

TEST_CASE("Fit reports the iteration of a failed check") {
    vstruct::random_engine_t rng{59};
    auto data = vstruct::Simulate(vstruct::CanonicalParameters(), 40,
        vstruct::MissingPolicy{true, false}, rng);

    FitOptions options;
    options.iterations = 3;
    options.check_tolerance = -1.0;

    CHECK_THROWS_AS(vstruct::Fit(data, options, rng), vstruct::ValidationError);
    try {
        auto result = vstruct::Fit(data, options, rng);
        FAIL("expected a ValidationError");
    } catch(const vstruct::ValidationError &e) {
        // the statistics are checked before anything else
        CHECK(e.table() == "Mx");
        REQUIRE(e.iteration().has_value());
        CHECK(*e.iteration() == 0);
        CHECK(std::string(e.what()).find("Validation failed in table 'Mx' at iteration 0")
            != std::string::npos);
    }
}

TEST_CASE("Fit writes progress to the log") {
    vstruct::random_engine_t rng{58};
    auto data = vstruct::Simulate(vstruct::CanonicalParameters(), 50,
        vstruct::MissingPolicy{true, false}, rng);

    std::ostringstream oss;
    FitOptions options;
    options.iterations = 3;
    options.log = &oss;
    vstruct::Fit(data, options, rng);

    auto text = oss.str();
    CHECK(text.find("iteration 0\t") != std::string::npos);
    CHECK(text.find("iteration 2\t") != std::string::npos);
    CHECK(text.find("iteration 3\t") == std::string::npos);
}
// LCOV_EXCL_STOP
