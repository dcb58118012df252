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

#ifndef VSTRUCT_EM_HPP
#define VSTRUCT_EM_HPP

#include <ostream>
#include <vector>

#include "expectation.hpp"
#include "maximization.hpp"
#include "likelihood.hpp"
#include "parameters.hpp"

namespace vstruct {

struct FitOptions {
    // number of EM iterations
    int iterations{10};
    InitMode init{InitMode::Uniform};
    // Stop once the log-likelihood improves by less than this. Zero disables
    // the check and runs every iteration.
    real_t tolerance{0.0};
    // tolerance used when validating statistics and parameters; a negative
    // value rejects everything
    real_t check_tolerance{1e-6};
    // progress is written here if not null
    std::ostream *log{nullptr};
};

struct IterationRecord {
    int iteration;
    // parameters produced by this iteration
    Parameters parameters;
    // log-likelihood of the parameters this iteration started from
    real_t log_likelihood;
    // Q(theta_t|theta_t) and Q(theta_t+1|theta_t)
    real_t expected_log_likelihood_before;
    real_t expected_log_likelihood_after;
};

struct FitResult {
    Parameters initial;
    Parameters parameters;
    real_t log_likelihood;
    bool converged{false};
    std::vector<IterationRecord> history;
};

// Alternate E and M steps starting from parameters drawn according to
// options.init. Statistics are checked after every E-step and parameters
// after every M-step; a ValidationError or DegenerateParameterError aborts
// the run and is rethrown with the failing iteration attached.
FitResult Fit(const Dataset &data, const FitOptions &options, random_engine_t &rng);

// Fit starting from the given parameters
FitResult Fit(const Dataset &data, const Parameters &initial, const FitOptions &options);

} // namespace vstruct

#endif // VSTRUCT_EM_HPP
