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

#ifndef VSTRUCT_LIKELIHOOD_HPP
#define VSTRUCT_LIKELIHOOD_HPP

#include "expectation.hpp"
#include "observation.hpp"
#include "parameters.hpp"

namespace vstruct {

// Marginal probability of one observation, summing over missing parents
real_t Probability(const Parameters &params, const Observation &obs);

// sum_i log P(observation i); -inf if any observation is impossible
real_t LogLikelihood(const Parameters &params, const Dataset &data);

// Expected complete-data log-likelihood of params given expected counts:
//
//   sum mx*log(qx) + sum my*log(qy) + sum mz*log(qz)
//
// Terms with a zero count contribute nothing.
real_t ExpectedLogLikelihood(const Parameters &params, const SufficientStatistics &stats);

} // namespace vstruct

#endif // VSTRUCT_LIKELIHOOD_HPP
