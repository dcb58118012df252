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

#ifndef VSTRUCT_SIMULATE_HPP
#define VSTRUCT_SIMULATE_HPP

#include <cstddef>

#include "observation.hpp"
#include "parameters.hpp"

namespace vstruct {

// How parent values are hidden when simulating data.
//
// partially_observed == false: nothing is hidden.
// never_coobserved == true:    exactly one of X and Y is hidden.
// otherwise:                   X and Y are hidden independently, each with
//                              probability 1/2.
struct MissingPolicy {
    bool partially_observed{false};
    bool never_coobserved{false};
};

// P(X) = [0.6, 0.4], P(Y) = [0.3, 0.7], and
// P(Z=1|X,Y) = 0.1, 0.8, 0.7, 0.2 for (0,0), (0,1), (1,0), (1,1)
Parameters CanonicalParameters();

Dataset Simulate(const Parameters &truth, std::size_t n, MissingPolicy policy,
    random_engine_t &rng);

} // namespace vstruct

#endif // VSTRUCT_SIMULATE_HPP
