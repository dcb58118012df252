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

#ifndef VSTRUCT_EXPECTATION_HPP
#define VSTRUCT_EXPECTATION_HPP

#include <cstddef>

#include "observation.hpp"
#include "parameters.hpp"

namespace vstruct {

// Expected counts accumulated by the E-step
//
//   mx(x)     = E[#(X=x)]
//   my(y)     = E[#(Y=y)]
//   mz(x,y,z) = E[#(X=x,Y=y,Z=z)]
struct SufficientStatistics {
    marginal_t mx = make_marginal();
    marginal_t my = make_marginal();
    conditional_t mz = make_conditional();

    SufficientStatistics& operator+=(const SufficientStatistics &rhs) {
        mx += rhs.mx;
        my += rhs.my;
        mz += rhs.mz;
        return *this;
    }
};

// Posterior P(X,Y|observed values,z) of a single observation
responsibility_t Responsibilities(const Parameters &params, const Observation &obs);

// Add the contribution of one observation to stats
void Accumulate(const Parameters &params, const Observation &obs, SufficientStatistics *stats);

template<typename InputIt>
SufficientStatistics Expect(const Parameters &params, InputIt first, InputIt last) {
    SufficientStatistics stats;
    for(; first != last; ++first) {
        Accumulate(params, *first, &stats);
    }
    return stats;
}

inline
SufficientStatistics Expect(const Parameters &params, const Dataset &data) {
    return Expect(params, data.begin(), data.end());
}

// Splits data into num_partitions contiguous blocks and adds their
// statistics together in block order.
SufficientStatistics ExpectPartitioned(const Parameters &params, const Dataset &data,
    std::size_t num_partitions);

// Throws ValidationError unless
//   sum(mx) == sum(my) == n
//   sum(mz(a,:,:)) == mx(a)
//   sum(mz(:,b,:)) == my(b)
// within a tolerance of tol*max(n,1).
void CheckStatistics(const SufficientStatistics &stats, std::size_t n, real_t tol);

} // namespace vstruct

#endif // VSTRUCT_EXPECTATION_HPP
