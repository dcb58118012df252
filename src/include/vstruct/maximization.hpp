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

#ifndef VSTRUCT_MAXIMIZATION_HPP
#define VSTRUCT_MAXIMIZATION_HPP

#include "expectation.hpp"
#include "parameters.hpp"

namespace vstruct {

// Maximum-likelihood parameters for the given expected counts
//
//   qx(x)     = mx(x) / sum(mx)
//   qy(y)     = my(y) / sum(my)
//   qz(x,y,z) = mz(x,y,z) / sum(mz(x,y,:))
//
// No smoothing is applied. A zero denominator throws
// DegenerateParameterError.
Parameters Maximize(const SufficientStatistics &stats);

} // namespace vstruct

#endif // VSTRUCT_MAXIMIZATION_HPP
