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

#ifndef VSTRUCT_PRINT_HPP
#define VSTRUCT_PRINT_HPP

#include <ostream>

#include "expectation.hpp"
#include "parameters.hpp"

namespace vstruct {

// Tab-separated tables, one block per table:
//
//   ## qx
//   X  P
//   0  0.6
//   ...
//   ## qz
//   X  Y  P(Z=0)  P(Z=1)
//   0  0  0.9     0.1
void PrintParameters(std::ostream &os, const Parameters &params);

// Same layout with expected counts
void PrintStatistics(std::ostream &os, const SufficientStatistics &stats);

} // namespace vstruct

#endif // VSTRUCT_PRINT_HPP
