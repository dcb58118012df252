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

#ifndef VSTRUCT_TABLE_HPP
#define VSTRUCT_TABLE_HPP

#include <cstddef>
#include <random>

#include <xtensor/xtensor.hpp>
#include <xtensor/xview.hpp>
#include <xtensor/xmath.hpp>
#include <xtensor/xio.hpp>

namespace vstruct {

using real_t = double;

// P(X) or P(Y), indexed by value
using marginal_t = xt::xtensor<real_t, 1>;
// P(Z|X,Y), indexed by (x, y, z)
using conditional_t = xt::xtensor<real_t, 3>;
// Joint posterior responsibilities over (x, y)
using responsibility_t = xt::xtensor<real_t, 2>;

using table_size_t = marginal_t::size_type;

// all variables are binary
constexpr table_size_t num_states = 2;

inline marginal_t make_marginal() {
    return xt::zeros<real_t>({num_states});
}

inline conditional_t make_conditional() {
    return xt::zeros<real_t>({num_states, num_states, num_states});
}

inline responsibility_t make_responsibility() {
    return xt::zeros<real_t>({num_states, num_states});
}

// Random numbers are always drawn from an engine owned by the caller.
using random_engine_t = std::mt19937_64;

} // namespace vstruct

#endif // VSTRUCT_TABLE_HPP
