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

#ifndef VSTRUCT_PARAMETERS_HPP
#define VSTRUCT_PARAMETERS_HPP

#include <map>
#include <string>

#include "table.hpp"
#include "error.hpp"

namespace vstruct {

enum struct InitMode : int {
    Uniform = 0,
    Random = 1
};

namespace detail {
extern const std::map<std::string, InitMode> INIT_MODE_MAP;
} // namespace detail

// The three probability tables of the network.
//
//   qx(x)     = P(X=x)
//   qy(y)     = P(Y=y)
//   qz(x,y,z) = P(Z=z|X=x,Y=y)
//
// A Parameters object is checked when it is constructed and has no
// mutators. Each EM iteration produces a new one.
class Parameters {
public:
    static constexpr real_t DEFAULT_TOLERANCE = 1e-9;

    Parameters(marginal_t qx, marginal_t qy, conditional_t qz);

    static Parameters Create(InitMode mode, random_engine_t &rng);

    const marginal_t & qx() const { return qx_; }
    const marginal_t & qy() const { return qy_; }
    const conditional_t & qz() const { return qz_; }

    // P(X=x,Y=y,Z=z)
    real_t Joint(int x, int y, int z) const {
        return qx_(x) * qy_(y) * qz_(x, y, z);
    }

private:
    marginal_t qx_;
    marginal_t qy_;
    conditional_t qz_;
};

// Throws ValidationError if a table is misshapen, has a negative or
// non-finite entry, or has a row that does not sum to 1 within tol.
void CheckMarginal(const marginal_t &q, const std::string &name, real_t tol);
void CheckConditional(const conditional_t &q, const std::string &name, real_t tol);
void CheckParameters(const Parameters &params, real_t tol);

} // namespace vstruct

#endif // VSTRUCT_PARAMETERS_HPP
