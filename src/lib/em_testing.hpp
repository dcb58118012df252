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

#ifndef VSTRUCT_EM_TESTING_HPP
#define VSTRUCT_EM_TESTING_HPP

#include <vstruct/observation.hpp>
#include <vstruct/parameters.hpp>
#include <vstruct/simulate.hpp>

#include <ostream>

// Build an observation for a test. A negative parent value means missing.
inline
vstruct::Observation make_test_observation(int x, int y, int z) {
    auto opt = [](int v) -> std::optional<int> {
        if(v < 0) {
            return std::nullopt;
        }
        return v;
    };
    return vstruct::make_observation(opt(x), opt(y), z);
}

// Empirical counts of a fully observed dataset
struct empirical_counts_t {
    vstruct::marginal_t mx = vstruct::make_marginal();
    vstruct::marginal_t my = vstruct::make_marginal();
    vstruct::conditional_t mz = vstruct::make_conditional();

    explicit empirical_counts_t(const vstruct::Dataset &data) {
        for(auto && o : data) {
            int x = std::get<vstruct::Observed>(o.x()).value();
            int y = std::get<vstruct::Observed>(o.y()).value();
            mx(x) += 1.0;
            my(y) += 1.0;
            mz(x, y, o.z()) += 1.0;
        }
    }
};

// Grid of (n, missingness policy, seed) used by the invariant tests
template<typename F>
void run_policy_tests(F test) {
    using vstruct::MissingPolicy;

    test(500, MissingPolicy{false, false}, 1);
    test(500, MissingPolicy{true,  false}, 2);
    test(500, MissingPolicy{true,  true},  3);
    test(100, MissingPolicy{true,  false}, 4);
    test(100, MissingPolicy{true,  true},  5);
    test(37,  MissingPolicy{true,  false}, 6);
    test(2000, MissingPolicy{true, false}, 7);
}

// for debugging purposes
namespace vstruct {
inline
std::ostream& operator<< (std::ostream& os, const parent_value_t & value) {
    if(auto p = std::get_if<Observed>(&value)) {
        return os << p->value;
    }
    return os << ".";
}

inline
std::ostream& operator<< (std::ostream& os, const Observation & value) {
    return os << "{" << value.x() << ", " << value.y() << ", " << value.z() << "}";
}
} // namespace vstruct

#endif // VSTRUCT_EM_TESTING_HPP
