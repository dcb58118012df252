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

#ifndef VSTRUCT_OBSERVATION_HPP
#define VSTRUCT_OBSERVATION_HPP

#include <optional>
#include <utility>
#include <variant>
#include <vector>

namespace vstruct {

// A parent value is either observed (0 or 1) or missing.
class Observed {
public:
    // throws std::invalid_argument unless value is 0 or 1
    explicit Observed(int value);

    int value() const { return value_; }

private:
    int value_;
};

struct Missing { };

inline bool operator==(Observed a, Observed b) { return a.value() == b.value(); }
inline bool operator!=(Observed a, Observed b) { return !(a == b); }
constexpr bool operator==(Missing, Missing) { return true; }
constexpr bool operator!=(Missing, Missing) { return false; }

using parent_value_t = std::variant<Observed, Missing>;

inline bool is_missing(const parent_value_t &v) {
    return std::holds_alternative<Missing>(v);
}

// Observation of (X, Y, Z). Z is never missing. Values are checked on
// construction and cannot be changed afterwards.
class Observation {
public:
    // throws std::invalid_argument unless z is 0 or 1
    Observation(parent_value_t x, parent_value_t y, int z);

    const parent_value_t& x() const { return x_; }
    const parent_value_t& y() const { return y_; }
    int z() const { return z_; }

private:
    parent_value_t x_;
    parent_value_t y_;
    int z_;
};

inline bool operator==(const Observation &a, const Observation &b) {
    return a.x() == b.x() && a.y() == b.y() && a.z() == b.z();
}

inline bool operator!=(const Observation &a, const Observation &b) {
    return !(a == b);
}

using Dataset = std::vector<Observation>;

// An empty optional means missing
parent_value_t make_parent_value(std::optional<int> v);

Observation make_observation(std::optional<int> x, std::optional<int> y, int z);

// Range [first, last) of candidate values of a parent: the observed value
// alone, or both values when it is missing.
inline
std::pair<int,int> candidate_values(const parent_value_t &v) {
    if(auto p = std::get_if<Observed>(&v)) {
        return {p->value(), p->value()+1};
    }
    return {0, 2};
}

} // namespace vstruct

#endif // VSTRUCT_OBSERVATION_HPP
