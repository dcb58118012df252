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

#include "unit_testing.hpp"

#include <vstruct/print.hpp>
#include <vstruct/simulate.hpp>

#include <sstream>

namespace {
void print_marginal(std::ostream &os, const char *name, const char *var,
    const char *column, const vstruct::marginal_t &m) {
    os << "## " << name << "\n"
       << var << "\t" << column << "\n";
    for(vstruct::table_size_t a = 0; a < m.size(); ++a) {
        os << a << "\t" << m(a) << "\n";
    }
}

void print_conditional(std::ostream &os, const char *name, const char *column,
    const vstruct::conditional_t &q) {
    os << "## " << name << "\n"
       << "X\tY\t" << column << "(Z=0)\t" << column << "(Z=1)\n";
    for(vstruct::table_size_t a = 0; a < vstruct::num_states; ++a) {
        for(vstruct::table_size_t b = 0; b < vstruct::num_states; ++b) {
            os << a << "\t" << b << "\t" << q(a,b,0) << "\t" << q(a,b,1) << "\n";
        }
    }
}
} // anon namespace

void vstruct::PrintParameters(std::ostream &os, const Parameters &params) {
    print_marginal(os, "qx", "X", "P", params.qx());
    print_marginal(os, "qy", "Y", "P", params.qy());
    print_conditional(os, "qz", "P", params.qz());
}

void vstruct::PrintStatistics(std::ostream &os, const SufficientStatistics &stats) {
    print_marginal(os, "Mx", "X", "E[N]", stats.mx);
    print_marginal(os, "My", "Y", "E[N]", stats.my);
    print_conditional(os, "Mz", "E[N]", stats.mz);
}

// LCOV_EXCL_START
TEST_CASE("PrintParameters") {
    std::ostringstream oss;
    vstruct::PrintParameters(oss, vstruct::CanonicalParameters());
    CHECK(oss.str() ==
        "## qx\n"
        "X\tP\n"
        "0\t0.6\n"
        "1\t0.4\n"
        "## qy\n"
        "Y\tP\n"
        "0\t0.3\n"
        "1\t0.7\n"
        "## qz\n"
        "X\tY\tP(Z=0)\tP(Z=1)\n"
        "0\t0\t0.9\t0.1\n"
        "0\t1\t0.2\t0.8\n"
        "1\t0\t0.3\t0.7\n"
        "1\t1\t0.8\t0.2\n");
}

TEST_CASE("PrintStatistics") {
    vstruct::SufficientStatistics stats;
    stats.mx = vstruct::marginal_t{1.5, 0.5};
    stats.my = vstruct::marginal_t{0.0, 2.0};
    stats.mz(0,1,1) = 1.5;
    stats.mz(1,1,0) = 0.5;

    std::ostringstream oss;
    vstruct::PrintStatistics(oss, stats);
    CHECK(oss.str() ==
        "## Mx\n"
        "X\tE[N]\n"
        "0\t1.5\n"
        "1\t0.5\n"
        "## My\n"
        "Y\tE[N]\n"
        "0\t0\n"
        "1\t2\n"
        "## Mz\n"
        "X\tY\tE[N](Z=0)\tE[N](Z=1)\n"
        "0\t0\t0\t0\n"
        "0\t1\t0\t1.5\n"
        "1\t0\t0\t0\n"
        "1\t1\t0.5\t0\n");
}
// LCOV_EXCL_STOP
