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

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include <vstruct/vstruct.hpp>
#include <vstruct/dataset.hpp>
#include <vstruct/simulate.hpp>
#include <vstruct/utility.hpp>

#include <CLI11.hpp>

#include "subcommand.hpp"

using namespace std::string_literals;

namespace {
struct args_t {
    std::size_t n{500};
    std::uint64_t seed{1};
    bool partially_observed{false};
    bool never_coobserved{false};

    std::string output{"-"};
};
}  // anon namespace

int main(int argc, char *argv[]) {
    VSTRUCT_RUNTIME_CHECK_VERSION_NUMBER_OR_RETURN();

    using namespace vstruct::subcommand::string_literals;

    args_t args;

    CLI::App app{"vstruct simulate v" VSTRUCT_VERSION};

    #define ADD_OPTION_(name, desc) app.add_option(#name##_opt, args.name, desc, true)
    #define ADD_FLAG_(name, desc) app.add_flag(#name##_opt, args.name, desc)

    ADD_OPTION_(n, "Number of observations");
    ADD_OPTION_(seed, "Random seed");
    ADD_FLAG_(partially_observed, "Hide each parent with probability 0.5");
    ADD_FLAG_(never_coobserved, "Hide exactly one parent of every observation");
    ADD_OPTION_(output, "Output file ('-' for stdout)");

    #undef ADD_FLAG_
    #undef ADD_OPTION_

    CLI11_PARSE(app, argc, argv);

    vstruct::MissingPolicy policy;
    policy.partially_observed = args.partially_observed || args.never_coobserved;
    policy.never_coobserved = args.never_coobserved;

    try {
        vstruct::utility::File output{args.output, std::ios_base::out};
        if(!output) {
            throw std::runtime_error("Unable to open output file '" + args.output + "'.");
        }

        vstruct::random_engine_t rng{args.seed};
        auto data = vstruct::Simulate(vstruct::CanonicalParameters(), args.n, policy, rng);
        vstruct::WriteDataset(output.stream(), data);
        output.stream().flush();
    } catch(const std::exception &e) {
        return vstruct::subcommand::print_error(e);
    }

    return EXIT_SUCCESS;
}
