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
#include <string>

#include <vstruct/vstruct.hpp>
#include <vstruct/dataset.hpp>
#include <vstruct/em.hpp>
#include <vstruct/print.hpp>

#include <CLI11.hpp>

#include "subcommand.hpp"

using namespace std::string_literals;

using InitMode = vstruct::InitMode;

namespace {
struct args_t {
    int iterations{10};
    InitMode init{InitMode::Uniform};
    std::uint64_t seed{1};
    double tolerance{0.0};
    bool verbose{false};

    std::string input{"-"};
};
}  // anon namespace

int main(int argc, char *argv[]) {
    VSTRUCT_RUNTIME_CHECK_VERSION_NUMBER_OR_RETURN();

    using namespace vstruct::subcommand::string_literals;

    args_t args;

    CLI::App app{"vstruct fit v" VSTRUCT_VERSION};

    #define ADD_OPTION_(name, desc) app.add_option(#name##_opt, args.name, desc, true)

    ADD_OPTION_(iterations, "Number of EM iterations")
        ->check(CLI::PositiveNumber);
    ADD_OPTION_(init, "Initial parameters")
        ->transform(CLI::CheckedTransformer(vstruct::detail::INIT_MODE_MAP, CLI::ignore_case));
    ADD_OPTION_(seed, "Random seed");
    ADD_OPTION_(tolerance, "Stop once the log-likelihood improves by less than this (0 disables)")
        ->check(CLI::NonNegativeNumber);

    #undef ADD_OPTION_

    app.add_flag("--verbose", args.verbose, "Log the progress of each iteration");

    app.add_option("input", args.input, "Dataset file ('-' for stdin)", true);

    CLI11_PARSE(app, argc, argv);

    try {
        auto data = vstruct::ReadDataset(args.input);

        vstruct::FitOptions options;
        options.iterations = args.iterations;
        options.init = args.init;
        options.tolerance = args.tolerance;
        if(args.verbose) {
            options.log = &std::cerr;
        }

        vstruct::random_engine_t rng{args.seed};
        auto result = vstruct::Fit(data, options, rng);

        std::cout << "##VSTRUCT v" VSTRUCT_VERSION "\n"
                  << "# observations\t" << data.size() << "\n"
                  << "# iterations\t" << result.history.size() << "\n"
                  << "# converged\t" << (result.converged ? "yes" : "no") << "\n"
                  << "# loglik\t" << result.log_likelihood << "\n";
        vstruct::PrintParameters(std::cout, result.parameters);
    } catch(const std::exception &e) {
        return vstruct::subcommand::print_error(e);
    }

    return EXIT_SUCCESS;
}
