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

#ifndef VSTRUCT_SUBCOMMAND_HPP
#define VSTRUCT_SUBCOMMAND_HPP

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

#include <vstruct/vstruct.hpp>

namespace vstruct {
namespace subcommand {

inline
int check_version_number() {
    if(vstruct::version_number_check_equal(VSTRUCT_VERSION_INTEGER) == false) {
        std::cerr << "ERROR: Version mismatch between headers (#"
                  << VSTRUCT_VERSION_INTEGER << ") and library (#"
                  << vstruct::version_integer() << ").\n";
        std::cerr << "       VSTRUCT linked against wrong version of library.\n";
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

#define VSTRUCT_RUNTIME_CHECK_VERSION_NUMBER_OR_RETURN() \
    do { \
        auto check = vstruct::subcommand::check_version_number(); \
        if(check != EXIT_SUCCESS) { \
            return check; \
        } \
    } while(false) \
/*spacer*/

// Report a failure caught at the top of a tool and return its exit status.
// Core errors already name their table and iteration in what().
inline
int print_error(const std::exception &e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    return EXIT_FAILURE;
}

namespace string_literals {

inline
std::string operator"" _opt(const char* p, std::size_t n) {
    using namespace std::string_literals;

    // setup long argument
    std::string ret = "--"s;
    ret.append(p, n);

    // replace underscores with dashes
    for(auto &&s : ret) {
        if(s == '_') {
            s = '-';
        }
    }

    return ret;
}
} // namespace string_literals

} // namespace subcommand
} // namespace vstruct

#endif // VSTRUCT_SUBCOMMAND_HPP
