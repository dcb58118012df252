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

#ifndef VSTRUCT_VSTRUCT_HPP
#define VSTRUCT_VSTRUCT_HPP

#define VSTRUCT_VERSION_MAJOR 0
#define VSTRUCT_VERSION_MINOR 1
#define VSTRUCT_VERSION_PATCH 0

#define VSTRUCT_VERSION "0.1.0"

#define VSTRUCT_VERSION_INTEGER (VSTRUCT_VERSION_MAJOR*10000000 \
    + VSTRUCT_VERSION_MINOR*10000 + VSTRUCT_VERSION_PATCH)

namespace vstruct {

bool version_number_check_equal(int version_int = VSTRUCT_VERSION_INTEGER);
int version_integer();

} // namespace vstruct

#endif // VSTRUCT_VSTRUCT_HPP
