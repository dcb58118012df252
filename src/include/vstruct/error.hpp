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

#ifndef VSTRUCT_ERROR_HPP
#define VSTRUCT_ERROR_HPP

#include <optional>
#include <stdexcept>
#include <string>

namespace vstruct {

// Base class for failures of the EM core. Records which table failed and,
// once the driver has seen it, which iteration.
class Error : public std::runtime_error {
public:
    Error(std::string kind, std::string table, std::string detail,
        std::optional<int> iteration = std::nullopt) :
        std::runtime_error(make_message(kind, table, detail, iteration)),
        table_{std::move(table)}, detail_{std::move(detail)}, iteration_{iteration} { }

    const std::string& table() const { return table_; }
    const std::string& detail() const { return detail_; }
    std::optional<int> iteration() const { return iteration_; }

private:
    static std::string make_message(const std::string &kind, const std::string &table,
        const std::string &detail, std::optional<int> iteration) {
        std::string ret = kind + " in table '" + table + "'";
        if(iteration) {
            ret += " at iteration " + std::to_string(*iteration);
        }
        ret += ": " + detail;
        return ret;
    }

    std::string table_;
    std::string detail_;
    std::optional<int> iteration_;
};

// A produced table or statistics accumulator breaks one of its invariants.
class ValidationError : public Error {
public:
    ValidationError(std::string table, std::string detail,
        std::optional<int> iteration = std::nullopt) :
        Error("Validation failed", std::move(table), std::move(detail), iteration) { }

    ValidationError AtIteration(int iteration) const {
        return {table(), detail(), iteration};
    }
};

// A normalizing denominator is zero: either a parent configuration has no
// expected observations or an observation has zero probability.
class DegenerateParameterError : public Error {
public:
    DegenerateParameterError(std::string table, std::string detail,
        std::optional<int> iteration = std::nullopt) :
        Error("Degenerate parameters", std::move(table), std::move(detail), iteration) { }

    DegenerateParameterError AtIteration(int iteration) const {
        return {table(), detail(), iteration};
    }
};

} // namespace vstruct

#endif // VSTRUCT_ERROR_HPP
