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

#ifndef VSTRUCT_DATASET_HPP
#define VSTRUCT_DATASET_HPP

#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "observation.hpp"
#include "utility.hpp"

namespace vstruct {

// Text format:
//
//   ##VSTRUCT v0.1
//   #X Y Z
//   0  1  1
//   .  0  0
//
// Tokens are separated by spaces or tabs. Rows starting with '#' are
// comments and '.' marks a missing parent.

template<typename Range>
Dataset ParseDataset(const Range &text);

Dataset ParseDatasetTable(const std::vector<std::vector<std::string>> &table);

Dataset ReadDataset(const std::string &path);

void WriteDataset(std::ostream &out, const Dataset &data);

template<typename Range>
Dataset ParseDataset(const Range &text) {
    using namespace std;
    // token are separated by one or more <space>s or <tab>s
    // <newline>s end the row
    auto tokens = utility::make_tokenizer_dropempty(text, "\t ", "\n");

    auto token_it = tokens.begin();
    if(token_it == tokens.end() || *token_it != "##VSTRUCT") {
        throw std::invalid_argument("Dataset parsing failed; "
            "unknown dataset format; missing '##VSTRUCT' header line.");
    }

    size_t k = 0;
    bool in_comment = false;
    vector<vector<string>> string_table;
    string_table.reserve(256);
    for(; token_it != tokens.end(); ++token_it) {
        const auto & token = *token_it;
        if(token == "\n") {
            k = 0;
            in_comment = false;
            continue;
        }
        if(in_comment) {
            continue;
        }
        if(k == 0) {
            string_table.emplace_back();
            if(token[0] == '#') {
                in_comment = true;
                continue;
            }
            string_table.back().reserve(3);
        }
        string_table.back().push_back(token);
        k += 1;
    }

    return ParseDatasetTable(string_table);
}

} // namespace vstruct

#endif // VSTRUCT_DATASET_HPP
