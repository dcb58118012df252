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

#ifndef VSTRUCT_UTILITY_HPP
#define VSTRUCT_UTILITY_HPP

#include <string>
#include <iostream>
#include <fstream>
#include <memory>

#include <boost/tokenizer.hpp>
#include <boost/range/iterator.hpp>
#include <boost/range/as_literal.hpp>

namespace vstruct {
namespace utility {

// Visitor built from a set of lambdas
template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// Tokenization Functions
namespace detail {
    using token_function = boost::char_separator<char>;
    template<typename Range>
    using char_tokenizer = boost::tokenizer<token_function, typename boost::range_iterator<const Range>::type>;
};

template<typename Range>
inline
detail::char_tokenizer<Range>
make_tokenizer_dropempty(const Range& text, const char *sep = "\t", const char *eol = "\n") {
    detail::token_function f(sep, eol, boost::drop_empty_tokens);
    return {boost::as_literal(text),f};
}

// wrapper for files that might be either a regular file or stdin/stdout
//
// "-" opens stdin or stdout depending on mode. Any other name is a plain
// path. Compressed files (.gz, .gzip, .bgz) are rejected.
class File {
public:
    File() = default;

    explicit File(const std::string &filename, std::ios_base::openmode mode = std::ios_base::in) {
        Open(filename, mode);
    }

    bool Open(const std::string &filename, std::ios_base::openmode mode = std::ios_base::in);

    bool Attach(std::streambuf *buffer) {
        stream_.rdbuf(buffer);
        stream_.unsetf(std::ios_base::skipws);
        return is_open();
    }

    bool is_open() const { return stream_.rdbuf() != nullptr; }
    operator bool() const { return is_open(); }

    std::iostream& stream() { return stream_; }

protected:
    std::iostream stream_{nullptr};

private:
    std::unique_ptr<std::streambuf> buffer_;
};

} // namespace utility
} // namespace vstruct

#endif // VSTRUCT_UTILITY_HPP
