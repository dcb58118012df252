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

#include <vstruct/utility.hpp>

#include <boost/algorithm/string/predicate.hpp>

#include <filesystem>
#include <fstream>
#include <vector>

namespace {
bool is_compressed(const std::string &path) {
    using boost::algorithm::ends_with;
    for(auto && s : {".gz", ".gzip", ".bgz"}) {
        if(ends_with(path, s)) {
            return true;
        }
    }
    return false;
}
} // anon namespace

bool vstruct::utility::File::Open(const std::string &filename, std::ios_base::openmode mode) {
    if(filename.empty() || is_compressed(filename)) {
        // compressed datasets are not supported
    } else if(filename != "-") {
        // if path is not "-" open a file
        buffer_.reset(new std::filebuf);
        std::filebuf *p = static_cast<std::filebuf*>(buffer_.get());
        p->open(filename.c_str(), mode);
        // if file is open, associate it with the stream
        if(p->is_open()) {
            return Attach(buffer_.get());
        }
    } else if((mode & std::ios_base::in) == (mode & std::ios_base::out)) {
        // can't do anything if both are set or none are set
    } else if(mode & std::ios_base::in) {
        return Attach(std::cin.rdbuf());
    } else {
        return Attach(std::cout.rdbuf());
    }
    return Attach(nullptr);
}

// LCOV_EXCL_START
TEST_CASE("utility::make_tokenizer_dropempty") {
    const char text[] = "a\t b\n\nc";
    auto tokens = vstruct::utility::make_tokenizer_dropempty(text, "\t ", "\n");
    std::vector<std::string> result(tokens.begin(), tokens.end());
    std::vector<std::string> expected = {"a", "b", "\n", "\n", "c"};
    CHECK_EQ_RANGES(result, expected);
}

TEST_CASE("utility::File") {
    namespace fs = std::filesystem;

    vstruct::utility::File missing{"this/file/does/not/exist.tsv"};
    CHECK_FALSE(missing.is_open());

    vstruct::utility::File stdin_file{"-"};
    CHECK(stdin_file.is_open());

    vstruct::utility::File stdout_file{"-", std::ios_base::out};
    CHECK(stdout_file.is_open());

    vstruct::utility::File compressed{"data.tsv.gz"};
    CHECK_FALSE(compressed.is_open());

    vstruct::utility::File empty{""};
    CHECK_FALSE(empty.is_open());

    // names are taken literally, colons included
    auto path = fs::temp_directory_path() / "libvstruct-file:test.txt";
    {
        std::ofstream out(path);
        REQUIRE(out);
        out << "abc";
    }
    vstruct::utility::File colon{path.string()};
    REQUIRE(colon.is_open());
    std::string text;
    colon.stream() >> text;
    CHECK(text == "abc");
    fs::remove(path);
}
// LCOV_EXCL_STOP
