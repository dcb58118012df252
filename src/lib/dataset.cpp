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
#include "em_testing.hpp"

#include <vstruct/dataset.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

using vstruct::Dataset;

namespace {
std::optional<int> parse_value(const std::string &token, const char *column, int row_num) {
    if(token == ".") {
        return std::nullopt;
    }
    if(token == "0") {
        return 0;
    }
    if(token == "1") {
        return 1;
    }
    throw std::invalid_argument("Dataset parsing failed. Row "
        + std::to_string(row_num) + " has invalid " + column + " value '"
        + token + "'."
    );
}
} // anon namespace

Dataset vstruct::ParseDatasetTable(const std::vector<std::vector<std::string>> &table) {
    Dataset ret;
    ret.reserve(table.size());
    int row_num = 0;
    for(auto &&row : table) {
        row_num += 1;
        if(row.empty()) {
            continue;
        }
        if(row.size() != 3) {
            throw std::invalid_argument("Dataset parsing failed. Row "
                + std::to_string(row_num) + " has "
                + std::to_string(row.size()) + " column(s) instead of 3 columns."
            );
        }
        auto x = parse_value(row[0], "X", row_num);
        auto y = parse_value(row[1], "Y", row_num);
        auto z = parse_value(row[2], "Z", row_num);
        if(!z) {
            throw std::invalid_argument("Dataset parsing failed. Row "
                + std::to_string(row_num) + " has a missing Z value."
            );
        }
        ret.push_back(make_observation(x, y, *z));
    }
    return ret;
}

Dataset vstruct::ReadDataset(const std::string &path) {
    utility::File input{path};
    if(!input) {
        throw std::runtime_error("Unable to open dataset file '" + path + "'.");
    }
    std::string text{std::istreambuf_iterator<char>(input.stream()),
        std::istreambuf_iterator<char>()};
    return ParseDataset(text);
}

void vstruct::WriteDataset(std::ostream &out, const Dataset &data) {
    auto value = utility::overloaded{
        [](const Observed &v) -> char { return v.value() == 0 ? '0' : '1'; },
        [](const Missing &) -> char { return '.'; }
    };
    out << "##VSTRUCT v0.1\n";
    out << "#X\tY\tZ\n";
    for(auto && obs : data) {
        out << std::visit(value, obs.x()) << '\t'
            << std::visit(value, obs.y()) << '\t'
            << obs.z() << '\n';
    }
}

// LCOV_EXCL_START
TEST_CASE("ParseDataset") {
    const char text[] =
        "##VSTRUCT v0.1\n"
        "#X\tY\tZ\n"
        "0 1 1\n"
        ".\t0\t0\n"
        "\n"
        "1    .    1\n"
        "# trailing comment 1 1 1\n"
        ".\t.\t0"
    ;
    Dataset data;
    REQUIRE_NOTHROW(data = vstruct::ParseDataset(text));
    Dataset expected = {
        make_test_observation(0, 1, 1),
        make_test_observation(-1, 0, 0),
        make_test_observation(1, -1, 1),
        make_test_observation(-1, -1, 0)
    };
    CHECK_EQ_RANGES(data, expected);

    CHECK(vstruct::ParseDataset(std::string{"##VSTRUCT\n"}).empty());

    CHECK_THROWS_AS(vstruct::ParseDataset(""), std::invalid_argument);
    CHECK_THROWS_AS(vstruct::ParseDataset("#VSTRUCT\n0\t0\t0"), std::invalid_argument);
    CHECK_THROWS_AS(vstruct::ParseDataset("0\t0\t0\n"), std::invalid_argument);
    CHECK_THROWS_AS(vstruct::ParseDataset("##VSTRUCT\n0\t0"), std::invalid_argument);
    CHECK_THROWS_AS(vstruct::ParseDataset("##VSTRUCT\n0\t0\t0\t0"), std::invalid_argument);
    CHECK_THROWS_AS(vstruct::ParseDataset("##VSTRUCT\n2\t0\t0"), std::invalid_argument);
    CHECK_THROWS_AS(vstruct::ParseDataset("##VSTRUCT\n0\tx\t0"), std::invalid_argument);
    CHECK_THROWS_AS(vstruct::ParseDataset("##VSTRUCT\n0\t0\t."), std::invalid_argument);
    CHECK_THROWS_AS(vstruct::ParseDataset("##VSTRUCT\n0\t0\t-1"), std::invalid_argument);
}

TEST_CASE("ParseDataset names the failing row") {
    try {
        auto data = vstruct::ParseDataset("##VSTRUCT\n0\t0\t0\n# comment\n1\t1\t7\n");
        FAIL("expected an invalid_argument");
    } catch(const std::invalid_argument &e) {
        std::string msg = e.what();
        CHECK(msg.find("Row 4") != std::string::npos);
        CHECK(msg.find("'7'") != std::string::npos);
    }
}

TEST_CASE("WriteDataset") {
    Dataset data = {
        make_test_observation(0, 1, 1),
        make_test_observation(-1, 0, 0),
        make_test_observation(1, -1, 1)
    };
    std::ostringstream out;
    vstruct::WriteDataset(out, data);
    CHECK(out.str() ==
        "##VSTRUCT v0.1\n"
        "#X\tY\tZ\n"
        "0\t1\t1\n"
        ".\t0\t0\n"
        "1\t.\t1\n");

    CHECK(vstruct::ParseDataset(out.str()) == data);
}

TEST_CASE("ReadDataset") {
    namespace fs = std::filesystem;
    auto path = fs::temp_directory_path() / "libvstruct-read-dataset-test.txt";
    {
        std::ofstream out(path);
        REQUIRE(out);
        out << "##VSTRUCT v0.1\n1\t.\t0\n.\t1\t1\n";
    }
    Dataset data;
    REQUIRE_NOTHROW(data = vstruct::ReadDataset(path.string()));
    Dataset expected = {
        make_test_observation(1, -1, 0),
        make_test_observation(-1, 1, 1)
    };
    CHECK(data == expected);
    fs::remove(path);

    CHECK_THROWS_AS(vstruct::ReadDataset(path.string()), std::runtime_error);
    CHECK_THROWS_AS(vstruct::ReadDataset("dataset.txt.gz"), std::runtime_error);
}

TEST_CASE("ReadDataset with a colon in the file name") {
    namespace fs = std::filesystem;
    auto path = fs::temp_directory_path() / "libvstruct-run:1.txt";
    {
        std::ofstream out(path);
        REQUIRE(out);
        out << "##VSTRUCT v0.1\n0\t1\t1\n";
    }
    Dataset data;
    REQUIRE_NOTHROW(data = vstruct::ReadDataset(path.string()));
    REQUIRE(data.size() == 1);
    CHECK(data[0] == make_test_observation(0, 1, 1));
    fs::remove(path);
}
// LCOV_EXCL_STOP
