#include <doctest/doctest.h>
#include <cmath>
#include <limits>
#include <string>
#include "etl/vector.h"
#include "scpicore/response.hpp"

using namespace scpicore;

namespace {

class Capture {
    etl::vector<uint8_t, 64> buffer_;

public:
    Capture() : out(buffer_) {}
    std::string text() const { return std::string(out.text().data(), out.text().size()); }

    BufferWriter out;
};

} // namespace

TEST_CASE("Booleans and integers") {
    Capture c;
    CHECK_FALSE(write_list(c.out, true, false, int8_t(-7), uint8_t(200), int64_t(-9000000000LL)));
    CHECK(c.text() == "1,0,-7,200,-9000000000");
}

TEST_CASE("Floats use the shortest form and the SCPI special values") {
    Capture c;
    CHECK_FALSE(write_response(c.out, 966.0));
    CHECK(c.text() == "966");
    c.out.clear();

    CHECK_FALSE(write_response(c.out, 1.25f));
    CHECK(c.text() == "1.25");
    c.out.clear();

    CHECK_FALSE(write_response(c.out, std::numeric_limits<double>::quiet_NaN()));
    CHECK(c.text() == "9.91E+37");
    c.out.clear();

    CHECK_FALSE(write_list(c.out, std::numeric_limits<double>::infinity(),
                           -std::numeric_limits<float>::infinity()));
    CHECK(c.text() == "9.9E+37,-9.9E+37");
}

TEST_CASE("Large and small floats use an uppercase, unpadded exponent") {
    Capture c;
    CHECK_FALSE(write_list(c.out, 1e20, 1.5e-5, 1e16));
    CHECK(c.text() == "1E+20,1.5E-5,1E+16");
    c.out.clear();

    CHECK_FALSE(write_list(c.out, -2.5e-7, 1e100));
    CHECK(c.text() == "-2.5E-7,1E+100");
    c.out.clear();

    // a real 9.91e37 reads back like the NaN sentinel, as SCPI defines it
    CHECK_FALSE(write_response(c.out, 9.91e37));
    CHECK(c.text() == "9.91E+37");
}

TEST_CASE("Strings are quoted, characters are bare") {
    Capture c;
    CHECK_FALSE(write_list(c.out, "ACME", etl::string_view("say \"hi\""), Characters{"1999.0"}));
    CHECK(c.text() == "\"ACME\",\"say \"hi\"\",1999.0");
}

TEST_CASE("Byte blocks use the definite length form") {
    Capture c;
    const uint8_t six[] = {'a', 'b', 'c', 'd', 'e', 'f'};
    CHECK_FALSE(write_response(c.out, Bytes(six, sizeof(six))));
    CHECK(c.text() == "#16abcdef");
    c.out.clear();

    CHECK_FALSE(write_response(c.out, Bytes{}));
    CHECK(c.text() == "#10");
    c.out.clear();

    uint8_t twelve[12] = {};
    CHECK_FALSE(write_response(c.out, Bytes(twelve, sizeof(twelve))));
    CHECK(c.text().substr(0, 4) == "#212");
    CHECK(c.text().size() == 16);
}

TEST_CASE("Errors render as number and quoted message") {
    Capture c;
    CHECK_FALSE(write_response(c.out, Error(Error::Code::UndefinedHeader)));
    CHECK(c.text() == "-113,\"Undefined header\"");
    c.out.clear();

    CHECK_FALSE(write_response(c.out, Error()));
    CHECK(c.text() == "0,\"No error\"");
}

TEST_CASE("Sequences are comma joined") {
    Capture c;
    const int32_t values[] = {1, -2, 3};
    CHECK_FALSE(write_sequence(c.out, etl::span<const int32_t>(values, 3)));
    CHECK(c.text() == "1,-2,3");
}

TEST_CASE("A full buffer reports TooMuchData instead of truncating") {
    etl::vector<uint8_t, 4> small;
    BufferWriter out(small);
    CHECK(write_response(out, "toolong") == Error::Code::TooMuchData);
    CHECK(small.size() == 1);          // only the opening quote fit
}
