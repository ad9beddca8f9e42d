#include <doctest/doctest.h>
#include <string>
#include "test_instrument.hpp"

using namespace scpicore;
using scpicore_test::Session;

TEST_CASE("Empty error queue answers No error") {
    Session s;
    CHECK(s.send("SYST:ERR?\n") == "0,\"No error\"\n");
    CHECK(s.send("SYSTEM:ERROR:NEXT?\n") == "0,\"No error\"\n");
    CHECK(s.send("SYST:ERR:COUN?\n") == "0\n");
}

TEST_CASE("Errors are read back oldest first") {
    Session s;
    const std::string out = s.send("NOPE\nMEAS:VOLT 99\nSYST:ERR:COUN?\nSYST:ERR?\nSYST:ERR:NEXT?\nSYST:ERR?\n");
    CHECK(out ==
          "2\n"
          "-113,\"Undefined header\"\n"
          "-222,\"Data out of range\"\n"
          "0,\"No error\"\n");
}

TEST_CASE("Overflowing the queue leaves QueueOverflow as the newest entry") {
    Session s;
    const size_t capacity = decltype(s.instrument.errors)::CAPACITY;
    std::string batch;
    for (size_t i = 0; i < capacity + 3; ++i) batch += "NOPE\n";
    CHECK(s.send(batch).empty());

    CHECK(s.send("SYST:ERR:COUN?\n") == std::to_string(capacity) + "\n");
    for (size_t i = 0; i + 1 < capacity; ++i) {
        CHECK(s.send("SYST:ERR?\n") == "-113,\"Undefined header\"\n");
    }
    CHECK(s.send("SYST:ERR?\n") == "-350,\"Queue overflow\"\n");
    CHECK(s.send("SYST:ERR?\n") == "0,\"No error\"\n");
}

TEST_CASE("Version is bare character data") {
    Session s;
    CHECK(s.send("SYST:VERS?\n") == "1999.0\n");
    CHECK(s.send(":system:version?\n") == "1999.0\n");
}

TEST_CASE("Standard queries take no parameters") {
    Session s;
    CHECK(s.send("SYST:ERR? 1\n").empty());
    CHECK(s.send("SYST:ERR?\n") == "-115,\"Unexpected number of parameters\"\n");
}
