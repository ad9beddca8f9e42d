#include <doctest/doctest.h>
#include <string>
#include "scpicore/parser.hpp"

using namespace scpicore;

namespace {

struct Parsed {
    ParseStatus status;
    etl::optional<CommandCall> call;
    std::string rest;

    bool ok() const { return !status.has_value(); }
    int error_number() const { return status->reported().number(); }
};

class ParserFixture {
public:
    ParserFixture() {
        const char* paths[] = {
            "*IDN?", "*RST", "VALue", "MEASure:VOLTage", "MEASure:VOLTage?", "SYSTem:ERRor?",
        };
        CommandId id = 0;
        for (const char* p : paths) {
            REQUIRE(tree.insert(Registration::from_path(p, id++, 0)) == BuildResult::Ok);
        }
    }

    Parsed parse_text(const std::string& text) { return parse_text(tree.root(), text); }

    Parsed parse_text(const Node& context, const std::string& text) {
        Parsed p;
        Bytes in = as_bytes(etl::string_view(text.data(), text.size()));
        p.status = parse(tree.root(), context, in, p.call);
        p.rest.assign(reinterpret_cast<const char*>(in.data()), in.size());
        return p;
    }

    CommandTree<64> tree;
};

std::string text_of(const Value& v) { return std::string(v.text().data(), v.text().size()); }

} // namespace

TEST_CASE_FIXTURE(ParserFixture, "Common query parses and consumes its terminator") {
    Parsed p = parse_text("*IDN?\n*RST\n");
    REQUIRE(p.ok());
    REQUIRE(p.call.has_value());
    CHECK(p.call->query);
    CHECK(p.call->terminated);
    CHECK(p.call->header == nullptr);
    CHECK(p.call->node == tree.root().child("*IDN"));
    CHECK(p.call->args.empty());
    CHECK(p.rest == "*RST\n");
}

TEST_CASE_FIXTURE(ParserFixture, "Every argument form is recorded with its lexical kind") {
    Parsed p = parse_text("VAL 1.5E3,#H1F,#q17,#B101,'single',\"dou;ble\",#15he\nlo,ON\n");
    REQUIRE(p.ok());
    const Arguments& args = p.call->args;
    REQUIRE(args.size() == 8);

    CHECK(args[0].kind() == Value::Kind::Decimal);
    CHECK(text_of(args[0]) == "1.5E3");
    CHECK(args[1].kind() == Value::Kind::Hexadecimal);
    CHECK(text_of(args[1]) == "1F");
    CHECK(args[2].kind() == Value::Kind::Octal);
    CHECK(text_of(args[2]) == "17");
    CHECK(args[3].kind() == Value::Kind::Binary);
    CHECK(text_of(args[3]) == "101");
    CHECK(args[4].kind() == Value::Kind::String);
    CHECK(text_of(args[4]) == "single");
    CHECK(args[5].kind() == Value::Kind::String);
    CHECK(text_of(args[5]) == "dou;ble");
    CHECK(args[6].kind() == Value::Kind::Arbitrary);
    CHECK(text_of(args[6]) == "he\nlo");
    CHECK(args[7].kind() == Value::Kind::Characters);
    CHECK(text_of(args[7]) == "ON");
    CHECK(p.rest.empty());
}

TEST_CASE_FIXTURE(ParserFixture, "Whitespace around headers and commas is allowed") {
    Parsed p = parse_text("  VAL \t -1 ,  +.5e-2  \n");
    REQUIRE(p.ok());
    REQUIRE(p.call->args.size() == 2);
    CHECK(text_of(p.call->args[0]) == "-1");
    CHECK(text_of(p.call->args[1]) == "+.5e-2");

    Parsed trailing = parse_text("*IDN?   \n");
    REQUIRE(trailing.ok());
    CHECK(trailing.call->args.empty());
}

TEST_CASE_FIXTURE(ParserFixture, "Blank line is an empty statement") {
    Parsed p = parse_text("   \nVAL\n");
    REQUIRE(p.ok());
    CHECK_FALSE(p.call.has_value());
    CHECK(p.rest == "VAL\n");
}

TEST_CASE_FIXTURE(ParserFixture, "Malformed statements report the matching error and keep the input") {
    struct Case { const char* text; int number; };
    const Case cases[] = {
        {"*IDN?abc\n",             -101},
        {"*IDN!\n",                -101},
        {"*IDN ?\n",               -101},
        {"VAL 123, 456abc\n",      -101},
        {"VAL 123 456\n",          -103},
        {"VAL 123,,456\n",         -103},
        {"VAL ,123\n",             -103},
        {"VAL,123\n",              -103},
        {"VAL #X12\n",             -101},
        {"VAL 'abc\n",             -151},
        {"VAL 1,\"ab\n\"\n",        -151},
        {"NOPE\n",                 -113},
        {"MEAS:CURRent?\n",        -113},
        {"ABCDEFGHIJKLMN\n",       -112},
        {"VAL 1,2,3,4,5,6,7,8,9,10,11\n", -115},
    };
    for (const Case& c : cases) {
        CAPTURE(c.text);
        Parsed p = parse_text(c.text);
        REQUIRE_FALSE(p.ok());
        CHECK(p.status->kind != ParseError::Kind::Incomplete);
        CHECK(p.error_number() == c.number);
        CHECK(p.rest == c.text);
    }
}

TEST_CASE_FIXTURE(ParserFixture, "Undefined header is fatal, separator problems are soft") {
    CHECK(parse_text("NOPE\n").status->kind == ParseError::Kind::Fatal);
    CHECK(parse_text("VAL 1 2\n").status->kind == ParseError::Kind::Soft);
}

TEST_CASE_FIXTURE(ParserFixture, "Statements cut short are incomplete") {
    const char* partial[] = {
        "", "  ", "*IDN?", "*IDN", "VAL 12", "VAL 1,", "VAL #H", "VAL #15hel", "VAL 'abc",
        "SYST:", "MEAS:VOLT", "VAL 1.5E",
    };
    for (const char* text : partial) {
        CAPTURE(text);
        Parsed p = parse_text(text);
        REQUIRE_FALSE(p.ok());
        CHECK(p.status->kind == ParseError::Kind::Incomplete);
        CHECK(p.rest == text);
    }
}

TEST_CASE_FIXTURE(ParserFixture, "Relative headers resolve from the context, ':' restarts at the root") {
    const Node* meas = tree.root().child("MEASURE");
    REQUIRE(meas != nullptr);

    Parsed rel = parse_text(*meas, "VOLT?\n");
    REQUIRE(rel.ok());
    CHECK(rel.call->node == meas->child("VOLT"));

    CHECK(parse_text("VOLT?\n").error_number() == -113);

    Parsed abs = parse_text(*meas, ":MEAS:VOLT?\n");
    REQUIRE(abs.ok());
    CHECK(abs.call->node == tree.root().child("MEAS")->child("VOLT"));

    Parsed common = parse_text(*meas, "*RST\n");
    REQUIRE(common.ok());
    CHECK(common.call->node == tree.root().child("*RST"));
}

TEST_CASE_FIXTURE(ParserFixture, "Semicolon leaves the statement unterminated with its parent header") {
    Parsed p = parse_text("MEAS:VOLT 5;VOLT?\n");
    REQUIRE(p.ok());
    CHECK_FALSE(p.call->terminated);
    CHECK(p.call->header == tree.root().child("MEAS"));
    CHECK(p.rest == "VOLT?\n");
}
