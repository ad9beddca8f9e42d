#include <doctest/doctest.h>
#include <string>
#include "scpicore/tree.hpp"

using namespace scpicore;

// Walk a colon separated header from the root, nullptr when a segment is missing.
static const Node* lookup(const Node& root, const std::string& path) {
    const Node* node = &root;
    size_t start = 0;
    while (node && start <= path.size()) {
        size_t end = path.find(':', start);
        if (end == std::string::npos) end = path.size();
        node = node->child(etl::string_view(path.data() + start, end - start));
        start = end + 1;
    }
    return node;
}

TEST_CASE("Every long/short/omitted spelling reaches the same query id") {
    CommandTree<64> tree;
    REQUIRE(tree.insert(Registration::from_path("[SYSTem]:ERRor:COUNt?", 7, 0)) == BuildResult::Ok);

    const char* spellings[] = {
        "SYSTEM:ERROR:COUNT", "SYST:ERR:COUN", "SYST:ERROR:COUN", "SYSTEM:ERR:COUNT",
        "ERROR:COUNT", "ERR:COUN", "syst:err:coun", "Error:Count",
    };
    for (const char* s : spellings) {
        CAPTURE(s);
        const Node* node = lookup(tree.root(), s);
        REQUIRE(node != nullptr);
        REQUIRE(node->query().has_value());
        CHECK(node->query().value() == 7);
        CHECK_FALSE(node->command().has_value());
    }

    CHECK(lookup(tree.root(), "SYSTE:ERR:COUN") == nullptr);   // neither long nor short
    CHECK(lookup(tree.root(), "SYST:COUN") == nullptr);
}

TEST_CASE("Command and query may share a node") {
    CommandTree<32> tree;
    CHECK(tree.insert(Registration::from_path("MEASure:VOLTage[:DC]", 3, 1)) == BuildResult::Ok);
    CHECK(tree.insert(Registration::from_path("MEASure:VOLTage[:DC]?", 4, 0)) == BuildResult::Ok);

    const Node* dc = lookup(tree.root(), "MEAS:VOLT:DC");
    const Node* volt = lookup(tree.root(), "MEASURE:VOLTAGE");
    REQUIRE(dc != nullptr);
    REQUIRE(volt != nullptr);
    CHECK(dc->command().value() == 3);
    CHECK(dc->query().value() == 4);
    CHECK(volt->command().value() == 3);
    CHECK(volt->query().value() == 4);
}

TEST_CASE("Conflicting registrations are build errors") {
    CommandTree<32> tree;
    REQUIRE(tree.insert(Registration::from_path("OUTPut[:STATe]", 1, 1)) == BuildResult::Ok);
    REQUIRE(tree.insert(Registration::from_path("OUTPut[:STATe]?", 2, 0)) == BuildResult::Ok);

    CHECK(tree.insert(Registration::from_path("OUTP", 5, 0)) == BuildResult::CommandExists);
    CHECK(tree.insert(Registration::from_path("OUTPUT:STAT?", 6, 0)) == BuildResult::QueryExists);
    // same id again is not a conflict
    CHECK(tree.insert(Registration::from_path("OUTPut:STATe", 1, 1)) == BuildResult::Ok);
}

TEST_CASE("Malformed paths are rejected") {
    CommandTree<16> tree;
    CHECK(tree.insert(Registration::from_path("", 0, 0)) == BuildResult::InvalidPath);
    CHECK(tree.insert(Registration::from_path("A::B", 0, 0)) == BuildResult::InvalidPath);
    CHECK(tree.insert(Registration::from_path("A:", 0, 0)) == BuildResult::InvalidPath);
    CHECK(tree.insert(Registration::from_path("[A", 0, 0)) == BuildResult::InvalidPath);
    CHECK(tree.insert(Registration::from_path("VOLT-AGE", 0, 0)) == BuildResult::InvalidPath);
    CHECK(tree.insert(Registration{nullptr, false, 0, 0}) == BuildResult::InvalidPath);
    CHECK(tree.node_count() == 1);
}

TEST_CASE("Node pool exhaustion is reported") {
    CommandTree<3> tree;
    CHECK(tree.insert(Registration::from_path("ABCdef:GHIjk", 0, 0)) == BuildResult::TooManyNodes);
    CHECK(tree.node_count() == 3);
}

TEST_CASE("Registration derives the query flag from the path") {
    CHECK(Registration::from_path("*IDN?", 0, 0).query);
    CHECK_FALSE(Registration::from_path("*RST", 1, 0).query);
    CHECK(std::string(to_string(BuildResult::QueryExists)) == "query_exists");
}
