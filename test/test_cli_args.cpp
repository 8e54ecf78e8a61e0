#include <catch2/catch_all.hpp>
#include <jx/cli_args.h>
#include <jx/cli_utils.h>
#include <stdexcept>
#include <vector>

using namespace jx;
using Catch::Matchers::ContainsSubstring;

namespace {
    CliArgs make_args(std::vector<const char*> argv) {
        argv.insert(argv.begin(), "jsonex");
        return CliArgs(static_cast<int>(argv.size()), argv.data());
    }

    std::string error_of(std::vector<const char*> argv) {
        try {
            make_args(argv);
        } catch (const std::invalid_argument& e) {
            return e.what();
        }
        FAIL("expected std::invalid_argument");
        return "";
    }
}

TEST_CASE("A file argument selects parsing", "[cli][args][unit]") {
    auto args = make_args({"data.json"});
    REQUIRE(args.getAction() == CliArgs::Action::PARSE);
    REQUIRE(args.getFilePath() == "data.json");
    REQUIRE(args.getOptions().format == Format::Standard);
    REQUIRE(args.getOptions().max_depth == 512);
    REQUIRE_FALSE(args.isVerbose());
}

TEST_CASE("No file or --help shows help", "[cli][args][unit]") {
    REQUIRE(make_args({}).getAction() == CliArgs::Action::HELP);
    REQUIRE(make_args({"--help"}).getAction() == CliArgs::Action::HELP);
    REQUIRE(make_args({"data.json", "-h"}).getAction() == CliArgs::Action::HELP);
}

TEST_CASE("Format and limit options", "[cli][args][unit]") {
    auto args = make_args({"-x", "--max-depth", "16", "-v", "in.jsonx"});
    REQUIRE(args.getOptions().format == Format::Extended);
    REQUIRE(args.getOptions().max_depth == 16);
    REQUIRE(args.isVerbose());

    REQUIRE(make_args({"--extended", "--standard", "a"}).getOptions().format == Format::Standard);
}

TEST_CASE("Bad --max-depth values", "[cli][args][unit][exception]") {
    REQUIRE_THAT(error_of({"--max-depth"}), ContainsSubstring("requires a value"));
    REQUIRE_THAT(error_of({"--max-depth", "0", "a"}), ContainsSubstring("at least 1"));
    REQUIRE_THAT(error_of({"--max-depth", "-3", "a"}), ContainsSubstring("positive integer"));
    REQUIRE_THAT(error_of({"--max-depth", "12x", "a"}), ContainsSubstring("positive integer"));
    REQUIRE_THAT(error_of({"--max-depth", "99999999999999999999999", "a"}), ContainsSubstring("out of range"));
    REQUIRE_THAT(error_of({"--max-depth", "2049", "a"}), ContainsSubstring("at most 2048"));
    REQUIRE(make_args({"--max-depth", "2048", "a"}).getOptions().max_depth == max_depth_limit);
}

TEST_CASE("Unknown options suggest the closest known one", "[cli][args][unit][exception]") {
    auto msg = error_of({"--extendd", "a"});
    REQUIRE_THAT(msg, ContainsSubstring("Unknown argument: --extendd"));
    REQUIRE_THAT(msg, ContainsSubstring("Did you mean '--extended'?"));

    auto far = error_of({"--completely-unrelated", "a"});
    REQUIRE_THAT(far, ContainsSubstring("Unknown argument"));
    REQUIRE_THAT(far, !ContainsSubstring("Did you mean"));
}

TEST_CASE("Only one input file", "[cli][args][unit][exception]") {
    REQUIRE_THAT(error_of({"a.json", "b.json"}), ContainsSubstring("only one input file"));
}

TEST_CASE("Edit distance", "[cli][unit]") {
    REQUIRE(cli_utils::edit_distance("", "") == 0);
    REQUIRE(cli_utils::edit_distance("abc", "") == 3);
    REQUIRE(cli_utils::edit_distance("kitten", "sitting") == 3);
    REQUIRE(cli_utils::closest_option("--verbos", {"--verbose", "--help"}) == "--verbose");
    REQUIRE(cli_utils::closest_option("--zzzzzzzz", {"--help"}).empty());
}
