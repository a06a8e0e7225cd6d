/*
   Copyright 2024 The B58 Authors

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/

#include "common.hpp"

#include <sstream>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include <core/common/base.hpp>
#include <core/common/cast.hpp>
#include <infra/os/terminal.hpp>

namespace b58::cmd {

namespace {

    struct RunResult {
        int exit_code{0};
        std::string output{};
    };

    RunResult run_with(std::vector<std::string> args, const std::string& input) {
        args.insert(args.begin(), "base58");
        std::vector<char*> argv;
        for (auto& arg : args) argv.push_back(arg.data());
        argv.push_back(nullptr);

        std::istringstream in{input};
        std::ostringstream out;
        RunResult result{};
        result.exit_code = run(static_cast<int>(args.size()), argv.data(), in, out);
        result.output = out.str();
        return result;
    }

    AppSettings parse(std::vector<std::string> args) {
        args.insert(args.begin(), "base58");
        std::vector<char*> argv;
        for (auto& arg : args) argv.push_back(arg.data());
        argv.push_back(nullptr);

        CLI::App cli;
        AppSettings settings{};
        parse_command_line(cli, static_cast<int>(args.size()), argv.data(), settings);
        return settings;
    }

}  // namespace

TEST_CASE("Command line parsing", "[cmd]") {
    SECTION("Defaults") {
        const auto settings{parse({})};
        CHECK(settings.mode == Mode::kEncode);
        CHECK(settings.alphabet == enc::Alphabet::kBitcoin);
    }

    SECTION("Canonical names and aliases") {
        CHECK(parse({"-a", "bitcoin"}).alphabet == enc::Alphabet::kBitcoin);
        CHECK(parse({"-a", "btc"}).alphabet == enc::Alphabet::kBitcoin);
        CHECK(parse({"--alphabet", "ripple"}).alphabet == enc::Alphabet::kRipple);
        CHECK(parse({"--alphabet=XRP"}).alphabet == enc::Alphabet::kRipple);
        CHECK(parse({"-a", "Flickr"}).alphabet == enc::Alphabet::kFlickr);
        CHECK(parse({"-d"}).mode == Mode::kDecode);
        CHECK(parse({"--decode", "-a", "xrp"}).mode == Mode::kDecode);
    }

    SECTION("Unknown alphabets") {
        CHECK_THROWS_AS(parse({"-a", "monero"}), CLI::ValidationError);
        // Enumerator values are not alphabet names
        CHECK_THROWS_AS(parse({"-a", "0"}), CLI::ValidationError);
        CHECK_THROWS_AS(parse({"-a", "1"}), CLI::ValidationError);
        CHECK_THROWS_AS(parse({"-a", "9"}), CLI::ValidationError);
    }

    SECTION("Log options") {
        const auto settings{parse({"--log.verbosity", "TRACE", "--log.nocolor"})};
        CHECK(settings.log.log_verbosity == log::Level::kTrace);
        CHECK(settings.log.log_nocolor);
        CHECK_THROWS_AS(parse({"--log.verbosity", "loud"}), CLI::ValidationError);
    }
}

TEST_CASE("Read whole stream", "[cmd]") {
    std::istringstream empty{""};
    CHECK(read_all(empty).empty());

    const std::string binary{"\x00\x0a\x0d\x1a\xff\n", 6};
    std::istringstream stream{binary};
    CHECK(read_all(stream) == binary);
}

TEST_CASE("Exit codes", "[cmd]") {
    CHECK(run_with({"--help"}, "").exit_code == 0);
    CHECK(run_with({"--version"}, "").exit_code == 0);

    const auto bad_flag{run_with({"--bogus"}, "Hello")};
    CHECK(bad_flag.exit_code == 1);
    CHECK(bad_flag.output.empty());

    for (const std::string name : {"monero", "0", "1", "9"}) {
        const auto bad_alphabet{run_with({"-a", name}, "Hello")};
        CHECK(bad_alphabet.exit_code == 1);
        CHECK(bad_alphabet.output.empty());
    }
}

TEST_CASE("Encoding from input stream", "[cmd]") {
    auto result{run_with({}, "Hello")};
    CHECK(result.exit_code == 0);
    CHECK(result.output == "9Ajdvzr\n");

    result = run_with({"-a", "XRP"}, "Hello");
    CHECK(result.exit_code == 0);
    CHECK(result.output == "9wjdvzi\n");

    result = run_with({"--alphabet", "flickr"}, "Hello");
    CHECK(result.exit_code == 0);
    CHECK(result.output == "9aJCVZR\n");

    // Empty input encodes to an empty line
    result = run_with({}, "");
    CHECK(result.exit_code == 0);
    CHECK(result.output == "\n");
}

TEST_CASE("Decoding from input stream", "[cmd]") {
    auto result{run_with({"-d"}, "  9Ajdvzr\n")};
    CHECK(result.exit_code == 0);
    CHECK(result.output == "Hello");

    // No-break space and ideographic space around the text
    result = run_with({"-d"}, "\xc2\xa0" "9Ajdvzr\xe3\x80\x80\r\n");
    CHECK(result.exit_code == 0);
    CHECK(result.output == "Hello");

    result = run_with({"-d", "-a", "ripple"}, "9wjdvzi");
    CHECK(result.exit_code == 0);
    CHECK(result.output == "Hello");

    SECTION("Failures write nothing") {
        result = run_with({"-d"}, "\xff");
        CHECK(result.exit_code == 1);
        CHECK(result.output.empty());

        result = run_with({"-d"}, "9Ajdvzr0");
        CHECK(result.exit_code == 1);
        CHECK(result.output.empty());

        result = run_with({"-d"}, "9Aj dvzr");
        CHECK(result.exit_code == 1);
        CHECK(result.output.empty());

        // Valid for bitcoin, but '0' is foreign to every alphabet
        result = run_with({"-d", "-a", "flickr"}, "0");
        CHECK(result.exit_code == 1);
        CHECK(result.output.empty());
    }
}

TEST_CASE("Binary round trip through streams", "[cmd]") {
    CHECK(init_binary_stdio());

    const Bytes data{0x00, 0x0a, 0x0d, 0x1a, 0xff};
    const std::string_view raw{byte_view_to_string_view(data)};
    AppSettings settings{};

    std::ostringstream encoded;
    REQUIRE(run_encode(settings, raw, encoded) == 0);
    CHECK(encoded.str() == "1FuH8i\n");

    std::ostringstream decoded;
    REQUIRE(run_decode(settings, encoded.str(), decoded) == 0);
    CHECK(decoded.str().size() == data.size());
    CHECK(decoded.str() == raw);
}

}  // namespace b58::cmd
