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

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

#include <catch2/catch.hpp>

#include <core/common/random.hpp>
#include <infra/common/log.hpp>

namespace b58::log {

namespace {
    // Exposes the buffered content of a log line
    template <Level level>
    class TestLogBuffer : public LogBuffer<level> {
      public:
        [[nodiscard]] std::string content() const { return LogBuffer<level>::sstream_.str(); }
        [[nodiscard]] std::string line(bool colorized) const { return LogBuffer<level>::format(colorized); }
    };

    template <Level level>
    void check_log_empty(bool expected) {
        auto log_buffer = TestLogBuffer<level>();
        log_buffer << "test";
        if (expected) {
            CHECK(log_buffer.content().empty());
        } else {
            CHECK(log_buffer.content() == "test");
        }
    }

    // Restores the previous verbosity on scope exit so tests can run in any order
    class VerbosityGuard {
      public:
        explicit VerbosityGuard(Level level) { set_verbosity(level); }
        ~VerbosityGuard() { set_verbosity(previous_); }

      private:
        Level previous_{get_verbosity()};
    };

    // Collects everything written to std::cerr while in scope
    class CerrCapture {
      public:
        CerrCapture() : previous_{std::cerr.rdbuf(sink_.rdbuf())} {}
        ~CerrCapture() { std::cerr.rdbuf(previous_); }
        [[nodiscard]] std::string str() const { return sink_.str(); }

      private:
        std::ostringstream sink_;
        std::streambuf* previous_;
    };
}  // namespace

TEST_CASE("LogBuffer", "[infra][log]") {
    CerrCapture capture;

    using enum b58::log::Level;
    SECTION("LogBuffer stores nothing for verbosity higher than default") {
        check_log_empty<kInfo>(true);
        check_log_empty<kDebug>(true);
        check_log_empty<kTrace>(true);
    }

    SECTION("LogBuffer stores content for verbosity lower than or equal to default") {
        check_log_empty<kWarning>(false);
        check_log_empty<kError>(false);
        check_log_empty<kCritical>(false);
        check_log_empty<kNone>(false);
    }

    SECTION("LogBuffer stores nothing for verbosity higher than configured one") {
        VerbosityGuard guard{kError};
        check_log_empty<kWarning>(true);
        check_log_empty<kInfo>(true);
        check_log_empty<kDebug>(true);
        check_log_empty<kTrace>(true);
    }

    SECTION("LogBuffer stores content for verbosity lower than or equal to configured one") {
        VerbosityGuard guard{kTrace};
        check_log_empty<kTrace>(false);
        check_log_empty<kDebug>(false);
        check_log_empty<kInfo>(false);
        check_log_empty<kCritical>(false);
    }

    SECTION("Verbosity guard restores previous level") {
        const auto previous{get_verbosity()};
        {
            VerbosityGuard guard{kNone};
            CHECK(get_verbosity() == kNone);
            CHECK(test_verbosity(kNone));
            CHECK_FALSE(test_verbosity(kCritical));
        }
        CHECK(get_verbosity() == previous);
    }

    SECTION("LogBuffer formats lines") {
        VerbosityGuard guard{kInfo};
        auto log_buffer = TestLogBuffer<kInfo>();
        log_buffer << "Decoded " << 1234567 << " bytes";
        CHECK(log_buffer.content() == "Decoded 1'234'567 bytes");

        const auto plain{log_buffer.line(false)};
        CHECK(plain.starts_with("INFO  ["));
        CHECK(plain.ends_with("] Decoded 1'234'567 bytes"));
        CHECK(plain.find('\x1b') == std::string::npos);

        const auto colorized{log_buffer.line(true)};
        CHECK(colorized.starts_with(kColorGreen));
        CHECK(colorized.ends_with("Decoded 1'234'567 bytes"));
    }

    SECTION("Macros skip discarded levels") {
        VerbosityGuard guard{kError};
        LOG_WARNING << "discarded";
        LOG_ERROR << "emitted";
        const auto output{capture.str()};
        CHECK(output.find("discarded") == std::string::npos);
        CHECK(output.find("emitted") not_eq std::string::npos);
    }
}

TEST_CASE("Log teeing to file", "[infra][log]") {
    CerrCapture capture;

    const auto log_path{std::filesystem::temp_directory_path() /
                        ("b58_log_test_" + std::to_string(randomize<uint32_t>()) + ".log")};
    Settings log_settings;
    log_settings.log_verbosity = Level::kInfo;
    log_settings.log_file = log_path.string();
    init(log_settings);
    log::Info("Decoded", {"bytes", "5"});
    log::Debug("Discarded", {"bytes", "5"});
    init(Settings{});  // Closes the file

    std::ifstream file{log_path};
    REQUIRE(file.is_open());
    const std::string content{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    file.close();
    std::filesystem::remove(log_path);

    CHECK(content.find("Decoded") not_eq std::string::npos);
    CHECK(content.find("bytes=5") not_eq std::string::npos);
    CHECK(content.find("Discarded") == std::string::npos);
    CHECK(content.find('\x1b') == std::string::npos);  // No colorization in files
    CHECK(capture.str().find("Decoded") not_eq std::string::npos);
    CHECK(get_verbosity() == Level::kWarning);
}
}  // namespace b58::log
