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

#include "log.hpp"

#include <array>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <locale>
#include <memory>
#include <mutex>
#include <utility>

#include <absl/strings/str_cat.h>
#include <absl/time/clock.h>
#include <boost/algorithm/string/predicate.hpp>

namespace b58::log {

namespace {
    Settings settings_{};
    absl::TimeZone time_zone_{absl::UTCTimeZone()};
    std::mutex out_mtx_{};
    std::unique_ptr<std::ofstream> file_{nullptr};

    struct LevelStyle {
        std::string_view label;
        const char* color;
    };

    // Indexed by Level
    constexpr std::array<LevelStyle, 7> kLevelStyles{{
        {"     ", kColorReset},
        {"CRIT ", kBackgroundRed},
        {"ERROR", kColorRed},
        {"WARN ", kColorOrangeHigh},
        {"INFO ", kColorGreen},
        {"DEBUG", kBackgroundPurple},
        {"TRACE", kColorCoal},
    }};
    static_assert(kLevelStyles.size() == static_cast<size_t>(Level::kTrace) + 1);

    absl::TimeZone load_time_zone(const std::string& name) {
        if (name.empty() or boost::iequals(name, "UTC")) {
            return absl::UTCTimeZone();
        }
        absl::TimeZone ret;
        if (not absl::LoadTimeZone(name, &ret)) {
            std::cerr << "Could not load time zone [" << name << "] defaulting to UTC" << std::endl;
            ret = absl::UTCTimeZone();
        }
        return ret;
    }

    struct separate_thousands : std::numpunct<char> {
        char separator;
        explicit separate_thousands(char sep) : separator(sep) {}
        [[nodiscard]] char do_thousands_sep() const override { return separator; }
        [[nodiscard]] string_type do_grouping() const override { return "\3"; }  // groups of 3 digit
    };

}  // namespace

void init(const Settings& settings) {
    settings_ = settings;
    time_zone_ = load_time_zone(settings_.log_timezone);
    file_.reset();
    if (not settings_.log_file.empty()) {
        tee_file(std::filesystem::path(settings_.log_file));
    }
    if (not init_terminal()) {
        settings_.log_nocolor = true;  // Redirected or not capable of ANSI colors
    }
}

void tee_file(const std::filesystem::path& path) {
    auto file{std::make_unique<std::ofstream>(path, std::ios::out bitor std::ios::app)};
    if (not file->is_open()) {
        std::cerr << "Could not open log file " << path.string() << std::endl;
        return;
    }
    file_ = std::move(file);
}

Level get_verbosity() noexcept { return settings_.log_verbosity; }

void set_verbosity(Level level) noexcept { settings_.log_verbosity = level; }

bool test_verbosity(Level level) noexcept { return level <= settings_.log_verbosity; }

BufferBase::BufferBase(Level level) : level_{level}, should_print_{test_verbosity(level)}, time_{absl::Now()} {
    if (should_print_ and settings_.log_thousands_sep not_eq 0) {
        sstream_.imbue(std::locale(sstream_.getloc(), new separate_thousands(settings_.log_thousands_sep)));
    }
}

BufferBase::BufferBase(Level level, std::string_view msg, const std::vector<std::string>& args) : BufferBase(level) {
    if (not should_print_) return;
    sstream_ << std::left << std::setw(25) << std::setfill(' ') << msg;
    for (size_t i{0}; i < args.size(); ++i) {
        sstream_ << args[i] << ((i % 2) == 0 ? "=" : " ");
    }
}

std::string BufferBase::format(bool colorized) const {
    const auto& style{kLevelStyles.at(static_cast<size_t>(level_))};
    const auto timestamp{absl::FormatTime("%m-%d|%H:%M:%E3S", time_, time_zone_)};
    if (not colorized) {
        return absl::StrCat(absl::string_view(style.label.data(), style.label.size()), " [", timestamp, "] ", sstream_.str());
    }
    return absl::StrCat(style.color, absl::string_view(style.label.data(), style.label.size()), kColorReset, " ", kColorCyan, "[", timestamp, "]", kColorReset, " ",
                        sstream_.str());
}

void BufferBase::flush() const {
    if (not should_print_) return;
    const std::lock_guard lock{out_mtx_};
    std::cerr << format(not settings_.log_nocolor) << std::endl;
    if (file_) {
        *file_ << format(/*colorized=*/false) << std::endl;
    }
}

}  // namespace b58::log
