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

#pragma once
#include <filesystem>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <absl/time/time.h>

#include <infra/os/terminal.hpp>

namespace b58::log {

//! \brief Available severity levels
enum class Level {
    kNone,      // Simple logging line with no severity (e.g. build info)
    kCritical,  // An error there's no way we can recover from
    kError,     // A conversion failed
    kWarning,   // Something happened and user might have the possibility to amend the situation
    kInfo,      // Info messages on regular operations
    kDebug,     // Debug information
    kTrace,     // Details of each conversion
};

//! \brief Holds logging configuration
//! \remarks Console logging always goes to std::cerr as std::cout carries the conversion output
struct Settings {
    std::string log_timezone{"UTC"};       // UTC or a valid IANA time zone (e.g. Europe/Rome)
    bool log_nocolor{false};               // Whether to disable colorized output
    Level log_verbosity{Level::kWarning};  // Log verbosity level
    std::string log_file;                  // Tee log lines to this file (never colorized)
    char log_thousands_sep{'\''};          // Thousands separator (0 to disable grouping)
};

//! \brief Initializes logging facilities
//! \note Not thread safe : meant to be called once at start of process
void init(const Settings& settings);

//! \brief Get the current logging verbosity
Level get_verbosity() noexcept;

//! \brief Sets logging verbosity
void set_verbosity(Level level) noexcept;

//! \brief Whether a line of the provided level would be printed with current settings
//! \remarks Lets callers skip computations whose outcome would be discarded
bool test_verbosity(Level level) noexcept;

//! \brief Sets a file output for log teeing (lines are appended)
void tee_file(const std::filesystem::path& path);

//! \brief Accumulates the body of one log line and emits it on destruction
class BufferBase {
  public:
    explicit BufferBase(Level level);
    explicit BufferBase(Level level, std::string_view msg, const std::vector<std::string>& args);
    BufferBase(const BufferBase&) = delete;
    BufferBase& operator=(const BufferBase&) = delete;
    ~BufferBase() { flush(); }

    template <class T>
    inline void append(T const& obj) {
        if (should_print_) sstream_ << obj;
    }
    template <class T>
    BufferBase& operator<<(T const& obj) {
        append(obj);
        return *this;
    }

  protected:
    //! \brief Composes the full line : severity label, timestamp and body
    [[nodiscard]] std::string format(bool colorized) const;

    void flush() const;

    const Level level_;
    const bool should_print_;
    const absl::Time time_;
    std::stringstream sstream_;
};

template <Level level>
class LogBuffer : public BufferBase {
  public:
    explicit LogBuffer() : BufferBase(level) {}
    explicit LogBuffer(std::string_view msg, std::vector<std::string> args = {}) : BufferBase(level, msg, args) {}
};

using Debug = LogBuffer<Level::kDebug>;
using Info = LogBuffer<Level::kInfo>;

}  // namespace b58::log

#define LOG_BUFFER(level_)                   \
    if (!b58::log::test_verbosity(level_)) { \
    } else                                   \
        b58::log::LogBuffer<level_>()

#define LOG_TRACE LOG_BUFFER(b58::log::Level::kTrace)
#define LOG_WARNING LOG_BUFFER(b58::log::Level::kWarning)
#define LOG_ERROR LOG_BUFFER(b58::log::Level::kError)
#define LOG_CRITICAL LOG_BUFFER(b58::log::Level::kCritical)
