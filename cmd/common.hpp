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

#include <istream>
#include <ostream>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include <infra/common/log.hpp>
#include <infra/common/settings.hpp>

namespace b58::cmd {

//! \brief Parses command line arguments for the conversion tool
//! \remarks Throws CLI::ParseError (or a derived exception) on invalid usage, help or version requests
void parse_command_line(CLI::App& cli, int argc, char* argv[], AppSettings& settings);

//! \brief Set up options to populate log settings after cli.parse()
void add_logging_options(CLI::App& cli, log::Settings& log_settings);

//! \brief Reads the whole content of the stream
std::string read_all(std::istream& stream);

//! \brief Writes the base58 text of input followed by a newline
//! \return The process exit code
int run_encode(const AppSettings& settings, std::string_view input, std::ostream& out);

//! \brief Writes the raw bytes decoded from input once surrounding white space is trimmed
//! \return The process exit code (1 when input is not UTF-8 text or holds a foreign symbol)
int run_decode(const AppSettings& settings, std::string_view input, std::ostream& out);

//! \brief Runs the conversion tool over the given streams
//! \return The process exit code : 0 on success, 1 on any failure
int run(int argc, char* argv[], std::istream& in, std::ostream& out);

}  // namespace b58::cmd
