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

#include <iostream>
#include <iterator>
#include <map>
#include <stdexcept>
#include <typeinfo>

#include <boost/algorithm/string/case_conv.hpp>
#include <magic_enum.hpp>

#include <core/common/base.hpp>
#include <core/common/cast.hpp>
#include <core/encoding/base58.hpp>
#include <core/encoding/hex.hpp>
#include <core/encoding/utf8.hpp>

namespace b58::cmd {

void parse_command_line(CLI::App& cli, int argc, char* argv[], AppSettings& settings) {
    cli.set_version_flag("--version", get_buildinfo_string());

    auto* decode_flag = cli.add_flag("-d,--decode", "Decode Base58 input (default: encode)");

    std::string alphabet_name{enc::to_string(settings.alphabet)};
    cli.add_option("-a,--alphabet", alphabet_name, "Alphabet used for conversion (bitcoin|btc, ripple|xrp, flickr)")
        ->check(CLI::Validator(
            [](std::string& name) -> std::string {
                return enc::parse_alphabet(name).has_value() ? std::string{} : "Unknown alphabet " + name;
            },
            "ALPHABET"))
        ->capture_default_str();

    // Logging options
    add_logging_options(cli, settings.log);

    // Parse and validate
    cli.parse(argc, argv);

    const auto alphabet{enc::parse_alphabet(alphabet_name)};
    if (not alphabet.has_value()) {
        throw CLI::ValidationError("--alphabet", "Unknown alphabet " + alphabet_name);
    }
    settings.alphabet = *alphabet;
    settings.mode = *decode_flag ? Mode::kDecode : Mode::kEncode;
}

void add_logging_options(CLI::App& cli, log::Settings& log_settings) {
    const auto level_name = [](log::Level level) {
        return boost::algorithm::to_lower_copy(std::string(magic_enum::enum_name(level).substr(1)));
    };

    std::map<std::string, log::Level, std::less<>> levels;
    for (const auto enumerator : magic_enum::enum_values<log::Level>()) {
        levels.try_emplace(level_name(enumerator), enumerator);
    }

    auto& log_opts = *cli.add_option_group("Log", "Logging options (log lines go to stderr)");
    log_opts.add_option("--log.verbosity", log_settings.log_verbosity, "Sets log verbosity")
        ->transform(CLI::CheckedTransformer(levels, CLI::ignore_case))
        ->default_str(level_name(log_settings.log_verbosity));
    log_opts.add_option("--log.timezone", log_settings.log_timezone, "Time zone of log timestamps (IANA name)")
        ->capture_default_str();
    log_opts.add_flag("--log.nocolor", log_settings.log_nocolor, "Disable colors on log lines");
    log_opts.add_option("--log.file", log_settings.log_file, "Tee all log lines to given file name");
}

std::string read_all(std::istream& stream) {
    std::string content{std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>()};
    if (stream.bad()) {
        throw std::runtime_error("Error reading input");
    }
    return content;
}

int run_encode(const AppSettings& settings, std::string_view input, std::ostream& out) {
    const auto encoded{enc::base58::encode(input, settings.alphabet)};
    LOG_TRACE << "Encoded " << input.size() << " bytes into " << encoded.size() << " symbols";
    out << encoded << '\n' << std::flush;
    if (not out) {
        LOG_ERROR << "Error writing output";
        return 1;
    }
    return 0;
}

int run_decode(const AppSettings& settings, std::string_view input, std::ostream& out) {
    if (not enc::utf8::is_valid(input)) {
        LOG_ERROR << "Input is not valid UTF-8";
        return 1;
    }
    input = enc::utf8::trim(input);

    const auto decoded{enc::base58::decode(input, settings.alphabet)};
    if (decoded.has_error()) {
        LOG_ERROR << decoded.error().message() << " in Base58 input";
        return 1;
    }

    const auto& bytes{decoded.value()};
    LOG_TRACE << "Decoded " << input.size() << " symbols into " << bytes.size() << " bytes "
              << enc::hex::encode(bytes, /*with_prefix=*/true);
    out.write(byte_ptr_cast(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (not out) {
        LOG_ERROR << "Error writing output";
        return 1;
    }
    return 0;
}

int run(int argc, char* argv[], std::istream& in, std::ostream& out) {
    CLI::App cli("base58 - Base58 encoding and decoding utility");
    cli.get_formatter()->column_width(40);
    cli.footer(
        "Examples:\n"
        "  printf 'Hello, World!' | base58\n"
        "  printf '72k1xXWG59fYdzSNoA' | base58 -d\n"
        "  base58 --alphabet ripple < input.txt\n"
        "  base58 -d --alphabet bitcoin < encoded.txt");

    AppSettings settings{};
    try {
        parse_command_line(cli, argc, argv, settings);
    } catch (const CLI::ParseError& ex) {
        // Help and version requests are successful exits
        return cli.exit(ex, out, std::cerr) == 0 ? 0 : 1;
    }

    try {
        log::init(settings.log);
        log::Debug("Starting", {"version", get_buildinfo()->project_version, "mode",
                                std::string(magic_enum::enum_name(settings.mode)).erase(0, 1), "alphabet",
                                enc::to_string(settings.alphabet)});

        const std::string input{read_all(in)};
        if (settings.mode == Mode::kDecode) {
            return run_decode(settings, input, out);
        }
        return run_encode(settings, input, out);

    } catch (const std::exception& ex) {
        LOG_CRITICAL << "Unexpected " << typeid(ex).name() << " : " << ex.what();
    }
    return 1;
}

}  // namespace b58::cmd
