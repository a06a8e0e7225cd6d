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
#include <cstdint>
#include <string>

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <magic_enum.hpp>

namespace b58::enc {

enum class Error {
    kSuccess,             // Not actually an error
    kIllegalHexDigit,     // One or more input characters is not a valid hex digit
    kIllegalBase58Digit,  // One input character is not a symbol of the selected base58 alphabet
    kInvalidUtf8Input,    // Input is not a well-formed UTF-8 text
    kEmptyInput,          // Reserved : empty inputs are valid and decode to empty outputs
    kOverflow,            // Reserved : decoded integers are not bounded to a fixed width
};

class ErrorCategory final : public boost::system::error_category {
  public:
    virtual ~ErrorCategory() noexcept = default;
    const char* name() const noexcept override { return "EncodingError"; }
    std::string message(int err_code) const override {
        std::string desc{"Unknown error"};
        if (const auto enumerator = magic_enum::enum_cast<enc::Error>(err_code); enumerator.has_value()) {
            desc.assign(std::string(magic_enum::enum_name<enc::Error>(*enumerator)));
            desc.erase(0, 1);  // Remove the constant `k` prefix
        }
        return desc;
    }
    boost::system::error_condition default_error_condition(int err_code) const noexcept override {
        const auto enumerator = magic_enum::enum_cast<enc::Error>(err_code);
        if (not enumerator.has_value()) {
            return {err_code, *this};  // No conversion
        }
        switch (*enumerator) {
            using enum Error;
            case kSuccess:
                return make_error_condition(boost::system::errc::success);
            case kIllegalHexDigit:
            case kIllegalBase58Digit:
                return make_error_condition(boost::system::errc::argument_out_of_domain);
            case kInvalidUtf8Input:
                return make_error_condition(boost::system::errc::illegal_byte_sequence);
            case kEmptyInput:
                return make_error_condition(boost::system::errc::invalid_argument);
            case kOverflow:
                return make_error_condition(boost::system::errc::value_too_large);
            default:
                return {err_code, *this};
        }
    }
};

// Overload the global make_error_code() free function with our
// custom enum. It will be found via ADL by the compiler if needed.
inline boost::system::error_code make_error_code(enc::Error err_code) {
    static enc::ErrorCategory category{};
    return {static_cast<int>(err_code), category};
}

//! \brief Details of a failed decoding : the error code and the offending input symbol
struct DecodingError {
    Error code{Error::kSuccess};  // What went wrong
    char32_t symbol{0};           // Offending symbol as unicode code point (or raw byte value)
    size_t position{0};           // Offset (in bytes) of the offending symbol within the input
    bool well_formed{true};       // False when symbol is the raw value of a byte not starting valid UTF-8

    //! \brief Returns a human-readable description of the failure
    [[nodiscard]] std::string message() const;

    friend bool operator==(const DecodingError&, const DecodingError&) = default;
};

// Allows outcome::result<T, DecodingError> to behave like an error-code based result
inline boost::system::error_code make_error_code(const DecodingError& error) { return make_error_code(error.code); }

// Invoked by outcome when value() is accessed on a failed result
[[noreturn]] inline void outcome_throw_as_system_error_with_payload(const DecodingError& error) {
    throw boost::system::system_error(make_error_code(error.code), error.message());
}

}  // namespace b58::enc

namespace boost::system {
// Tell the C++ 11 STL metaprogramming that our enums are registered with the
// error code system
template <>
struct is_error_code_enum<b58::enc::Error> : public std::true_type {};
}  // namespace boost::system
