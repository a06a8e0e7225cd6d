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

#include "errors.hpp"

#include <iomanip>
#include <sstream>

#include <core/encoding/utf8.hpp>

namespace b58::enc {

std::string DecodingError::message() const {
    if (code not_eq Error::kIllegalBase58Digit) {
        return make_error_code(code).message();
    }

    std::ostringstream stream;
    stream << "Invalid character '";
    if (not well_formed or symbol < 0x20U or symbol == 0x7fU) {
        // Raw bytes and C0 controls
        stream << "\\x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<uint32_t>(symbol) << std::dec;
    } else if (symbol >= 0x80U and symbol < 0xa0U) {
        // C1 controls
        stream << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<uint32_t>(symbol) << std::dec;
    } else {
        stream << utf8::encode(symbol);
    }
    stream << "' at position " << position;
    return stream.str();
}

}  // namespace b58::enc
