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

#include <core/encoding/alphabet.hpp>

#include <infra/common/log.hpp>

namespace b58 {

//! \brief Conversion direction
enum class Mode {
    kEncode,  // Raw bytes to base58 text
    kDecode,  // Base58 text to raw bytes
};

struct AppSettings {
    Mode mode{Mode::kEncode};                       // Conversion direction
    enc::Alphabet alphabet{enc::kDefaultAlphabet};  // Alphabet used for both directions
    log::Settings log{};                            // Log related settings
};

}  // namespace b58
