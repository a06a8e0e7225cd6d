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

#include "random.hpp"

#include <algorithm>

namespace b58 {

Bytes get_random_bytes(size_t size) noexcept {
    Bytes ret(size, 0x00);
    std::ranges::generate(ret, [] { return static_cast<uint8_t>(randomize<uint32_t>(0U, UINT8_MAX)); });
    return ret;
}

}  // namespace b58
