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

#include "assert.hpp"

#include <cstdlib>
#include <iostream>

namespace b58 {
void abort_on_broken_invariant(std::string_view expression, const std::source_location& location) {
    std::cerr << "\nBroken invariant [" << expression << "]\n"
              << "  in " << location.function_name() << "\n"
              << "  at " << location.file_name() << ":" << location.line() << std::endl;
    std::abort();
}
}  // namespace b58
