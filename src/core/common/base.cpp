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

#include "base.hpp"

namespace b58 {

const buildinfo* get_buildinfo() noexcept { return b58_get_buildinfo(); }

std::string get_buildinfo_string() noexcept {
    const auto* info{get_buildinfo()};
    std::string ret{info->project_name};
    for (const auto* part : {" ", info->project_version, " (", info->system_name, "-", info->system_processor, " ",
                             info->build_type, " ", info->compiler_id, "-", info->compiler_version, ")"}) {
        ret.append(part);
    }
    return ret;
}

}  // namespace b58
