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

namespace b58 {

// ANSI escape sequences for colorized console output
inline constexpr const char* kColorReset{"\x1b[0m"};
inline constexpr const char* kColorRed{"\x1b[31m"};
inline constexpr const char* kColorGreen{"\x1b[32m"};
inline constexpr const char* kColorCyan{"\x1b[36m"};
inline constexpr const char* kColorCoal{"\x1b[38;5;240m"};
inline constexpr const char* kColorOrangeHigh{"\x1b[38;5;214m"};
inline constexpr const char* kBackgroundRed{"\x1b[41m"};
inline constexpr const char* kBackgroundPurple{"\x1b[45m"};

//! \brief Prepares the error console for UTF-8 and colorized output
//! \return Whether std::cerr is attached to a terminal able to render ANSI colors
bool init_terminal();

//! \brief Switches stdin and stdout to binary mode where the platform distinguishes text mode
//! \return Whether the standard streams are now untranslated
bool init_binary_stdio();

}  // namespace b58
