// OpenBSP, FPGA Board Support and SoC Composition
// Copyright (c) 2025, Parallax Software, Inc.
// 
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
// 
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
// GNU General Public License for more details.
// 
// You should have received a copy of the GNU General Public License
// along with this program. If not, see <https://www.gnu.org/licenses/>.
// 
// The origin of this software must not be misrepresented; you must not
// claim that you wrote the original software.
// 
// Altered source versions must be plainly marked as such, and must not be
// misrepresented as being the original software.
// 
// This notice may not be removed or altered from any source distribution.

#pragma once

#include <cstdarg>
#include <cstring>
#include <string>
#include <vector>

#include "Machine.hh" // __attribute__

namespace bsp {

using StringSeq = std::vector<std::string>;

inline bool
stringEq(const char *str1,
         const char *str2)
{
  return strcmp(str1, str2) == 0;
}

bool
isDigits(const char *str);
// True if str parses completely as a floating point number
// (1e8, 100e6, 25000000.0).
bool
isFloat(const char *str);

std::string
stdstrPrint(const char *fmt,
            ...) __attribute__((format (printf, 1, 2)));
void
stringPrintArgs(std::string &str,
                const char *fmt,
                va_list args);

void
split(const std::string &text,
      const std::string &delims,
      // Return values.
      StringSeq &tokens);

// Join tokens with sep between them.
std::string
join(const StringSeq &tokens,
     const char *sep);

} // namespace
