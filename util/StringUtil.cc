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

#include "StringUtil.hh"

#include <cctype>
#include <cstdio>
#include <cstdlib>

#include "Machine.hh"

namespace bsp {

bool
isDigits(const char *str)
{
  if (*str == '\0')
    return false;
  for (const char *s = str; *s; s++) {
    if (!isdigit(*s))
      return false;
  }
  return true;
}

bool
isFloat(const char *str)
{
  if (*str == '\0')
    return false;
  char *end;
  strtod(str, &end);
  return *end == '\0';
}

void
stringPrintArgs(std::string &str,
                const char *fmt,
                va_list args)
{
  va_list args_copy;
  va_copy(args_copy, args);
  char buffer[256];
  // Returned length does NOT include trailing '\0'.
  size_t length = vsnprintf(buffer, sizeof(buffer), fmt, args_copy);
  va_end(args_copy);
  if (length < sizeof(buffer))
    str.assign(buffer, length);
  else {
    str.resize(length + 1);
    va_copy(args_copy, args);
    vsnprintf(&str[0], length + 1, fmt, args_copy);
    va_end(args_copy);
    str.resize(length);
  }
}

std::string
stdstrPrint(const char *fmt,
	    ...)
{
  va_list args;
  va_start(args, fmt);
  std::string str;
  stringPrintArgs(str, fmt, args);
  va_end(args);
  return str;
}

void
split(const std::string &text,
      const std::string &delims,
      // Return values.
      StringSeq &tokens)
{
  auto start = text.find_first_not_of(delims);
  auto end = text.find_first_of(delims, start);
  while (end != std::string::npos) {
    tokens.push_back(text.substr(start, end - start));
    start = text.find_first_not_of(delims, end);
    end = text.find_first_of(delims, start);
  }
  if (start != std::string::npos)
    tokens.push_back(text.substr(start));
}

std::string
join(const StringSeq &tokens,
     const char *sep)
{
  std::string joined;
  bool first = true;
  for (const std::string &token : tokens) {
    if (!first)
      joined += sep;
    joined += token;
    first = false;
  }
  return joined;
}

} // namespace
