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

#include <stdio.h>
#include <cstdarg>
#include <set>
#include <string>

#include "Machine.hh" // __attribute__

struct Tcl_Interp;

namespace bsp {

// Message sink for reports, warnings and errors.
// Every warning and error carries a message id that is unique
// across the sources so it can be suppressed or matched in tests.
class Report
{
public:
  Report();
  virtual ~Report();

  // Print line with return.
  virtual void reportLine(const char *fmt, ...)
    __attribute__((format (printf, 2, 3)));
  virtual void reportLineString(const char *line);
  virtual void reportLineString(const std::string &line);
  virtual void reportBlankLine();

  ////////////////////////////////////////////////////////////////

  // Print "Warning: msg" unless id is suppressed.
  virtual void warn(int id,
                    const char *fmt, ...)
    __attribute__((format (printf, 3, 4)));
  // Throw ExceptionMsg with the formatted message and id.
  // Errors cannot be suppressed.
  virtual void error(int id,
                     const char *fmt, ...)
    __attribute__((format (printf, 3, 4)));

  void suppressMsgId(int id);
  void unsuppressMsgId(int id);
  bool isSuppressed(int id) const;
  // Warnings printed (not suppressed) since construction.
  int warningCount() const { return warning_count_; }

  // Log output to filename until logEnd is called.
  virtual void logBegin(const char *filename);
  virtual void logEnd();
  // Redirect output to a string until redirectStringEnd is called.
  virtual void redirectStringBegin();
  virtual const char *redirectStringEnd();
  virtual void setTclInterp(Tcl_Interp *) {}

  // Primitive to print output.
  // Return the number of characters written.
  // public for use by ReportTcl encapsulated channel functions
  // and progress output that is not line oriented.
  virtual size_t printString(const char *buffer,
                             size_t length);
  size_t printString(const char *str);
  static Report *defaultReport() { return default_; }

protected:
  // All print functions have an implicit return printed by this function.
  virtual void printLine(const char *line,
                         size_t length);
  // Primitive to print output on the console.
  // Return the number of characters written.
  virtual size_t printConsole(const char *buffer,
                              size_t length);
  void printToBuffer(const char *fmt,
                     ...)
    __attribute__((format (printf, 2, 3)));
  void printToBuffer(const char *fmt,
                     va_list args);
  void printToBufferAppend(const char *fmt,
                           va_list args);
  void printBufferLine();

  FILE *log_stream_;
  bool redirect_to_string_;
  std::string redirect_string_;
  // Buffer to support printf style arguments.
  std::string buffer_;
  std::set<int> suppressed_msg_ids_;
  int warning_count_;
  static Report *default_;

  friend class Debug;
};

} // namespace
