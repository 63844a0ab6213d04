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

#include "Report.hh"

#include <algorithm> // min
#include <cstring>   // strlen

#include "Machine.hh"
#include "StringUtil.hh"
#include "Error.hh"

namespace bsp {

using std::min;

Report *Report::default_ = nullptr;

Report::Report() :
  log_stream_(nullptr),
  redirect_to_string_(false),
  warning_count_(0)
{
  default_ = this;
}

Report::~Report()
{
  logEnd();
  if (default_ == this)
    default_ = nullptr;
}

size_t
Report::printConsole(const char *buffer,
                     size_t length)
{
  return fwrite(buffer, sizeof(char), length, stdout);
}

void
Report::printLine(const char *line,
                  size_t length)
{
  printString(line, length);
  printString("\n", 1);
}

// String redirection captures the output instead of printing it, but
// the log still sees everything that reaches the console.
size_t
Report::printString(const char *buffer,
                    size_t length)
{
  size_t ret = length;
  if (redirect_to_string_)
    redirect_string_.append(buffer, length);
  else {
    ret = min(ret, printConsole(buffer, length));
    if (log_stream_)
      ret = min(ret, fwrite(buffer, sizeof(char), length, log_stream_));
  }
  return ret;
}

size_t
Report::printString(const char *str)
{
  return printString(str, strlen(str));
}

void
Report::reportLine(const char *fmt, ...)
{
  va_list args;
  va_start(args, fmt);
  printToBuffer(fmt, args);
  printBufferLine();
  va_end(args);
}

void
Report::reportBlankLine()
{
  printLine("", 0);
}

void
Report::reportLineString(const char *line)
{
  printLine(line, strlen(line));
}

void
Report::reportLineString(const std::string &line)
{
  printLine(line.c_str(), line.length());
}

////////////////////////////////////////////////////////////////

void
Report::printToBuffer(const char *fmt,
                      ...)
{
  va_list args;
  va_start(args, fmt);
  printToBuffer(fmt, args);
  va_end(args);
}

void
Report::printToBuffer(const char *fmt,
                      va_list args)
{
  stringPrintArgs(buffer_, fmt, args);
}

void
Report::printToBufferAppend(const char *fmt,
                            va_list args)
{
  std::string tmp;
  stringPrintArgs(tmp, fmt, args);
  buffer_ += tmp;
}

void
Report::printBufferLine()
{
  printLine(buffer_.c_str(), buffer_.length());
}

////////////////////////////////////////////////////////////////

void
Report::warn(int id,
             const char *fmt,
             ...)
{
  if (isSuppressed(id))
    return;
  va_list args;
  va_start(args, fmt);
  printToBuffer("Warning: ");
  printToBufferAppend(fmt, args);
  printBufferLine();
  va_end(args);
  warning_count_++;
}

void
Report::error(int id,
              const char *fmt, ...)
{
  va_list args;
  va_start(args, fmt);
  // No prefix msg, no \n.
  printToBuffer(fmt, args);
  va_end(args);
  throw ExceptionMsg(buffer_.c_str(), id);
}

void
Report::suppressMsgId(int id)
{
  suppressed_msg_ids_.insert(id);
}

void
Report::unsuppressMsgId(int id)
{
  suppressed_msg_ids_.erase(id);
}

bool
Report::isSuppressed(int id) const
{
  return suppressed_msg_ids_.find(id) != suppressed_msg_ids_.end();
}

////////////////////////////////////////////////////////////////

void
Report::logBegin(const char *filename)
{
  logEnd();
  log_stream_ = fopen(filename, "w");
  if (log_stream_ == nullptr)
    throw FileNotWritable(filename);
}

void
Report::logEnd()
{
  if (log_stream_)
    fclose(log_stream_);
  log_stream_ = nullptr;
}

void
Report::redirectStringBegin()
{
  redirect_to_string_ = true;
  redirect_string_.clear();
}

const char *
Report::redirectStringEnd()
{
  redirect_to_string_ = false;
  return redirect_string_.c_str();
}

} // namespace
