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

#include "WriteConstraints.hh"

#include <cstdio>

#include "Error.hh"
#include "Report.hh"
#include "Debug.hh"
#include "StringUtil.hh"
#include "BspState.hh"
#include "Soc.hh"

namespace bsp {

class ConstraintWriter
{
public:
  ConstraintWriter(const Platform *platform,
                   const char *filename,
                   FILE *stream,
                   const BspState *bsp);
  void writeConstraints();

protected:
  void writeXdc();
  void writeXdcPins(const std::string &port,
                    const StringSeq &pins,
                    const std::string &iostandard,
                    const StringSeq &misc);
  void writeXdcClocks();
  void writeLpf();
  void writeLpfPins(const std::string &port,
                    const StringSeq &pins,
                    const std::string &iostandard,
                    const StringSeq &misc);
  void writeLpfClocks();
  // Port name of "resource" or "resource:subsignal" when requested.
  bool findClockPort(const char *signal,
                     std::string &port) const;
  static std::string pinPort(const std::string &port,
                             size_t pin_count,
                             size_t index);

  const Platform *platform_;
  const char *filename_;
  FILE *stream_;
  Report *report_;
  Debug *debug_;
  int pin_count_;
};

const char *
constraintsExtension(VendorFamily family)
{
  switch (family) {
  case VendorFamily::xilinx_7series:
  case VendorFamily::xilinx_usplus:
    return "xdc";
  case VendorFamily::lattice_ecp5:
    return "lpf";
  }
  return "";
}

void
writeConstraints(const Soc *soc,
                 const char *filename,
                 const BspState *bsp)
{
  FILE *stream = fopen(filename, "w");
  if (stream) {
    ConstraintWriter writer(soc->platform(), filename, stream, bsp);
    writer.writeConstraints();
    fclose(stream);
  }
  else
    throw FileNotWritable(filename);
}

ConstraintWriter::ConstraintWriter(const Platform *platform,
                                   const char *filename,
                                   FILE *stream,
                                   const BspState *bsp) :
  platform_(platform),
  filename_(filename),
  stream_(stream),
  report_(bsp->report()),
  debug_(bsp->debug()),
  pin_count_(0)
{
}

void
ConstraintWriter::writeConstraints()
{
  switch (platform_->family()) {
  case VendorFamily::xilinx_7series:
  case VendorFamily::xilinx_usplus:
    writeXdc();
    break;
  case VendorFamily::lattice_ecp5:
    writeLpf();
    break;
  }
  debugPrint(debug_, "soc", 1, "wrote %d pins to %s", pin_count_, filename_);
}

std::string
ConstraintWriter::pinPort(const std::string &port,
                          size_t pin_count,
                          size_t index)
{
  if (pin_count > 1)
    return stdstrPrint("%s[%zu]", port.c_str(), index);
  else
    return port;
}

bool
ConstraintWriter::findClockPort(const char *signal,
                                std::string &port) const
{
  StringSeq names;
  split(signal, ":", names);
  if (names.empty())
    return false;
  const IoResource *resource = platform_->lookup(names[0].c_str(), 0);
  if (resource == nullptr || !resource->isRequested())
    return false;
  if (names.size() > 1) {
    const IoSubsignal *subsignal = resource->findSubsignal(names[1].c_str());
    if (subsignal == nullptr) {
      report_->warn(610, "%s: period constraint on unknown subsignal %s.",
                    filename_, signal);
      return false;
    }
    port = platform_->portName(resource, subsignal);
  }
  else
    port = platform_->portName(resource);
  return true;
}

////////////////////////////////////////////////////////////////

void
ConstraintWriter::writeXdc()
{
  fprintf(stream_, "# %s %s\n\n", platform_->name(), platform_->device());
  fprintf(stream_, "# IO constraints\n\n");
  for (const IoResource *resource : platform_->requested()) {
    fprintf(stream_, "## %s:%d\n", resource->name(), resource->number());
    if (resource->hasSubsignals()) {
      for (const IoSubsignal *subsignal : resource->subsignals()) {
        if (subsignal->pins().empty())
          continue;
        const std::string &iostandard = subsignal->iostandard().empty()
          ? resource->iostandard()
          : subsignal->iostandard();
        StringSeq misc = resource->misc();
        misc.insert(misc.end(), subsignal->misc().begin(),
                    subsignal->misc().end());
        writeXdcPins(platform_->portName(resource, subsignal),
                     subsignal->pins(), iostandard, misc);
      }
    }
    else
      writeXdcPins(platform_->portName(resource), resource->pins(),
                   resource->iostandard(), resource->misc());
    fprintf(stream_, "\n");
  }
  writeXdcClocks();
  const StringSeq &commands = platform_->platformCommands();
  if (!commands.empty()) {
    fprintf(stream_, "# Design constraints\n\n");
    for (const std::string &command : commands)
      fprintf(stream_, "%s\n", command.c_str());
  }
}

void
ConstraintWriter::writeXdcPins(const std::string &port,
                               const StringSeq &pins,
                               const std::string &iostandard,
                               const StringSeq &misc)
{
  for (size_t i = 0; i < pins.size(); i++) {
    std::string pin_port = pinPort(port, pins.size(), i);
    fprintf(stream_, "set_property LOC %s [get_ports {%s}]\n",
            pins[i].c_str(),
            pin_port.c_str());
    if (!iostandard.empty())
      fprintf(stream_, "set_property IOSTANDARD %s [get_ports {%s}]\n",
              iostandard.c_str(),
              pin_port.c_str());
    for (const std::string &attr : misc) {
      size_t eq = attr.find('=');
      if (eq == std::string::npos)
        report_->warn(611, "%s: misc attribute %s is not KEY=VALUE.",
                      filename_, attr.c_str());
      else
        fprintf(stream_, "set_property %s %s [get_ports {%s}]\n",
                attr.substr(0, eq).c_str(),
                attr.substr(eq + 1).c_str(),
                pin_port.c_str());
    }
    pin_count_++;
  }
}

void
ConstraintWriter::writeXdcClocks()
{
  bool header = false;
  for (const PeriodConstraint &constraint : platform_->periodConstraints()) {
    std::string port;
    if (findClockPort(constraint.signal(), port)) {
      if (!header) {
        fprintf(stream_, "# Clock constraints\n\n");
        header = true;
      }
      fprintf(stream_, "create_clock -name %s -period %.3f [get_ports {%s}]\n",
              port.c_str(),
              constraint.period() * 1e9,
              port.c_str());
    }
  }
  if (header)
    fprintf(stream_, "\n");
}

////////////////////////////////////////////////////////////////

void
ConstraintWriter::writeLpf()
{
  fprintf(stream_, "# %s %s\n", platform_->name(), platform_->device());
  fprintf(stream_, "BLOCK RESETPATHS;\n");
  fprintf(stream_, "BLOCK ASYNCPATHS;\n");
  for (const IoResource *resource : platform_->requested()) {
    if (resource->hasSubsignals()) {
      for (const IoSubsignal *subsignal : resource->subsignals()) {
        if (subsignal->pins().empty())
          continue;
        const std::string &iostandard = subsignal->iostandard().empty()
          ? resource->iostandard()
          : subsignal->iostandard();
        StringSeq misc = resource->misc();
        misc.insert(misc.end(), subsignal->misc().begin(),
                    subsignal->misc().end());
        writeLpfPins(platform_->portName(resource, subsignal),
                     subsignal->pins(), iostandard, misc);
      }
    }
    else
      writeLpfPins(platform_->portName(resource), resource->pins(),
                   resource->iostandard(), resource->misc());
  }
  writeLpfClocks();
  for (const std::string &command : platform_->platformCommands())
    fprintf(stream_, "%s\n", command.c_str());
}

void
ConstraintWriter::writeLpfPins(const std::string &port,
                               const StringSeq &pins,
                               const std::string &iostandard,
                               const StringSeq &misc)
{
  for (size_t i = 0; i < pins.size(); i++) {
    std::string pin_port = pinPort(port, pins.size(), i);
    fprintf(stream_, "LOCATE COMP \"%s\" SITE \"%s\";\n",
            pin_port.c_str(),
            pins[i].c_str());
    if (!iostandard.empty() || !misc.empty()) {
      fprintf(stream_, "IOBUF PORT \"%s\"", pin_port.c_str());
      if (!iostandard.empty())
        fprintf(stream_, " IO_TYPE=%s", iostandard.c_str());
      for (const std::string &attr : misc)
        fprintf(stream_, " %s", attr.c_str());
      fprintf(stream_, ";\n");
    }
    pin_count_++;
  }
}

void
ConstraintWriter::writeLpfClocks()
{
  for (const PeriodConstraint &constraint : platform_->periodConstraints()) {
    std::string port;
    if (findClockPort(constraint.signal(), port))
      fprintf(stream_, "FREQUENCY PORT \"%s\" %.1f MHz;\n",
              port.c_str(),
              1e-6 / constraint.period());
  }
}

} // namespace
