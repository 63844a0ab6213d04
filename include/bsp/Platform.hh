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

#include <string>
#include <vector>

#include "StringUtil.hh"
#include "BspState.hh"

namespace bsp {

class IoSubsignal;
class IoResource;

using IoSubsignalSeq = std::vector<IoSubsignal*>;
using IoResourceSeq = std::vector<IoResource*>;

enum class VendorFamily { xilinx_7series, xilinx_usplus, lattice_ecp5 };

const char *
vendorFamilyName(VendorFamily family);

// Named group of pins inside a resource ("tx" of "serial").
class IoSubsignal
{
public:
  IoSubsignal(const char *name,
              const char *pins,
              const char *iostandard,
              const char *misc);
  const char *name() const { return name_.c_str(); }
  const StringSeq &pins() const { return pins_; }
  // Empty when inherited from the resource.
  const std::string &iostandard() const { return iostandard_; }
  // "KEY=VALUE" attributes added to the resource ones.
  const StringSeq &misc() const { return misc_; }

private:
  std::string name_;
  StringSeq pins_;
  std::string iostandard_;
  StringSeq misc_;
};

// Board IO resource: a single pin group ("clk100", "user_led" 3) or a
// set of subsignals ("eth", "ddram").
class IoResource
{
public:
  IoResource(const char *name,
             int number,
             const char *pins,
             const char *iostandard,
             const char *misc);
  ~IoResource();
  const char *name() const { return name_.c_str(); }
  int number() const { return number_; }
  const StringSeq &pins() const { return pins_; }
  const std::string &iostandard() const { return iostandard_; }
  const StringSeq &misc() const { return misc_; }
  IoSubsignal *addSubsignal(const char *name,
                            const char *pins,
                            const char *iostandard = nullptr,
                            const char *misc = nullptr);
  const IoSubsignalSeq &subsignals() const { return subsignals_; }
  IoSubsignal *findSubsignal(const char *name) const;
  bool hasSubsignals() const { return !subsignals_.empty(); }
  bool isRequested() const { return requested_; }
  void setRequested(bool requested);
  // Number of pins including every subsignal.
  size_t pinCount() const;

private:
  std::string name_;
  int number_;
  StringSeq pins_;
  std::string iostandard_;
  StringSeq misc_;
  IoSubsignalSeq subsignals_;
  bool requested_;
};

// Period constraint on a pin ("clk100", "eth_clocks:rx").
class PeriodConstraint
{
public:
  PeriodConstraint(const char *signal,
                   double period);
  const char *signal() const { return signal_.c_str(); }
  double period() const { return period_; }

private:
  std::string signal_;
  double period_;
};

using PeriodConstraintSeq = std::vector<PeriodConstraint>;

// FPGA board: device, toolchain and IO resources.
class Platform : public BspState
{
public:
  Platform(const char *name,
           const char *device,
           VendorFamily family,
           const char *toolchain,
           const BspState *bsp);
  virtual ~Platform();
  const char *name() const { return name_.c_str(); }
  const char *device() const { return device_.c_str(); }
  VendorFamily family() const { return family_; }
  const char *toolchain() const { return toolchain_.c_str(); }
  // Xilinx speed grade from the device part (-1 for xc7a35ticsg324-1L).
  int speedgrade() const;
  void setDefaultClk(const char *name,
                     double period);
  const char *defaultClkName() const { return default_clk_name_.c_str(); }
  double defaultClkPeriod() const { return default_clk_period_; }

  IoResource *addResource(const char *name,
                          int number,
                          const char *pins = nullptr,
                          const char *iostandard = nullptr,
                          const char *misc = nullptr);
  const IoResourceSeq &resources() const { return resources_; }
  // Find without requesting.
  IoResource *lookup(const char *name,
                     int number = 0) const;
  // Find and mark used. Unknown or already requested resources are errors.
  IoResource *request(const char *name,
                      int number = 0);
  // Every unrequested resource with name.
  IoResourceSeq requestAll(const char *name);
  IoResourceSeq requested() const;
  // Number of resources sharing name.
  int resourceCount(const char *name) const;
  // Top level port name ("clk100", "user_led0", "serial_tx").
  std::string portName(const IoResource *resource) const;
  std::string portName(const IoResource *resource,
                       const IoSubsignal *subsignal) const;

  void addPlatformCommand(const char *command);
  const StringSeq &platformCommands() const { return platform_commands_; }
  void addPeriodConstraint(const char *signal,
                           double period);
  const PeriodConstraintSeq &periodConstraints() const { return period_constraints_; }

protected:
  std::string name_;
  std::string device_;
  VendorFamily family_;
  std::string toolchain_;
  std::string default_clk_name_;
  double default_clk_period_;
  IoResourceSeq resources_;
  StringSeq platform_commands_;
  PeriodConstraintSeq period_constraints_;
};

} // namespace
