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

#include "Platform.hh"

#include <cctype>
#include <cstdlib>

#include "Report.hh"
#include "Debug.hh"
#include "EnumNameMap.hh"

namespace bsp {

static EnumNameMap<VendorFamily> vendor_family_names =
  {{VendorFamily::xilinx_7series, "xilinx_7series"},
   {VendorFamily::xilinx_usplus, "xilinx_usplus"},
   {VendorFamily::lattice_ecp5, "lattice_ecp5"}};

const char *
vendorFamilyName(VendorFamily family)
{
  return vendor_family_names.find(family);
}

static void
splitMisc(const char *misc,
          StringSeq &attrs)
{
  if (misc)
    split(misc, " ", attrs);
}

IoSubsignal::IoSubsignal(const char *name,
                         const char *pins,
                         const char *iostandard,
                         const char *misc) :
  name_(name),
  iostandard_(iostandard ? iostandard : "")
{
  if (pins)
    split(pins, " ", pins_);
  splitMisc(misc, misc_);
}

IoResource::IoResource(const char *name,
                       int number,
                       const char *pins,
                       const char *iostandard,
                       const char *misc) :
  name_(name),
  number_(number),
  iostandard_(iostandard ? iostandard : ""),
  requested_(false)
{
  if (pins)
    split(pins, " ", pins_);
  splitMisc(misc, misc_);
}

IoResource::~IoResource()
{
  for (IoSubsignal *subsignal : subsignals_)
    delete subsignal;
}

IoSubsignal *
IoResource::addSubsignal(const char *name,
                         const char *pins,
                         const char *iostandard,
                         const char *misc)
{
  IoSubsignal *subsignal = new IoSubsignal(name, pins, iostandard, misc);
  subsignals_.push_back(subsignal);
  return subsignal;
}

IoSubsignal *
IoResource::findSubsignal(const char *name) const
{
  for (IoSubsignal *subsignal : subsignals_) {
    if (stringEq(subsignal->name(), name))
      return subsignal;
  }
  return nullptr;
}

void
IoResource::setRequested(bool requested)
{
  requested_ = requested;
}

size_t
IoResource::pinCount() const
{
  size_t count = pins_.size();
  for (const IoSubsignal *subsignal : subsignals_)
    count += subsignal->pins().size();
  return count;
}

PeriodConstraint::PeriodConstraint(const char *signal,
                                   double period) :
  signal_(signal),
  period_(period)
{
}

////////////////////////////////////////////////////////////////

Platform::Platform(const char *name,
                   const char *device,
                   VendorFamily family,
                   const char *toolchain,
                   const BspState *bsp) :
  BspState(bsp),
  name_(name),
  device_(device),
  family_(family),
  toolchain_(toolchain),
  default_clk_period_(0.0)
{
}

Platform::~Platform()
{
  for (IoResource *resource : resources_)
    delete resource;
}

int
Platform::speedgrade() const
{
  // Xilinx parts end in -<grade> with an optional temperature/voltage
  // letter (xc7k70tfbg484-1, xc7a35ticsg324-1L, xczu7ev-ffvc1156-2-e).
  size_t dash = device_.rfind('-');
  while (dash != std::string::npos) {
    const char *grade = device_.c_str() + dash + 1;
    if (isdigit(*grade))
      return -atoi(grade);
    if (dash == 0)
      break;
    dash = device_.rfind('-', dash - 1);
  }
  return -1;
}

void
Platform::setDefaultClk(const char *name,
                        double period)
{
  default_clk_name_ = name;
  default_clk_period_ = period;
}

IoResource *
Platform::addResource(const char *name,
                      int number,
                      const char *pins,
                      const char *iostandard,
                      const char *misc)
{
  if (lookup(name, number))
    report_->error(500, "%s: duplicate resource %s:%d.",
                   name_.c_str(), name, number);
  IoResource *resource = new IoResource(name, number, pins, iostandard, misc);
  resources_.push_back(resource);
  return resource;
}

IoResource *
Platform::lookup(const char *name,
                 int number) const
{
  for (IoResource *resource : resources_) {
    if (stringEq(resource->name(), name)
        && resource->number() == number)
      return resource;
  }
  return nullptr;
}

IoResource *
Platform::request(const char *name,
                  int number)
{
  IoResource *resource = lookup(name, number);
  if (resource == nullptr)
    report_->error(501, "%s: no resource %s:%d.",
                   name_.c_str(), name, number);
  if (resource->isRequested())
    report_->error(502, "%s: resource %s:%d already requested.",
                   name_.c_str(), name, number);
  resource->setRequested(true);
  debugPrint(debug_, "soc", 2, "request %s:%d", name, number);
  return resource;
}

IoResourceSeq
Platform::requestAll(const char *name)
{
  IoResourceSeq resources;
  for (IoResource *resource : resources_) {
    if (stringEq(resource->name(), name)
        && !resource->isRequested()) {
      resource->setRequested(true);
      resources.push_back(resource);
    }
  }
  return resources;
}

IoResourceSeq
Platform::requested() const
{
  IoResourceSeq resources;
  for (IoResource *resource : resources_) {
    if (resource->isRequested())
      resources.push_back(resource);
  }
  return resources;
}

int
Platform::resourceCount(const char *name) const
{
  int count = 0;
  for (const IoResource *resource : resources_) {
    if (stringEq(resource->name(), name))
      count++;
  }
  return count;
}

std::string
Platform::portName(const IoResource *resource) const
{
  std::string port = resource->name();
  if (resourceCount(resource->name()) > 1)
    port += std::to_string(resource->number());
  return port;
}

std::string
Platform::portName(const IoResource *resource,
                   const IoSubsignal *subsignal) const
{
  return portName(resource) + "_" + subsignal->name();
}

void
Platform::addPlatformCommand(const char *command)
{
  platform_commands_.push_back(command);
}

void
Platform::addPeriodConstraint(const char *signal,
                              double period)
{
  period_constraints_.push_back(PeriodConstraint(signal, period));
}

} // namespace
