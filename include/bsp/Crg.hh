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

#include "BspState.hh"
#include "ClockDomain.hh"

namespace bsp {

class Pll;
class Platform;
class IoResource;

// Clock driven out on a pin (Ethernet PHY reference clock).
class ClockPin
{
public:
  ClockPin(const ClockDomain *domain,
           const IoResource *resource);
  const ClockDomain *domain() const { return domain_; }
  const IoResource *resource() const { return resource_; }

private:
  const ClockDomain *domain_;
  const IoResource *resource_;
};

using ClockPinSeq = std::vector<ClockPin>;

// Clock/reset generator. Owns its PLL and clock domains and requests
// the reference clock, reset and clock output pins from the platform.
class Crg : public BspState
{
public:
  Crg(Platform *platform,
      const BspState *bsp);
  virtual ~Crg();
  Platform *platform() const { return platform_; }
  Pll *pll() const { return pll_; }
  // Takes ownership of pll.
  void setPll(Pll *pll);
  // Request the reference clock pin and register it on the PLL.
  IoResource *requestClkin(const char *resource_name,
                           int number,
                           double freq);
  IoResource *requestReset(const char *resource_name,
                           int number);
  const IoResource *resetResource() const { return reset_resource_; }
  ClockDomain *makePllDomain(const char *name,
                             double freq,
                             double phase = 0.0,
                             bool with_reset = true,
                             bool buffered = true);
  // Domain clocked directly by the reference clock or another
  // external clock pin.
  ClockDomain *makePinDomain(const char *name,
                             const char *resource_name,
                             int number,
                             double freq,
                             bool reset_less = false);
  ClockDomain *makeDerivedDomain(const char *name,
                                 const char *from,
                                 int divide,
                                 bool reset_less = false);
  // Drive domain's clock onto a platform pin.
  void driveClockPin(const char *domain_name,
                     const char *resource_name,
                     int number);
  const ClockPinSeq &clockPins() const { return clock_pins_; }
  ClockDomain *findDomain(const char *name) const;
  const ClockDomainSeq &domains() const { return domains_; }
  // Finalize the PLL (throws PllNoConfig) and resolve every domain.
  void finalize();
  bool isFinalized() const { return finalized_; }
  // Resolved frequency of a domain.
  double freq(const char *domain_name) const;

protected:
  ClockDomain *makeDomain(const char *name,
                          bool reset_less);
  ClockDomain *findDomainOrError(const char *name) const;

  Platform *platform_;
  Pll *pll_;
  ClockDomainSeq domains_;
  IoResource *reset_resource_;
  ClockPinSeq clock_pins_;
  bool finalized_;
};

} // namespace
