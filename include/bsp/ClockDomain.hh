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

namespace bsp {

class Pll;
class ClockDomain;

using ClockDomainSeq = std::vector<ClockDomain*>;

enum class ClockSource { none, pll, pin, derived };

const char *
clockSourceName(ClockSource source);

// Named clock and its reset.
// The clock comes from a PLL output of the same name, an external pin
// or another domain divided by an integer.
class ClockDomain
{
public:
  ClockDomain(const char *name,
              bool reset_less);
  const char *name() const { return name_.c_str(); }
  bool resetLess() const { return reset_less_; }
  ClockSource source() const { return source_; }
  void setPllSource(Pll *pll);
  void setPinSource(const char *pin_name,
                    double freq);
  void setDerivedSource(ClockDomain *from,
                        int divide);
  Pll *pll() const { return pll_; }
  const char *pinName() const { return pin_name_.c_str(); }
  ClockDomain *derivedFrom() const { return derived_from_; }
  int divide() const { return divide_; }
  // Set frequency and phase from the source.
  // PLL sourced domains require a finalized PLL.
  void resolve();
  bool isResolved() const { return resolved_; }
  double freq() const { return freq_; }
  double phase() const { return phase_; }
  double period() const { return 1.0 / freq_; }

private:
  std::string name_;
  bool reset_less_;
  ClockSource source_;
  Pll *pll_;
  std::string pin_name_;
  ClockDomain *derived_from_;
  int divide_;
  bool resolved_;
  double freq_;
  double phase_;
};

} // namespace
