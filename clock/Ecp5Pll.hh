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

#include "Pll.hh"

namespace bsp {

// Lattice ECP5 EHXPLLL.
// The input divider and the feedback divider both ascend; the first
// pair whose PFD and VCO frequencies are legal and that satisfies
// every output wins.
class Ecp5Pll : public Pll
{
public:
  Ecp5Pll(const char *name,
          const BspState *bsp);
  const char *familyName() const override { return "ECP5PLL"; }

  static constexpr int nclkouts_max = 4;
  static constexpr double clki_freq_min = 8e6;
  static constexpr double clki_freq_max = 400e6;
  static constexpr double clko_freq_min = 3.125e6;
  static constexpr double clko_freq_max = 400e6;
  static constexpr double vco_freq_min = 400e6;
  static constexpr double vco_freq_max = 800e6;
  static constexpr double pfd_freq_min = 10e6;
  static constexpr double pfd_freq_max = 400e6;
  static constexpr int div_min = 1;
  static constexpr int div_max = 128;

protected:
  void checkClkin(double freq) const override;
  void computeConfig(PllConfig &config) const override;
  bool findDivide(double vco,
                  const PllClkout *clkout,
                  // Return value.
                  PllOutputConfig &output) const;
};

} // namespace
