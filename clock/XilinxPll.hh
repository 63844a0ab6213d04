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

// Divider/multiplier search shared by the Xilinx PLL and MMCM
// primitives. D ascends over the input divider range, M descends over
// the feedback multiplier range and the first (D, M) that satisfies
// every output wins.
class XilinxPll : public Pll
{
public:
  int speedgrade() const { return speedgrade_; }
  double vcoMin() const { return vco_min_; }
  double vcoMax() const { return vco_max_; }

protected:
  XilinxPll(const char *name,
            int nclkouts_max,
            int speedgrade,
            const BspState *bsp);
  void checkClkin(double freq) const override;
  void computeConfig(PllConfig &config) const override;
  bool findDivide(double vco,
                  const PllClkout *clkout,
                  // Return value.
                  PllOutputConfig &output) const;
  bool findDivide(double vco,
                  const PllClkout *clkout,
                  double div_min,
                  double div_max,
                  double div_step,
                  // Return value.
                  PllOutputConfig &output) const;
  void setVcoRange(double vco_min,
                   double vco_max);
  void badSpeedgrade() const;

  int speedgrade_;
  double clkin_min_;
  double clkin_max_;
  int divclk_min_;
  int divclk_max_;
  int mult_min_;
  int mult_max_;
  int clkout_div_min_;
  int clkout_div_max_;
  // MMCM output 0 also divides in 1/8 steps over [2, 128].
  bool clkout0_frac_;
  double vco_min_;
  double vco_max_;
  double clkout_min_;
  double clkout_max_;
};

// 7-series PLLE2_ADV.
class S7Pll : public XilinxPll
{
public:
  S7Pll(const char *name,
        int speedgrade,
        const BspState *bsp);
  const char *familyName() const override { return "S7PLL"; }
};

// 7-series MMCME2_ADV.
class S7Mmcm : public XilinxPll
{
public:
  S7Mmcm(const char *name,
         int speedgrade,
         const BspState *bsp);
  const char *familyName() const override { return "S7MMCM"; }
};

// UltraScale/UltraScale+ MMCME4_ADV.
class UsMmcm : public XilinxPll
{
public:
  UsMmcm(const char *name,
         int speedgrade,
         const BspState *bsp);
  const char *familyName() const override { return "USMMCM"; }
};

} // namespace
