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

#include "clock/XilinxPll.hh"

#include <cmath>

#include "Report.hh"
#include "Debug.hh"

namespace bsp {

XilinxPll::XilinxPll(const char *name,
                     int nclkouts_max,
                     int speedgrade,
                     const BspState *bsp) :
  Pll(name, nclkouts_max, bsp),
  speedgrade_(speedgrade),
  clkin_min_(10e6),
  clkin_max_(800e6),
  divclk_min_(1),
  divclk_max_(106),
  mult_min_(2),
  mult_max_(64),
  clkout_div_min_(1),
  clkout_div_max_(128),
  clkout0_frac_(false),
  vco_min_(600e6),
  vco_max_(1200e6),
  clkout_min_(4.69e6),
  clkout_max_(800e6)
{
  if (speedgrade != -1 && speedgrade != -2 && speedgrade != -3)
    badSpeedgrade();
}

void
XilinxPll::badSpeedgrade() const
{
  report_->error(210, "%s: unsupported speed grade %d.", name(), speedgrade_);
}

void
XilinxPll::setVcoRange(double vco_min,
                       double vco_max)
{
  vco_min_ = vco_min;
  vco_max_ = vco_max;
}

void
XilinxPll::checkClkin(double freq) const
{
  if (freq < clkin_min_ || freq > clkin_max_)
    report_->error(211, "%s: reference clock %.3f MHz outside %s input range %.3f-%.3f MHz.",
                   name(),
                   freq / 1e6,
                   familyName(),
                   clkin_min_ / 1e6,
                   clkin_max_ / 1e6);
}

void
XilinxPll::computeConfig(PllConfig &config) const
{
  double vco_lo = vco_min_ * (1.0 + vco_margin_);
  double vco_hi = vco_max_ * (1.0 - vco_margin_);
  for (int divclk = divclk_min_; divclk <= divclk_max_; divclk++) {
    for (int mult = mult_max_; mult >= mult_min_; mult--) {
      double vco = clkin_freq_ * mult / divclk;
      if (vco < vco_lo || vco > vco_hi)
        continue;
      PllOutputConfigSeq &outputs = config.outputs();
      outputs.assign(clkouts_.size(), PllOutputConfig());
      bool all_valid = true;
      for (const PllClkout *clkout : clkouts_) {
        if (!findDivide(vco, clkout, outputs[clkout->index()])) {
          all_valid = false;
          break;
        }
      }
      if (all_valid) {
        config.setInputDivide(divclk);
        config.setFeedbackMult(mult);
        config.setVco(vco);
        config.setPfd(clkin_freq_ / divclk);
        return;
      }
    }
  }
  debugPrint(debug_, "pll", 2, "%s no config for %zu outputs",
             name(), clkouts_.size());
  noConfig();
}

bool
XilinxPll::findDivide(double vco,
                      const PllClkout *clkout,
                      PllOutputConfig &output) const
{
  if (findDivide(vco, clkout, clkout_div_min_, clkout_div_max_, 1.0, output))
    return true;
  return clkout0_frac_
    && clkout->index() == 0
    && findDivide(vco, clkout, 2.0, 128.0, 0.125, output);
}

bool
XilinxPll::findDivide(double vco,
                      const PllClkout *clkout,
                      double div_min,
                      double div_max,
                      double div_step,
                      PllOutputConfig &output) const
{
  double freq = clkout->freq();
  double tolerance = freq * clkout->margin();
  int steps = static_cast<int>(std::lround((div_max - div_min) / div_step));
  for (int i = 0; i <= steps; i++) {
    double divide = div_min + i * div_step;
    double clk_freq = vco / divide;
    if (std::abs(clk_freq - freq) <= tolerance) {
      if (clk_freq < clkout_min_ || clk_freq > clkout_max_)
        return false;
      output = PllOutputConfig(clk_freq, divide, clkout->phase(), 0, 0);
      return true;
    }
    // Output frequency only falls from here on.
    if (clk_freq < freq - tolerance)
      break;
  }
  return false;
}

////////////////////////////////////////////////////////////////

S7Pll::S7Pll(const char *name,
             int speedgrade,
             const BspState *bsp) :
  XilinxPll(name, 6, speedgrade, bsp)
{
  clkin_min_ = 19e6;
  clkin_max_ = 800e6;
  divclk_min_ = 1;
  divclk_max_ = 56;
  mult_min_ = 2;
  mult_max_ = 64;
  clkout_min_ = 6.25e6;
  switch (speedgrade) {
  case -1:
    setVcoRange(800e6, 1600e6);
    clkout_max_ = 800e6;
    break;
  case -2:
    setVcoRange(800e6, 1866e6);
    clkout_max_ = 933e6;
    break;
  case -3:
    setVcoRange(800e6, 2133e6);
    clkout_max_ = 1066e6;
    break;
  }
}

S7Mmcm::S7Mmcm(const char *name,
               int speedgrade,
               const BspState *bsp) :
  XilinxPll(name, 7, speedgrade, bsp)
{
  clkin_min_ = 10e6;
  clkin_max_ = 800e6;
  divclk_min_ = 1;
  divclk_max_ = 106;
  mult_min_ = 2;
  mult_max_ = 64;
  clkout0_frac_ = true;
  clkout_min_ = 4.69e6;
  switch (speedgrade) {
  case -1:
    setVcoRange(600e6, 1200e6);
    clkout_max_ = 800e6;
    break;
  case -2:
    setVcoRange(600e6, 1440e6);
    clkout_max_ = 933e6;
    break;
  case -3:
    setVcoRange(600e6, 1600e6);
    clkout_max_ = 1066e6;
    break;
  }
}

UsMmcm::UsMmcm(const char *name,
               int speedgrade,
               const BspState *bsp) :
  XilinxPll(name, 7, speedgrade, bsp)
{
  clkin_min_ = 10e6;
  clkin_max_ = 800e6;
  divclk_min_ = 1;
  divclk_max_ = 106;
  mult_min_ = 2;
  mult_max_ = 128;
  clkout0_frac_ = true;
  clkout_min_ = 4.69e6;
  switch (speedgrade) {
  case -1:
    setVcoRange(600e6, 1200e6);
    clkout_max_ = 775e6;
    break;
  case -2:
    setVcoRange(600e6, 1440e6);
    clkout_max_ = 850e6;
    break;
  case -3:
    setVcoRange(600e6, 1600e6);
    clkout_max_ = 891e6;
    break;
  }
}

} // namespace
