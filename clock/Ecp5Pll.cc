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

#include "clock/Ecp5Pll.hh"

#include <cmath>

#include "Report.hh"
#include "Debug.hh"

namespace bsp {

Ecp5Pll::Ecp5Pll(const char *name,
                 const BspState *bsp) :
  Pll(name, nclkouts_max, bsp)
{
}

void
Ecp5Pll::checkClkin(double freq) const
{
  if (freq < clki_freq_min || freq > clki_freq_max)
    report_->error(220, "%s: reference clock %.3f MHz outside %s input range %.3f-%.3f MHz.",
                   name(),
                   freq / 1e6,
                   familyName(),
                   clki_freq_min / 1e6,
                   clki_freq_max / 1e6);
}

void
Ecp5Pll::computeConfig(PllConfig &config) const
{
  // Outputs the primitive cannot produce at all never find a divider.
  for (const PllClkout *clkout : clkouts_) {
    double freq = clkout->freq();
    if (freq < clko_freq_min || freq > clko_freq_max) {
      debugPrint(debug_, "pll", 2, "%s %s %.3f MHz outside output range",
                 name(), clkout->domain(), freq / 1e6);
      noConfig();
    }
  }
  for (int clki_div = div_min; clki_div <= div_max; clki_div++) {
    double pfd = clkin_freq_ / clki_div;
    if (pfd < pfd_freq_min || pfd > pfd_freq_max)
      continue;
    for (int clkfb_div = div_min; clkfb_div <= div_max; clkfb_div++) {
      double vco = pfd * clkfb_div;
      if (vco < vco_freq_min || vco > vco_freq_max)
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
        config.setInputDivide(clki_div);
        config.setFeedbackMult(clkfb_div);
        config.setVco(vco);
        config.setPfd(pfd);
        return;
      }
    }
  }
  noConfig();
}

bool
Ecp5Pll::findDivide(double vco,
                    const PllClkout *clkout,
                    PllOutputConfig &output) const
{
  double freq = clkout->freq();
  double tolerance = freq * clkout->margin();
  for (int div = div_min; div <= div_max; div++) {
    double clk_freq = vco / div;
    if (std::abs(clk_freq - freq) <= tolerance) {
      double phase = clkout->phase();
      // Coarse steps of one VCO period, fine steps of 1/8 period.
      double steps = phase * (div + 1) / 360.0 + div;
      int cphase = static_cast<int>(steps);
      int fphase = static_cast<int>((steps - cphase) * 8);
      output = PllOutputConfig(clk_freq, div, phase, cphase, fphase);
      return true;
    }
    if (clk_freq < freq - tolerance)
      break;
  }
  return false;
}

} // namespace
