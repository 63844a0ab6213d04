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
#include "SdramModule.hh"
#include "Soc.hh"

namespace bsp {

class Report;
class Units;

class ClockSummary
{
public:
  ClockSummary(const char *name,
               const char *source,
               double freq,
               double phase,
               bool reset_less);

  std::string name;
  // "pll", "pin" or "derived".
  std::string source;
  double freq;
  double phase;
  bool reset_less;
};

using ClockSummarySeq = std::vector<ClockSummary>;

// Fields of a composed SoC, named and typed.
class SocSummary
{
public:
  SocSummary();

  std::string board;
  std::string ident;
  std::string device;
  std::string family;
  std::string toolchain;
  double sys_clk_freq;

  std::string pll_family;
  double pll_clkin_freq;
  int pll_input_divide;
  int pll_feedback_mult;
  double pll_vco;
  ClockSummarySeq clocks;

  MemoryRegionSeq memory_regions;

  bool with_sdram;
  std::string sdram_phy;
  std::string sdram_module;
  std::string sdram_type;
  std::string sdram_rate;
  int sdram_nphases;
  int sdram_bankbits;
  int sdram_rowbits;
  int sdram_colbits;
  long long sdram_size;
  SdramTimingCycles sdram_timing;
  int l2_size;
  bool masked_write;

  bool with_eth;
  std::string eth_phy;
  std::string eth_mode;
  std::string eth_ip;
  bool eth_dynamic_ip;
  double eth_rx_delay;

  // Enabled pin-only blocks and bridges ("hyperram", "jtagbone").
  StringSeq peripherals;
  StringSeq constants;
  // Port names of every requested resource.
  StringSeq ports;
};

SocSummary
socSummary(const Soc *soc);
void
reportSocSummary(const SocSummary &summary,
                 Report *report,
                 const Units *units);

} // namespace
