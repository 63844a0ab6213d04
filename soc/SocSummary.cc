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

#include "SocSummary.hh"

#include "Report.hh"
#include "Units.hh"
#include "Pll.hh"
#include "ClockDomain.hh"
#include "Crg.hh"
#include "Platform.hh"

namespace bsp {

ClockSummary::ClockSummary(const char *name,
                           const char *source,
                           double freq,
                           double phase,
                           bool reset_less) :
  name(name),
  source(source),
  freq(freq),
  phase(phase),
  reset_less(reset_less)
{
}

SocSummary::SocSummary() :
  sys_clk_freq(0.0),
  pll_clkin_freq(0.0),
  pll_input_divide(0),
  pll_feedback_mult(0),
  pll_vco(0.0),
  with_sdram(false),
  sdram_nphases(0),
  sdram_bankbits(0),
  sdram_rowbits(0),
  sdram_colbits(0),
  sdram_size(0),
  l2_size(0),
  masked_write(false),
  with_eth(false),
  eth_dynamic_ip(false),
  eth_rx_delay(0.0)
{
}

static void
addPeripheral(const PadsBlock *block,
              StringSeq &peripherals)
{
  if (block)
    peripherals.push_back(block->kind());
}

SocSummary
socSummary(const Soc *soc)
{
  SocSummary summary;
  const SocConfig &config = soc->config();
  const Platform *platform = soc->platform();
  summary.board = soc->board();
  summary.ident = config.ident;
  summary.device = platform->device();
  summary.family = vendorFamilyName(platform->family());
  summary.toolchain = platform->toolchain();
  summary.sys_clk_freq = config.sys_clk_freq;

  const Crg *crg = soc->crg();
  if (crg) {
    const Pll *pll = crg->pll();
    if (pll && pll->isFinalized()) {
      const PllConfig &pll_config = pll->config();
      summary.pll_family = pll->familyName();
      summary.pll_clkin_freq = pll->clkinFreq();
      summary.pll_input_divide = pll_config.inputDivide();
      summary.pll_feedback_mult = pll_config.feedbackMult();
      summary.pll_vco = pll_config.vco();
    }
    for (const ClockDomain *domain : crg->domains()) {
      if (domain->isResolved())
        summary.clocks.push_back(ClockSummary(domain->name(),
                                              clockSourceName(domain->source()),
                                              domain->freq(),
                                              domain->phase(),
                                              domain->resetLess()));
    }
  }

  summary.memory_regions = soc->memoryRegions();

  const DramPhy *dram_phy = soc->dramPhy();
  if (dram_phy) {
    const SdramModule *module = dram_phy->module();
    summary.with_sdram = true;
    summary.sdram_phy = dram_phy->phyName();
    summary.sdram_module = module->name();
    summary.sdram_type = sdramTypeName(module->type());
    summary.sdram_rate = sdramRateName(dram_phy->rate());
    summary.sdram_nphases = dram_phy->nphases();
    summary.sdram_bankbits = module->bankbits();
    summary.sdram_rowbits = module->rowbits();
    summary.sdram_colbits = module->colbits();
    summary.sdram_size = module->size();
    summary.sdram_timing = dram_phy->timing();
    summary.l2_size = dram_phy->l2Size();
    summary.masked_write = dram_phy->maskedWrite();
  }

  const EthPhy *eth_phy = soc->ethPhy();
  if (eth_phy) {
    summary.with_eth = true;
    summary.eth_phy = eth_phy->phyName();
    summary.eth_mode = ethModeName(eth_phy->mode());
    summary.eth_ip = eth_phy->ipAddress();
    summary.eth_dynamic_ip = eth_phy->dynamicIp();
    summary.eth_rx_delay = eth_phy->rxDelay();
  }

  addPeripheral(soc->uart(), summary.peripherals);
  addPeripheral(soc->hyperRam(), summary.peripherals);
  addPeripheral(soc->sdCard(), summary.peripherals);
  addPeripheral(soc->pcie(), summary.peripherals);
  addPeripheral(soc->i2c(), summary.peripherals);
  addPeripheral(soc->hbm(), summary.peripherals);
  addPeripheral(soc->leds(), summary.peripherals);
  for (const DebugBridge *bridge : soc->bridges())
    summary.peripherals.push_back(bridgeKindName(bridge->kind()));
  summary.constants = soc->constants();

  for (const IoResource *resource : platform->requested()) {
    if (resource->hasSubsignals()) {
      for (const IoSubsignal *subsignal : resource->subsignals())
        summary.ports.push_back(platform->portName(resource, subsignal));
    }
    else
      summary.ports.push_back(platform->portName(resource));
  }
  return summary;
}

////////////////////////////////////////////////////////////////

void
reportSocSummary(const SocSummary &summary,
                 Report *report,
                 const Units *units)
{
  const Unit *freq_unit = units->frequencyUnit();
  const Unit *time_unit = units->timeUnit();
  const Unit *phase_unit = units->phaseUnit();
  report->reportLine("Board      %s", summary.board.c_str());
  report->reportLine("Ident      %s", summary.ident.c_str());
  report->reportLine("Device     %s (%s, %s)",
                     summary.device.c_str(),
                     summary.family.c_str(),
                     summary.toolchain.c_str());
  report->reportLine("Sys clock  %s",
                     freq_unit->asStringSuffix(summary.sys_clk_freq).c_str());
  report->reportBlankLine();

  if (!summary.pll_family.empty()) {
    report->reportLine("PLL %s clkin %s D=%d M=%d vco %s",
                       summary.pll_family.c_str(),
                       freq_unit->asStringSuffix(summary.pll_clkin_freq).c_str(),
                       summary.pll_input_divide,
                       summary.pll_feedback_mult,
                       freq_unit->asStringSuffix(summary.pll_vco).c_str());
  }
  report->reportLine("Clock domain    Source     Frequency  Phase");
  report->reportLine("----------------------------------------------");
  for (const ClockSummary &clock : summary.clocks)
    report->reportLine("%-15s %-8s %11s %6s%s",
                       clock.name.c_str(),
                       clock.source.c_str(),
                       freq_unit->asStringSuffix(clock.freq).c_str(),
                       phase_unit->asString(clock.phase).c_str(),
                       clock.reset_less ? " reset_less" : "");
  report->reportBlankLine();

  report->reportLine("Region     Origin       Size");
  report->reportLine("------------------------------------");
  for (const MemoryRegion &region : summary.memory_regions)
    report->reportLine("%-10s 0x%08llx   0x%08llx%s",
                       region.name(),
                       static_cast<unsigned long long>(region.origin()),
                       static_cast<unsigned long long>(region.size()),
                       region.cached() ? "" : " io");
  report->reportBlankLine();

  if (summary.with_sdram) {
    const SdramTimingCycles &timing = summary.sdram_timing;
    report->reportLine("SDRAM %s %s %s rate %s nphases %d",
                       summary.sdram_phy.c_str(),
                       summary.sdram_module.c_str(),
                       summary.sdram_type.c_str(),
                       summary.sdram_rate.c_str(),
                       summary.sdram_nphases);
    report->reportLine(" geometry bank %d row %d col %d size %lld MiB",
                       summary.sdram_bankbits,
                       summary.sdram_rowbits,
                       summary.sdram_colbits,
                       summary.sdram_size >> 20);
    report->reportLine(" tRP %d tRCD %d tWR %d tWTR %d tREFI %d tRFC %d",
                       timing.tRP, timing.tRCD, timing.tWR,
                       timing.tWTR, timing.tREFI, timing.tRFC);
    report->reportLine(" tFAW %d tCCD %d tRRD %d tRC %d tRAS %d tZQCS %d",
                       timing.tFAW, timing.tCCD, timing.tRRD,
                       timing.tRC, timing.tRAS, timing.tZQCS);
    report->reportLine(" l2_size %d%s",
                       summary.l2_size,
                       summary.masked_write ? "" : " no masked write");
  }
  if (summary.with_eth) {
    if (summary.eth_dynamic_ip)
      report->reportLine("Eth %s %s dynamic ip rx_delay %s",
                         summary.eth_phy.c_str(),
                         summary.eth_mode.c_str(),
                         time_unit->asStringSuffix(summary.eth_rx_delay).c_str());
    else
      report->reportLine("Eth %s %s ip %s rx_delay %s",
                         summary.eth_phy.c_str(),
                         summary.eth_mode.c_str(),
                         summary.eth_ip.empty() ? "-" : summary.eth_ip.c_str(),
                         time_unit->asStringSuffix(summary.eth_rx_delay).c_str());
  }
  if (!summary.peripherals.empty())
    report->reportLine("Peripherals %s", join(summary.peripherals, " ").c_str());
  if (!summary.constants.empty())
    report->reportLine("Constants %s", join(summary.constants, " ").c_str());
}

} // namespace
