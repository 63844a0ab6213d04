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

#include "platform/Boards.hh"

#include "Report.hh"
#include "StringUtil.hh"
#include "Board.hh"
#include "Platform.hh"
#include "Crg.hh"
#include "Soc.hh"
#include "SdramModule.hh"
#include "clock/XilinxPll.hh"

namespace bsp {

// Digilent Arty A7 (a7-35, a7-100).
class DigilentArty : public Board
{
public:
  explicit DigilentArty(const BspState *bsp);
  void defaultConfig(SocConfig &config) const override;
  Platform *makePlatform(const SocConfig &config) const override;

protected:
  void buildCrg(Crg *crg,
                const SocConfig &config) const override;
  void addBlocks(Soc *soc) const override;
  const char *device(const std::string &variant) const;
};

Board *
makeDigilentArty(const BspState *bsp)
{
  return new DigilentArty(bsp);
}

DigilentArty::DigilentArty(const BspState *bsp) :
  Board("digilent_arty", "Digilent Arty A7", bsp)
{
}

void
DigilentArty::defaultConfig(SocConfig &config) const
{
  config.board = name();
  config.variant = "a7-35";
  config.toolchain = "vivado";
  config.ident = "LiteX SoC on Arty A7";
  config.sys_clk_freq = 50e6;
  config.iodelay_clk_freq = 200e6;
  config.rw_bios_mem = true;
  config.integrated_main_ram_size = 0;
  config.with_sdram = true;
  config.l2_size = 0;
  config.with_leds = true;
}

const char *
DigilentArty::device(const std::string &variant) const
{
  if (variant.empty() || variant == "a7-35")
    return "xc7a35ticsg324-1L";
  else if (variant == "a7-100")
    return "xc7a100tcsg324-1";
  report_->error(530, "%s: unknown variant %s, use a7-35 or a7-100.",
                 name(), variant.c_str());
  return nullptr;
}

Platform *
DigilentArty::makePlatform(const SocConfig &config) const
{
  const char *part = device(config.variant);
  Platform *platform = new Platform(name(), part,
                                    VendorFamily::xilinx_7series,
                                    config.toolchain.c_str(), this);
  platform->setDefaultClk("clk100", 1.0 / 100e6);
  platform->addResource("clk100", 0, "E3", "LVCMOS33");
  platform->addResource("cpu_reset", 0, "C2", "LVCMOS33");

  platform->addResource("user_led", 0, "H5", "LVCMOS33");
  platform->addResource("user_led", 1, "J5", "LVCMOS33");
  platform->addResource("user_led", 2, "T9", "LVCMOS33");
  platform->addResource("user_led", 3, "T10", "LVCMOS33");

  platform->addResource("user_btn", 0, "D9", "LVCMOS33");
  platform->addResource("user_btn", 1, "C9", "LVCMOS33");
  platform->addResource("user_btn", 2, "B9", "LVCMOS33");
  platform->addResource("user_btn", 3, "B8", "LVCMOS33");

  IoResource *serial = platform->addResource("serial", 0, nullptr, "LVCMOS33");
  serial->addSubsignal("tx", "D10");
  serial->addSubsignal("rx", "A9");

  IoResource *ddram = platform->addResource("ddram", 0, nullptr, "SSTL135",
                                            "SLEW=FAST");
  ddram->addSubsignal("a", "R2 M6 N4 T1 N6 R7 V6 U7 R8 V7 R6 U6 T6 T8");
  ddram->addSubsignal("ba", "R1 P4 P2");
  ddram->addSubsignal("ras_n", "P3");
  ddram->addSubsignal("cas_n", "M4");
  ddram->addSubsignal("we_n", "P5");
  ddram->addSubsignal("cs_n", "U8");
  ddram->addSubsignal("dm", "L1 U1");
  ddram->addSubsignal("dq", "K5 L3 K3 L6 M3 M1 L4 M2 V4 T5 U4 V5 V1 T3 U3 R3",
                      nullptr, "IN_TERM=UNTUNED_SPLIT_40");
  ddram->addSubsignal("dqs_p", "N2 U2", "DIFF_SSTL135");
  ddram->addSubsignal("dqs_n", "N1 V2", "DIFF_SSTL135");
  ddram->addSubsignal("clk_p", "U9", "DIFF_SSTL135");
  ddram->addSubsignal("clk_n", "V9", "DIFF_SSTL135");
  ddram->addSubsignal("cke", "N5");
  ddram->addSubsignal("odt", "R5");
  ddram->addSubsignal("reset_n", "K6");

  platform->addResource("eth_ref_clk", 0, "G18", "LVCMOS33");
  IoResource *eth_clocks = platform->addResource("eth_clocks", 0, nullptr,
                                                 "LVCMOS33");
  eth_clocks->addSubsignal("tx", "H16");
  eth_clocks->addSubsignal("rx", "F15");
  IoResource *eth = platform->addResource("eth", 0, nullptr, "LVCMOS33");
  eth->addSubsignal("rst_n", "C16");
  eth->addSubsignal("mdio", "K13");
  eth->addSubsignal("mdc", "F16");
  eth->addSubsignal("rx_dv", "G16");
  eth->addSubsignal("rx_er", "C17");
  eth->addSubsignal("rx_data", "D18 E17 E18 G17");
  eth->addSubsignal("tx_en", "H15");
  eth->addSubsignal("tx_data", "H14 J14 J13 H17");
  eth->addSubsignal("col", "D17");
  eth->addSubsignal("crs", "G14");

  // Digilent microSD PMOD on JD.
  IoResource *sdcard = platform->addResource("sdcard", 0, nullptr, "LVCMOS33",
                                             "SLEW=FAST");
  sdcard->addSubsignal("data", "F4 E2 D2 D4", nullptr, "PULLUP=TRUE");
  sdcard->addSubsignal("cmd", "D3", nullptr, "PULLUP=TRUE");
  sdcard->addSubsignal("clk", "F3");
  sdcard->addSubsignal("cd", "H2");

  platform->addPlatformCommand("set_property INTERNAL_VREF 0.675 [get_iobanks 34]");
  platform->addPlatformCommand("set_property CFGBVS VCCO [current_design]");
  platform->addPlatformCommand("set_property CONFIG_VOLTAGE 3.3 [current_design]");
  platform->addPeriodConstraint("clk100", 1.0 / 100e6);
  platform->addPeriodConstraint("eth_clocks:rx", 1.0 / 25e6);
  platform->addPeriodConstraint("eth_clocks:tx", 1.0 / 25e6);
  return platform;
}

void
DigilentArty::buildCrg(Crg *crg,
                       const SocConfig &config) const
{
  double sys_clk_freq = config.sys_clk_freq;
  crg->setPll(new S7Pll("pll", -1, this));
  crg->requestReset("cpu_reset", 0);
  crg->requestClkin("clk100", 0, 100e6);
  crg->makePllDomain("sys", sys_clk_freq);
  // Reset from sys so the half rate PHY counters stay aligned.
  crg->makePllDomain("sys2x", 2 * sys_clk_freq, 0.0, false);
  crg->makePllDomain("sys8x", 8 * sys_clk_freq, 0.0, false);
  crg->makePllDomain("sys8x_dqs", 8 * sys_clk_freq, 90.0, false);
  crg->makePllDomain("idelay", 200e6);
  crg->makePllDomain("eth", 25e6);
  crg->driveClockPin("eth", "eth_ref_clk", 0);
}

void
DigilentArty::addBlocks(Soc *soc) const
{
  const SocConfig &config = soc->config();
  Platform *platform = soc->platform();
  addIntegratedMemories(soc);
  addUart(soc);
  if (config.with_sdram && config.integrated_main_ram_size == 0) {
    const SdramModule *module = SdramModule::find("MT41K128M16");
    IoResource *pads = platform->request("ddram", 0);
    DramPhy *phy = new DramPhy("HalfRateA7DDRPHY", pads, module,
                               SdramRate::rate_1_8, 8, config.sys_clk_freq);
    soc->setDramPhy(phy);
    phy->setL2Size(config.l2_size);
    addMainRam(soc, module->size());
  }
  addEthernet(soc, "LiteEthPHYMII", 0.0, false);
  if (config.with_sdcard) {
    IoResource *pads = platform->request("sdcard", 0);
    soc->setSdCard(new PadsBlock("sdcard", "LiteSDCard", {pads}));
  }
  addBridges(soc, 1);
  addLeds(soc);
}

} // namespace
