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
#include "Board.hh"
#include "Platform.hh"
#include "Crg.hh"
#include "Soc.hh"
#include "SdramModule.hh"
#include "clock/XilinxPll.hh"

namespace bsp {

Platform *
makeLpddr4TestPlatform(const BspState *bsp)
{
  Platform *platform = new Platform("lpddr4_test_board", "xc7k70tfbg484-1",
                                    VendorFamily::xilinx_7series, "vivado",
                                    bsp);
  platform->setDefaultClk("clk100", 1.0 / 100e6);
  platform->addResource("clk100", 0, "L19", "LVCMOS33");

  platform->addResource("user_led", 0, "F8", "LVCMOS33");
  platform->addResource("user_led", 1, "C8", "LVCMOS33");
  platform->addResource("user_led", 2, "A8", "LVCMOS33");
  platform->addResource("user_led", 3, "D9", "LVCMOS33");
  platform->addResource("user_led", 4, "F9", "LVCMOS33");

  platform->addResource("user_btn", 0, "E8", "LVCMOS33");
  platform->addResource("user_btn", 1, "B9", "LVCMOS33");
  platform->addResource("user_btn", 2, "C9", "LVCMOS33");
  platform->addResource("user_btn", 3, "E9", "LVCMOS33");

  IoResource *serial0 = platform->addResource("serial", 0, nullptr, "LVCMOS33");
  serial0->addSubsignal("tx", "AB18");
  serial0->addSubsignal("rx", "AA18");
  IoResource *serial1 = platform->addResource("serial", 1, nullptr, "LVCMOS33");
  serial1->addSubsignal("tx", "AA20");
  serial1->addSubsignal("rx", "AB20");

  // Runs at 1.1V rather than 1.2V.
  IoResource *lpddr4 = platform->addResource("lpddr4", 0, nullptr, nullptr,
                                             "SLEW=FAST");
  lpddr4->addSubsignal("clk_p", "Y3", "DIFF_SSTL12");
  lpddr4->addSubsignal("clk_n", "Y2", "DIFF_SSTL12");
  lpddr4->addSubsignal("cke", "N4", "SSTL12");
  lpddr4->addSubsignal("odt", "", "SSTL12");
  lpddr4->addSubsignal("reset_n", "", "SSTL12");
  lpddr4->addSubsignal("cs", "N3", "SSTL12");
  lpddr4->addSubsignal("ca", "L3 L4 AA4 AA3 AB3 AB2", "SSTL12");
  lpddr4->addSubsignal("dq",
                       "L1 K2 K1 K3 R1 P2 P1 N2 W2 Y1 AA1 AB1 R2 T1 T3 U1",
                       "SSTL12", "IN_TERM=UNTUNED_SPLIT_40");
  lpddr4->addSubsignal("dqs_p", "M2 U2", "DIFF_SSTL12",
                       "IN_TERM=UNTUNED_SPLIT_40");
  lpddr4->addSubsignal("dqs_n", "M1 V2", "DIFF_SSTL12",
                       "IN_TERM=UNTUNED_SPLIT_40");
  lpddr4->addSubsignal("dmi", "M3 W1", "SSTL12");

  platform->addResource("eth_ref_clk", 0, "C12", "LVCMOS33");
  IoResource *eth_clocks = platform->addResource("eth_clocks", 0, nullptr,
                                                 "LVCMOS33");
  eth_clocks->addSubsignal("tx", "E17");
  eth_clocks->addSubsignal("rx", "C17");
  IoResource *eth = platform->addResource("eth", 0, nullptr, "LVCMOS33");
  eth->addSubsignal("rst_n", "C15");
  eth->addSubsignal("mdio", "C13");
  eth->addSubsignal("mdc", "C14");
  eth->addSubsignal("rx_dv", "B13");
  eth->addSubsignal("rx_er", "A14");
  eth->addSubsignal("rx_data", "A15 B16 A16 B17");
  eth->addSubsignal("tx_en", "A18");
  eth->addSubsignal("tx_data", "A19 B20 A20 B21");
  eth->addSubsignal("col", "B15");
  eth->addSubsignal("crs", "A13");

  IoResource *hyperram = platform->addResource("hyperram", 0, nullptr,
                                               "LVCMOS33");
  hyperram->addSubsignal("clk", "AB15");
  hyperram->addSubsignal("rst_n", "V17");
  hyperram->addSubsignal("dq", "W15 AA15 AA14 W14 Y14 V15 Y16 W17");
  hyperram->addSubsignal("cs_n", "AA16");
  hyperram->addSubsignal("rwds", "Y17");

  platform->addPlatformCommand("set_property INTERNAL_VREF 0.6 [get_iobanks 34]");
  platform->addPeriodConstraint("clk100", 1.0 / 100e6);
  return platform;
}

////////////////////////////////////////////////////////////////

// Integrated main RAM, MII Ethernet and HyperRAM always present.
class Lpddr4TestBoard : public Board
{
public:
  explicit Lpddr4TestBoard(const BspState *bsp);
  void defaultConfig(SocConfig &config) const override;
  Platform *makePlatform(const SocConfig &config) const override;

protected:
  void buildCrg(Crg *crg,
                const SocConfig &config) const override;
  void addBlocks(Soc *soc) const override;

  static constexpr uint64_t hyperram_origin = 0x30000000;
  static constexpr uint64_t hyperram_size = 8 * 1024 * 1024;
};

Board *
makeLpddr4TestBoard(const BspState *bsp)
{
  return new Lpddr4TestBoard(bsp);
}

Lpddr4TestBoard::Lpddr4TestBoard(const BspState *bsp) :
  Board("lpddr4_test_board", "LPDDR4 Test Board with on-chip main RAM", bsp)
{
}

void
Lpddr4TestBoard::defaultConfig(SocConfig &config) const
{
  config.board = name();
  config.ident = "LiteX SoC";
  config.sys_clk_freq = 100e6;
  config.iodelay_clk_freq = 200e6;
  config.integrated_main_ram_size = 0x10000;
  config.with_sdram = false;
  config.with_ethernet = true;
  config.with_hyperram = true;
  config.with_leds = true;
}

Platform *
Lpddr4TestBoard::makePlatform(const SocConfig &) const
{
  return makeLpddr4TestPlatform(this);
}

void
Lpddr4TestBoard::buildCrg(Crg *crg,
                          const SocConfig &config) const
{
  double sys_clk_freq = config.sys_clk_freq;
  crg->setPll(new S7Pll("pll", -1, this));
  crg->requestClkin("clk100", 0, 100e6);
  crg->makePllDomain("sys", sys_clk_freq);
  crg->makePllDomain("sys4x", 4 * sys_clk_freq, 0.0, false);
  crg->makePllDomain("sys4x_dqs", 4 * sys_clk_freq, 90.0, false);
  crg->makePllDomain("idelay", 200e6);
  crg->makePllDomain("eth", 25e6);
  crg->driveClockPin("eth", "eth_ref_clk", 0);
}

void
Lpddr4TestBoard::addBlocks(Soc *soc) const
{
  const SocConfig &config = soc->config();
  if (config.with_sdram)
    report_->error(520, "%s: LPDDR4 controller is not wired on this target, use antmicro_lpddr4_test_board.",
                   name());
  addIntegratedMemories(soc);
  addUart(soc);
  addEthernet(soc, "LiteEthPHYMII", 0.0, false);
  if (config.with_hyperram) {
    IoResource *pads = soc->platform()->request("hyperram", 0);
    soc->setHyperRam(new PadsBlock("hyperram", "HyperRAM", {pads}));
    soc->addMemoryRegion("hyperram", hyperram_origin, hyperram_size, true);
  }
  addBridges(soc, 1);
  addLeds(soc);
}

////////////////////////////////////////////////////////////////

// LPDDR4 through K7LPDDR4PHY with optional Ethernet, HyperRAM and
// debug bridges.
class AntmicroLpddr4TestBoard : public Board
{
public:
  explicit AntmicroLpddr4TestBoard(const BspState *bsp);
  void defaultConfig(SocConfig &config) const override;
  Platform *makePlatform(const SocConfig &config) const override;

protected:
  void buildCrg(Crg *crg,
                const SocConfig &config) const override;
  void addBlocks(Soc *soc) const override;

  static constexpr uint64_t hyperram_origin = 0x20000000;
  static constexpr uint64_t hyperram_size = 8 * 1024 * 1024;
  // PHY adds 1.2ns to RX CLK, 2ns are needed.
  static constexpr double eth_rx_delay = 0.8e-9;
};

Board *
makeAntmicroLpddr4TestBoard(const BspState *bsp)
{
  return new AntmicroLpddr4TestBoard(bsp);
}

AntmicroLpddr4TestBoard::AntmicroLpddr4TestBoard(const BspState *bsp) :
  Board("antmicro_lpddr4_test_board", "Antmicro LPDDR4 Test Board", bsp)
{
}

void
AntmicroLpddr4TestBoard::defaultConfig(SocConfig &config) const
{
  config.board = name();
  config.ident = "LiteX SoC on LPDDR4 Test Board";
  config.sys_clk_freq = 50e6;
  config.iodelay_clk_freq = 200e6;
  config.integrated_rom_size = 0x10000;
  config.integrated_main_ram_size = 0;
  config.with_sdram = true;
  config.l2_size = 8192;
  config.masked_write = true;
  config.with_jtagbone = true;
  config.with_leds = true;
}

Platform *
AntmicroLpddr4TestBoard::makePlatform(const SocConfig &) const
{
  return makeLpddr4TestPlatform(this);
}

void
AntmicroLpddr4TestBoard::buildCrg(Crg *crg,
                                  const SocConfig &config) const
{
  double sys_clk_freq = config.sys_clk_freq;
  crg->setPll(new S7Pll("pll", -1, this));
  crg->requestClkin("clk100", 0, 100e6);
  crg->makePllDomain("sys", sys_clk_freq);
  crg->makePllDomain("sys2x", 2 * sys_clk_freq, 0.0, false);
  crg->makePllDomain("sys8x", 8 * sys_clk_freq, 0.0, false);
  crg->makePllDomain("idelay", config.iodelay_clk_freq);
}

void
AntmicroLpddr4TestBoard::addBlocks(Soc *soc) const
{
  const SocConfig &config = soc->config();
  Platform *platform = soc->platform();
  addIntegratedMemories(soc);
  addUart(soc);
  if (config.with_sdram && config.integrated_main_ram_size == 0) {
    checkIodelayClkFreq("K7LPDDR4PHY", config.iodelay_clk_freq);
    const SdramModule *module = SdramModule::find("MT53E256M16D1");
    IoResource *pads = platform->request("lpddr4", 0);
    DramPhy *phy = new DramPhy("K7LPDDR4PHY", pads, module,
                               SdramRate::rate_1_8, 8, config.sys_clk_freq);
    soc->setDramPhy(phy);
    phy->setIodelayClkFreq(config.iodelay_clk_freq);
    phy->setMaskedWrite(config.masked_write);
    phy->setL2Size(config.l2_size);
    phy->setL2MinDataWidth(256);
    addMainRam(soc, module->size());
    soc->addConstant("SDRAM_DEBUG");
  }
  if (config.with_hyperram) {
    IoResource *pads = platform->request("hyperram", 0);
    soc->setHyperRam(new PadsBlock("hyperram", "HyperRAM", {pads}));
    soc->addMemoryRegion("hyperram", hyperram_origin, hyperram_size, true);
  }
  if (config.with_sdcard) {
    IoResource *pads = platform->request("sdcard", 0);
    soc->setSdCard(new PadsBlock("sdcard", "LiteSDCard", {pads}));
  }
  addEthernet(soc, "LiteEthS7PHYRGMII", eth_rx_delay, true);
  addBridges(soc, 1);
  addLeds(soc);
}

} // namespace
