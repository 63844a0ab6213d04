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
#include "clock/Ecp5Pll.hh"

namespace bsp {

// ECP5 DC-SCM: DDR3, RGMII Ethernet, PCIe x1 and two ULPI clocks.
class Ecp5DcScm : public Board
{
public:
  explicit Ecp5DcScm(const BspState *bsp);
  void defaultConfig(SocConfig &config) const override;
  Platform *makePlatform(const SocConfig &config) const override;

protected:
  void buildCrg(Crg *crg,
                const SocConfig &config) const override;
  void addBlocks(Soc *soc) const override;
};

Board *
makeEcp5DcScm(const BspState *bsp)
{
  return new Ecp5DcScm(bsp);
}

Ecp5DcScm::Ecp5DcScm(const BspState *bsp) :
  Board("ecp5_dc_scm", "Lattice ECP5 DC-SCM", bsp)
{
}

void
Ecp5DcScm::defaultConfig(SocConfig &config) const
{
  config.board = name();
  config.toolchain = "trellis";
  config.ident = "LiteX SoC";
  config.sys_clk_freq = 75e6;
  config.integrated_rom_size = 0x10000;
  config.integrated_main_ram_size = 0;
  config.with_sdram = true;
  config.l2_size = 8192;
  config.with_ethernet = true;
  config.with_pcie = true;
  config.with_leds = false;
}

Platform *
Ecp5DcScm::makePlatform(const SocConfig &config) const
{
  Platform *platform = new Platform(name(), "LFE5UM5G-85F-8BG756C",
                                    VendorFamily::lattice_ecp5,
                                    config.toolchain.c_str(), this);
  platform->setDefaultClk("clk100", 1.0 / 100e6);
  platform->addResource("clk100", 0, "C5", "LVCMOS33");

  IoResource *serial = platform->addResource("serial", 0);
  serial->addSubsignal("rx", "C4", "LVCMOS33");
  serial->addSubsignal("tx", "D5", "LVCMOS33");

  IoResource *ddram = platform->addResource("ddram", 0, nullptr, nullptr,
                                            "SLEWRATE=FAST");
  ddram->addSubsignal("a", "W4 V7 U7 AE6 R6 AE4 U6 U5 R7 R4 U4 T6 T5 T4 T7",
                      "SSTL135_I");
  ddram->addSubsignal("ba", "AC7 V6 W5", "SSTL135_I");
  ddram->addSubsignal("ras_n", "AB3", "SSTL135_I");
  ddram->addSubsignal("cas_n", "W2", "SSTL135_I");
  ddram->addSubsignal("we_n", "AC5", "SSTL135_I");
  ddram->addSubsignal("cs_n", "R1", "SSTL135_I");
  ddram->addSubsignal("dm", "AD7 AC2", "SSTL135_I");
  ddram->addSubsignal("dq", "AC6 AD6 Y4 AE5 AB7 Y5 Y6 Y7 AE3 AE1 AD3 AB1 AB4 AC1 AE2 AD1",
                      "SSTL135_I", "TERMINATION=75");
  ddram->addSubsignal("dqs_p", "AB5 AC3", "SSTL135D_I",
                      "TERMINATION=OFF DIFFRESISTOR=100");
  ddram->addSubsignal("clk_p", "P5", "SSTL135D_I");
  ddram->addSubsignal("cke", "Y1", "SSTL135_I");
  ddram->addSubsignal("odt", "AD4", "SSTL135_I");
  ddram->addSubsignal("reset_n", "T2", "SSTL135_I");

  IoResource *eth_clocks = platform->addResource("eth_clocks", 0, nullptr,
                                                 "LVCMOS33");
  eth_clocks->addSubsignal("tx", "C17");
  eth_clocks->addSubsignal("rx", "A17");
  eth_clocks->addSubsignal("ref", "B17");
  IoResource *eth = platform->addResource("eth", 0, nullptr, "LVCMOS33");
  eth->addSubsignal("rst_n", "D18");
  eth->addSubsignal("int_n", "A19");
  eth->addSubsignal("mdio", "D17");
  eth->addSubsignal("mdc", "B16");
  eth->addSubsignal("rx_ctl", "C16");
  eth->addSubsignal("rx_data", "A16 D16 E16 C8");
  eth->addSubsignal("tx_ctl", "D15");
  eth->addSubsignal("tx_data", "A14 A8 B8 D8");

  // SERDES pins, no IO standard.
  IoResource *pcie = platform->addResource("pcie_x1", 0);
  pcie->addSubsignal("clk_p", "AM14");
  pcie->addSubsignal("clk_n", "AM15");
  pcie->addSubsignal("rx_p", "AM8");
  pcie->addSubsignal("rx_n", "AM9");
  pcie->addSubsignal("tx_p", "AK9");
  pcie->addSubsignal("tx_n", "AK10");

  platform->addResource("ulpi_clock", 0, "P28", "LVCMOS33");
  IoResource *ulpi0 = platform->addResource("ulpi", 0, nullptr, "LVCMOS33");
  ulpi0->addSubsignal("stp", "P32");
  ulpi0->addSubsignal("dir", "P31");
  ulpi0->addSubsignal("nxt", "N32");
  ulpi0->addSubsignal("reset", "P30");
  ulpi0->addSubsignal("data", "W31 W32 V32 U31 U32 T31 T32 R32");
  platform->addResource("ulpi_clock", 1, "N26", "LVCMOS33");
  IoResource *ulpi1 = platform->addResource("ulpi", 1, nullptr, "LVCMOS33");
  ulpi1->addSubsignal("stp", "Y28");
  ulpi1->addSubsignal("dir", "Y29");
  ulpi1->addSubsignal("nxt", "Y30");
  ulpi1->addSubsignal("reset", "Y32");
  ulpi1->addSubsignal("data", "AE32 AE31 AD32 AC31 AC32 AB31 AB32 AB30");

  platform->addPeriodConstraint("clk100", 1.0 / 100e6);
  platform->addPeriodConstraint("eth_clocks:rx", 1.0 / 125e6);
  return platform;
}

void
Ecp5DcScm::buildCrg(Crg *crg,
                    const SocConfig &config) const
{
  double sys_clk_freq = config.sys_clk_freq;
  crg->setPll(new Ecp5Pll("pll", this));
  crg->requestClkin("clk100", 0, 100e6);
  // Power on reset counter runs on the reference clock.
  crg->makePinDomain("por", "clk100", 0, 100e6, true);
  crg->makePllDomain("sys2x_i", 2 * sys_clk_freq, 0.0, false);
  crg->makePllDomain("init", 25e6);
  // ECLKSYNCB then CLKDIVF /2.
  crg->makeDerivedDomain("sys2x", "sys2x_i", 1);
  crg->makeDerivedDomain("sys", "sys2x", 2);
  crg->makePinDomain("ulpi0", "ulpi_clock", 0, 60e6);
  crg->makePinDomain("ulpi1", "ulpi_clock", 1, 60e6);
}

void
Ecp5DcScm::addBlocks(Soc *soc) const
{
  const SocConfig &config = soc->config();
  Platform *platform = soc->platform();
  addIntegratedMemories(soc);
  addUart(soc);
  if (config.with_sdram && config.integrated_main_ram_size == 0) {
    const SdramModule *module = SdramModule::find("AS4C256M16D3A");
    IoResource *pads = platform->request("ddram", 0);
    DramPhy *phy = new DramPhy("ECP5DDRPHY", pads, module,
                               SdramRate::rate_1_2, 2, config.sys_clk_freq);
    soc->setDramPhy(phy);
    phy->setL2Size(config.l2_size);
    addMainRam(soc, module->size());
  }
  addEthernet(soc, "LiteEthPHYRGMII", 0.0, false);
  if (config.with_pcie) {
    IoResource *pads = platform->request("pcie_x1", 0);
    soc->setPcie(new PadsBlock("pcie", "LatticeECP5PCIeSERDES", {pads}));
  }
  if (config.with_hyperram)
    report_->error(540, "%s: board has no HyperRAM.", name());
  if (config.with_sdcard)
    report_->error(541, "%s: board has no SD card slot.", name());
  addBridges(soc, 1);
  addLeds(soc);
}

} // namespace
