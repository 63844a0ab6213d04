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
#include "StringUtil.hh"
#include "clock/XilinxPll.hh"

namespace bsp {

// Artix-7 DC-SCM: DDR3, RGMII Ethernet, PCIe x1 and two ULPI clocks.
// Built with either an xc7a100t or an xc7a15t.
class ArtixDcScm : public Board
{
public:
  explicit ArtixDcScm(const BspState *bsp);
  void defaultConfig(SocConfig &config) const override;
  Platform *makePlatform(const SocConfig &config) const override;

protected:
  void checkConfig(const SocConfig &config) const override;
  void buildCrg(Crg *crg,
                const SocConfig &config) const override;
  void addBlocks(Soc *soc) const override;
  const char *device(const SocConfig &config) const;

  static constexpr const char *device_100t = "xc7a100tfgg484-1";
  static constexpr const char *device_15t = "xc7a15tfgg484-1";
};

Board *
makeArtixDcScm(const BspState *bsp)
{
  return new ArtixDcScm(bsp);
}

ArtixDcScm::ArtixDcScm(const BspState *bsp) :
  Board("artix_dc_scm", "Artix-7 DC-SCM", bsp)
{
}

void
ArtixDcScm::defaultConfig(SocConfig &config) const
{
  config.board = name();
  config.device = device_100t;
  config.ident = "LiteX SoC";
  config.ident_version = false;
  config.sys_clk_freq = 100e6;
  config.iodelay_clk_freq = 200e6;
  config.integrated_rom_size = 0x10000;
  config.integrated_main_ram_size = 0;
  config.with_sdram = false;
  config.l2_size = 8192;
  config.with_ethernet = false;
  config.with_pcie = false;
  config.with_leds = true;
}

const char *
ArtixDcScm::device(const SocConfig &config) const
{
  const char *device = config.device.c_str();
  if (config.device.empty() || stringEq(device, device_100t))
    return device_100t;
  else if (stringEq(device, device_15t))
    return device_15t;
  report_->error(560, "%s: unknown device %s, use %s or %s.",
                 name(), device, device_100t, device_15t);
  return nullptr;
}

void
ArtixDcScm::checkConfig(const SocConfig &config) const
{
  Board::checkConfig(config);
  device(config);
}

Platform *
ArtixDcScm::makePlatform(const SocConfig &config) const
{
  Platform *platform = new Platform(name(), device(config),
                                    VendorFamily::xilinx_7series,
                                    config.toolchain.c_str(), this);
  platform->setDefaultClk("clk100", 1.0 / 100e6);
  platform->addResource("clk100", 0, "A13", "LVCMOS33");

  IoResource *serial = platform->addResource("serial", 0, nullptr, "LVCMOS33");
  serial->addSubsignal("tx", "B13");
  serial->addSubsignal("rx", "C13");

  platform->addResource("user_led", 0, "B17", "LVCMOS33");
  platform->addResource("user_led", 1, "C17", "LVCMOS33");
  platform->addResource("user_led", 2, "D17", "LVCMOS33");
  platform->addResource("user_led", 3, "E17", "LVCMOS33");

  // 16 bit DDR3L on bank 34.
  IoResource *ddram = platform->addResource("ddram", 0, nullptr, nullptr,
                                            "SLEW=FAST");
  ddram->addSubsignal("a", "M1 N1 P1 R1 T1 U1 V1 W1 Y1 AA1 AB1 M2 N2 P2 R2",
                      "SSTL135");
  ddram->addSubsignal("ba", "T2 U2 V2", "SSTL135");
  ddram->addSubsignal("ras_n", "W2", "SSTL135");
  ddram->addSubsignal("cas_n", "Y2", "SSTL135");
  ddram->addSubsignal("we_n", "AA2", "SSTL135");
  ddram->addSubsignal("cs_n", "AB2", "SSTL135");
  ddram->addSubsignal("dm", "M3 N3", "SSTL135");
  ddram->addSubsignal("dq", "P3 R3 T3 U3 V3 W3 Y3 AA3 AB3 M4 N4 P4 R4 T4 U4 V4",
                      "SSTL135", "IN_TERM=UNTUNED_SPLIT_50");
  ddram->addSubsignal("dqs_p", "W4 Y4", "DIFF_SSTL135");
  ddram->addSubsignal("dqs_n", "AA4 AB4", "DIFF_SSTL135");
  ddram->addSubsignal("clk_p", "M5", "DIFF_SSTL135");
  ddram->addSubsignal("clk_n", "N5", "DIFF_SSTL135");
  ddram->addSubsignal("cke", "P5", "SSTL135");
  ddram->addSubsignal("odt", "R5", "SSTL135");
  ddram->addSubsignal("reset_n", "T5", "SSTL135");

  IoResource *eth_clocks = platform->addResource("eth_clocks", 0, nullptr,
                                                 "LVCMOS33");
  eth_clocks->addSubsignal("tx", "D13");
  eth_clocks->addSubsignal("rx", "E13");
  IoResource *eth = platform->addResource("eth", 0, nullptr, "LVCMOS33");
  eth->addSubsignal("rst_n", "F13");
  eth->addSubsignal("mdio", "G13");
  eth->addSubsignal("mdc", "H13");
  eth->addSubsignal("rx_ctl", "B14");
  eth->addSubsignal("rx_data", "J13 K13 L13 A14");
  eth->addSubsignal("tx_ctl", "G14");
  eth->addSubsignal("tx_data", "C14 D14 E14 F14");

  // GTP quad 216, no IO standard on the transceiver pins.
  IoResource *pcie = platform->addResource("pcie_x1", 0);
  pcie->addSubsignal("rst_n", "H14", "LVCMOS33");
  pcie->addSubsignal("clk_p", "F10");
  pcie->addSubsignal("clk_n", "E10");
  pcie->addSubsignal("rx_p", "D11");
  pcie->addSubsignal("rx_n", "C11");
  pcie->addSubsignal("tx_p", "D7");
  pcie->addSubsignal("tx_n", "C7");

  platform->addResource("ulpi_clock", 0, "J14", "LVCMOS33");
  IoResource *ulpi0 = platform->addResource("ulpi", 0, nullptr, "LVCMOS33");
  ulpi0->addSubsignal("stp", "L14");
  ulpi0->addSubsignal("dir", "A15");
  ulpi0->addSubsignal("nxt", "B15");
  ulpi0->addSubsignal("reset", "C15");
  ulpi0->addSubsignal("data", "D15 E15 F15 G15 H15 J15 K15 L15");
  platform->addResource("ulpi_clock", 1, "K14", "LVCMOS33");
  IoResource *ulpi1 = platform->addResource("ulpi", 1, nullptr, "LVCMOS33");
  ulpi1->addSubsignal("stp", "A16");
  ulpi1->addSubsignal("dir", "B16");
  ulpi1->addSubsignal("nxt", "C16");
  ulpi1->addSubsignal("reset", "D16");
  ulpi1->addSubsignal("data", "E16 F16 G16 H16 J16 K16 L16 A17");

  platform->addPeriodConstraint("clk100", 1.0 / 100e6);
  platform->addPeriodConstraint("eth_clocks:rx", 1.0 / 125e6);
  return platform;
}

void
ArtixDcScm::buildCrg(Crg *crg,
                     const SocConfig &config) const
{
  double sys_clk_freq = config.sys_clk_freq;
  crg->setPll(new S7Pll("pll", -1, this));
  crg->requestClkin("clk100", 0, 100e6);
  crg->makePllDomain("sys", sys_clk_freq);
  crg->makePllDomain("sys4x", 4 * sys_clk_freq, 0.0, false);
  crg->makePllDomain("sys4x_dqs", 4 * sys_clk_freq, 90.0, false);
  crg->makePllDomain("idelay", config.iodelay_clk_freq);
  crg->makePinDomain("ulpi0", "ulpi_clock", 0, 60e6);
  crg->makePinDomain("ulpi1", "ulpi_clock", 1, 60e6);
}

void
ArtixDcScm::addBlocks(Soc *soc) const
{
  const SocConfig &config = soc->config();
  Platform *platform = soc->platform();
  if (config.with_etherbone)
    report_->error(561, "%s: Etherbone is not supported on this target.", name());
  if (config.with_hyperram)
    report_->error(562, "%s: board has no HyperRAM.", name());
  if (config.with_sdcard)
    report_->error(563, "%s: board has no SD card slot.", name());
  addIntegratedMemories(soc);
  addUart(soc);
  if (config.with_sdram && config.integrated_main_ram_size == 0) {
    checkIodelayClkFreq("A7DDRPHY", config.iodelay_clk_freq);
    const SdramModule *module = SdramModule::find("AS4C256M16D3A");
    IoResource *pads = platform->request("ddram", 0);
    DramPhy *phy = new DramPhy("A7DDRPHY", pads, module,
                               SdramRate::rate_1_4, 4, config.sys_clk_freq);
    soc->setDramPhy(phy);
    phy->setIodelayClkFreq(config.iodelay_clk_freq);
    phy->setL2Size(config.l2_size);
    phy->setL2MinDataWidth(128);
    addMainRam(soc, module->size());
  }
  addEthernet(soc, "LiteEthS7PHYRGMII", 0.0, true);
  if (config.with_pcie) {
    IoResource *pads = platform->request("pcie_x1", 0);
    soc->setPcie(new PadsBlock("pcie", "S7PCIEPHY", {pads}));
  }
  addBridges(soc, 0);
  addLeds(soc);
}

} // namespace
