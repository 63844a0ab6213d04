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

// Xilinx ZCU104 (Zynq UltraScale+ xczu7ev) with the DDR4 SODIMM on
// USPDDRPHY.
class Zcu104 : public Board
{
public:
  explicit Zcu104(const BspState *bsp);
  void defaultConfig(SocConfig &config) const override;
  Platform *makePlatform(const SocConfig &config) const override;

protected:
  void buildCrg(Crg *crg,
                const SocConfig &config) const override;
  void addBlocks(Soc *soc) const override;
  void addSdram(Soc *soc) const;
};

Board *
makeZcu104(const BspState *bsp)
{
  return new Zcu104(bsp);
}

Zcu104::Zcu104(const BspState *bsp) :
  Board("zcu104", "Xilinx ZCU104", bsp)
{
}

void
Zcu104::defaultConfig(SocConfig &config) const
{
  config.board = name();
  config.ident = "LiteX SoC on ZCU104";
  config.sys_clk_freq = 125e6;
  config.iodelay_clk_freq = 500e6;
  config.integrated_main_ram_size = 0;
  config.with_sdram = true;
  config.sdram_module = "MTA4ATF51264HZ";
  config.l2_size = 8192;
  config.with_leds = true;
}

Platform *
Zcu104::makePlatform(const SocConfig &config) const
{
  Platform *platform = new Platform(name(), "xczu7ev-ffvc1156-2-i",
                                    VendorFamily::xilinx_usplus,
                                    config.toolchain.c_str(), this);
  platform->setDefaultClk("clk125", 1.0 / 125e6);
  IoResource *clk125 = platform->addResource("clk125", 0, nullptr, "LVDS");
  clk125->addSubsignal("p", "F23");
  clk125->addSubsignal("n", "E23");

  platform->addResource("user_led", 0, "D5", "LVCMOS33");
  platform->addResource("user_led", 1, "D6", "LVCMOS33");
  platform->addResource("user_led", 2, "A5", "LVCMOS33");
  platform->addResource("user_led", 3, "B5", "LVCMOS33");

  IoResource *serial = platform->addResource("serial", 0, nullptr, "LVCMOS18");
  serial->addSubsignal("tx", "A20");
  serial->addSubsignal("rx", "C19");

  IoResource *i2c = platform->addResource("i2c", 0, nullptr, "LVCMOS33");
  i2c->addSubsignal("scl", "N12");
  i2c->addSubsignal("sda", "P12");

  // 64 bit DDR4 SODIMM on banks 64-66.
  IoResource *ddram = platform->addResource("ddram", 0, nullptr, nullptr,
                                            "SLEW=FAST");
  ddram->addSubsignal("a", "AH16 AG14 AG15 AF15 AF16 AJ14 AH14 AF17 "
                      "AK17 AJ17 AK14 AK15 AL15 AL16", "SSTL12_DCI");
  ddram->addSubsignal("ba", "AL18 AK18", "SSTL12_DCI");
  ddram->addSubsignal("bg", "AJ16", "SSTL12_DCI");
  ddram->addSubsignal("ras_n", "AJ15", "SSTL12_DCI");
  ddram->addSubsignal("cas_n", "AG16", "SSTL12_DCI");
  ddram->addSubsignal("we_n", "AH18", "SSTL12_DCI");
  ddram->addSubsignal("cs_n", "AL19", "SSTL12_DCI");
  ddram->addSubsignal("act_n", "AJ19", "SSTL12_DCI");
  ddram->addSubsignal("dm", "AD20 AG20 AK20 AN24 AD25 AG25 AK29 AD29",
                      "POD12_DCI");
  ddram->addSubsignal("dq",
                      "AD21 AD22 AD23 AE20 AE23 AF20 AF21 AF22 "
                      "AG21 AG22 AG23 AH20 AH23 AJ20 AJ21 AJ22 "
                      "AK21 AK22 AK23 AL20 AL23 AM20 AM21 AM22 "
                      "AN25 AN26 AN27 AP24 AP27 AM24 AM25 AM26 "
                      "AD26 AD27 AD28 AE25 AE28 AF25 AF26 AF27 "
                      "AG26 AG27 AG28 AH25 AH28 AJ25 AJ26 AJ27 "
                      "AK30 AK31 AK32 AL29 AL32 AP29 AP30 AP31 "
                      "AD30 AD31 AD32 AE29 AE32 AF29 AF30 AF31",
                      "POD12_DCI", "ODT=RTT_40");
  ddram->addSubsignal("dqs_p", "AE21 AH21 AL21 AP25 AE26 AH26 AL30 AE30",
                      "DIFF_POD12_DCI", "ODT=RTT_40");
  ddram->addSubsignal("dqs_n", "AE22 AH22 AL22 AP26 AE27 AH27 AL31 AE31",
                      "DIFF_POD12_DCI", "ODT=RTT_40");
  ddram->addSubsignal("clk_p", "AF18", "DIFF_SSTL12_DCI");
  ddram->addSubsignal("clk_n", "AG18", "DIFF_SSTL12_DCI");
  ddram->addSubsignal("cke", "AD17", "SSTL12_DCI");
  ddram->addSubsignal("odt", "AE16", "SSTL12_DCI");
  ddram->addSubsignal("reset_n", "AB14", "LVCMOS12");

  platform->addPeriodConstraint("clk125", 1.0 / 125e6);
  return platform;
}

void
Zcu104::buildCrg(Crg *crg,
                 const SocConfig &config) const
{
  double sys_clk_freq = config.sys_clk_freq;
  crg->setPll(new UsMmcm("pll", -2, this));
  crg->requestClkin("clk125", 0, 125e6);
  crg->makePllDomain("pll4x", 4 * sys_clk_freq, 0.0, false, false);
  // IDELAYCTRL reference.
  crg->makePllDomain("clk500", 500e6, 0.0, false);
  // BUFGCE_DIV /4 and BUFGCE.
  crg->makeDerivedDomain("sys", "pll4x", 4);
  crg->makeDerivedDomain("sys4x", "pll4x", 1, true);
}

void
Zcu104::addBlocks(Soc *soc) const
{
  const SocConfig &config = soc->config();
  if (config.with_ethernet || config.with_etherbone)
    report_->error(551, "%s: Ethernet is not supported on this target.", name());
  if (config.with_hyperram)
    report_->error(552, "%s: board has no HyperRAM.", name());
  if (config.with_sdcard)
    report_->error(553, "%s: board has no SD card slot.", name());
  if (config.with_pcie)
    report_->error(554, "%s: PCIe is not supported on this target.", name());
  addIntegratedMemories(soc);
  addUart(soc);
  if (config.with_sdram && config.integrated_main_ram_size == 0)
    addSdram(soc);
  IoResource *i2c = soc->platform()->request("i2c", 0);
  soc->setI2c(new PadsBlock("i2c", "I2CMaster", {i2c}));
  addBridges(soc, 1);
  addLeds(soc);
}

void
Zcu104::addSdram(Soc *soc) const
{
  const SocConfig &config = soc->config();
  const char *module_name = config.sdram_module.c_str();
  const SdramModule *module = SdramModule::find(module_name);
  if (module == nullptr || module->type() != SdramType::ddr4)
    report_->error(550, "%s: unknown SODIMM %s, use MTA4ATF51264HZ or KVR21SE15S84.",
                   name(), module_name);
  checkUsIodelayClkFreq("USPDDRPHY", config.iodelay_clk_freq);
  IoResource *pads = soc->platform()->request("ddram", 0);
  DramPhy *phy = new DramPhy("USPDDRPHY", pads, module,
                             SdramRate::rate_1_4, 4, config.sys_clk_freq);
  soc->setDramPhy(phy);
  phy->setIodelayClkFreq(config.iodelay_clk_freq);
  phy->setL2Size(config.l2_size);
  phy->setL2MinDataWidth(128);
  addMainRam(soc, module->size());
}

} // namespace
