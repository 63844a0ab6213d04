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
#include "clock/XilinxPll.hh"

namespace bsp {

// Fidus/Xilinx Forest Kitten 33 (Virtex UltraScale+ xcvu33p) with main
// RAM in the in-package HBM2.
class ForestKitten33 : public Board
{
public:
  explicit ForestKitten33(const BspState *bsp);
  void defaultConfig(SocConfig &config) const override;
  Platform *makePlatform(const SocConfig &config) const override;
  bool sysClkRange(double &min,
                   double &max) const override;

protected:
  void buildCrg(Crg *crg,
                const SocConfig &config) const override;
  void addBlocks(Soc *soc) const override;

  // Two 4 GiB stacks.
  static constexpr long long hbm_size = 8LL << 30;
};

Board *
makeForestKitten33(const BspState *bsp)
{
  return new ForestKitten33(bsp);
}

ForestKitten33::ForestKitten33(const BspState *bsp) :
  Board("forest_kitten_33", "Forest Kitten 33", bsp)
{
}

void
ForestKitten33::defaultConfig(SocConfig &config) const
{
  config.board = name();
  config.sys_clk_freq = 450e6;
  config.integrated_main_ram_size = 0;
  config.with_sdram = false;
  config.with_leds = true;
}

bool
ForestKitten33::sysClkRange(double &min,
                            double &max) const
{
  // HBM AXI ports run on sys.
  min = 225e6;
  max = 450e6;
  return true;
}

Platform *
ForestKitten33::makePlatform(const SocConfig &config) const
{
  Platform *platform = new Platform(name(), "xcvu33p-fsvh2104-2L-e",
                                    VendorFamily::xilinx_usplus,
                                    config.toolchain.c_str(), this);
  platform->setDefaultClk("clk200", 1.0 / 200e6);
  IoResource *clk200 = platform->addResource("clk200", 0, nullptr,
                                             "DIFF_SSTL12");
  clk200->addSubsignal("p", "BJ4");
  clk200->addSubsignal("n", "BK3");

  const char *led_pins[] = {"BD8", "BD7", "BE8", "BA8", "BB8", "BC7", "BA7"};
  int led_index = 0;
  for (const char *pin : led_pins)
    platform->addResource("user_led", led_index++, pin, "LVCMOS18");

  IoResource *serial = platform->addResource("serial", 0, nullptr, "LVCMOS18");
  serial->addSubsignal("rx", "BF18");
  serial->addSubsignal("tx", "BB20");

  platform->addPeriodConstraint("clk200", 1.0 / 200e6);
  return platform;
}

void
ForestKitten33::buildCrg(Crg *crg,
                         const SocConfig &config) const
{
  crg->setPll(new UsMmcm("pll", -2, this));
  crg->requestClkin("clk200", 0, 200e6);
  crg->makePllDomain("sys", config.sys_clk_freq);
  crg->makePllDomain("hbm_ref", 100e6);
  crg->makePllDomain("apb", 100e6);
}

void
ForestKitten33::addBlocks(Soc *soc) const
{
  const SocConfig &config = soc->config();
  if (config.with_ethernet || config.with_etherbone)
    report_->error(570, "%s: Ethernet is not supported on this target.", name());
  if (config.with_sdram)
    report_->error(571, "%s: main RAM is HBM, board has no SDRAM.", name());
  if (config.with_pcie)
    report_->error(572, "%s: PCIe is not supported on this target.", name());
  if (config.with_hyperram)
    report_->error(573, "%s: board has no HyperRAM.", name());
  if (config.with_sdcard)
    report_->error(574, "%s: board has no SD card slot.", name());
  addIntegratedMemories(soc);
  addUart(soc);
  if (config.integrated_main_ram_size == 0) {
    // AXI bridge address width limits the window to main_ram_size_max.
    soc->setHbm(new PadsBlock("hbm", "HBMIP", {}));
    addMainRam(soc, hbm_size);
  }
  addBridges(soc, 0);
  addLeds(soc);
}

} // namespace
