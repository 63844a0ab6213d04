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

#include "Board.hh"

#include <cmath>

#include "Report.hh"
#include "Debug.hh"
#include "Fuzzy.hh"
#include "Pll.hh"
#include "Crg.hh"
#include "Platform.hh"
#include "Soc.hh"
#include "platform/Boards.hh"

namespace bsp {

Board::Board(const char *name,
             const char *description,
             const BspState *bsp) :
  BspState(bsp),
  name_(name),
  description_(description)
{
}

SocConfig
Board::defaultConfig() const
{
  SocConfig config;
  defaultConfig(config);
  return config;
}

bool
Board::sysClkRange(double &,
                   double &) const
{
  return false;
}

void
Board::checkConfig(const SocConfig &config) const
{
  if (config.sys_clk_freq <= 0.0)
    report_->error(510, "%s: sys_clk_freq must be positive.", name());
  if (config.with_ethernet && config.with_etherbone)
    report_->error(512, "%s: ethernet and etherbone are mutually exclusive.",
                   name());
  if (config.with_etherbone && config.eth_dynamic_ip)
    report_->error(513, "%s: dynamic IP is not supported with etherbone.",
                   name());
  if (config.l2_size < 0)
    report_->error(514, "%s: negative L2 size %d.", name(), config.l2_size);
}

Crg *
Board::makeCrg(Platform *platform,
               const SocConfig &config) const
{
  // Scans see this too, so an out of range candidate stops the scan.
  double min, max;
  if (sysClkRange(min, max)
      && (config.sys_clk_freq < min || config.sys_clk_freq > max))
    report_->error(511, "%s: sys_clk_freq %.2f MHz outside %.2f-%.2f MHz.",
                   name(),
                   config.sys_clk_freq / 1e6,
                   min / 1e6,
                   max / 1e6);
  Crg *crg = new Crg(platform, this);
  try {
    buildCrg(crg, config);
  }
  catch (...) {
    delete crg;
    throw;
  }
  return crg;
}

Soc *
Board::composeSoc(const SocConfig &config) const
{
  checkConfig(config);
  Platform *platform = makePlatform(config);
  Soc *soc = new Soc(platform, config, this);
  try {
    Crg *crg = makeCrg(platform, config);
    soc->setCrg(crg);
    try {
      crg->finalize();
    }
    catch (const PllNoConfig &) {
      report_->error(515, "%s: no PLL configuration for sys_clk_freq %.2f MHz.",
                     name(),
                     config.sys_clk_freq / 1e6);
    }
    addBlocks(soc);
  }
  catch (...) {
    delete soc;
    throw;
  }
  debugPrint(debug_, "soc", 1, "%s composed, %zu regions",
             name(), soc->memoryRegions().size());
  return soc;
}

void
Board::scanTrial(const SocConfig &config,
                 double sys_clk_freq) const
{
  SocConfig trial_config = config;
  trial_config.sys_clk_freq = sys_clk_freq;
  Platform *platform = makePlatform(trial_config);
  Crg *crg = nullptr;
  try {
    crg = makeCrg(platform, trial_config);
    crg->finalize();
  }
  catch (...) {
    delete crg;
    delete platform;
    throw;
  }
  delete crg;
  delete platform;
}

PllScanResultSeq
Board::scanPll(const SocConfig &config,
               double fmin,
               double fmax,
               double fstep,
               bool report_results) const
{
  PllScan scan(this);
  PllScanTrial trial = [this, &config] (double sys_clk_freq) {
    scanTrial(config, sys_clk_freq);
  };
  if (report_results)
    return scan.scanAndReport(fmin, fmax, fstep, trial);
  else
    return scan.scan(fmin, fmax, fstep, trial);
}

////////////////////////////////////////////////////////////////

void
Board::addIntegratedMemories(Soc *soc) const
{
  const SocConfig &config = soc->config();
  if (config.integrated_rom_size > 0)
    soc->addMemoryRegion("rom", Soc::rom_origin,
                         config.integrated_rom_size, true);
  if (config.integrated_sram_size > 0)
    soc->addMemoryRegion("sram", Soc::sram_origin,
                         config.integrated_sram_size, true);
  if (config.integrated_main_ram_size > 0)
    soc->addMemoryRegion("main_ram", Soc::main_ram_origin,
                         config.integrated_main_ram_size, true);
  soc->addMemoryRegion("csr", Soc::csr_origin, Soc::csr_size, false);
}

void
Board::addUart(Soc *soc) const
{
  IoResource *serial = soc->platform()->request("serial", 0);
  soc->setUart(new PadsBlock("uart", "UART", {serial}));
}

void
Board::addMainRam(Soc *soc,
                  long long sdram_size) const
{
  uint64_t size = static_cast<uint64_t>(sdram_size);
  if (size > Soc::main_ram_size_max)
    size = Soc::main_ram_size_max;
  soc->addMemoryRegion("main_ram", Soc::main_ram_origin, size, true);
}

void
Board::addEthernet(Soc *soc,
                   const char *phy_name,
                   double rx_delay,
                   bool uses_iodelay) const
{
  const SocConfig &config = soc->config();
  if (config.with_ethernet || config.with_etherbone) {
    Platform *platform = soc->platform();
    IoResource *clock_pads = platform->request("eth_clocks", 0);
    IoResource *pads = platform->request("eth", 0);
    EthMode mode = config.with_etherbone ? EthMode::etherbone : EthMode::ethernet;
    EthPhy *phy = new EthPhy(phy_name, clock_pads, pads, mode);
    soc->setEthPhy(phy);
    phy->setRxDelay(rx_delay);
    if (uses_iodelay) {
      checkIodelayClkFreq(phy_name, config.iodelay_clk_freq);
      phy->setIodelayClkFreq(config.iodelay_clk_freq);
    }
    if (mode == EthMode::ethernet) {
      phy->setDynamicIp(config.eth_dynamic_ip);
      soc->addMemoryRegion("ethmac", Soc::ethmac_origin, Soc::ethmac_size, false);
    }
    else
      phy->setIpAddress(config.eth_ip.c_str());
  }
}

void
Board::addLeds(Soc *soc) const
{
  if (soc->config().with_leds) {
    IoResourceSeq leds = soc->platform()->requestAll("user_led");
    if (leds.empty())
      report_->error(516, "%s: no user_led resources.", name());
    soc->setLeds(new PadsBlock("leds", "LedChaser", leds));
  }
}

void
Board::addBridges(Soc *soc,
                  int uartbone_serial) const
{
  const SocConfig &config = soc->config();
  if (config.with_jtagbone)
    soc->addBridge(new DebugBridge(BridgeKind::jtag, nullptr, 0.0));
  if (config.with_uartbone) {
    IoResource *serial = soc->platform()->request("serial", uartbone_serial);
    soc->addBridge(new DebugBridge(BridgeKind::uart, serial, 1e6));
  }
}

void
Board::checkIodelayClkFreq(const char *phy_name,
                           double freq) const
{
  if (!(fuzzyEqual(freq, 200e6)
        || fuzzyEqual(freq, 300e6)
        || fuzzyEqual(freq, 400e6)))
    report_->error(517, "%s: %s IODELAY reference %.2f MHz must be 200, 300 or 400 MHz.",
                   name(), phy_name, freq / 1e6);
}

void
Board::checkUsIodelayClkFreq(const char *phy_name,
                             double freq) const
{
  if (freq < 300e6 || freq > 800e6)
    report_->error(519, "%s: %s IODELAY reference %.2f MHz must be 300-800 MHz.",
                   name(), phy_name, freq / 1e6);
}

////////////////////////////////////////////////////////////////

Boards::Boards(const BspState *bsp) :
  BspState(bsp)
{
  addBoard(makeLpddr4TestBoard(this));
  addBoard(makeAntmicroLpddr4TestBoard(this));
  addBoard(makeDigilentArty(this));
  addBoard(makeEcp5DcScm(this));
  addBoard(makeZcu104(this));
  addBoard(makeArtixDcScm(this));
  addBoard(makeForestKitten33(this));
}

Boards::~Boards()
{
  for (auto &name_board : board_map_)
    delete name_board.second;
}

void
Boards::addBoard(Board *board)
{
  auto find_iter = board_map_.find(board->name());
  if (find_iter != board_map_.end()) {
    delete find_iter->second;
    find_iter->second = board;
  }
  else
    board_map_[board->name()] = board;
}

const Board *
Boards::find(const char *name) const
{
  auto find_iter = board_map_.find(name);
  if (find_iter != board_map_.end())
    return find_iter->second;
  return nullptr;
}

const Board *
Boards::findOrError(const char *name) const
{
  const Board *board = find(name);
  if (board == nullptr)
    report_->error(518, "unknown board %s.", name);
  return board;
}

BoardSeq
Boards::boards() const
{
  BoardSeq boards;
  for (auto &name_board : board_map_)
    boards.push_back(name_board.second);
  return boards;
}

} // namespace
