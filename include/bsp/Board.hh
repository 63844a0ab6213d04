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

#include <map>
#include <string>
#include <vector>

#include "BspState.hh"
#include "SocConfig.hh"
#include "PllScan.hh"

namespace bsp {

class Platform;
class Crg;
class Soc;
class Board;

using BoardSeq = std::vector<const Board*>;

// Board target: platform description, clock/reset generator recipe and
// SoC recipe.
class Board : public BspState
{
public:
  Board(const char *name,
        const char *description,
        const BspState *bsp);
  virtual ~Board() {}
  const char *name() const { return name_.c_str(); }
  const char *description() const { return description_.c_str(); }
  // Defaults of the target's command line.
  virtual void defaultConfig(SocConfig &config) const = 0;
  SocConfig defaultConfig() const;
  virtual Platform *makePlatform(const SocConfig &config) const = 0;
  // CRG for config.sys_clk_freq. Not finalized.
  Crg *makeCrg(Platform *platform,
               const SocConfig &config) const;
  // Legal system clock range. Returns false when unconstrained.
  virtual bool sysClkRange(double &min,
                           double &max) const;
  // Validate config, build and finalize the CRG and wire the blocks
  // config enables. The caller owns the result.
  Soc *composeSoc(const SocConfig &config) const;
  // Scan sys_clk_freq over [fmin, fmax) with the CRG recipe and
  // config's other clocks.
  PllScanResultSeq scanPll(const SocConfig &config,
                           double fmin,
                           double fmax,
                           double fstep,
                           bool report_results) const;

protected:
  virtual void checkConfig(const SocConfig &config) const;
  // Add the PLL, clock domains and pin requests to crg.
  virtual void buildCrg(Crg *crg,
                        const SocConfig &config) const = 0;
  virtual void addBlocks(Soc *soc) const = 0;
  // Build a CRG for sys_clk_freq and finalize it.
  void scanTrial(const SocConfig &config,
                 double sys_clk_freq) const;

  // Helpers shared by the board recipes.
  void addIntegratedMemories(Soc *soc) const;
  void addUart(Soc *soc) const;
  void addMainRam(Soc *soc,
                  long long sdram_size) const;
  void addEthernet(Soc *soc,
                   const char *phy_name,
                   double rx_delay,
                   bool uses_iodelay) const;
  void addLeds(Soc *soc) const;
  void addBridges(Soc *soc,
                  int uartbone_serial) const;
  // 7-series IDELAYCTRL reference.
  void checkIodelayClkFreq(const char *phy_name,
                           double freq) const;
  // UltraScale+ IDELAYCTRL reference.
  void checkUsIodelayClkFreq(const char *phy_name,
                             double freq) const;

  std::string name_;
  std::string description_;
};

// Registry of the supported boards.
class Boards : public BspState
{
public:
  explicit Boards(const BspState *bsp);
  ~Boards();
  const Board *find(const char *name) const;
  // Errors for unknown boards.
  const Board *findOrError(const char *name) const;
  // Sorted by name.
  BoardSeq boards() const;
  void addBoard(Board *board);

private:
  std::map<std::string, Board*> board_map_;
};

} // namespace
