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

#include "BspState.hh"
#include "SocConfig.hh"
#include "PllScan.hh"
#include "SocSummary.hh"

struct Tcl_Interp;

namespace bsp {

class Board;
class Boards;
class Soc;

// Delete the Bsp singleton.
void
deleteAllMemory();

// Top level object. Owns the report, debug and units components, the
// board registry and the most recently composed SoC.
class Bsp : public BspState
{
public:
  Bsp();
  virtual ~Bsp();
  // Singleton used by the Tcl commands.
  static Bsp *bsp();
  static void setBsp(Bsp *bsp);
  virtual void makeComponents();
  Tcl_Interp *tclInterp() const { return tcl_interp_; }
  void setTclInterp(Tcl_Interp *interp);

  const Boards *boards() const { return boards_; }
  // Errors for unknown boards.
  const Board *findBoard(const char *name) const;
  SocConfig defaultConfig(const char *board_name) const;

  // Compose config.board and make it the current SoC.
  Soc *composeSoc(const SocConfig &config);
  Soc *soc() const { return soc_; }
  // Errors when nothing has been composed.
  Soc *ensureSoc() const;
  SocSummary socSummary() const;
  void reportSoc() const;
  void writeConstraints(const char *filename) const;
  // "<dir>/<board>.xdc" or ".lpf".
  std::string constraintsFilename(const char *dir) const;

  PllScanResultSeq scanPll(const SocConfig &config,
                           double fmin,
                           double fmax,
                           double fstep,
                           bool report_results) const;
  void setDebugLevel(const char *what,
                     int level);

protected:
  virtual void makeReport();
  virtual void makeDebug();
  virtual void makeUnits();
  virtual void makeBoards();

  Tcl_Interp *tcl_interp_;
  Boards *boards_;
  Soc *soc_;

private:
  static Bsp *bsp_;
};

} // namespace
