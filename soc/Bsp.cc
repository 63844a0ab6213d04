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

#include "Bsp.hh"

#include "Report.hh"
#include "ReportTcl.hh"
#include "Debug.hh"
#include "Units.hh"
#include "Board.hh"
#include "Platform.hh"
#include "Soc.hh"
#include "StringUtil.hh"
#include "WriteConstraints.hh"

namespace bsp {

void
deleteAllMemory()
{
  Bsp *bsp = Bsp::bsp();
  if (bsp) {
    delete bsp;
    Bsp::setBsp(nullptr);
  }
}

////////////////////////////////////////////////////////////////

Bsp *Bsp::bsp_;

Bsp::Bsp() :
  BspState(),
  tcl_interp_(nullptr),
  boards_(nullptr),
  soc_(nullptr)
{
}

void
Bsp::makeComponents()
{
  makeReport();
  makeDebug();
  makeUnits();
  makeBoards();
}

void
Bsp::makeReport()
{
  report_ = new ReportTcl();
}

void
Bsp::makeDebug()
{
  debug_ = new Debug(report_);
}

void
Bsp::makeUnits()
{
  units_ = new Units();
}

void
Bsp::makeBoards()
{
  boards_ = new Boards(this);
}

void
Bsp::setBsp(Bsp *bsp)
{
  bsp_ = bsp;
}

Bsp *
Bsp::bsp()
{
  return bsp_;
}

Bsp::~Bsp()
{
  // The SoC and boards print through the report, delete them first.
  delete soc_;
  delete boards_;
  delete units_;
  delete debug_;
  delete report_;
}

void
Bsp::setTclInterp(Tcl_Interp *interp)
{
  tcl_interp_ = interp;
  report_->setTclInterp(interp);
}

const Board *
Bsp::findBoard(const char *name) const
{
  return boards_->findOrError(name);
}

SocConfig
Bsp::defaultConfig(const char *board_name) const
{
  return findBoard(board_name)->defaultConfig();
}

Soc *
Bsp::composeSoc(const SocConfig &config)
{
  const Board *board = findBoard(config.board.c_str());
  Soc *soc = board->composeSoc(config);
  delete soc_;
  soc_ = soc;
  return soc_;
}

Soc *
Bsp::ensureSoc() const
{
  if (soc_ == nullptr)
    report_->error(620, "no SoC has been composed.");
  return soc_;
}

SocSummary
Bsp::socSummary() const
{
  return bsp::socSummary(ensureSoc());
}

void
Bsp::reportSoc() const
{
  reportSocSummary(socSummary(), report_, units_);
}

void
Bsp::writeConstraints(const char *filename) const
{
  bsp::writeConstraints(ensureSoc(), filename, this);
}

std::string
Bsp::constraintsFilename(const char *dir) const
{
  const Soc *soc = ensureSoc();
  const Platform *platform = soc->platform();
  return stdstrPrint("%s/%s.%s", dir, soc->board(),
                     constraintsExtension(platform->family()));
}

PllScanResultSeq
Bsp::scanPll(const SocConfig &config,
             double fmin,
             double fmax,
             double fstep,
             bool report_results) const
{
  const Board *board = findBoard(config.board.c_str());
  return board->scanPll(config, fmin, fmax, fstep, report_results);
}

void
Bsp::setDebugLevel(const char *what,
                   int level)
{
  debug_->setLevel(what, level);
}

} // namespace
