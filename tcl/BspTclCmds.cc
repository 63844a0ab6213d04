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

#include "BspTcl.hh"

#include <tcl.h>
#include <exception>
#include <vector>

#include "BspConfig.hh"  // BSP_VERSION
#include "StringUtil.hh"
#include "Report.hh"
#include "Bsp.hh"
#include "Board.hh"
#include "TclTypeHelpers.hh"

namespace bsp {

static int
tclError(Tcl_Interp *interp,
         const std::exception &error)
{
  Tcl_SetObjResult(interp, Tcl_NewStringObj(error.what(), -1));
  return TCL_ERROR;
}

static int
wrongArgs(Tcl_Interp *interp,
          Tcl_Obj *const objv[],
          const char *usage)
{
  Tcl_WrongNumArgs(interp, 1, objv, usage);
  return TCL_ERROR;
}

// Apply -flag and -key value options to config.
static bool
parseConfigArgs(Tcl_Interp *interp,
                int objc,
                Tcl_Obj *const objv[],
                int first,
                Report *report,
                SocConfig &config)
{
  for (int i = first; i < objc; i++) {
    const char *arg = Tcl_GetString(objv[i]);
    if (arg[0] != '-') {
      tclArgError(interp, 700, "positional argument not allowed:", arg);
      return false;
    }
    const char *name = arg + 1;
    if (config.setFlag(name))
      continue;
    if (i + 1 < objc
        && config.setOption(name, Tcl_GetString(objv[i + 1]), report)) {
      i++;
      continue;
    }
    tclArgError(interp, 701, "unknown or incomplete option", arg);
    return false;
  }
  return true;
}

static int
listBoardsCmd(ClientData client_data,
              Tcl_Interp *interp,
              int objc,
              Tcl_Obj *const objv[])
{
  if (objc != 1)
    return wrongArgs(interp, objv, "");
  Bsp *bsp = static_cast<Bsp*>(client_data);
  StringSeq names;
  for (const Board *board : bsp->boards()->boards())
    names.push_back(board->name());
  Tcl_SetObjResult(interp, tclStringSeqList(names));
  return TCL_OK;
}

static int
composeSocCmd(ClientData client_data,
              Tcl_Interp *interp,
              int objc,
              Tcl_Obj *const objv[])
{
  if (objc < 2)
    return wrongArgs(interp, objv, "board ?options?");
  Bsp *bsp = static_cast<Bsp*>(client_data);
  try {
    SocConfig config = bsp->defaultConfig(Tcl_GetString(objv[1]));
    if (!parseConfigArgs(interp, objc, objv, 2, bsp->report(), config))
      return TCL_ERROR;
    bsp->composeSoc(config);
    Tcl_SetObjResult(interp, Tcl_NewStringObj(config.board.c_str(), -1));
  }
  catch (const std::exception &error) {
    return tclError(interp, error);
  }
  return TCL_OK;
}

static int
reportSocCmd(ClientData client_data,
             Tcl_Interp *interp,
             int objc,
             Tcl_Obj *const objv[])
{
  if (objc != 1)
    return wrongArgs(interp, objv, "");
  Bsp *bsp = static_cast<Bsp*>(client_data);
  try {
    bsp->reportSoc();
  }
  catch (const std::exception &error) {
    return tclError(interp, error);
  }
  return TCL_OK;
}

static int
writeConstraintsCmd(ClientData client_data,
                    Tcl_Interp *interp,
                    int objc,
                    Tcl_Obj *const objv[])
{
  if (objc != 2)
    return wrongArgs(interp, objv, "filename");
  Bsp *bsp = static_cast<Bsp*>(client_data);
  try {
    bsp->writeConstraints(Tcl_GetString(objv[1]));
  }
  catch (const std::exception &error) {
    return tclError(interp, error);
  }
  return TCL_OK;
}

static int
scanPllCmd(ClientData client_data,
           Tcl_Interp *interp,
           int objc,
           Tcl_Obj *const objv[])
{
  if (objc < 5)
    return wrongArgs(interp, objv, "board fmin fmax fstep ?options?");
  Bsp *bsp = static_cast<Bsp*>(client_data);
  double fmin, fmax, fstep;
  if (!tclDoubleArg(interp, objv[2], "fmin", fmin)
      || !tclDoubleArg(interp, objv[3], "fmax", fmax)
      || !tclDoubleArg(interp, objv[4], "fstep", fstep))
    return TCL_ERROR;
  try {
    SocConfig config = bsp->defaultConfig(Tcl_GetString(objv[1]));
    if (!parseConfigArgs(interp, objc, objv, 5, bsp->report(), config))
      return TCL_ERROR;
    PllScanResultSeq results = bsp->scanPll(config, fmin, fmax, fstep, true);
    Tcl_SetObjResult(interp, tclFreqSeqList(PllScan::foundFreqs(results)));
  }
  catch (const std::exception &error) {
    return tclError(interp, error);
  }
  return TCL_OK;
}

static int
setDebugCmd(ClientData client_data,
            Tcl_Interp *interp,
            int objc,
            Tcl_Obj *const objv[])
{
  if (objc != 3)
    return wrongArgs(interp, objv, "what level");
  Bsp *bsp = static_cast<Bsp*>(client_data);
  int level;
  if (Tcl_GetIntFromObj(interp, objv[2], &level) != TCL_OK)
    return TCL_ERROR;
  bsp->setDebugLevel(Tcl_GetString(objv[1]), level);
  return TCL_OK;
}

static int
logBeginCmd(ClientData client_data,
            Tcl_Interp *interp,
            int objc,
            Tcl_Obj *const objv[])
{
  if (objc != 2)
    return wrongArgs(interp, objv, "filename");
  Bsp *bsp = static_cast<Bsp*>(client_data);
  try {
    bsp->report()->logBegin(Tcl_GetString(objv[1]));
  }
  catch (const std::exception &error) {
    return tclError(interp, error);
  }
  return TCL_OK;
}

static int
logEndCmd(ClientData client_data,
          Tcl_Interp *interp,
          int objc,
          Tcl_Obj *const objv[])
{
  if (objc != 1)
    return wrongArgs(interp, objv, "");
  Bsp *bsp = static_cast<Bsp*>(client_data);
  bsp->report()->logEnd();
  return TCL_OK;
}

// suppress_msg and unsuppress_msg take a list of warning ids.
static int
setMsgSuppressed(ClientData client_data,
                 Tcl_Interp *interp,
                 int objc,
                 Tcl_Obj *const objv[],
                 bool suppress)
{
  if (objc != 2)
    return wrongArgs(interp, objv, "msg_ids");
  Bsp *bsp = static_cast<Bsp*>(client_data);
  Tcl_Size id_count;
  Tcl_Obj **id_objs;
  if (Tcl_ListObjGetElements(interp, objv[1], &id_count, &id_objs) != TCL_OK)
    return TCL_ERROR;
  std::vector<int> ids;
  for (Tcl_Size i = 0; i < id_count; i++) {
    int id;
    if (Tcl_GetIntFromObj(interp, id_objs[i], &id) != TCL_OK)
      return TCL_ERROR;
    ids.push_back(id);
  }
  Report *report = bsp->report();
  for (int id : ids) {
    if (suppress)
      report->suppressMsgId(id);
    else
      report->unsuppressMsgId(id);
  }
  return TCL_OK;
}

static int
suppressMsgCmd(ClientData client_data,
               Tcl_Interp *interp,
               int objc,
               Tcl_Obj *const objv[])
{
  return setMsgSuppressed(client_data, interp, objc, objv, true);
}

static int
unsuppressMsgCmd(ClientData client_data,
                 Tcl_Interp *interp,
                 int objc,
                 Tcl_Obj *const objv[])
{
  return setMsgSuppressed(client_data, interp, objc, objv, false);
}

class BspTclCmd
{
public:
  const char *name;
  Tcl_ObjCmdProc *proc;
};

static const BspTclCmd bsp_tcl_cmds[] = {
  {"list_boards", listBoardsCmd},
  {"compose_soc", composeSocCmd},
  {"report_soc", reportSocCmd},
  {"write_constraints", writeConstraintsCmd},
  {"scan_pll", scanPllCmd},
  {"set_debug", setDebugCmd},
  {"log_begin", logBeginCmd},
  {"log_end", logEndCmd},
  {"suppress_msg", suppressMsgCmd},
  {"unsuppress_msg", unsuppressMsgCmd},
  {nullptr, nullptr}
};

} // namespace

using bsp::Bsp;
using bsp::bsp_tcl_cmds;
using bsp::BspTclCmd;
using bsp::stdstrPrint;

extern "C" {

int
Bsp_Init(Tcl_Interp *interp)
{
  Bsp *bsp = Bsp::bsp();
  if (bsp == nullptr) {
    Tcl_SetObjResult(interp, Tcl_NewStringObj("bsp is not initialized.", -1));
    return TCL_ERROR;
  }
  if (Tcl_Eval(interp, "namespace eval bsp {}") != TCL_OK)
    return TCL_ERROR;
  for (const BspTclCmd *cmd = bsp_tcl_cmds; cmd->name; cmd++) {
    std::string cmd_name = stdstrPrint("::bsp::%s", cmd->name);
    Tcl_CreateObjCommand(interp, cmd_name.c_str(), cmd->proc, bsp, nullptr);
  }
  if (Tcl_Eval(interp, "namespace eval bsp { namespace export * }\n"
               "namespace import -force bsp::*") != TCL_OK)
    return TCL_ERROR;
  return Tcl_PkgProvide(interp, "bsp", BSP_VERSION);
}

}
