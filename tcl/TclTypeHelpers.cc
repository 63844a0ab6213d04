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

#include "TclTypeHelpers.hh"

namespace bsp {

bool
tclListSeqStdString(Tcl_Obj *const source,
                    Tcl_Interp *interp,
                    StringSeq &seq)
{
  Tcl_Size argc;
  Tcl_Obj **argv;

  if (Tcl_ListObjGetElements(interp, source, &argc, &argv) == TCL_OK) {
    for (int i = 0; i < argc; i++) {
      Tcl_Size length;
      const char *str = Tcl_GetStringFromObj(argv[i], &length);
      seq.push_back(str);
    }
    return true;
  }
  else
    return false;
}

Tcl_Obj *
tclStringSeqList(const StringSeq &seq)
{
  Tcl_Obj *list = Tcl_NewListObj(0, nullptr);
  for (const std::string &str : seq) {
    Tcl_Obj *obj = Tcl_NewStringObj(str.c_str(), str.size());
    Tcl_ListObjAppendElement(nullptr, list, obj);
  }
  return list;
}

Tcl_Obj *
tclFreqSeqList(const FreqSeq &freqs)
{
  Tcl_Obj *list = Tcl_NewListObj(0, nullptr);
  for (double freq : freqs)
    Tcl_ListObjAppendElement(nullptr, list, Tcl_NewDoubleObj(freq));
  return list;
}

int
tclArgError(Tcl_Interp *interp,
            int /* id */,
            const char *msg,
            const char *arg)
{
  // Same text Report::error would throw.
  std::string error_msg = stdstrPrint("%s %s.", msg, arg);
  Tcl_SetObjResult(interp, Tcl_NewStringObj(error_msg.c_str(),
                                            error_msg.size()));
  return TCL_ERROR;
}

bool
tclDoubleArg(Tcl_Interp *interp,
             Tcl_Obj *obj,
             const char *arg_name,
             double &value)
{
  if (Tcl_GetDoubleFromObj(nullptr, obj, &value) == TCL_OK)
    return true;
  else {
    std::string msg = stdstrPrint("%s is not a number:", arg_name);
    tclArgError(interp, 710, msg.c_str(), Tcl_GetString(obj));
    return false;
  }
}

} // namespace
