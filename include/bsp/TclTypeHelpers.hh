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

#include <tcl.h>

#include "StringUtil.hh"
#include "PllScan.hh"

namespace bsp {

#if TCL_MAJOR_VERSION < 9
    typedef int Tcl_Size;
#endif

// Elements of a Tcl list. Returns false when source is not a list.
bool
tclListSeqStdString(Tcl_Obj *const source,
                    Tcl_Interp *interp,
                    // Return value.
                    StringSeq &seq);
Tcl_Obj *
tclStringSeqList(const StringSeq &seq);
Tcl_Obj *
tclFreqSeqList(const FreqSeq &freqs);

// Set the interp result to an error message for arg and return TCL_ERROR.
int
tclArgError(Tcl_Interp *interp,
            int id,
            const char *msg,
            const char *arg);
// Parse a double argument, setting an error result on failure.
bool
tclDoubleArg(Tcl_Interp *interp,
             Tcl_Obj *obj,
             const char *arg_name,
             // Return value.
             double &value);

} // namespace
