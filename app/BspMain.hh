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

struct Tcl_Interp;

namespace bsp {

class Bsp;

// Remove flag from argv when present.
bool
findCmdLineFlag(int &argc,
                char *argv[],
                const char *flag);
// Remove key and its value from argv and return the value.
char *
findCmdLineKey(int &argc,
               char *argv[],
               const char *key);
// Remove key and its nvalues values. Returns false if key is missing
// or has too few values.
bool
findCmdLineKeyValues(int &argc,
                     char *argv[],
                     const char *key,
                     int nvalues,
                     // Return values.
                     char *values[]);

int
sourceTclFile(const char *filename,
              Tcl_Interp *interp);

// Board target command line (--board name ...).
// Returns the process exit code.
int
bspBoardMain(Bsp *bsp,
             int argc,
             char *argv[]);
void
showBoardUsage(const char *prog);

} // namespace
