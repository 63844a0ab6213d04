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

#include "BspConfig.hh"  // BSP_VERSION

#include <stdio.h>
#include <cstdlib>              // exit
#include <filesystem>
#include <tcl.h>
#if TCL_READLINE
  #include <tclreadline.h>
#endif

#include "StringUtil.hh"
#include "Bsp.hh"
#include "BspTcl.hh"
#include "BspMain.hh"

using std::string;
using bsp::stringEq;
using bsp::findCmdLineFlag;
using bsp::Bsp;
using bsp::sourceTclFile;
using bsp::bspBoardMain;
using bsp::showBoardUsage;

static int cmd_argc;
static char **cmd_argv;
static const char *init_filename = ".bsp";

static void
showUsage(const char *prog,
          const char *init_filename);
static int
tclAppInit(Tcl_Interp *interp);
static int
bspTclAppInit(int argc,
              char *argv[],
              const char *init_filename,
              Tcl_Interp *interp);
static Bsp *
makeBsp();
static bool
isBoardCmdLine(int argc,
               char *argv[]);

int
main(int argc,
     char *argv[])
{
  if (argc == 2 && stringEq(argv[1], "-help")) {
    showUsage(argv[0], init_filename);
    return 0;
  }
  else if (argc == 2 && stringEq(argv[1], "-version")) {
    printf("%s\n", BSP_VERSION);
    return 0;
  }
  else if (isBoardCmdLine(argc, argv)) {
    Bsp *bsp = makeBsp();
    int exit_code = bspBoardMain(bsp, argc, argv);
    bsp::deleteAllMemory();
    return exit_code;
  }
  else {
    // Set argc to 1 so Tcl_Main doesn't source any files.
    // Tcl_Main never returns.
    cmd_argc = argc;
    cmd_argv = argv;
    Tcl_Main(1, argv, tclAppInit);
    return 0;
  }
}

static bool
isBoardCmdLine(int argc,
               char *argv[])
{
  for (int i = 1; i < argc; i++) {
    if (stringEq(argv[i], "--board"))
      return true;
  }
  return false;
}

static Bsp *
makeBsp()
{
  Bsp *bsp = new Bsp;
  Bsp::setBsp(bsp);
  bsp->makeComponents();
  return bsp;
}

static int
tclAppInit(Tcl_Interp *interp)
{
  return bspTclAppInit(cmd_argc, cmd_argv, init_filename, interp);
}

// Tcl init executed inside Tcl_Main.
static int
bspTclAppInit(int argc,
              char *argv[],
              const char *init_filename,
              Tcl_Interp *interp)
{
  // source init.tcl
  if (Tcl_Init(interp) == TCL_ERROR)
    return TCL_ERROR;

#if TCL_READLINE
  if (Tclreadline_Init(interp) == TCL_ERROR)
    return TCL_ERROR;
  Tcl_StaticPackage(interp, "tclreadline", Tclreadline_Init, Tclreadline_SafeInit);
  if (Tcl_EvalFile(interp, TCLRL_LIBRARY "/tclreadlineInit.tcl") != TCL_OK)
    printf("Failed to load tclreadline.tcl\n");
#endif

  Bsp *bsp = makeBsp();
  bsp->setTclInterp(interp);
  if (Bsp_Init(interp) == TCL_ERROR)
    return TCL_ERROR;

  if (!findCmdLineFlag(argc, argv, "-no_init")) {
    const char *home = getenv("HOME");
    if (home) {
      string init_path = home;
      init_path += "/";
      init_path += init_filename;
      if (std::filesystem::is_regular_file(init_path))
        sourceTclFile(init_path.c_str(), interp);
    }
  }

  bool exit_after_cmd_file = findCmdLineFlag(argc, argv, "-exit");

  if (argc > 2
      || (argc > 1 && argv[1][0] == '-')) {
    showUsage(argv[0], init_filename);
    exit(1);
  }
  else {
    if (argc == 2) {
      char *cmd_file = argv[1];
      if (cmd_file) {
        int result = sourceTclFile(cmd_file, interp);
        if (result != TCL_OK)
          fprintf(stderr, "Error: %s\n", Tcl_GetStringResult(interp));
        if (exit_after_cmd_file) {
          int exit_code = (result == TCL_OK) ? EXIT_SUCCESS : EXIT_FAILURE;
          exit(exit_code);
        }
      }
    }
  }
#if TCL_READLINE
  return Tcl_Eval(interp, "::tclreadline::Loop");
#else
  return TCL_OK;
#endif
}

static void
showUsage(const char *prog,
          const char *init_filename)
{
  printf("Usage: %s [-help] [-version] [-no_init] [-exit] cmd_file\n", prog);
  printf("  -help              show help and exit\n");
  printf("  -version           show version and exit\n");
  printf("  -no_init           do not read %s init file\n", init_filename);
  printf("  -exit              exit after reading cmd_file\n");
  printf("  cmd_file           source cmd_file\n");
  printf("\n");
  showBoardUsage(prog);
}
