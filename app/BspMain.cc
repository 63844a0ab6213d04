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

#include "BspMain.hh"

#include <tcl.h>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <filesystem>
#include <system_error>

#include "StringUtil.hh"
#include "Error.hh"
#include "Report.hh"
#include "Bsp.hh"

namespace bsp {

bool
findCmdLineFlag(int &argc,
                char *argv[],
                const char *flag)
{
  for (int i = 1; i < argc; i++) {
    char *arg = argv[i];
    if (stringEq(arg, flag)) {
      // remove flag from argv.
      for (int j = i + 1; j < argc; j++, i++)
        argv[i] = argv[j];
      argc--;
      return true;
    }
  }
  return false;
}

char *
findCmdLineKey(int &argc,
               char *argv[],
               const char *key)
{
  char *value;
  if (findCmdLineKeyValues(argc, argv, key, 1, &value))
    return value;
  return nullptr;
}

bool
findCmdLineKeyValues(int &argc,
                     char *argv[],
                     const char *key,
                     int nvalues,
                     char *values[])
{
  for (int i = 1; i < argc; i++) {
    char *arg = argv[i];
    if (stringEq(arg, key) && i + nvalues < argc) {
      for (int v = 0; v < nvalues; v++)
        values[v] = argv[i + 1 + v];
      // remove key and values from argv.
      for (int j = i + 1 + nvalues; j < argc; j++, i++)
        argv[i] = argv[j];
      argc -= 1 + nvalues;
      return true;
    }
  }
  return false;
}

int
sourceTclFile(const char *filename,
              Tcl_Interp *interp)
{
  return Tcl_EvalFile(interp, filename);
}

////////////////////////////////////////////////////////////////

static double
parseFreqArg(const char *key,
             const char *value,
             Report *report)
{
  if (!isFloat(value))
    report->error(800, "%s value %s is not a number.", key, value);
  return strtod(value, nullptr);
}

// "--with-ethernet" -> "with_ethernet".
static std::string
optionName(const char *arg)
{
  std::string name = arg + 2;
  for (char &ch : name) {
    if (ch == '-')
      ch = '_';
  }
  return name;
}

static void
parseConfigArgs(int argc,
                char *argv[],
                Report *report,
                SocConfig &config)
{
  for (int i = 1; i < argc; i++) {
    const char *arg = argv[i];
    if (strncmp(arg, "--", 2) != 0)
      report->error(801, "unexpected argument %s.", arg);
    std::string name = optionName(arg);
    if (config.setFlag(name.c_str()))
      continue;
    if (i + 1 < argc
        && config.setOption(name.c_str(), argv[i + 1], report)) {
      i++;
      continue;
    }
    report->error(802, "unknown option %s.", arg);
  }
}

int
bspBoardMain(Bsp *bsp,
             int argc,
             char *argv[])
{
  Report *report = bsp->report();
  try {
    const char *board_name = findCmdLineKey(argc, argv, "--board");
    if (board_name == nullptr)
      report->error(803, "missing --board.");
    SocConfig config = bsp->defaultConfig(board_name);

    bool build = findCmdLineFlag(argc, argv, "--build");
    bool load = findCmdLineFlag(argc, argv, "--load");
    const char *output_dir = findCmdLineKey(argc, argv, "--output-dir");
    char *debug_args[2];
    while (findCmdLineKeyValues(argc, argv, "--debug", 2, debug_args)) {
      if (!isDigits(debug_args[1]))
        report->error(804, "--debug level %s is not an integer.", debug_args[1]);
      bsp->setDebugLevel(debug_args[0], atoi(debug_args[1]));
    }
    char *scan_args[3];
    bool scan = findCmdLineKeyValues(argc, argv, "--scan-pll", 3, scan_args);
    if (!scan && findCmdLineFlag(argc, argv, "--scan-pll"))
      report->error(805, "--scan-pll requires fmin fmax fstep.");
    parseConfigArgs(argc, argv, report, config);

    if (load)
      report->error(806, "--load: bitstream loading is not supported.");
    if (scan) {
      double fmin = parseFreqArg("fmin", scan_args[0], report);
      double fmax = parseFreqArg("fmax", scan_args[1], report);
      double fstep = parseFreqArg("fstep", scan_args[2], report);
      bsp->scanPll(config, fmin, fmax, fstep, true);
      return EXIT_SUCCESS;
    }

    bsp->composeSoc(config);
    bsp->reportSoc();
    if (build) {
      std::string dir = output_dir
        ? std::string(output_dir)
        : stdstrPrint("build/%s", board_name);
      std::error_code error;
      std::filesystem::create_directories(dir, error);
      if (error)
        report->error(807, "cannot create directory %s: %s.",
                      dir.c_str(), error.message().c_str());
      std::string filename = bsp->constraintsFilename(dir.c_str());
      bsp->writeConstraints(filename.c_str());
      report->reportLine("Wrote %s", filename.c_str());
    }
  }
  catch (const Exception &error) {
    report->reportLine("Error: %s", error.what());
    return EXIT_FAILURE;
  }
  catch (const std::exception &error) {
    report->reportLine("Error: %s", error.what());
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}

void
showBoardUsage(const char *prog)
{
  printf("Usage: %s --board name [--build] [--load] [--output-dir dir]\n", prog);
  printf("          [--sys-clk-freq Hz] [--iodelay-clk-freq Hz]\n");
  printf("          [--scan-pll fmin fmax fstep] [--debug what level]\n");
  printf("          [--variant name] [--device part] [--toolchain name]\n");
  printf("          [--l2-size bytes] [--sdram-module name]\n");
  printf("          [--with-sdram|--no-sdram] [--with-ethernet|--with-etherbone]\n");
  printf("          [--eth-ip ip] [--eth-dynamic-ip] [--with-hyperram]\n");
  printf("          [--with-sdcard] [--with-jtagbone] [--with-uartbone]\n");
  printf("          [--with-pcie] [--no-leds] [--no-masked-write]\n");
  printf("  --scan-pll         report the sys_clk_freq values the PLL can make\n");
  printf("  --build            also write the constraints file\n");
}

} // namespace
