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

namespace bsp {

class Report;

// Build configuration of a board target.
// Boards fill in their defaults; the command line and Tcl commands
// override individual fields before composition.
class SocConfig
{
public:
  SocConfig();
  // Set a boolean option by name ("with_ethernet", "no_sdram").
  // Returns false for unknown names.
  bool setFlag(const char *name);
  // Set a valued option by name ("sys_clk_freq", "eth_ip", "l2_size").
  // Returns false for unknown names. Malformed values are errors.
  bool setOption(const char *name,
                 const char *value,
                 Report *report);

  std::string board;
  // Board variant ("a7-35", "a7-100"). Empty for the default.
  std::string variant;
  // FPGA part for boards built with more than one. Empty for the default.
  std::string device;
  std::string toolchain;
  std::string ident;
  bool ident_version;

  double sys_clk_freq;
  double iodelay_clk_freq;

  int integrated_rom_size;
  int integrated_sram_size;
  // Non-zero selects on-chip main RAM instead of SDRAM.
  int integrated_main_ram_size;
  // Writable BIOS memory.
  bool rw_bios_mem;

  bool with_sdram;
  // SDRAM module part number for boards with a module choice.
  std::string sdram_module;
  int l2_size;
  // LPDDR4 MASKED-WRITE instead of WRITE.
  bool masked_write;

  bool with_ethernet;
  bool with_etherbone;
  std::string eth_ip;
  bool eth_dynamic_ip;

  bool with_hyperram;
  bool with_sdcard;
  bool with_jtagbone;
  bool with_uartbone;
  bool with_pcie;
  bool with_leds;
};

} // namespace
