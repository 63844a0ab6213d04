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

#include "SocConfig.hh"

#include <climits>
#include <cmath>
#include <cstdlib>

#include "StringUtil.hh"
#include "Report.hh"

namespace bsp {

SocConfig::SocConfig() :
  toolchain("vivado"),
  ident("LiteX SoC"),
  ident_version(true),
  sys_clk_freq(100e6),
  iodelay_clk_freq(200e6),
  integrated_rom_size(0x20000),
  integrated_sram_size(0x2000),
  integrated_main_ram_size(0),
  rw_bios_mem(false),
  with_sdram(false),
  l2_size(8192),
  masked_write(true),
  with_ethernet(false),
  with_etherbone(false),
  eth_ip("192.168.1.50"),
  eth_dynamic_ip(false),
  with_hyperram(false),
  with_sdcard(false),
  with_jtagbone(false),
  with_uartbone(false),
  with_pcie(false),
  with_leds(true)
{
}

bool
SocConfig::setFlag(const char *name)
{
  if (stringEq(name, "with_sdram"))
    with_sdram = true;
  else if (stringEq(name, "no_sdram"))
    with_sdram = false;
  else if (stringEq(name, "with_ethernet"))
    with_ethernet = true;
  else if (stringEq(name, "no_ethernet"))
    with_ethernet = false;
  else if (stringEq(name, "with_etherbone"))
    with_etherbone = true;
  else if (stringEq(name, "eth_dynamic_ip"))
    eth_dynamic_ip = true;
  else if (stringEq(name, "with_hyperram"))
    with_hyperram = true;
  else if (stringEq(name, "no_hyperram"))
    with_hyperram = false;
  else if (stringEq(name, "with_sdcard"))
    with_sdcard = true;
  else if (stringEq(name, "with_jtagbone"))
    with_jtagbone = true;
  else if (stringEq(name, "no_jtagbone"))
    with_jtagbone = false;
  else if (stringEq(name, "with_uartbone"))
    with_uartbone = true;
  else if (stringEq(name, "with_pcie"))
    with_pcie = true;
  else if (stringEq(name, "no_pcie"))
    with_pcie = false;
  else if (stringEq(name, "with_leds"))
    with_leds = true;
  else if (stringEq(name, "no_leds"))
    with_leds = false;
  else if (stringEq(name, "no_masked_write"))
    masked_write = false;
  else if (stringEq(name, "rw_bios_mem"))
    rw_bios_mem = true;
  else if (stringEq(name, "no_ident_version"))
    ident_version = false;
  else
    return false;
  return true;
}

static double
parseFreq(const char *name,
          const char *value,
          Report *report)
{
  if (!isFloat(value))
    report->error(630, "%s value %s is not a number.", name, value);
  double freq = strtod(value, nullptr);
  if (!std::isfinite(freq))
    report->error(630, "%s value %s is not a number.", name, value);
  return freq;
}

static int
parseSize(const char *name,
          const char *value,
          Report *report)
{
  char *end;
  long long size = strtoll(value, &end, 0);
  if (*value == '\0' || *end != '\0' || size < 0 || size > INT_MAX)
    report->error(631, "%s value %s is not an integer in 0-%d.",
                  name, value, INT_MAX);
  return static_cast<int>(size);
}

bool
SocConfig::setOption(const char *name,
                     const char *value,
                     Report *report)
{
  if (stringEq(name, "sys_clk_freq"))
    sys_clk_freq = parseFreq(name, value, report);
  else if (stringEq(name, "iodelay_clk_freq"))
    iodelay_clk_freq = parseFreq(name, value, report);
  else if (stringEq(name, "eth_ip"))
    eth_ip = value;
  else if (stringEq(name, "l2_size"))
    l2_size = parseSize(name, value, report);
  else if (stringEq(name, "integrated_rom_size"))
    integrated_rom_size = parseSize(name, value, report);
  else if (stringEq(name, "integrated_sram_size"))
    integrated_sram_size = parseSize(name, value, report);
  else if (stringEq(name, "integrated_main_ram_size"))
    integrated_main_ram_size = parseSize(name, value, report);
  else if (stringEq(name, "variant"))
    variant = value;
  else if (stringEq(name, "device"))
    device = value;
  else if (stringEq(name, "sdram_module"))
    sdram_module = value;
  else if (stringEq(name, "toolchain"))
    toolchain = value;
  else if (stringEq(name, "ident"))
    ident = value;
  else
    return false;
  return true;
}

} // namespace
