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

#include "SdramModule.hh"

#include <algorithm>
#include <cmath>

#include "StringUtil.hh"
#include "EnumNameMap.hh"

namespace bsp {

static EnumNameMap<SdramType> sdram_type_names =
  {{SdramType::ddr3, "DDR3"},
   {SdramType::ddr4, "DDR4"},
   {SdramType::lpddr4, "LPDDR4"}};

static EnumNameMap<SdramRate> sdram_rate_names =
  {{SdramRate::rate_1_1, "1:1"},
   {SdramRate::rate_1_2, "1:2"},
   {SdramRate::rate_1_4, "1:4"},
   {SdramRate::rate_1_8, "1:8"}};

const char *
sdramTypeName(SdramType type)
{
  return sdram_type_names.find(type);
}

const char *
sdramRateName(SdramRate rate)
{
  return sdram_rate_names.find(rate);
}

bool
findSdramRate(const char *name,
              SdramRate &rate)
{
  bool exists;
  sdram_rate_names.find(name, rate, exists);
  return exists;
}

int
sdramRateRatio(SdramRate rate)
{
  switch (rate) {
  case SdramRate::rate_1_1:
    return 1;
  case SdramRate::rate_1_2:
    return 2;
  case SdramRate::rate_1_4:
    return 4;
  case SdramRate::rate_1_8:
    return 8;
  }
  return 1;
}

SdramTiming::SdramTiming() :
  ck_(0),
  ns_(0.0)
{
}

SdramTiming::SdramTiming(int ck,
                         double ns) :
  ck_(ck),
  ns_(ns)
{
}

SdramTimingCycles::SdramTimingCycles() :
  tRP(0),
  tRCD(0),
  tWR(0),
  tWTR(0),
  tREFI(0),
  tRFC(0),
  tFAW(0),
  tCCD(0),
  tRRD(0),
  tRC(0),
  tRAS(0),
  tZQCS(0)
{
}

////////////////////////////////////////////////////////////////

SdramModule::SdramModule(const char *name,
                         SdramType type,
                         int nbanks,
                         int nrows,
                         int ncols,
                         int databits,
                         const char *speedgrade) :
  tREFI(0.0),
  name_(name),
  type_(type),
  nbanks_(nbanks),
  nrows_(nrows),
  ncols_(ncols),
  databits_(databits),
  speedgrade_(speedgrade)
{
}

int
SdramModule::log2(int value)
{
  int bits = 0;
  while ((1 << bits) < value)
    bits++;
  return bits;
}

int
SdramModule::bankbits() const
{
  return log2(nbanks_);
}

int
SdramModule::rowbits() const
{
  return log2(nrows_);
}

int
SdramModule::colbits() const
{
  return log2(ncols_);
}

long long
SdramModule::size() const
{
  return static_cast<long long>(nbanks_) * nrows_ * ncols_ * databits_ / 8;
}

int
SdramModule::ckToCycles(int ck,
                        SdramRate rate)
{
  int ratio = sdramRateRatio(rate);
  return (ck + ratio - 1) / ratio;
}

int
SdramModule::nsToCycles(double ns,
                        double sys_clk_freq,
                        SdramRate rate,
                        bool margin)
{
  double clk_period_ns = 1e9 / sys_clk_freq;
  if (margin) {
    switch (rate) {
    case SdramRate::rate_1_1:
      break;
    case SdramRate::rate_1_2:
      ns += clk_period_ns / 2;
      break;
    case SdramRate::rate_1_4:
      ns += 3 * clk_period_ns / 4;
      break;
    case SdramRate::rate_1_8:
      ns += 7 * clk_period_ns / 8;
      break;
    }
  }
  return static_cast<int>(std::ceil(ns / clk_period_ns));
}

int
SdramModule::timingCycles(const SdramTiming &timing,
                          double sys_clk_freq,
                          SdramRate rate)
{
  return std::max(ckToCycles(timing.ck(), rate),
                  nsToCycles(timing.ns(), sys_clk_freq, rate));
}

SdramTimingCycles
SdramModule::timingCycles(double sys_clk_freq,
                          SdramRate rate) const
{
  SdramTimingCycles cycles;
  cycles.tRP = timingCycles(tRP, sys_clk_freq, rate);
  cycles.tRCD = timingCycles(tRCD, sys_clk_freq, rate);
  cycles.tWR = timingCycles(tWR, sys_clk_freq, rate);
  cycles.tWTR = timingCycles(tWTR, sys_clk_freq, rate);
  cycles.tREFI = nsToCycles(tREFI, sys_clk_freq, rate, false);
  cycles.tRFC = timingCycles(tRFC, sys_clk_freq, rate);
  cycles.tFAW = timingCycles(tFAW, sys_clk_freq, rate);
  cycles.tCCD = timingCycles(tCCD, sys_clk_freq, rate);
  cycles.tRRD = timingCycles(tRRD, sys_clk_freq, rate);
  if (tRAS.isSpecified()) {
    SdramTiming trc(tRP.ck() + tRAS.ck(), tRP.ns() + tRAS.ns());
    cycles.tRC = timingCycles(trc, sys_clk_freq, rate);
    cycles.tRAS = timingCycles(tRAS, sys_clk_freq, rate);
  }
  cycles.tZQCS = timingCycles(tZQCS, sys_clk_freq, rate);
  return cycles;
}

////////////////////////////////////////////////////////////////

static SdramModuleSeq
makeModules()
{
  SdramModuleSeq modules;

  SdramModule *mt41k128m16 = new SdramModule("MT41K128M16", SdramType::ddr3,
                                             8, 16384, 1024, 16, "1600");
  mt41k128m16->tREFI = 64e6 / 8192;
  mt41k128m16->tWTR = SdramTiming(4, 7.5);
  mt41k128m16->tCCD = SdramTiming(4, 0.0);
  mt41k128m16->tRRD = SdramTiming(4, 10.0);
  mt41k128m16->tZQCS = SdramTiming(64, 80.0);
  mt41k128m16->tRP = SdramTiming(0, 13.75);
  mt41k128m16->tRCD = SdramTiming(0, 13.75);
  mt41k128m16->tWR = SdramTiming(0, 13.75);
  mt41k128m16->tRFC = SdramTiming(128, 0.0);
  mt41k128m16->tFAW = SdramTiming(0, 40.0);
  mt41k128m16->tRAS = SdramTiming(0, 35.0);
  modules.push_back(mt41k128m16);

  SdramModule *as4c256m16d3a = new SdramModule("AS4C256M16D3A", SdramType::ddr3,
                                               8, 32768, 1024, 16, "1600");
  as4c256m16d3a->tREFI = 64e6 / 8192;
  as4c256m16d3a->tWTR = SdramTiming(4, 7.5);
  as4c256m16d3a->tCCD = SdramTiming(4, 0.0);
  as4c256m16d3a->tRRD = SdramTiming(4, 7.5);
  as4c256m16d3a->tZQCS = SdramTiming(64, 80.0);
  as4c256m16d3a->tRP = SdramTiming(0, 13.75);
  as4c256m16d3a->tRCD = SdramTiming(0, 13.75);
  as4c256m16d3a->tWR = SdramTiming(0, 15.0);
  as4c256m16d3a->tRFC = SdramTiming(0, 260.0);
  as4c256m16d3a->tFAW = SdramTiming(0, 40.0);
  as4c256m16d3a->tRAS = SdramTiming(0, 35.0);
  modules.push_back(as4c256m16d3a);

  SdramModule *mt53e256m16d1 = new SdramModule("MT53E256M16D1", SdramType::lpddr4,
                                               8, 32768, 1024, 16, "1866");
  mt53e256m16d1->tREFI = 32e6 / 8192;
  mt53e256m16d1->tWTR = SdramTiming(8, 10.0);
  mt53e256m16d1->tCCD = SdramTiming(8, 0.0);
  mt53e256m16d1->tRRD = SdramTiming(4, 10.0);
  mt53e256m16d1->tZQCS = SdramTiming(0, 30.0);
  mt53e256m16d1->tRP = SdramTiming(3, 21.0);
  mt53e256m16d1->tRCD = SdramTiming(4, 18.0);
  mt53e256m16d1->tWR = SdramTiming(4, 18.0);
  mt53e256m16d1->tRFC = SdramTiming(0, 180.0);
  mt53e256m16d1->tFAW = SdramTiming(0, 40.0);
  mt53e256m16d1->tRAS = SdramTiming(3, 42.0);
  modules.push_back(mt53e256m16d1);

  // 2 bank groups of 4 banks.
  SdramModule *mta4atf51264hz = new SdramModule("MTA4ATF51264HZ", SdramType::ddr4,
                                                8, 65536, 1024, 64, "2133");
  mta4atf51264hz->tREFI = 64e6 / 8192;
  mta4atf51264hz->tWTR = SdramTiming(4, 7.5);
  mta4atf51264hz->tCCD = SdramTiming(4, 0.0);
  mta4atf51264hz->tRRD = SdramTiming(4, 4.9);
  mta4atf51264hz->tZQCS = SdramTiming(128, 80.0);
  mta4atf51264hz->tRP = SdramTiming(0, 13.5);
  mta4atf51264hz->tRCD = SdramTiming(0, 13.5);
  mta4atf51264hz->tWR = SdramTiming(0, 15.0);
  mta4atf51264hz->tRFC = SdramTiming(0, 350.0);
  mta4atf51264hz->tFAW = SdramTiming(0, 30.0);
  mta4atf51264hz->tRAS = SdramTiming(0, 33.0);
  modules.push_back(mta4atf51264hz);

  // x8 parts, 4 bank groups of 4 banks.
  SdramModule *kvr21se15s84 = new SdramModule("KVR21SE15S84", SdramType::ddr4,
                                              16, 32768, 1024, 64, "2133");
  kvr21se15s84->tREFI = 64e6 / 8192;
  kvr21se15s84->tWTR = SdramTiming(4, 7.5);
  kvr21se15s84->tCCD = SdramTiming(4, 0.0);
  kvr21se15s84->tRRD = SdramTiming(4, 5.3);
  kvr21se15s84->tZQCS = SdramTiming(128, 80.0);
  kvr21se15s84->tRP = SdramTiming(0, 13.5);
  kvr21se15s84->tRCD = SdramTiming(0, 13.5);
  kvr21se15s84->tWR = SdramTiming(0, 15.0);
  kvr21se15s84->tRFC = SdramTiming(0, 260.0);
  kvr21se15s84->tFAW = SdramTiming(0, 21.0);
  kvr21se15s84->tRAS = SdramTiming(0, 33.0);
  modules.push_back(kvr21se15s84);

  return modules;
}

SdramModuleSeq
SdramModule::modules()
{
  // Lives for the whole process.
  static const SdramModuleSeq modules = makeModules();
  return modules;
}

const SdramModule *
SdramModule::find(const char *name)
{
  for (const SdramModule *module : modules()) {
    if (stringEq(module->name(), name))
      return module;
  }
  return nullptr;
}

} // namespace
