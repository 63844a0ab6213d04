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
#include <vector>

namespace bsp {

class SdramModule;

using SdramModuleSeq = std::vector<const SdramModule*>;

enum class SdramType { ddr3, ddr4, lpddr4 };

const char *
sdramTypeName(SdramType type);

// Controller to DRAM clock ratio.
enum class SdramRate { rate_1_1, rate_1_2, rate_1_4, rate_1_8 };

const char *
sdramRateName(SdramRate rate);
// "1:4" -> rate_1_4. Returns false for unknown names.
bool
findSdramRate(const char *name,
              SdramRate &rate);
// DRAM clocks per controller clock.
int
sdramRateRatio(SdramRate rate);

// Timing given as DRAM clock cycles and/or nanoseconds; the larger of
// the two wins. Zero means unspecified.
class SdramTiming
{
public:
  SdramTiming();
  SdramTiming(int ck,
              double ns);
  int ck() const { return ck_; }
  double ns() const { return ns_; }
  bool isSpecified() const { return ck_ != 0 || ns_ != 0.0; }

private:
  int ck_;
  double ns_;
};

// Timings in controller clock cycles for a system clock and rate.
class SdramTimingCycles
{
public:
  SdramTimingCycles();

  int tRP;
  int tRCD;
  int tWR;
  int tWTR;
  int tREFI;
  int tRFC;
  int tFAW;
  int tCCD;
  int tRRD;
  int tRC;
  int tRAS;
  int tZQCS;
};

// SDRAM part: geometry and datasheet timings.
class SdramModule
{
public:
  SdramModule(const char *name,
              SdramType type,
              int nbanks,
              int nrows,
              int ncols,
              int databits,
              const char *speedgrade);
  const char *name() const { return name_.c_str(); }
  SdramType type() const { return type_; }
  int nbanks() const { return nbanks_; }
  int nrows() const { return nrows_; }
  int ncols() const { return ncols_; }
  int databits() const { return databits_; }
  int bankbits() const;
  int rowbits() const;
  int colbits() const;
  // Bytes.
  long long size() const;
  const char *speedgrade() const { return speedgrade_.c_str(); }

  SdramTiming tRP;
  SdramTiming tRCD;
  SdramTiming tWR;
  SdramTiming tWTR;
  // Nanoseconds only.
  double tREFI;
  SdramTiming tRFC;
  SdramTiming tFAW;
  SdramTiming tCCD;
  SdramTiming tRRD;
  SdramTiming tRAS;
  SdramTiming tZQCS;

  // DRAM clock cycles to controller cycles.
  static int ckToCycles(int ck,
                        SdramRate rate);
  // Nanoseconds to controller cycles. With margin the phase
  // uncertainty of the rate is added first.
  static int nsToCycles(double ns,
                        double sys_clk_freq,
                        SdramRate rate,
                        bool margin = true);
  static int timingCycles(const SdramTiming &timing,
                          double sys_clk_freq,
                          SdramRate rate);
  SdramTimingCycles timingCycles(double sys_clk_freq,
                                 SdramRate rate) const;

  // Catalog of the parts used by the boards.
  static const SdramModule *find(const char *name);
  static SdramModuleSeq modules();

private:
  static int log2(int value);

  std::string name_;
  SdramType type_;
  int nbanks_;
  int nrows_;
  int ncols_;
  int databits_;
  std::string speedgrade_;
};

} // namespace
