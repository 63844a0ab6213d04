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

#include <functional>
#include <vector>

#include "BspState.hh"

namespace bsp {

class PllScanResult
{
public:
  PllScanResult(double freq,
                bool found);
  double freq() const { return freq_; }
  bool found() const { return found_; }

private:
  double freq_;
  bool found_;
};

using PllScanResultSeq = std::vector<PllScanResult>;
using FreqSeq = std::vector<double>;
// Contiguous runs of found frequencies.
using PllScanBandSeq = std::vector<FreqSeq>;
// Build a fresh clock domain set for sys_clk_freq on its own PLL and
// finalize it. Throws PllNoConfig when the PLL cannot make it.
using PllScanTrial = std::function<void (double sys_clk_freq)>;

// Sweep candidate system clock frequencies and record which ones the
// PLL can synthesize together with the fixed auxiliary clocks.
class PllScan : public BspState
{
public:
  explicit PllScan(const BspState *bsp);
  // fmin + i*fstep for i in [0, floor((fmax-fmin)/fstep)).
  // Errors when fmin >= fmax or fstep <= 0.
  FreqSeq candidates(double fmin,
                     double fmax,
                     double fstep) const;
  // Run trial on every candidate. PllNoConfig marks the candidate not
  // found; any other exception propagates and ends the scan.
  PllScanResultSeq scan(double fmin,
                        double fmax,
                        double fstep,
                        const PllScanTrial &trial) const;
  // Split found frequencies where consecutive ones are more than
  // fstep apart.
  static PllScanBandSeq bands(const PllScanResultSeq &results,
                              double fstep);
  static FreqSeq foundFreqs(const PllScanResultSeq &results);
  void reportResults(const PllScanResultSeq &results,
                     double fstep) const;
  // scan followed by reportResults.
  PllScanResultSeq scanAndReport(double fmin,
                                 double fmax,
                                 double fstep,
                                 const PllScanTrial &trial) const;
};

} // namespace
