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

#include "PllScan.hh"

#include <cmath>

#include "Report.hh"
#include "Debug.hh"
#include "Pll.hh"

namespace bsp {

// Each candidate is a full PLL search, so anything near this is already
// far beyond a useful scan.
static constexpr size_t scan_count_max = 1000000;

PllScanResult::PllScanResult(double freq,
                             bool found) :
  freq_(freq),
  found_(found)
{
}

PllScan::PllScan(const BspState *bsp) :
  BspState(bsp)
{
}

FreqSeq
PllScan::candidates(double fmin,
                    double fmax,
                    double fstep) const
{
  if (!std::isfinite(fmin) || !std::isfinite(fmax) || !std::isfinite(fstep))
    report_->error(402, "scan range %g %g %g must be finite.", fmin, fmax, fstep);
  if (fstep <= 0.0)
    report_->error(400, "scan step %.0f Hz must be positive.", fstep);
  if (fmin >= fmax)
    report_->error(401, "scan minimum %.0f Hz must be less than maximum %.0f Hz.",
                   fmin, fmax);
  double count = std::floor((fmax - fmin) / fstep);
  if (count > scan_count_max)
    report_->error(403, "scan range %.0f to %.0f Hz in %.0f Hz steps has %.0f candidates, more than %zu.",
                   fmin, fmax, fstep, count, scan_count_max);
  size_t freq_count = static_cast<size_t>(count);
  FreqSeq freqs;
  freqs.reserve(freq_count);
  for (size_t i = 0; i < freq_count; i++)
    freqs.push_back(fmin + i * fstep);
  return freqs;
}

PllScanResultSeq
PllScan::scan(double fmin,
              double fmax,
              double fstep,
              const PllScanTrial &trial) const
{
  FreqSeq freqs = candidates(fmin, fmax, fstep);
  bool verbose = debug_->check("scan", 1);
  PllScanResultSeq results;
  results.reserve(freqs.size());
  for (double freq : freqs) {
    bool found = true;
    try {
      trial(freq);
    }
    catch (const PllNoConfig &) {
      found = false;
    }
    results.push_back(PllScanResult(freq, found));
    if (verbose)
      debug_->reportLine("scan", "Trying sys_clk_freq = %6.2f MHz ... %s",
                         freq / 1e6,
                         found ? "OK" : "FAIL");
    else
      report_->printString(found ? "." : "X");
  }
  if (!verbose && !freqs.empty())
    report_->printString("\n");
  return results;
}

PllScanBandSeq
PllScan::bands(const PllScanResultSeq &results,
               double fstep)
{
  PllScanBandSeq bands;
  double prev_freq = 0.0;
  bool have_prev = false;
  for (const PllScanResult &result : results) {
    if (result.found()) {
      double freq = result.freq();
      if (!have_prev || (freq - prev_freq) > fstep * 1.001)
        bands.push_back(FreqSeq());
      bands.back().push_back(freq);
      prev_freq = freq;
      have_prev = true;
    }
  }
  return bands;
}

FreqSeq
PllScan::foundFreqs(const PllScanResultSeq &results)
{
  FreqSeq freqs;
  for (const PllScanResult &result : results) {
    if (result.found())
      freqs.push_back(result.freq());
  }
  return freqs;
}

void
PllScan::reportResults(const PllScanResultSeq &results,
                       double fstep) const
{
  report_->reportLine("Found PLL configs for:");
  for (const FreqSeq &band : bands(results, fstep)) {
    report_->reportLine("---");
    for (double freq : band)
      report_->reportLine("  sys_clk_freq = %6.2f MHz", freq / 1e6);
  }
}

PllScanResultSeq
PllScan::scanAndReport(double fmin,
                       double fmax,
                       double fstep,
                       const PllScanTrial &trial) const
{
  PllScanResultSeq results = scan(fmin, fmax, fstep, trial);
  reportResults(results, fstep);
  return results;
}

} // namespace
