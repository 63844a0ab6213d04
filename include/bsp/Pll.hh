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

#include "Error.hh"
#include "BspState.hh"

namespace bsp {

class PllClkout;
class PllOutputConfig;

using PllClkoutSeq = std::vector<PllClkout*>;
using PllOutputConfigSeq = std::vector<PllOutputConfig>;

// No legal divider/multiplier combination produces the requested
// outputs. Expected while scanning; every other exception is fatal.
class PllNoConfig : public ExceptionMsg
{
public:
  explicit PllNoConfig(const char *msg);
};

// Output clock requested from a PLL.
class PllClkout
{
public:
  PllClkout(int index,
            const char *domain,
            double freq,
            double phase,
            double margin,
            bool with_reset,
            bool buffered);
  int index() const { return index_; }
  const char *domain() const { return domain_.c_str(); }
  double freq() const { return freq_; }
  // Degrees.
  double phase() const { return phase_; }
  // Relative frequency tolerance.
  double margin() const { return margin_; }
  bool withReset() const { return with_reset_; }
  bool buffered() const { return buffered_; }

private:
  int index_;
  std::string domain_;
  double freq_;
  double phase_;
  double margin_;
  bool with_reset_;
  bool buffered_;
};

// Achieved setting of one PLL output.
class PllOutputConfig
{
public:
  PllOutputConfig();
  PllOutputConfig(double freq,
                  double divide,
                  double phase,
                  int cphase,
                  int fphase);
  double freq() const { return freq_; }
  // Fractional on MMCM output 0.
  double divide() const { return divide_; }
  double phase() const { return phase_; }
  // ECP5 coarse/fine phase steps. Zero for other families.
  int cphase() const { return cphase_; }
  int fphase() const { return fphase_; }

private:
  double freq_;
  double divide_;
  double phase_;
  int cphase_;
  int fphase_;
};

class PllConfig
{
public:
  PllConfig();
  void clear();
  int inputDivide() const { return input_divide_; }
  void setInputDivide(int divide);
  int feedbackMult() const { return feedback_mult_; }
  void setFeedbackMult(int mult);
  double vco() const { return vco_; }
  void setVco(double vco);
  // Phase frequency detector (fin / input divide).
  double pfd() const { return pfd_; }
  void setPfd(double pfd);
  // Indexed like the clkouts.
  const PllOutputConfigSeq &outputs() const { return outputs_; }
  PllOutputConfigSeq &outputs() { return outputs_; }

private:
  int input_divide_;
  int feedback_mult_;
  double vco_;
  double pfd_;
  PllOutputConfigSeq outputs_;
};

// Abstract PLL hard block.
// Register the reference clock, create the outputs and call finalize
// to search the legal divider/multiplier ranges for a configuration.
class Pll : public BspState
{
public:
  Pll(const char *name,
      int nclkouts_max,
      const BspState *bsp);
  virtual ~Pll();
  const char *name() const { return name_.c_str(); }
  // "S7PLL", "S7MMCM", "USMMCM", "ECP5PLL".
  virtual const char *familyName() const = 0;
  int nclkoutsMax() const { return nclkouts_max_; }
  // Once per PLL. The frequency must be inside the family input range.
  void registerClkin(const char *clkin_name,
                     double freq);
  bool hasClkin() const { return clkin_freq_ > 0.0; }
  const char *clkinName() const { return clkin_name_.c_str(); }
  double clkinFreq() const { return clkin_freq_; }
  PllClkout *createClkout(const char *domain,
                          double freq,
                          double phase = 0.0,
                          double margin = 1e-2,
                          bool with_reset = true,
                          bool buffered = true);
  const PllClkoutSeq &clkouts() const { return clkouts_; }
  PllClkout *findClkout(const char *domain) const;
  double vcoMargin() const { return vco_margin_; }
  void setVcoMargin(double margin);
  // Search for a configuration. Throws PllNoConfig when there is none.
  // The result is cached.
  const PllConfig &finalize();
  bool isFinalized() const { return finalized_; }
  const PllConfig &config() const { return config_; }
  // Achieved frequency of the output driving domain.
  double clkoutFreq(const char *domain) const;
  double clkoutPhase(const char *domain) const;

protected:
  virtual void checkClkin(double freq) const = 0;
  // Fill config or throw PllNoConfig.
  virtual void computeConfig(PllConfig &config) const = 0;
  void noConfig() const __attribute__((noreturn));

  std::string name_;
  int nclkouts_max_;
  std::string clkin_name_;
  double clkin_freq_;
  double vco_margin_;
  PllClkoutSeq clkouts_;
  PllConfig config_;
  bool finalized_;
};

} // namespace
