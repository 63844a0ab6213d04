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

#include "Pll.hh"

#include "Report.hh"
#include "Debug.hh"
#include "StringUtil.hh"

namespace bsp {

PllNoConfig::PllNoConfig(const char *msg) :
  ExceptionMsg(msg, 208)
{
}

PllClkout::PllClkout(int index,
                     const char *domain,
                     double freq,
                     double phase,
                     double margin,
                     bool with_reset,
                     bool buffered) :
  index_(index),
  domain_(domain),
  freq_(freq),
  phase_(phase),
  margin_(margin),
  with_reset_(with_reset),
  buffered_(buffered)
{
}

PllOutputConfig::PllOutputConfig() :
  freq_(0.0),
  divide_(0.0),
  phase_(0.0),
  cphase_(0),
  fphase_(0)
{
}

PllOutputConfig::PllOutputConfig(double freq,
                                 double divide,
                                 double phase,
                                 int cphase,
                                 int fphase) :
  freq_(freq),
  divide_(divide),
  phase_(phase),
  cphase_(cphase),
  fphase_(fphase)
{
}

PllConfig::PllConfig()
{
  clear();
}

void
PllConfig::clear()
{
  input_divide_ = 0;
  feedback_mult_ = 0;
  vco_ = 0.0;
  pfd_ = 0.0;
  outputs_.clear();
}

void
PllConfig::setInputDivide(int divide)
{
  input_divide_ = divide;
}

void
PllConfig::setFeedbackMult(int mult)
{
  feedback_mult_ = mult;
}

void
PllConfig::setVco(double vco)
{
  vco_ = vco;
}

void
PllConfig::setPfd(double pfd)
{
  pfd_ = pfd;
}

////////////////////////////////////////////////////////////////

Pll::Pll(const char *name,
         int nclkouts_max,
         const BspState *bsp) :
  BspState(bsp),
  name_(name),
  nclkouts_max_(nclkouts_max),
  clkin_freq_(0.0),
  vco_margin_(0.0),
  finalized_(false)
{
}

Pll::~Pll()
{
  for (PllClkout *clkout : clkouts_)
    delete clkout;
}

void
Pll::registerClkin(const char *clkin_name,
                   double freq)
{
  if (hasClkin())
    report_->error(200, "%s: reference clock already registered.", name());
  checkClkin(freq);
  clkin_name_ = clkin_name;
  clkin_freq_ = freq;
  debugPrint(debug_, "pll", 1, "%s clkin %s %.3f MHz",
             name(), clkin_name, freq / 1e6);
}

PllClkout *
Pll::createClkout(const char *domain,
                  double freq,
                  double phase,
                  double margin,
                  bool with_reset,
                  bool buffered)
{
  int index = static_cast<int>(clkouts_.size());
  if (index >= nclkouts_max_)
    report_->error(201, "%s: %s supports at most %d outputs.",
                   name(), familyName(), nclkouts_max_);
  if (freq <= 0.0)
    report_->error(202, "%s: clock %s frequency must be positive.",
                   name(), domain);
  if (findClkout(domain))
    report_->error(203, "%s: clock %s already has an output.",
                   name(), domain);
  PllClkout *clkout = new PllClkout(index, domain, freq, phase, margin,
                                    with_reset, buffered);
  clkouts_.push_back(clkout);
  finalized_ = false;
  debugPrint(debug_, "pll", 1, "%s clkout%d %s %.3f MHz %.1f deg",
             name(), index, domain, freq / 1e6, phase);
  return clkout;
}

PllClkout *
Pll::findClkout(const char *domain) const
{
  for (PllClkout *clkout : clkouts_) {
    if (stringEq(clkout->domain(), domain))
      return clkout;
  }
  return nullptr;
}

void
Pll::setVcoMargin(double margin)
{
  vco_margin_ = margin;
  finalized_ = false;
}

const PllConfig &
Pll::finalize()
{
  if (!finalized_) {
    if (!hasClkin())
      report_->error(204, "%s: no reference clock registered.", name());
    config_.clear();
    computeConfig(config_);
    finalized_ = true;
    debugPrint(debug_, "pll", 1, "%s config D=%d M=%d vco=%.3f MHz",
               name(),
               config_.inputDivide(),
               config_.feedbackMult(),
               config_.vco() / 1e6);
    if (debug_->check("pll", 2)) {
      for (const PllClkout *clkout : clkouts_) {
        const PllOutputConfig &output = config_.outputs()[clkout->index()];
        debug_->reportLine("pll", "  clkout%d %s div=%.3f %.3f MHz",
                           clkout->index(),
                           clkout->domain(),
                           output.divide(),
                           output.freq() / 1e6);
      }
    }
  }
  return config_;
}

double
Pll::clkoutFreq(const char *domain) const
{
  const PllClkout *clkout = findClkout(domain);
  if (clkout == nullptr)
    report_->error(205, "%s: no output for clock %s.", name(), domain);
  if (!finalized_)
    report_->error(206, "%s: not finalized.", name());
  return config_.outputs()[clkout->index()].freq();
}

double
Pll::clkoutPhase(const char *domain) const
{
  const PllClkout *clkout = findClkout(domain);
  if (clkout == nullptr)
    report_->error(207, "%s: no output for clock %s.", name(), domain);
  return clkout->phase();
}

void
Pll::noConfig() const
{
  std::string msg = stdstrPrint("%s: No PLL config found.", name());
  throw PllNoConfig(msg.c_str());
}

} // namespace
