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

#include "ClockDomain.hh"

#include "Pll.hh"

namespace bsp {

const char *
clockSourceName(ClockSource source)
{
  switch (source) {
  case ClockSource::pll:
    return "pll";
  case ClockSource::pin:
    return "pin";
  case ClockSource::derived:
    return "derived";
  case ClockSource::none:
    break;
  }
  return "none";
}

ClockDomain::ClockDomain(const char *name,
                         bool reset_less) :
  name_(name),
  reset_less_(reset_less),
  source_(ClockSource::none),
  pll_(nullptr),
  derived_from_(nullptr),
  divide_(1),
  resolved_(false),
  freq_(0.0),
  phase_(0.0)
{
}

void
ClockDomain::setPllSource(Pll *pll)
{
  source_ = ClockSource::pll;
  pll_ = pll;
  resolved_ = false;
}

void
ClockDomain::setPinSource(const char *pin_name,
                          double freq)
{
  source_ = ClockSource::pin;
  pin_name_ = pin_name;
  freq_ = freq;
  resolved_ = false;
}

void
ClockDomain::setDerivedSource(ClockDomain *from,
                              int divide)
{
  source_ = ClockSource::derived;
  derived_from_ = from;
  divide_ = divide;
  resolved_ = false;
}

void
ClockDomain::resolve()
{
  switch (source_) {
  case ClockSource::pll:
    freq_ = pll_->clkoutFreq(name_.c_str());
    phase_ = pll_->clkoutPhase(name_.c_str());
    break;
  case ClockSource::pin:
    phase_ = 0.0;
    break;
  case ClockSource::derived:
    if (!derived_from_->isResolved())
      derived_from_->resolve();
    freq_ = derived_from_->freq() / divide_;
    phase_ = derived_from_->phase();
    break;
  case ClockSource::none:
    freq_ = 0.0;
    break;
  }
  resolved_ = true;
}

} // namespace
