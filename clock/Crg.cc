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

#include "Crg.hh"

#include "Report.hh"
#include "Debug.hh"
#include "StringUtil.hh"
#include "Pll.hh"
#include "Platform.hh"

namespace bsp {

ClockPin::ClockPin(const ClockDomain *domain,
                   const IoResource *resource) :
  domain_(domain),
  resource_(resource)
{
}

Crg::Crg(Platform *platform,
         const BspState *bsp) :
  BspState(bsp),
  platform_(platform),
  pll_(nullptr),
  reset_resource_(nullptr),
  finalized_(false)
{
}

Crg::~Crg()
{
  for (ClockDomain *domain : domains_)
    delete domain;
  delete pll_;
}

void
Crg::setPll(Pll *pll)
{
  delete pll_;
  pll_ = pll;
  finalized_ = false;
}

IoResource *
Crg::requestClkin(const char *resource_name,
                  int number,
                  double freq)
{
  if (pll_ == nullptr)
    report_->error(300, "CRG has no PLL for reference clock %s.",
                   resource_name);
  IoResource *resource = platform_->request(resource_name, number);
  pll_->registerClkin(resource_name, freq);
  return resource;
}

IoResource *
Crg::requestReset(const char *resource_name,
                  int number)
{
  reset_resource_ = platform_->request(resource_name, number);
  return reset_resource_;
}

ClockDomain *
Crg::makeDomain(const char *name,
                bool reset_less)
{
  if (findDomain(name))
    report_->error(301, "clock domain %s already exists.", name);
  ClockDomain *domain = new ClockDomain(name, reset_less);
  domains_.push_back(domain);
  finalized_ = false;
  return domain;
}

ClockDomain *
Crg::makePllDomain(const char *name,
                   double freq,
                   double phase,
                   bool with_reset,
                   bool buffered)
{
  if (pll_ == nullptr)
    report_->error(302, "CRG has no PLL for clock domain %s.", name);
  if (findDomain(name))
    report_->error(301, "clock domain %s already exists.", name);
  // The PLL rejects the output before the domain exists.
  pll_->createClkout(name, freq, phase, 1e-2, with_reset, buffered);
  ClockDomain *domain = makeDomain(name, !with_reset);
  domain->setPllSource(pll_);
  return domain;
}

ClockDomain *
Crg::makePinDomain(const char *name,
                   const char *resource_name,
                   int number,
                   double freq,
                   bool reset_less)
{
  IoResource *resource = platform_->lookup(resource_name, number);
  if (resource == nullptr)
    report_->error(303, "clock domain %s: no resource %s:%d.",
                   name, resource_name, number);
  ClockDomain *domain = makeDomain(name, reset_less);
  // The reference clock pin also clocks domains beside the PLL.
  if (!resource->isRequested())
    platform_->request(resource_name, number);
  domain->setPinSource(platform_->portName(resource).c_str(), freq);
  return domain;
}

ClockDomain *
Crg::makeDerivedDomain(const char *name,
                       const char *from,
                       int divide,
                       bool reset_less)
{
  if (divide < 1)
    report_->error(304, "clock domain %s divider %d must be positive.",
                   name, divide);
  ClockDomain *from_domain = findDomainOrError(from);
  ClockDomain *domain = makeDomain(name, reset_less);
  domain->setDerivedSource(from_domain, divide);
  return domain;
}

void
Crg::driveClockPin(const char *domain_name,
                   const char *resource_name,
                   int number)
{
  const ClockDomain *domain = findDomainOrError(domain_name);
  IoResource *resource = platform_->request(resource_name, number);
  clock_pins_.push_back(ClockPin(domain, resource));
}

ClockDomain *
Crg::findDomain(const char *name) const
{
  for (ClockDomain *domain : domains_) {
    if (stringEq(domain->name(), name))
      return domain;
  }
  return nullptr;
}

ClockDomain *
Crg::findDomainOrError(const char *name) const
{
  ClockDomain *domain = findDomain(name);
  if (domain == nullptr)
    report_->error(305, "clock domain %s not found.", name);
  return domain;
}

void
Crg::finalize()
{
  if (finalized_)
    return;
  if (pll_)
    pll_->finalize();
  for (ClockDomain *domain : domains_) {
    if (domain->source() == ClockSource::none)
      report_->error(306, "clock domain %s has no clock source.",
                     domain->name());
    domain->resolve();
    debugPrint(debug_, "crg", 1, "%s %s %.3f MHz %.1f deg",
               domain->name(),
               clockSourceName(domain->source()),
               domain->freq() / 1e6,
               domain->phase());
  }
  finalized_ = true;
}

double
Crg::freq(const char *domain_name) const
{
  const ClockDomain *domain = findDomainOrError(domain_name);
  if (!domain->isResolved())
    report_->error(307, "clock domain %s is not resolved.", domain_name);
  return domain->freq();
}

} // namespace
