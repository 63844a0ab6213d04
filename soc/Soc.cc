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

#include "Soc.hh"

#include <cinttypes>

#include "Report.hh"
#include "Debug.hh"
#include "Crg.hh"

namespace bsp {

MemoryRegion::MemoryRegion(const char *name,
                           uint64_t origin,
                           uint64_t size,
                           bool cached) :
  name_(name),
  origin_(origin),
  size_(size),
  cached_(cached)
{
}

bool
MemoryRegion::overlaps(const MemoryRegion &region) const
{
  return origin_ < region.end() && region.origin() < end();
}

////////////////////////////////////////////////////////////////

DramPhy::DramPhy(const char *phy_name,
                 const IoResource *pads,
                 const SdramModule *module,
                 SdramRate rate,
                 int nphases,
                 double sys_clk_freq) :
  phy_name_(phy_name),
  pads_(pads),
  module_(module),
  rate_(rate),
  nphases_(nphases),
  timing_(module->timingCycles(sys_clk_freq, rate)),
  l2_size_(0),
  l2_min_data_width_(128),
  masked_write_(false),
  iodelay_clk_freq_(0.0)
{
}

void
DramPhy::setL2Size(int size)
{
  l2_size_ = size;
}

void
DramPhy::setL2MinDataWidth(int width)
{
  l2_min_data_width_ = width;
}

void
DramPhy::setMaskedWrite(bool masked_write)
{
  masked_write_ = masked_write;
}

void
DramPhy::setIodelayClkFreq(double freq)
{
  iodelay_clk_freq_ = freq;
}

////////////////////////////////////////////////////////////////

const char *
ethModeName(EthMode mode)
{
  switch (mode) {
  case EthMode::ethernet:
    return "ethernet";
  case EthMode::etherbone:
    return "etherbone";
  }
  return "";
}

EthPhy::EthPhy(const char *phy_name,
               const IoResource *clock_pads,
               const IoResource *pads,
               EthMode mode) :
  phy_name_(phy_name),
  clock_pads_(clock_pads),
  pads_(pads),
  mode_(mode),
  dynamic_ip_(false),
  rx_delay_(0.0),
  iodelay_clk_freq_(0.0)
{
}

void
EthPhy::setIpAddress(const char *ip)
{
  ip_address_ = ip;
}

void
EthPhy::setDynamicIp(bool dynamic_ip)
{
  dynamic_ip_ = dynamic_ip;
}

void
EthPhy::setRxDelay(double delay)
{
  rx_delay_ = delay;
}

void
EthPhy::setIodelayClkFreq(double freq)
{
  iodelay_clk_freq_ = freq;
}

////////////////////////////////////////////////////////////////

const char *
bridgeKindName(BridgeKind kind)
{
  switch (kind) {
  case BridgeKind::jtag:
    return "jtagbone";
  case BridgeKind::uart:
    return "uartbone";
  }
  return "";
}

DebugBridge::DebugBridge(BridgeKind kind,
                         const IoResource *pads,
                         double baudrate) :
  kind_(kind),
  pads_(pads),
  baudrate_(baudrate)
{
}

PadsBlock::PadsBlock(const char *kind,
                     const char *core,
                     const IoResourceSeq &pads) :
  kind_(kind),
  core_(core),
  pads_(pads)
{
}

////////////////////////////////////////////////////////////////

Soc::Soc(Platform *platform,
         const SocConfig &config,
         const BspState *bsp) :
  BspState(bsp),
  platform_(platform),
  config_(config),
  crg_(nullptr),
  dram_phy_(nullptr),
  eth_phy_(nullptr),
  hyperram_(nullptr),
  sdcard_(nullptr),
  pcie_(nullptr),
  i2c_(nullptr),
  hbm_(nullptr),
  leds_(nullptr),
  uart_(nullptr)
{
}

Soc::~Soc()
{
  for (DebugBridge *bridge : bridges_)
    delete bridge;
  delete uart_;
  delete leds_;
  delete hbm_;
  delete i2c_;
  delete pcie_;
  delete sdcard_;
  delete hyperram_;
  delete eth_phy_;
  delete dram_phy_;
  delete crg_;
  delete platform_;
}

void
Soc::setCrg(Crg *crg)
{
  delete crg_;
  crg_ = crg;
}

void
Soc::addMemoryRegion(const char *name,
                     uint64_t origin,
                     uint64_t size,
                     bool cached)
{
  if (size == 0)
    report_->error(600, "memory region %s is empty.", name);
  if (findMemoryRegion(name))
    report_->error(601, "memory region %s already exists.", name);
  MemoryRegion region(name, origin, size, cached);
  for (const MemoryRegion &other : memory_regions_) {
    if (region.overlaps(other))
      report_->error(602, "memory region %s 0x%08" PRIx64 "-0x%08" PRIx64
                     " overlaps %s 0x%08" PRIx64 "-0x%08" PRIx64 ".",
                     name, region.origin(), region.end() - 1,
                     other.name(), other.origin(), other.end() - 1);
  }
  memory_regions_.push_back(region);
  debugPrint(debug_, "soc", 1, "region %s 0x%08" PRIx64 " 0x%" PRIx64,
             name, origin, size);
}

const MemoryRegion *
Soc::findMemoryRegion(const char *name) const
{
  for (const MemoryRegion &region : memory_regions_) {
    if (stringEq(region.name(), name))
      return &region;
  }
  return nullptr;
}

void
Soc::setDramPhy(DramPhy *phy)
{
  delete dram_phy_;
  dram_phy_ = phy;
}

void
Soc::setEthPhy(EthPhy *phy)
{
  delete eth_phy_;
  eth_phy_ = phy;
}

void
Soc::setHyperRam(PadsBlock *hyperram)
{
  delete hyperram_;
  hyperram_ = hyperram;
}

void
Soc::setSdCard(PadsBlock *sdcard)
{
  delete sdcard_;
  sdcard_ = sdcard;
}

void
Soc::setPcie(PadsBlock *pcie)
{
  delete pcie_;
  pcie_ = pcie;
}

void
Soc::setI2c(PadsBlock *i2c)
{
  delete i2c_;
  i2c_ = i2c;
}

void
Soc::setHbm(PadsBlock *hbm)
{
  delete hbm_;
  hbm_ = hbm;
}

void
Soc::setLeds(PadsBlock *leds)
{
  delete leds_;
  leds_ = leds;
}

void
Soc::setUart(PadsBlock *uart)
{
  delete uart_;
  uart_ = uart;
}

void
Soc::addBridge(DebugBridge *bridge)
{
  bridges_.push_back(bridge);
}

const DebugBridge *
Soc::findBridge(BridgeKind kind) const
{
  for (const DebugBridge *bridge : bridges_) {
    if (bridge->kind() == kind)
      return bridge;
  }
  return nullptr;
}

void
Soc::addConstant(const char *name)
{
  constants_.push_back(name);
}

} // namespace
