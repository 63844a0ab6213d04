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

#include <cstdint>
#include <string>
#include <vector>

#include "BspState.hh"
#include "SocConfig.hh"
#include "SdramModule.hh"
#include "Platform.hh"

namespace bsp {

class Crg;

class MemoryRegion
{
public:
  MemoryRegion(const char *name,
               uint64_t origin,
               uint64_t size,
               bool cached);
  const char *name() const { return name_.c_str(); }
  uint64_t origin() const { return origin_; }
  uint64_t size() const { return size_; }
  // One past the last address.
  uint64_t end() const { return origin_ + size_; }
  bool cached() const { return cached_; }
  bool overlaps(const MemoryRegion &region) const;

private:
  std::string name_;
  uint64_t origin_;
  uint64_t size_;
  bool cached_;
};

using MemoryRegionSeq = std::vector<MemoryRegion>;

// DRAM PHY wired to the SDRAM pins with its module.
class DramPhy
{
public:
  DramPhy(const char *phy_name,
          const IoResource *pads,
          const SdramModule *module,
          SdramRate rate,
          int nphases,
          double sys_clk_freq);
  const char *phyName() const { return phy_name_.c_str(); }
  const IoResource *pads() const { return pads_; }
  const SdramModule *module() const { return module_; }
  SdramRate rate() const { return rate_; }
  int nphases() const { return nphases_; }
  const SdramTimingCycles &timing() const { return timing_; }
  int l2Size() const { return l2_size_; }
  void setL2Size(int size);
  int l2MinDataWidth() const { return l2_min_data_width_; }
  void setL2MinDataWidth(int width);
  bool maskedWrite() const { return masked_write_; }
  void setMaskedWrite(bool masked_write);
  // IODELAY reference frequency; zero when the PHY has no IODELAYs.
  double iodelayClkFreq() const { return iodelay_clk_freq_; }
  void setIodelayClkFreq(double freq);

private:
  std::string phy_name_;
  const IoResource *pads_;
  const SdramModule *module_;
  SdramRate rate_;
  int nphases_;
  SdramTimingCycles timing_;
  int l2_size_;
  int l2_min_data_width_;
  bool masked_write_;
  double iodelay_clk_freq_;
};

enum class EthMode { ethernet, etherbone };

const char *
ethModeName(EthMode mode);

class EthPhy
{
public:
  EthPhy(const char *phy_name,
         const IoResource *clock_pads,
         const IoResource *pads,
         EthMode mode);
  const char *phyName() const { return phy_name_.c_str(); }
  const IoResource *clockPads() const { return clock_pads_; }
  const IoResource *pads() const { return pads_; }
  EthMode mode() const { return mode_; }
  const char *ipAddress() const { return ip_address_.c_str(); }
  void setIpAddress(const char *ip);
  bool dynamicIp() const { return dynamic_ip_; }
  void setDynamicIp(bool dynamic_ip);
  // Seconds.
  double rxDelay() const { return rx_delay_; }
  void setRxDelay(double delay);
  double iodelayClkFreq() const { return iodelay_clk_freq_; }
  void setIodelayClkFreq(double freq);

private:
  std::string phy_name_;
  const IoResource *clock_pads_;
  const IoResource *pads_;
  EthMode mode_;
  std::string ip_address_;
  bool dynamic_ip_;
  double rx_delay_;
  double iodelay_clk_freq_;
};

enum class BridgeKind { jtag, uart };

const char *
bridgeKindName(BridgeKind kind);

// Debug bus bridge (JTAGBone, UARTBone).
class DebugBridge
{
public:
  DebugBridge(BridgeKind kind,
              const IoResource *pads,
              double baudrate);
  BridgeKind kind() const { return kind_; }
  // Null for JTAG.
  const IoResource *pads() const { return pads_; }
  double baudrate() const { return baudrate_; }

private:
  BridgeKind kind_;
  const IoResource *pads_;
  double baudrate_;
};

// Peripheral that only claims pins (HyperRAM, SD card, PCIe PHY,
// I2C master, LED chaser, UART).
class PadsBlock
{
public:
  PadsBlock(const char *kind,
            const char *core,
            const IoResourceSeq &pads);
  const char *kind() const { return kind_.c_str(); }
  // Core or PHY instantiated on the pads.
  const char *core() const { return core_.c_str(); }
  const IoResourceSeq &pads() const { return pads_; }

private:
  std::string kind_;
  std::string core_;
  IoResourceSeq pads_;
};

// System-on-chip composed for a board from a SocConfig.
// Owns its platform, CRG and blocks.
class Soc : public BspState
{
public:
  Soc(Platform *platform,
      const SocConfig &config,
      const BspState *bsp);
  virtual ~Soc();
  const char *board() const { return config_.board.c_str(); }
  Platform *platform() const { return platform_; }
  const SocConfig &config() const { return config_; }
  double sysClkFreq() const { return config_.sys_clk_freq; }
  Crg *crg() const { return crg_; }
  // Takes ownership.
  void setCrg(Crg *crg);

  // Errors on duplicate names or overlapping address ranges.
  void addMemoryRegion(const char *name,
                       uint64_t origin,
                       uint64_t size,
                       bool cached);
  const MemoryRegionSeq &memoryRegions() const { return memory_regions_; }
  const MemoryRegion *findMemoryRegion(const char *name) const;

  DramPhy *dramPhy() const { return dram_phy_; }
  void setDramPhy(DramPhy *phy);
  EthPhy *ethPhy() const { return eth_phy_; }
  void setEthPhy(EthPhy *phy);
  const PadsBlock *hyperRam() const { return hyperram_; }
  void setHyperRam(PadsBlock *hyperram);
  const PadsBlock *sdCard() const { return sdcard_; }
  void setSdCard(PadsBlock *sdcard);
  const PadsBlock *pcie() const { return pcie_; }
  void setPcie(PadsBlock *pcie);
  const PadsBlock *i2c() const { return i2c_; }
  void setI2c(PadsBlock *i2c);
  // In-package HBM2 has no board pads.
  const PadsBlock *hbm() const { return hbm_; }
  void setHbm(PadsBlock *hbm);
  const PadsBlock *leds() const { return leds_; }
  void setLeds(PadsBlock *leds);
  const PadsBlock *uart() const { return uart_; }
  void setUart(PadsBlock *uart);
  void addBridge(DebugBridge *bridge);
  const std::vector<DebugBridge*> &bridges() const { return bridges_; }
  const DebugBridge *findBridge(BridgeKind kind) const;
  // Named constants exported to software ("SDRAM_DEBUG").
  void addConstant(const char *name);
  const StringSeq &constants() const { return constants_; }

  // Standard LiteX SoC memory map.
  static constexpr uint64_t rom_origin = 0x00000000;
  static constexpr uint64_t sram_origin = 0x10000000;
  static constexpr uint64_t main_ram_origin = 0x40000000;
  static constexpr uint64_t ethmac_origin = 0x80000000;
  static constexpr uint64_t ethmac_size = 0x2000;
  static constexpr uint64_t csr_origin = 0xf0000000;
  static constexpr uint64_t csr_size = 0x10000;
  static constexpr uint64_t main_ram_size_max = 0x40000000;

protected:
  Platform *platform_;
  SocConfig config_;
  Crg *crg_;
  MemoryRegionSeq memory_regions_;
  DramPhy *dram_phy_;
  EthPhy *eth_phy_;
  PadsBlock *hyperram_;
  PadsBlock *sdcard_;
  PadsBlock *pcie_;
  PadsBlock *i2c_;
  PadsBlock *hbm_;
  PadsBlock *leds_;
  PadsBlock *uart_;
  std::vector<DebugBridge*> bridges_;
  StringSeq constants_;
};

} // namespace
