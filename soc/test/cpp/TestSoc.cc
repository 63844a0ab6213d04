#include <gtest/gtest.h>
#include <algorithm>
#include <string>

#include "Report.hh"
#include "Error.hh"
#include "Debug.hh"
#include "Units.hh"
#include "BspState.hh"
#include "Platform.hh"
#include "SdramModule.hh"
#include "SocConfig.hh"
#include "Soc.hh"
#include "SocSummary.hh"
#include "Board.hh"

namespace bsp {

class SocTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    report_ = new Report;
    debug_ = new Debug(report_);
    units_ = new Units;
    state_.setReport(report_);
    state_.setDebug(debug_);
    state_.setUnits(units_);
  }
  void TearDown() override
  {
    delete units_;
    delete debug_;
    delete report_;
  }

  Soc *makeSoc()
  {
    Platform *platform = new Platform("test", "xc7a35ticsg324-1L",
                                      VendorFamily::xilinx_7series,
                                      "vivado", &state_);
    SocConfig config;
    config.board = "test";
    return new Soc(platform, config, &state_);
  }

  Report *report_;
  Debug *debug_;
  Units *units_;
  BspState state_;
};

TEST_F(SocTest, MemoryRegionOverlap)
{
  MemoryRegion rom("rom", 0x0, 0x20000, true);
  MemoryRegion sram("sram", 0x10000000, 0x2000, true);
  MemoryRegion inside("inside", 0x1000, 0x100, true);
  MemoryRegion adjacent("adjacent", 0x20000, 0x100, true);
  EXPECT_FALSE(rom.overlaps(sram));
  EXPECT_TRUE(rom.overlaps(inside));
  EXPECT_TRUE(inside.overlaps(rom));
  EXPECT_FALSE(rom.overlaps(adjacent));
  EXPECT_EQ(rom.end(), 0x20000u);
}

TEST_F(SocTest, AddMemoryRegions)
{
  Soc *soc = makeSoc();
  soc->addMemoryRegion("rom", Soc::rom_origin, 0x20000, true);
  soc->addMemoryRegion("csr", Soc::csr_origin, Soc::csr_size, false);
  ASSERT_EQ(soc->memoryRegions().size(), 2u);
  EXPECT_FALSE(soc->findMemoryRegion("csr")->cached());
  EXPECT_EQ(soc->findMemoryRegion("main_ram"), nullptr);

  // Empty.
  EXPECT_THROW(soc->addMemoryRegion("sram", Soc::sram_origin, 0, true),
               ExceptionMsg);
  // Duplicate name.
  EXPECT_THROW(soc->addMemoryRegion("rom", Soc::sram_origin, 0x2000, true),
               ExceptionMsg);
  // Overlaps rom.
  EXPECT_THROW(soc->addMemoryRegion("boot", 0x10000, 0x20000, true),
               ExceptionMsg);
  EXPECT_EQ(soc->memoryRegions().size(), 2u);
  delete soc;
}

TEST_F(SocTest, Bridges)
{
  Soc *soc = makeSoc();
  EXPECT_EQ(soc->findBridge(BridgeKind::jtag), nullptr);
  soc->addBridge(new DebugBridge(BridgeKind::jtag, nullptr, 0.0));
  EXPECT_NE(soc->findBridge(BridgeKind::jtag), nullptr);
  EXPECT_STREQ(bridgeKindName(BridgeKind::uart), "uartbone");
  EXPECT_STREQ(ethModeName(EthMode::etherbone), "etherbone");
  delete soc;
}

////////////////////////////////////////////////////////////////

TEST(SdramModuleTest, Catalog)
{
  EXPECT_EQ(SdramModule::modules().size(), 5u);
  EXPECT_EQ(SdramModule::find("MT41K256M16"), nullptr);
  const SdramModule *module = SdramModule::find("MT41K128M16");
  ASSERT_NE(module, nullptr);
  EXPECT_EQ(module->type(), SdramType::ddr3);
  EXPECT_EQ(module->bankbits(), 3);
  EXPECT_EQ(module->rowbits(), 14);
  EXPECT_EQ(module->colbits(), 10);
  EXPECT_EQ(module->size(), 256LL * 1024 * 1024);
  const SdramModule *lpddr4 = SdramModule::find("MT53E256M16D1");
  ASSERT_NE(lpddr4, nullptr);
  EXPECT_STREQ(sdramTypeName(lpddr4->type()), "LPDDR4");
  EXPECT_EQ(lpddr4->size(), 512LL * 1024 * 1024);
  // Both ZCU104 SODIMMs are 4 GiB.
  const SdramModule *kvr = SdramModule::find("KVR21SE15S84");
  ASSERT_NE(kvr, nullptr);
  EXPECT_EQ(kvr->type(), SdramType::ddr4);
  EXPECT_EQ(kvr->bankbits(), 4);
  EXPECT_EQ(kvr->rowbits(), 15);
  EXPECT_EQ(kvr->size(), 4096LL * 1024 * 1024);
  EXPECT_EQ(SdramModule::find("MTA4ATF51264HZ")->size(), kvr->size());
}

TEST(SdramModuleTest, Rates)
{
  SdramRate rate;
  EXPECT_TRUE(findSdramRate("1:4", rate));
  EXPECT_EQ(rate, SdramRate::rate_1_4);
  EXPECT_FALSE(findSdramRate("1:3", rate));
  EXPECT_STREQ(sdramRateName(SdramRate::rate_1_8), "1:8");
  EXPECT_EQ(sdramRateRatio(SdramRate::rate_1_2), 2);
}

TEST(SdramModuleTest, CycleConversion)
{
  EXPECT_EQ(SdramModule::ckToCycles(4, SdramRate::rate_1_4), 1);
  EXPECT_EQ(SdramModule::ckToCycles(5, SdramRate::rate_1_4), 2);
  EXPECT_EQ(SdramModule::ckToCycles(0, SdramRate::rate_1_8), 0);
  // 10ns period, 7.5ns of phase margin at 1:4.
  EXPECT_EQ(SdramModule::nsToCycles(13.75, 100e6, SdramRate::rate_1_4), 3);
  EXPECT_EQ(SdramModule::nsToCycles(13.75, 100e6, SdramRate::rate_1_1), 2);
  EXPECT_EQ(SdramModule::nsToCycles(7812.5, 100e6, SdramRate::rate_1_4,
                                    false), 782);
  EXPECT_EQ(SdramModule::timingCycles(SdramTiming(4, 7.5), 100e6,
                                      SdramRate::rate_1_4), 2);
}

TEST(SdramModuleTest, ModuleTiming)
{
  const SdramModule *module = SdramModule::find("MT41K128M16");
  SdramTimingCycles timing = module->timingCycles(100e6, SdramRate::rate_1_4);
  EXPECT_EQ(timing.tRP, 3);
  EXPECT_EQ(timing.tRCD, 3);
  EXPECT_EQ(timing.tWTR, 2);
  EXPECT_EQ(timing.tREFI, 782);
  EXPECT_EQ(timing.tRFC, 32);
  EXPECT_EQ(timing.tCCD, 1);
  EXPECT_EQ(timing.tRAS, 5);
  EXPECT_EQ(timing.tRC, 6);
  EXPECT_EQ(timing.tZQCS, 16);
}

////////////////////////////////////////////////////////////////

TEST_F(SocTest, ConfigFlags)
{
  SocConfig config;
  EXPECT_FALSE(config.with_sdram);
  EXPECT_TRUE(config.setFlag("with_sdram"));
  EXPECT_TRUE(config.with_sdram);
  EXPECT_TRUE(config.setFlag("no_sdram"));
  EXPECT_FALSE(config.with_sdram);
  EXPECT_TRUE(config.setFlag("no_leds"));
  EXPECT_FALSE(config.with_leds);
  EXPECT_TRUE(config.setFlag("no_masked_write"));
  EXPECT_FALSE(config.masked_write);
  EXPECT_FALSE(config.setFlag("with_video"));
}

TEST_F(SocTest, ConfigOptions)
{
  SocConfig config;
  EXPECT_TRUE(config.setOption("sys_clk_freq", "75e6", report_));
  EXPECT_DOUBLE_EQ(config.sys_clk_freq, 75e6);
  EXPECT_TRUE(config.setOption("l2_size", "0x4000", report_));
  EXPECT_EQ(config.l2_size, 0x4000);
  EXPECT_TRUE(config.setOption("eth_ip", "10.0.0.2", report_));
  EXPECT_EQ(config.eth_ip, "10.0.0.2");
  EXPECT_TRUE(config.setOption("variant", "a7-100", report_));
  EXPECT_EQ(config.variant, "a7-100");
  EXPECT_FALSE(config.setOption("cpu_type", "vexriscv", report_));
  EXPECT_THROW(config.setOption("sys_clk_freq", "fast", report_),
               ExceptionMsg);
  EXPECT_THROW(config.setOption("l2_size", "8k", report_), ExceptionMsg);
  EXPECT_THROW(config.setOption("integrated_rom_size", "-1", report_),
               ExceptionMsg);
  EXPECT_THROW(config.setOption("sys_clk_freq", "nan", report_),
               ExceptionMsg);
  EXPECT_THROW(config.setOption("sys_clk_freq", "inf", report_),
               ExceptionMsg);
  EXPECT_TRUE(config.setOption("sdram_module", "KVR21SE15S84", report_));
  EXPECT_EQ(config.sdram_module, "KVR21SE15S84");
  EXPECT_TRUE(config.setOption("device", "xc7a15tfgg484-1", report_));
  EXPECT_EQ(config.device, "xc7a15tfgg484-1");
}

TEST_F(SocTest, ConfigSizeRange)
{
  SocConfig config;
  EXPECT_TRUE(config.setOption("integrated_main_ram_size", "0", report_));
  EXPECT_EQ(config.integrated_main_ram_size, 0);
  EXPECT_TRUE(config.setOption("l2_size", "2147483647", report_));
  EXPECT_EQ(config.l2_size, 2147483647);
  // Used to wrap to 0.
  EXPECT_THROW(config.setOption("l2_size", "4294967296", report_),
               ExceptionMsg);
  EXPECT_EQ(config.l2_size, 2147483647);
  EXPECT_THROW(config.setOption("l2_size", "2147483648", report_),
               ExceptionMsg);
  EXPECT_THROW(config.setOption("l2_size", "99999999999999999999", report_),
               ExceptionMsg);
  EXPECT_THROW(config.setOption("l2_size", "-1", report_), ExceptionMsg);
  try {
    config.setOption("integrated_rom_size", "0x100000000", report_);
    FAIL() << "expected ExceptionMsg";
  }
  catch (const ExceptionMsg &error) {
    EXPECT_EQ(error.id(), 631);
    EXPECT_STREQ(error.what(),
                 "integrated_rom_size value 0x100000000 is not an integer in 0-2147483647.");
  }
}

////////////////////////////////////////////////////////////////

TEST_F(SocTest, ArtySummary)
{
  Boards boards(&state_);
  const Board *arty = boards.findOrError("digilent_arty");
  SocConfig config = arty->defaultConfig();
  config.with_ethernet = true;
  Soc *soc = arty->composeSoc(config);
  SocSummary summary = socSummary(soc);
  EXPECT_EQ(summary.board, "digilent_arty");
  EXPECT_EQ(summary.device, "xc7a35ticsg324-1L");
  EXPECT_EQ(summary.family, "xilinx_7series");
  EXPECT_EQ(summary.pll_family, "S7PLL");
  EXPECT_DOUBLE_EQ(summary.pll_clkin_freq, 100e6);
  EXPECT_GT(summary.pll_vco, 0.0);

  auto sys = std::find_if(summary.clocks.begin(), summary.clocks.end(),
                          [] (const ClockSummary &clock) {
                            return clock.name == "sys";
                          });
  ASSERT_NE(sys, summary.clocks.end());
  EXPECT_EQ(sys->source, "pll");
  EXPECT_DOUBLE_EQ(sys->freq, 50e6);

  EXPECT_TRUE(summary.with_sdram);
  EXPECT_EQ(summary.sdram_module, "MT41K128M16");
  EXPECT_EQ(summary.sdram_rate, "1:8");
  EXPECT_EQ(summary.sdram_rowbits, 14);
  EXPECT_EQ(summary.sdram_timing.tRP, 2);
  EXPECT_EQ(summary.l2_size, 0);

  EXPECT_TRUE(summary.with_eth);
  EXPECT_EQ(summary.eth_phy, "LiteEthPHYMII");
  EXPECT_EQ(summary.eth_mode, "ethernet");

  EXPECT_NE(std::find(summary.peripherals.begin(), summary.peripherals.end(),
                      "uart"), summary.peripherals.end());
  EXPECT_NE(std::find(summary.peripherals.begin(), summary.peripherals.end(),
                      "leds"), summary.peripherals.end());
  EXPECT_NE(std::find(summary.ports.begin(), summary.ports.end(),
                      "serial_tx"), summary.ports.end());
  EXPECT_NE(std::find(summary.ports.begin(), summary.ports.end(),
                      "user_led0"), summary.ports.end());
  delete soc;
}

TEST_F(SocTest, ReportSummary)
{
  Boards boards(&state_);
  const Board *zcu = boards.findOrError("zcu104");
  Soc *soc = zcu->composeSoc(zcu->defaultConfig());
  report_->redirectStringBegin();
  reportSocSummary(socSummary(soc), report_, units_);
  std::string out(report_->redirectStringEnd());
  EXPECT_NE(out.find("Board      zcu104\n"), std::string::npos);
  EXPECT_NE(out.find("Device     xczu7ev-ffvc1156-2-i (xilinx_usplus, vivado)"),
            std::string::npos);
  EXPECT_NE(out.find("PLL USMMCM"), std::string::npos);
  // 4 GiB SODIMM capped at the main_ram window.
  EXPECT_NE(out.find("main_ram   0x40000000   0x40000000\n"), std::string::npos);
  EXPECT_NE(out.find("csr        0xf0000000   0x00010000 io\n"),
            std::string::npos);
  EXPECT_NE(out.find("SDRAM USPDDRPHY MTA4ATF51264HZ DDR4 rate 1:4 nphases 4\n"),
            std::string::npos);
  EXPECT_NE(out.find(" geometry bank 3 row 16 col 10 size 4096 MiB\n"),
            std::string::npos);
  EXPECT_NE(out.find("Peripherals uart i2c leds"), std::string::npos);
  delete soc;
}

} // namespace
