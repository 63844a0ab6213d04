#include <gtest/gtest.h>
#include <string>

#include "Report.hh"
#include "Debug.hh"
#include "Units.hh"
#include "BspState.hh"
#include "Pll.hh"
#include "Crg.hh"
#include "Platform.hh"
#include "Board.hh"
#include "Soc.hh"

namespace bsp {

class BoardsTest : public ::testing::Test
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
    boards_ = new Boards(&state_);
  }
  void TearDown() override
  {
    delete boards_;
    delete units_;
    delete debug_;
    delete report_;
  }

  const Board *board(const char *name) const
  {
    return boards_->findOrError(name);
  }

  Report *report_;
  Debug *debug_;
  Units *units_;
  BspState state_;
  Boards *boards_;
};

TEST_F(BoardsTest, Registry)
{
  BoardSeq boards = boards_->boards();
  ASSERT_EQ(boards.size(), 7u);
  EXPECT_STREQ(boards[0]->name(), "antmicro_lpddr4_test_board");
  EXPECT_STREQ(boards[1]->name(), "artix_dc_scm");
  EXPECT_STREQ(boards[2]->name(), "digilent_arty");
  EXPECT_STREQ(boards[3]->name(), "ecp5_dc_scm");
  EXPECT_STREQ(boards[4]->name(), "forest_kitten_33");
  EXPECT_STREQ(boards[5]->name(), "lpddr4_test_board");
  EXPECT_STREQ(boards[6]->name(), "zcu104");
  EXPECT_EQ(boards_->find("arty"), nullptr);
  EXPECT_THROW(boards_->findOrError("arty"), ExceptionMsg);
}

TEST_F(BoardsTest, ComposeDefaults)
{
  for (const Board *board : boards_->boards()) {
    SocConfig config = board->defaultConfig();
    EXPECT_EQ(config.board, board->name());
    Soc *soc = board->composeSoc(config);
    EXPECT_TRUE(soc->crg()->isFinalized()) << board->name();
    EXPECT_NEAR(soc->crg()->freq("sys"), config.sys_clk_freq,
                config.sys_clk_freq * 1e-2) << board->name();
    EXPECT_NE(soc->findMemoryRegion("csr"), nullptr) << board->name();
    EXPECT_NE(soc->uart(), nullptr) << board->name();
    delete soc;
  }
}

TEST_F(BoardsTest, AntmicroLpddr4)
{
  const Board *antmicro = board("antmicro_lpddr4_test_board");
  SocConfig config = antmicro->defaultConfig();
  EXPECT_DOUBLE_EQ(config.sys_clk_freq, 50e6);
  config.with_hyperram = true;
  config.with_ethernet = true;
  Soc *soc = antmicro->composeSoc(config);
  const DramPhy *phy = soc->dramPhy();
  ASSERT_NE(phy, nullptr);
  EXPECT_STREQ(phy->phyName(), "K7LPDDR4PHY");
  EXPECT_STREQ(phy->module()->name(), "MT53E256M16D1");
  EXPECT_EQ(phy->rate(), SdramRate::rate_1_8);
  EXPECT_EQ(phy->l2Size(), 8192);
  EXPECT_EQ(phy->l2MinDataWidth(), 256);
  EXPECT_TRUE(phy->maskedWrite());
  EXPECT_DOUBLE_EQ(phy->iodelayClkFreq(), 200e6);

  const MemoryRegion *main_ram = soc->findMemoryRegion("main_ram");
  ASSERT_NE(main_ram, nullptr);
  EXPECT_EQ(main_ram->origin(), Soc::main_ram_origin);
  EXPECT_EQ(main_ram->size(), 0x20000000u);
  const MemoryRegion *hyperram = soc->findMemoryRegion("hyperram");
  ASSERT_NE(hyperram, nullptr);
  EXPECT_EQ(hyperram->origin(), 0x20000000u);
  EXPECT_EQ(soc->constants(), StringSeq({"SDRAM_DEBUG"}));

  const EthPhy *eth = soc->ethPhy();
  ASSERT_NE(eth, nullptr);
  EXPECT_STREQ(eth->phyName(), "LiteEthS7PHYRGMII");
  EXPECT_EQ(eth->mode(), EthMode::ethernet);
  EXPECT_DOUBLE_EQ(eth->rxDelay(), 0.8e-9);
  EXPECT_NE(soc->findMemoryRegion("ethmac"), nullptr);
  EXPECT_NE(soc->findBridge(BridgeKind::jtag), nullptr);
  EXPECT_EQ(soc->findBridge(BridgeKind::uart), nullptr);
  ASSERT_NE(soc->leds(), nullptr);
  EXPECT_EQ(soc->leds()->pads().size(), 5u);
  delete soc;
}

TEST_F(BoardsTest, MemoryRegionsDisjoint)
{
  const Board *antmicro = board("antmicro_lpddr4_test_board");
  SocConfig config = antmicro->defaultConfig();
  config.with_hyperram = true;
  config.with_ethernet = true;
  Soc *soc = antmicro->composeSoc(config);
  const MemoryRegionSeq &regions = soc->memoryRegions();
  for (size_t i = 0; i < regions.size(); i++) {
    for (size_t j = i + 1; j < regions.size(); j++)
      EXPECT_FALSE(regions[i].overlaps(regions[j]))
        << regions[i].name() << " " << regions[j].name();
  }
  delete soc;
}

TEST_F(BoardsTest, Etherbone)
{
  const Board *antmicro = board("antmicro_lpddr4_test_board");
  SocConfig config = antmicro->defaultConfig();
  config.with_etherbone = true;
  config.eth_ip = "10.0.0.2";
  Soc *soc = antmicro->composeSoc(config);
  const EthPhy *eth = soc->ethPhy();
  ASSERT_NE(eth, nullptr);
  EXPECT_EQ(eth->mode(), EthMode::etherbone);
  EXPECT_STREQ(eth->ipAddress(), "10.0.0.2");
  EXPECT_EQ(soc->findMemoryRegion("ethmac"), nullptr);
  delete soc;
}

TEST_F(BoardsTest, ConfigErrors)
{
  const Board *antmicro = board("antmicro_lpddr4_test_board");
  SocConfig config = antmicro->defaultConfig();
  config.with_ethernet = true;
  config.with_etherbone = true;
  EXPECT_THROW(antmicro->composeSoc(config), ExceptionMsg);

  config = antmicro->defaultConfig();
  config.with_etherbone = true;
  config.eth_dynamic_ip = true;
  EXPECT_THROW(antmicro->composeSoc(config), ExceptionMsg);

  config = antmicro->defaultConfig();
  config.sys_clk_freq = 0.0;
  EXPECT_THROW(antmicro->composeSoc(config), ExceptionMsg);

  config = antmicro->defaultConfig();
  config.iodelay_clk_freq = 250e6;
  EXPECT_THROW(antmicro->composeSoc(config), ExceptionMsg);

  config = antmicro->defaultConfig();
  config.l2_size = -1;
  EXPECT_THROW(antmicro->composeSoc(config), ExceptionMsg);
}

TEST_F(BoardsTest, NoPllConfigIsError)
{
  const Board *arty = board("digilent_arty");
  SocConfig config = arty->defaultConfig();
  // sys is below the PLL output minimum.
  config.sys_clk_freq = 1e6;
  try {
    Soc *soc = arty->composeSoc(config);
    delete soc;
    FAIL() << "expected ExceptionMsg";
  }
  catch (const PllNoConfig &) {
    FAIL() << "composition reports no config as an error";
  }
  catch (const ExceptionMsg &error) {
    EXPECT_NE(std::string(error.what()).find("no PLL configuration"),
              std::string::npos);
  }
}

TEST_F(BoardsTest, Lpddr4TestBoard)
{
  const Board *lpddr4 = board("lpddr4_test_board");
  SocConfig config = lpddr4->defaultConfig();
  Soc *soc = lpddr4->composeSoc(config);
  EXPECT_EQ(soc->dramPhy(), nullptr);
  const MemoryRegion *main_ram = soc->findMemoryRegion("main_ram");
  ASSERT_NE(main_ram, nullptr);
  EXPECT_EQ(main_ram->size(), 0x10000u);
  EXPECT_NE(soc->hyperRam(), nullptr);
  EXPECT_EQ(soc->findMemoryRegion("hyperram")->origin(), 0x30000000u);
  ASSERT_NE(soc->ethPhy(), nullptr);
  EXPECT_STREQ(soc->ethPhy()->phyName(), "LiteEthPHYMII");
  ASSERT_EQ(soc->crg()->clockPins().size(), 1u);
  EXPECT_DOUBLE_EQ(soc->crg()->freq("eth"), 25e6);
  delete soc;

  config.with_sdram = true;
  EXPECT_THROW(lpddr4->composeSoc(config), ExceptionMsg);
}

TEST_F(BoardsTest, ArtyVariants)
{
  const Board *arty = board("digilent_arty");
  SocConfig config = arty->defaultConfig();
  Platform *platform = arty->makePlatform(config);
  EXPECT_STREQ(platform->device(), "xc7a35ticsg324-1L");
  delete platform;

  config.variant = "a7-100";
  platform = arty->makePlatform(config);
  EXPECT_STREQ(platform->device(), "xc7a100tcsg324-1");
  delete platform;

  config.variant = "a7-50";
  EXPECT_THROW(arty->makePlatform(config), ExceptionMsg);
}

TEST_F(BoardsTest, ArtySdram)
{
  const Board *arty = board("digilent_arty");
  SocConfig config = arty->defaultConfig();
  config.with_sdcard = true;
  Soc *soc = arty->composeSoc(config);
  const DramPhy *phy = soc->dramPhy();
  ASSERT_NE(phy, nullptr);
  EXPECT_STREQ(phy->module()->name(), "MT41K128M16");
  EXPECT_EQ(soc->findMemoryRegion("main_ram")->size(), 0x10000000u);
  EXPECT_NE(soc->sdCard(), nullptr);
  EXPECT_STREQ(soc->crg()->resetResource()->name(), "cpu_reset");
  EXPECT_DOUBLE_EQ(soc->crg()->findDomain("sys8x_dqs")->phase(), 90.0);
  delete soc;
}

TEST_F(BoardsTest, Ecp5DcScm)
{
  const Board *ecp5 = board("ecp5_dc_scm");
  SocConfig config = ecp5->defaultConfig();
  EXPECT_DOUBLE_EQ(config.sys_clk_freq, 75e6);
  Soc *soc = ecp5->composeSoc(config);
  EXPECT_EQ(soc->platform()->family(), VendorFamily::lattice_ecp5);
  const Crg *crg = soc->crg();
  EXPECT_STREQ(crg->pll()->familyName(), "ECP5PLL");
  EXPECT_DOUBLE_EQ(crg->freq("sys2x"), 150e6);
  EXPECT_DOUBLE_EQ(crg->freq("sys"), 75e6);
  EXPECT_DOUBLE_EQ(crg->freq("init"), 25e6);
  EXPECT_DOUBLE_EQ(crg->freq("por"), 100e6);
  EXPECT_DOUBLE_EQ(crg->freq("ulpi1"), 60e6);
  ASSERT_NE(soc->dramPhy(), nullptr);
  EXPECT_EQ(soc->dramPhy()->rate(), SdramRate::rate_1_2);
  ASSERT_NE(soc->pcie(), nullptr);
  EXPECT_STREQ(soc->pcie()->core(), "LatticeECP5PCIeSERDES");
  ASSERT_NE(soc->ethPhy(), nullptr);
  EXPECT_STREQ(soc->ethPhy()->phyName(), "LiteEthPHYRGMII");
  EXPECT_EQ(soc->leds(), nullptr);
  delete soc;
}

TEST_F(BoardsTest, Zcu104)
{
  const Board *zcu = board("zcu104");
  SocConfig config = zcu->defaultConfig();
  Soc *soc = zcu->composeSoc(config);
  const Crg *crg = soc->crg();
  EXPECT_STREQ(crg->pll()->familyName(), "USMMCM");
  EXPECT_DOUBLE_EQ(crg->freq("pll4x"), 500e6);
  EXPECT_DOUBLE_EQ(crg->freq("sys"), 125e6);
  EXPECT_DOUBLE_EQ(crg->freq("clk500"), 500e6);
  EXPECT_EQ(soc->leds()->pads().size(), 4u);
  ASSERT_NE(soc->i2c(), nullptr);
  EXPECT_STREQ(soc->i2c()->core(), "I2CMaster");
  EXPECT_TRUE(soc->platform()->lookup("i2c", 0)->isRequested());

  const DramPhy *phy = soc->dramPhy();
  ASSERT_NE(phy, nullptr);
  EXPECT_STREQ(phy->phyName(), "USPDDRPHY");
  EXPECT_STREQ(phy->module()->name(), "MTA4ATF51264HZ");
  EXPECT_EQ(phy->module()->type(), SdramType::ddr4);
  EXPECT_EQ(phy->rate(), SdramRate::rate_1_4);
  EXPECT_EQ(phy->nphases(), 4);
  EXPECT_DOUBLE_EQ(phy->iodelayClkFreq(), 500e6);
  EXPECT_EQ(phy->l2Size(), 8192);
  EXPECT_EQ(phy->l2MinDataWidth(), 128);
  EXPECT_STREQ(phy->pads()->name(), "ddram");
  EXPECT_EQ(phy->pads()->findSubsignal("dq")->pins().size(), 64u);
  EXPECT_EQ(phy->pads()->findSubsignal("dqs_p")->pins().size(), 8u);
  const MemoryRegion *main_ram = soc->findMemoryRegion("main_ram");
  ASSERT_NE(main_ram, nullptr);
  EXPECT_EQ(main_ram->size(), Soc::main_ram_size_max);
  delete soc;
}

TEST_F(BoardsTest, Zcu104SdramChoices)
{
  const Board *zcu = board("zcu104");
  SocConfig config = zcu->defaultConfig();
  config.sdram_module = "KVR21SE15S84";
  Soc *soc = zcu->composeSoc(config);
  ASSERT_NE(soc->dramPhy(), nullptr);
  EXPECT_STREQ(soc->dramPhy()->module()->name(), "KVR21SE15S84");
  delete soc;

  // On-chip main RAM replaces the SODIMM.
  config = zcu->defaultConfig();
  config.integrated_main_ram_size = 0x10000;
  soc = zcu->composeSoc(config);
  EXPECT_EQ(soc->dramPhy(), nullptr);
  EXPECT_EQ(soc->findMemoryRegion("main_ram")->size(), 0x10000u);
  EXPECT_FALSE(soc->platform()->lookup("ddram", 0)->isRequested());
  delete soc;

  config = zcu->defaultConfig();
  config.sdram_module = "MT41K128M16";
  EXPECT_THROW(zcu->composeSoc(config), ExceptionMsg);
  config.sdram_module = "DDR4-8G";
  EXPECT_THROW(zcu->composeSoc(config), ExceptionMsg);
  config = zcu->defaultConfig();
  // 7-series reference frequency is too slow for UltraScale+.
  config.iodelay_clk_freq = 200e6;
  EXPECT_THROW(zcu->composeSoc(config), ExceptionMsg);
  config = zcu->defaultConfig();
  config.with_ethernet = true;
  EXPECT_THROW(zcu->composeSoc(config), ExceptionMsg);
}

TEST_F(BoardsTest, ArtixDcScm)
{
  const Board *artix = board("artix_dc_scm");
  SocConfig config = artix->defaultConfig();
  EXPECT_DOUBLE_EQ(config.sys_clk_freq, 100e6);
  EXPECT_EQ(config.integrated_rom_size, 0x10000);
  Soc *soc = artix->composeSoc(config);
  EXPECT_STREQ(soc->platform()->device(), "xc7a100tfgg484-1");
  const Crg *crg = soc->crg();
  EXPECT_STREQ(crg->pll()->familyName(), "S7PLL");
  EXPECT_DOUBLE_EQ(crg->freq("sys4x"), 400e6);
  EXPECT_DOUBLE_EQ(crg->findDomain("sys4x_dqs")->phase(), 90.0);
  EXPECT_DOUBLE_EQ(crg->freq("idelay"), 200e6);
  EXPECT_DOUBLE_EQ(crg->freq("ulpi0"), 60e6);
  EXPECT_DOUBLE_EQ(crg->freq("ulpi1"), 60e6);
  EXPECT_EQ(soc->dramPhy(), nullptr);
  EXPECT_EQ(soc->pcie(), nullptr);
  EXPECT_EQ(soc->ethPhy(), nullptr);
  EXPECT_EQ(soc->leds()->pads().size(), 4u);
  delete soc;

  config.device = "xc7a15tfgg484-1";
  config.with_sdram = true;
  config.with_ethernet = true;
  config.with_pcie = true;
  soc = artix->composeSoc(config);
  EXPECT_STREQ(soc->platform()->device(), "xc7a15tfgg484-1");
  const DramPhy *phy = soc->dramPhy();
  ASSERT_NE(phy, nullptr);
  EXPECT_STREQ(phy->phyName(), "A7DDRPHY");
  EXPECT_STREQ(phy->module()->name(), "AS4C256M16D3A");
  EXPECT_EQ(phy->nphases(), 4);
  EXPECT_EQ(phy->l2MinDataWidth(), 128);
  EXPECT_EQ(phy->pads()->findSubsignal("dq")->pins().size(), 16u);
  EXPECT_NE(soc->findMemoryRegion("main_ram"), nullptr);
  ASSERT_NE(soc->pcie(), nullptr);
  EXPECT_STREQ(soc->pcie()->core(), "S7PCIEPHY");
  EXPECT_TRUE(soc->platform()->lookup("pcie_x1", 0)->isRequested());
  ASSERT_NE(soc->ethPhy(), nullptr);
  EXPECT_STREQ(soc->ethPhy()->phyName(), "LiteEthS7PHYRGMII");
  delete soc;

  config = artix->defaultConfig();
  config.device = "xc7a35ticsg324-1L";
  try {
    artix->composeSoc(config);
    FAIL() << "unknown device accepted";
  }
  catch (const ExceptionMsg &error) {
    EXPECT_EQ(error.id(), 560);
  }
  config = artix->defaultConfig();
  config.with_etherbone = true;
  EXPECT_THROW(artix->composeSoc(config), ExceptionMsg);
  config = artix->defaultConfig();
  config.with_hyperram = true;
  EXPECT_THROW(artix->composeSoc(config), ExceptionMsg);
}

TEST_F(BoardsTest, ForestKitten33)
{
  const Board *kitten = board("forest_kitten_33");
  SocConfig config = kitten->defaultConfig();
  EXPECT_DOUBLE_EQ(config.sys_clk_freq, 450e6);
  double min, max;
  ASSERT_TRUE(kitten->sysClkRange(min, max));
  EXPECT_DOUBLE_EQ(min, 225e6);
  EXPECT_DOUBLE_EQ(max, 450e6);
  Soc *soc = kitten->composeSoc(config);
  EXPECT_EQ(soc->platform()->family(), VendorFamily::xilinx_usplus);
  const Crg *crg = soc->crg();
  EXPECT_STREQ(crg->pll()->familyName(), "USMMCM");
  EXPECT_DOUBLE_EQ(crg->freq("hbm_ref"), 100e6);
  EXPECT_DOUBLE_EQ(crg->freq("apb"), 100e6);
  ASSERT_NE(soc->hbm(), nullptr);
  EXPECT_STREQ(soc->hbm()->core(), "HBMIP");
  EXPECT_TRUE(soc->hbm()->pads().empty());
  EXPECT_EQ(soc->dramPhy(), nullptr);
  EXPECT_EQ(soc->findMemoryRegion("main_ram")->size(), Soc::main_ram_size_max);
  EXPECT_EQ(soc->leds()->pads().size(), 7u);
  delete soc;

  config.with_sdram = true;
  EXPECT_THROW(kitten->composeSoc(config), ExceptionMsg);
  config = kitten->defaultConfig();
  config.with_pcie = true;
  EXPECT_THROW(kitten->composeSoc(config), ExceptionMsg);
}

TEST_F(BoardsTest, SysClkRangeChecked)
{
  const Board *kitten = board("forest_kitten_33");
  SocConfig config = kitten->defaultConfig();
  config.sys_clk_freq = 200e6;
  try {
    kitten->composeSoc(config);
    FAIL() << "sys_clk_freq below range accepted";
  }
  catch (const ExceptionMsg &error) {
    EXPECT_EQ(error.id(), 511);
  }

  // An out of range candidate stops the scan.
  config = kitten->defaultConfig();
  report_->redirectStringBegin();
  try {
    kitten->scanPll(config, 440e6, 460e6, 5e6, false);
    FAIL() << "scan past the range accepted";
  }
  catch (const ExceptionMsg &error) {
    EXPECT_EQ(error.id(), 511);
  }
  report_->redirectStringEnd();
}

TEST_F(BoardsTest, ScanArty)
{
  const Board *arty = board("digilent_arty");
  SocConfig config = arty->defaultConfig();
  report_->redirectStringBegin();
  PllScanResultSeq results = arty->scanPll(config, 50e6, 52e6, 1e6, true);
  std::string out(report_->redirectStringEnd());
  ASSERT_EQ(results.size(), 2u);
  EXPECT_TRUE(results[0].found());
  EXPECT_DOUBLE_EQ(results[1].freq(), 51e6);
  EXPECT_NE(out.find("Found PLL configs for:"), std::string::npos);
  EXPECT_NE(out.find("sys_clk_freq =  50.00 MHz"), std::string::npos);
}

TEST_F(BoardsTest, ScanRecordsNoConfig)
{
  const Board *arty = board("digilent_arty");
  SocConfig config = arty->defaultConfig();
  report_->redirectStringBegin();
  PllScanResultSeq results = arty->scanPll(config, 1e6, 3e6, 1e6, false);
  report_->redirectStringEnd();
  ASSERT_EQ(results.size(), 2u);
  EXPECT_FALSE(results[0].found());
  EXPECT_FALSE(results[1].found());
}

TEST_F(BoardsTest, ScanFatalError)
{
  const Board *arty = board("digilent_arty");
  SocConfig config = arty->defaultConfig();
  config.variant = "a7-50";
  report_->redirectStringBegin();
  EXPECT_THROW(arty->scanPll(config, 50e6, 52e6, 1e6, false), ExceptionMsg);
  report_->redirectStringEnd();
}

} // namespace
