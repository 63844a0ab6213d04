#include <gtest/gtest.h>
#include <string>

#include "Report.hh"
#include "Debug.hh"
#include "Units.hh"
#include "BspState.hh"
#include "Platform.hh"
#include "Pll.hh"
#include "ClockDomain.hh"
#include "Crg.hh"
#include "clock/XilinxPll.hh"

namespace bsp {

class CrgTest : public ::testing::Test
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
    platform_ = new Platform("test", "xc7a35ticsg324-1L",
                             VendorFamily::xilinx_7series, "vivado", &state_);
    platform_->addResource("clk100", 0, "E3", "LVCMOS33");
    platform_->addResource("cpu_reset", 0, "C2", "LVCMOS33");
    platform_->addResource("eth_ref_clk", 0, "G18", "LVCMOS33");
    platform_->addResource("ulpi_clock", 0, "P28", "LVCMOS33");
    crg_ = new Crg(platform_, &state_);
    crg_->setPll(new S7Pll("pll", -1, &state_));
  }
  void TearDown() override
  {
    delete crg_;
    delete platform_;
    delete units_;
    delete debug_;
    delete report_;
  }

  Report *report_;
  Debug *debug_;
  Units *units_;
  BspState state_;
  Platform *platform_;
  Crg *crg_;
};

TEST_F(CrgTest, ResolveDomains)
{
  crg_->requestReset("cpu_reset", 0);
  crg_->requestClkin("clk100", 0, 100e6);
  crg_->makePllDomain("sys", 100e6);
  crg_->makePllDomain("sys4x", 400e6, 0.0, false);
  crg_->makePllDomain("sys4x_dqs", 400e6, 90.0, false);
  crg_->makePllDomain("eth", 25e6);
  crg_->makeDerivedDomain("sys_half", "sys", 2);
  crg_->makePinDomain("por", "clk100", 0, 100e6, true);
  crg_->driveClockPin("eth", "eth_ref_clk", 0);
  crg_->finalize();

  EXPECT_TRUE(crg_->isFinalized());
  EXPECT_DOUBLE_EQ(crg_->freq("sys"), 100e6);
  EXPECT_DOUBLE_EQ(crg_->freq("sys4x"), 400e6);
  EXPECT_DOUBLE_EQ(crg_->freq("sys_half"), 50e6);
  EXPECT_DOUBLE_EQ(crg_->freq("por"), 100e6);
  EXPECT_DOUBLE_EQ(crg_->findDomain("sys4x_dqs")->phase(), 90.0);
  EXPECT_TRUE(crg_->findDomain("sys4x")->resetLess());
  EXPECT_FALSE(crg_->findDomain("sys")->resetLess());
  EXPECT_TRUE(crg_->findDomain("por")->resetLess());
  EXPECT_EQ(crg_->findDomain("sys_half")->source(), ClockSource::derived);
  EXPECT_STREQ(crg_->findDomain("por")->pinName(), "clk100");
  EXPECT_STREQ(crg_->resetResource()->name(), "cpu_reset");

  ASSERT_EQ(crg_->clockPins().size(), 1u);
  EXPECT_STREQ(crg_->clockPins()[0].resource()->name(), "eth_ref_clk");
  EXPECT_TRUE(platform_->lookup("eth_ref_clk", 0)->isRequested());
  EXPECT_TRUE(platform_->lookup("clk100", 0)->isRequested());
}

TEST_F(CrgTest, DerivedChain)
{
  crg_->requestClkin("clk100", 0, 100e6);
  crg_->makePllDomain("pll4x", 400e6);
  crg_->makeDerivedDomain("sys2x", "pll4x", 2);
  crg_->makeDerivedDomain("sys", "sys2x", 2);
  crg_->finalize();
  EXPECT_DOUBLE_EQ(crg_->freq("sys"), 100e6);
}

TEST_F(CrgTest, PinDomainOnly)
{
  crg_->makePinDomain("ulpi", "ulpi_clock", 0, 60e6);
  crg_->requestClkin("clk100", 0, 100e6);
  crg_->makePllDomain("sys", 50e6);
  crg_->finalize();
  EXPECT_DOUBLE_EQ(crg_->freq("ulpi"), 60e6);
  EXPECT_EQ(crg_->findDomain("ulpi")->source(), ClockSource::pin);
}

TEST_F(CrgTest, DuplicateDomain)
{
  crg_->requestClkin("clk100", 0, 100e6);
  crg_->makePllDomain("sys", 100e6);
  EXPECT_THROW(crg_->makePllDomain("sys", 50e6), ExceptionMsg);
  EXPECT_THROW(crg_->makeDerivedDomain("sys", "sys", 2), ExceptionMsg);
}

TEST_F(CrgTest, RejectedOutputLeavesNoDomain)
{
  crg_->requestClkin("clk100", 0, 100e6);
  crg_->makePllDomain("sys", 100e6);
  EXPECT_THROW(crg_->makePllDomain("stopped", 0.0), ExceptionMsg);
  EXPECT_EQ(crg_->findDomain("stopped"), nullptr);
  for (int i = 1; i < 6; i++) {
    std::string name = "clk" + std::to_string(i);
    crg_->makePllDomain(name.c_str(), 50e6);
  }
  // S7PLL has six outputs.
  EXPECT_THROW(crg_->makePllDomain("clk6", 50e6), ExceptionMsg);
  EXPECT_EQ(crg_->findDomain("clk6"), nullptr);
  EXPECT_THROW(crg_->makePinDomain("x", "clk200", 0, 200e6), ExceptionMsg);
  EXPECT_EQ(crg_->findDomain("x"), nullptr);
  // Every remaining domain has a source.
  crg_->finalize();
  EXPECT_EQ(crg_->domains().size(), 6u);
}

TEST_F(CrgTest, BadDerivedDomain)
{
  EXPECT_THROW(crg_->makeDerivedDomain("half", "missing", 2), ExceptionMsg);
  crg_->requestClkin("clk100", 0, 100e6);
  crg_->makePllDomain("sys", 100e6);
  EXPECT_THROW(crg_->makeDerivedDomain("zero", "sys", 0), ExceptionMsg);
}

TEST_F(CrgTest, UnknownPins)
{
  EXPECT_THROW(crg_->requestClkin("clk200", 0, 200e6), ExceptionMsg);
  EXPECT_THROW(crg_->makePinDomain("x", "clk200", 0, 200e6), ExceptionMsg);
  crg_->requestClkin("clk100", 0, 100e6);
  crg_->makePllDomain("eth", 25e6);
  crg_->driveClockPin("eth", "eth_ref_clk", 0);
  EXPECT_THROW(crg_->driveClockPin("eth", "eth_ref_clk", 0), ExceptionMsg);
}

TEST_F(CrgTest, NoConfigPropagates)
{
  crg_->requestClkin("clk100", 0, 100e6);
  crg_->makePllDomain("sys", 100e6);
  crg_->makePllDomain("odd", 97.3e6, 0.0, true, true);
  EXPECT_THROW(crg_->finalize(), PllNoConfig);
  EXPECT_FALSE(crg_->isFinalized());
  EXPECT_THROW(crg_->freq("sys"), ExceptionMsg);
}

TEST_F(CrgTest, NoPll)
{
  Crg crg(platform_, &state_);
  EXPECT_THROW(crg.requestClkin("clk100", 0, 100e6), ExceptionMsg);
  EXPECT_THROW(crg.makePllDomain("sys", 100e6), ExceptionMsg);
}

} // namespace
