#include <gtest/gtest.h>
#include <limits>
#include <string>

#include "Report.hh"
#include "Debug.hh"
#include "Units.hh"
#include "BspState.hh"
#include "Pll.hh"
#include "PllScan.hh"

namespace bsp {

// PLL that can make exactly the outputs inside [freq_min, freq_max].
class RangePll : public Pll
{
public:
  RangePll(double freq_min,
           double freq_max,
           const BspState *bsp) :
    Pll("range_pll", 4, bsp),
    freq_min_(freq_min),
    freq_max_(freq_max)
  {
  }
  const char *familyName() const override { return "RANGE"; }

protected:
  void checkClkin(double) const override {}
  void computeConfig(PllConfig &config) const override
  {
    for (const PllClkout *clkout : clkouts_) {
      if (clkout->freq() < freq_min_ || clkout->freq() > freq_max_)
        noConfig();
      config.outputs().push_back(PllOutputConfig(clkout->freq(), 1.0,
                                                 clkout->phase(), 0, 0));
    }
    config.setInputDivide(1);
    config.setFeedbackMult(1);
    config.setVco(clkin_freq_);
  }

  double freq_min_;
  double freq_max_;
};

class PllScanTest : public ::testing::Test
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

  // Fresh PLL per candidate with a fixed auxiliary clock in range.
  PllScanTrial rangeTrial(double freq_min,
                          double freq_max)
  {
    return [this, freq_min, freq_max] (double sys_clk_freq) {
      RangePll pll(freq_min, freq_max, &state_);
      pll.registerClkin("clk100", 100e6);
      pll.createClkout("sys", sys_clk_freq);
      pll.createClkout("aux", (freq_min + freq_max) / 2);
      pll.finalize();
    };
  }

  Report *report_;
  Debug *debug_;
  Units *units_;
  BspState state_;
};

TEST_F(PllScanTest, CandidateCount)
{
  PllScan scan(&state_);
  FreqSeq freqs = scan.candidates(40e6, 60e6, 5e6);
  ASSERT_EQ(freqs.size(), 4u);
  EXPECT_DOUBLE_EQ(freqs[0], 40e6);
  EXPECT_DOUBLE_EQ(freqs[3], 55e6);
  // fmax is never a candidate.
  EXPECT_EQ(scan.candidates(50e6, 100e6, 1e6).size(), 50u);
  EXPECT_EQ(scan.candidates(50e6, 100.5e6, 1e6).size(), 50u);
}

TEST_F(PllScanTest, CandidatesIncrease)
{
  PllScan scan(&state_);
  FreqSeq freqs = scan.candidates(10e6, 20e6, 0.25e6);
  ASSERT_EQ(freqs.size(), 40u);
  for (size_t i = 1; i < freqs.size(); i++) {
    EXPECT_GT(freqs[i], freqs[i - 1]);
    EXPECT_NEAR(freqs[i] - freqs[i - 1], 0.25e6, 1e-3);
  }
}

TEST_F(PllScanTest, BadArgs)
{
  PllScan scan(&state_);
  int trials = 0;
  PllScanTrial count_trial = [&trials] (double) { trials++; };
  EXPECT_THROW(scan.scan(60e6, 40e6, 5e6, count_trial), ExceptionMsg);
  EXPECT_THROW(scan.scan(40e6, 40e6, 5e6, count_trial), ExceptionMsg);
  EXPECT_THROW(scan.scan(40e6, 60e6, 0.0, count_trial), ExceptionMsg);
  EXPECT_THROW(scan.scan(40e6, 60e6, -1e6, count_trial), ExceptionMsg);
  EXPECT_EQ(trials, 0);
}

TEST_F(PllScanTest, HugeRangeRejected)
{
  PllScan scan(&state_);
  EXPECT_THROW(scan.candidates(0.0, 1e10, 1.0), ExceptionMsg);
  EXPECT_THROW(scan.candidates(0.0, 1e30, 1e-3), ExceptionMsg);
  try {
    scan.candidates(0.0, 1e10, 1.0);
  }
  catch (const ExceptionMsg &error) {
    EXPECT_EQ(error.id(), 403);
  }
  // A million steps is still allowed.
  EXPECT_EQ(scan.candidates(0.0, 1e6, 1.0).size(), 1000000u);
}

TEST_F(PllScanTest, NonFiniteRejected)
{
  PllScan scan(&state_);
  double nan = std::numeric_limits<double>::quiet_NaN();
  double inf = std::numeric_limits<double>::infinity();
  EXPECT_THROW(scan.candidates(nan, 1e6, 1.0), ExceptionMsg);
  EXPECT_THROW(scan.candidates(0.0, nan, 1.0), ExceptionMsg);
  EXPECT_THROW(scan.candidates(0.0, 1e6, nan), ExceptionMsg);
  EXPECT_THROW(scan.candidates(0.0, inf, 1.0), ExceptionMsg);
  EXPECT_THROW(scan.candidates(-inf, 1e6, 1.0), ExceptionMsg);
  EXPECT_THROW(scan.candidates(0.0, 1e6, inf), ExceptionMsg);
}

TEST_F(PllScanTest, StepLargerThanRange)
{
  PllScan scan(&state_);
  report_->redirectStringBegin();
  PllScanResultSeq results = scan.scan(40e6, 41e6, 5e6, rangeTrial(0, 1e9));
  std::string out(report_->redirectStringEnd());
  EXPECT_TRUE(results.empty());
  EXPECT_EQ(out, "");
}

TEST_F(PllScanTest, RangeScenario)
{
  PllScan scan(&state_);
  report_->redirectStringBegin();
  PllScanResultSeq results = scan.scan(40e6, 60e6, 5e6,
                                       rangeTrial(45e6, 55e6));
  std::string progress(report_->redirectStringEnd());
  ASSERT_EQ(results.size(), 4u);
  EXPECT_FALSE(results[0].found());
  EXPECT_TRUE(results[1].found());
  EXPECT_TRUE(results[2].found());
  EXPECT_TRUE(results[3].found());
  EXPECT_EQ(progress, "X...\n");

  PllScanBandSeq bands = PllScan::bands(results, 5e6);
  ASSERT_EQ(bands.size(), 1u);
  EXPECT_DOUBLE_EQ(bands[0].front(), 45e6);
  EXPECT_DOUBLE_EQ(bands[0].back(), 55e6);
}

TEST_F(PllScanTest, Deterministic)
{
  PllScan scan(&state_);
  report_->redirectStringBegin();
  PllScanResultSeq results1 = scan.scan(40e6, 60e6, 1e6,
                                        rangeTrial(45e6, 55e6));
  PllScanResultSeq results2 = scan.scan(40e6, 60e6, 1e6,
                                        rangeTrial(45e6, 55e6));
  report_->redirectStringEnd();
  ASSERT_EQ(results1.size(), results2.size());
  for (size_t i = 0; i < results1.size(); i++) {
    EXPECT_EQ(results1[i].freq(), results2[i].freq());
    EXPECT_EQ(results1[i].found(), results2[i].found());
  }
}

TEST_F(PllScanTest, FatalErrorAbortsScan)
{
  PllScan scan(&state_);
  int trials = 0;
  PllScanTrial trial = [this, &trials] (double sys_clk_freq) {
    trials++;
    if (sys_clk_freq >= 50e6)
      report_->error(1, "clkin out of range");
  };
  report_->redirectStringBegin();
  EXPECT_THROW(scan.scan(40e6, 60e6, 5e6, trial), ExceptionMsg);
  report_->redirectStringEnd();
  EXPECT_EQ(trials, 3);
}

TEST_F(PllScanTest, GroupBands)
{
  PllScanResultSeq results;
  for (double freq : {100.0, 101.0, 102.0, 110.0, 111.0})
    results.push_back(PllScanResult(freq, true));
  PllScanBandSeq bands = PllScan::bands(results, 1.0);
  ASSERT_EQ(bands.size(), 2u);
  EXPECT_EQ(bands[0], FreqSeq({100.0, 101.0, 102.0}));
  EXPECT_EQ(bands[1], FreqSeq({110.0, 111.0}));
}

TEST_F(PllScanTest, FailuresSplitBands)
{
  PllScanResultSeq results;
  results.push_back(PllScanResult(10.0, true));
  results.push_back(PllScanResult(11.0, false));
  results.push_back(PllScanResult(12.0, true));
  results.push_back(PllScanResult(13.0, true));
  PllScanBandSeq bands = PllScan::bands(results, 1.0);
  ASSERT_EQ(bands.size(), 2u);
  EXPECT_EQ(bands[0], FreqSeq({10.0}));
  EXPECT_EQ(bands[1], FreqSeq({12.0, 13.0}));
  EXPECT_EQ(PllScan::foundFreqs(results), FreqSeq({10.0, 12.0, 13.0}));
}

TEST_F(PllScanTest, ReportFormat)
{
  PllScan scan(&state_);
  report_->redirectStringBegin();
  scan.scanAndReport(44e6, 48e6, 1e6, rangeTrial(45e6, 46e6));
  std::string out(report_->redirectStringEnd());
  EXPECT_EQ(out,
            "X..X\n"
            "Found PLL configs for:\n"
            "---\n"
            "  sys_clk_freq =  45.00 MHz\n"
            "  sys_clk_freq =  46.00 MHz\n");
}

TEST_F(PllScanTest, VerboseScan)
{
  PllScan scan(&state_);
  debug_->setLevel("scan", 1);
  report_->redirectStringBegin();
  scan.scan(45e6, 47e6, 1e6, rangeTrial(46e6, 50e6));
  std::string out(report_->redirectStringEnd());
  EXPECT_EQ(out,
            "scan: Trying sys_clk_freq =  45.00 MHz ... FAIL\n"
            "scan: Trying sys_clk_freq =  46.00 MHz ... OK\n");
}

} // namespace
