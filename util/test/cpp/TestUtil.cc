#include <gtest/gtest.h>
#include <string>
#include <cstdio>
#include <fstream>
#include <sstream>

#include "Fuzzy.hh"
#include "StringUtil.hh"
#include "Report.hh"
#include "ReportStd.hh"
#include "Error.hh"
#include "Debug.hh"
#include "Units.hh"
#include "EnumNameMap.hh"

namespace bsp {

TEST(FuzzyTest, EqualValues)
{
  EXPECT_TRUE(fuzzyEqual(100e6, 100e6));
  EXPECT_TRUE(fuzzyEqual(0.0, 0.0));
  EXPECT_TRUE(fuzzyEqual(100e6, 100e6 * (1.0 + 1e-12)));
}

TEST(FuzzyTest, EqualVeryDifferent)
{
  EXPECT_FALSE(fuzzyEqual(100e6, 101e6));
  EXPECT_FALSE(fuzzyEqual(0.0, 1.0));
}

TEST(FuzzyTest, ZeroVerySmall)
{
  EXPECT_TRUE(fuzzyZero(1e-20));
  EXPECT_FALSE(fuzzyZero(1e-3));
}

////////////////////////////////////////////////////////////////

TEST(StringUtilTest, StringEq)
{
  EXPECT_TRUE(stringEq("sys", "sys"));
  EXPECT_FALSE(stringEq("sys", "sys2x"));
}

TEST(StringUtilTest, IsDigits)
{
  EXPECT_TRUE(isDigits("8192"));
  EXPECT_FALSE(isDigits("8k"));
  EXPECT_FALSE(isDigits(""));
}

TEST(StringUtilTest, IsFloat)
{
  EXPECT_TRUE(isFloat("100e6"));
  EXPECT_TRUE(isFloat("25000000.0"));
  EXPECT_TRUE(isFloat("-1.5"));
  EXPECT_FALSE(isFloat("100MHz"));
  EXPECT_FALSE(isFloat(""));
}

TEST(StringUtilTest, StdstrPrintLong)
{
  std::string long_arg(600, 'x');
  std::string str = stdstrPrint("<%s>", long_arg.c_str());
  EXPECT_EQ(str.size(), 602u);
  EXPECT_EQ(str.front(), '<');
  EXPECT_EQ(str.back(), '>');
}

TEST(StringUtilTest, SplitSpaces)
{
  StringSeq tokens;
  split("  A15 B16  A16 B17 ", " ", tokens);
  ASSERT_EQ(tokens.size(), 4u);
  EXPECT_EQ(tokens[0], "A15");
  EXPECT_EQ(tokens[3], "B17");
}

TEST(StringUtilTest, SplitEmpty)
{
  StringSeq tokens;
  split("", " ", tokens);
  EXPECT_TRUE(tokens.empty());
}

TEST(StringUtilTest, Join)
{
  StringSeq tokens = {"a", "b", "c"};
  EXPECT_EQ(join(tokens, ", "), "a, b, c");
  EXPECT_EQ(join(StringSeq(), ", "), "");
}

////////////////////////////////////////////////////////////////

TEST(ReportTest, RedirectString)
{
  Report report;
  report.redirectStringBegin();
  report.reportLineString("hello world");
  report.reportLine("value=%d", 42);
  std::string s(report.redirectStringEnd());
  EXPECT_EQ(s, "hello world\nvalue=42\n");
}

TEST(ReportTest, PrintStringNoNewline)
{
  Report report;
  report.redirectStringBegin();
  report.printString(".");
  report.printString("X");
  std::string s(report.redirectStringEnd());
  EXPECT_EQ(s, ".X");
}

TEST(ReportTest, Warn)
{
  Report report;
  report.redirectStringBegin();
  report.warn(1, "clock %s unused", "eth");
  std::string s(report.redirectStringEnd());
  EXPECT_EQ(s, "Warning: clock eth unused\n");
}

TEST(ReportTest, ErrorThrows)
{
  Report report;
  try {
    report.error(2, "unknown board %s", "foo");
    FAIL() << "expected ExceptionMsg";
  }
  catch (const ExceptionMsg &e) {
    EXPECT_STREQ(e.what(), "unknown board foo");
  }
}

TEST(ReportTest, ErrorCarriesId)
{
  Report report;
  try {
    report.error(517, "iodelay clock %d MHz", 250);
    FAIL() << "expected ExceptionMsg";
  }
  catch (const ExceptionMsg &e) {
    EXPECT_EQ(e.id(), 517);
    EXPECT_STREQ(e.what(), "iodelay clock 250 MHz");
  }
}

TEST(ReportTest, SuppressWarning)
{
  Report report;
  report.suppressMsgId(610);
  EXPECT_TRUE(report.isSuppressed(610));
  EXPECT_FALSE(report.isSuppressed(611));
  report.redirectStringBegin();
  report.warn(610, "resource %s unused", "serial");
  report.warn(611, "domain %s unconstrained", "eth_rx");
  std::string s(report.redirectStringEnd());
  EXPECT_EQ(s, "Warning: domain eth_rx unconstrained\n");
  EXPECT_EQ(report.warningCount(), 1);
}

TEST(ReportTest, UnsuppressWarning)
{
  Report report;
  report.suppressMsgId(610);
  report.unsuppressMsgId(610);
  EXPECT_FALSE(report.isSuppressed(610));
  report.redirectStringBegin();
  report.warn(610, "resource %s unused", "serial");
  std::string s(report.redirectStringEnd());
  EXPECT_EQ(s, "Warning: resource serial unused\n");
}

TEST(ReportTest, SuppressDoesNotStopErrors)
{
  Report report;
  report.suppressMsgId(400);
  EXPECT_THROW(report.error(400, "scan step must be positive"), ExceptionMsg);
}

TEST(ReportTest, LogToFile)
{
  Report report;
  const char *tmpfile = "/tmp/bsp_test_report_log.txt";
  report.logBegin(tmpfile);
  report.redirectStringBegin();
  report.redirectStringEnd();
  report.reportLineString("log test line");
  report.logEnd();
  std::ifstream in(tmpfile);
  std::stringstream contents;
  contents << in.rdbuf();
  EXPECT_NE(contents.str().find("log test line"), std::string::npos);
  std::remove(tmpfile);
}

TEST(ReportTest, LogUnwritable)
{
  Report report;
  EXPECT_THROW(report.logBegin("/nonexistent_dir/log.txt"), FileNotWritable);
}

TEST(ReportTest, DefaultReport)
{
  Report *report = makeReportStd();
  EXPECT_EQ(Report::defaultReport(), report);
  delete report;
}

////////////////////////////////////////////////////////////////

TEST(DebugTest, Levels)
{
  Report report;
  Debug debug(&report);
  EXPECT_FALSE(debug.check("scan", 1));
  debug.setLevel("scan", 2);
  EXPECT_TRUE(debug.check("scan", 1));
  EXPECT_TRUE(debug.check("scan", 2));
  EXPECT_FALSE(debug.check("scan", 3));
  EXPECT_FALSE(debug.check("pll", 1));
  EXPECT_EQ(debug.level("scan"), 2);
  debug.setLevel("scan", 0);
  EXPECT_FALSE(debug.check("scan", 1));
  EXPECT_EQ(debug.level("scan"), 0);
}

TEST(DebugTest, PrintPrefix)
{
  Report report;
  Debug debug(&report);
  Debug *debug_ptr = &debug;
  debug.setLevel("pll", 1);
  report.redirectStringBegin();
  debugPrint(debug_ptr, "pll", 1, "vco %.0f", 1200e6);
  debugPrint(debug_ptr, "pll", 2, "not printed");
  std::string s(report.redirectStringEnd());
  EXPECT_EQ(s, "pll: vco 1200000000\n");
}

////////////////////////////////////////////////////////////////

TEST(UnitsTest, Frequency)
{
  Units units;
  const Unit *freq = units.frequencyUnit();
  EXPECT_EQ(freq->scaledSuffix(), "MHz");
  EXPECT_EQ(freq->asString(100e6), "100.00");
  EXPECT_EQ(freq->asStringSuffix(62.5e6), "62.50 MHz");
}

TEST(UnitsTest, TimeAndPhase)
{
  Units units;
  EXPECT_EQ(units.timeUnit()->asStringSuffix(10e-9), "10.000 ns");
  EXPECT_EQ(units.timeUnit()->scaledSuffix(), "ns");
  EXPECT_EQ(units.phaseUnit()->asString(90.0), "90.0");
  // No negative zero.
  EXPECT_EQ(units.phaseUnit()->asString(-1e-20), "0.0");
}

////////////////////////////////////////////////////////////////

enum class Speed { fast, slow, unknown };

TEST(EnumNameMapTest, Find)
{
  EnumNameMap<Speed> names = {{Speed::fast, "fast"},
                              {Speed::slow, "slow"}};
  EXPECT_STREQ(names.find(Speed::fast), "fast");
  EXPECT_EQ(names.find(Speed::unknown), nullptr);
  EXPECT_EQ(names.find("slow", Speed::unknown), Speed::slow);
  EXPECT_EQ(names.find("medium", Speed::unknown), Speed::unknown);
  Speed key;
  bool exists;
  names.find("fast", key, exists);
  EXPECT_TRUE(exists);
  EXPECT_EQ(key, Speed::fast);
}

} // namespace bsp
