#include <gtest/gtest.h>
#include <tcl.h>
#include <filesystem>
#include <string>

#include "Report.hh"
#include "Bsp.hh"
#include "BspTcl.hh"
#include "Soc.hh"

namespace bsp {

class TclCmdsTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    Tcl_FindExecutable(nullptr);
    interp_ = Tcl_CreateInterp();
    bsp_ = new Bsp;
    bsp_->makeComponents();
    Bsp::setBsp(bsp_);
    bsp_->setTclInterp(interp_);
    ASSERT_EQ(Bsp_Init(interp_), TCL_OK);
  }
  void TearDown() override
  {
    deleteAllMemory();
    Tcl_DeleteInterp(interp_);
  }

  int eval(const char *cmd)
  {
    return Tcl_Eval(interp_, cmd);
  }
  std::string result() const
  {
    return Tcl_GetStringResult(interp_);
  }

  Tcl_Interp *interp_;
  Bsp *bsp_;
};

TEST_F(TclCmdsTest, PackageProvided)
{
  EXPECT_NE(Tcl_PkgPresent(interp_, "bsp", nullptr, 0), nullptr);
  ASSERT_EQ(eval("bsp::list_boards"), TCL_OK);
}

TEST_F(TclCmdsTest, ListBoards)
{
  ASSERT_EQ(eval("list_boards"), TCL_OK);
  EXPECT_EQ(result(), "antmicro_lpddr4_test_board artix_dc_scm digilent_arty "
            "ecp5_dc_scm forest_kitten_33 lpddr4_test_board zcu104");
  EXPECT_EQ(eval("list_boards extra"), TCL_ERROR);
}

TEST_F(TclCmdsTest, ComposeSoc)
{
  ASSERT_EQ(eval("compose_soc digilent_arty -with_ethernet -sys_clk_freq 50e6"),
            TCL_OK) << result();
  EXPECT_EQ(result(), "digilent_arty");
  Soc *soc = bsp_->soc();
  ASSERT_NE(soc, nullptr);
  EXPECT_NE(soc->ethPhy(), nullptr);
  EXPECT_DOUBLE_EQ(soc->sysClkFreq(), 50e6);

  // A new composition replaces the current one.
  ASSERT_EQ(eval("compose_soc zcu104"), TCL_OK) << result();
  EXPECT_STREQ(bsp_->soc()->board(), "zcu104");
}

TEST_F(TclCmdsTest, ComposeErrors)
{
  EXPECT_EQ(eval("compose_soc"), TCL_ERROR);
  EXPECT_EQ(eval("compose_soc nope"), TCL_ERROR);
  EXPECT_EQ(result(), "unknown board nope.");
  EXPECT_EQ(eval("compose_soc digilent_arty -with_video"), TCL_ERROR);
  EXPECT_EQ(result(), "unknown or incomplete option -with_video.");
  EXPECT_EQ(eval("compose_soc digilent_arty -l2_size"), TCL_ERROR);
  EXPECT_EQ(eval("compose_soc digilent_arty with_ethernet"), TCL_ERROR);
  EXPECT_EQ(result(), "positional argument not allowed: with_ethernet.");
  EXPECT_EQ(eval("compose_soc digilent_arty -sys_clk_freq fast"), TCL_ERROR);
  EXPECT_EQ(eval("compose_soc digilent_arty -with_ethernet -with_etherbone"),
            TCL_ERROR);
  EXPECT_EQ(bsp_->soc(), nullptr);
}

TEST_F(TclCmdsTest, ReportSoc)
{
  EXPECT_EQ(eval("report_soc"), TCL_ERROR);
  EXPECT_EQ(result(), "no SoC has been composed.");
  ASSERT_EQ(eval("compose_soc zcu104"), TCL_OK) << result();
  Report *report = bsp_->report();
  report->redirectStringBegin();
  int status = eval("report_soc");
  std::string out(report->redirectStringEnd());
  ASSERT_EQ(status, TCL_OK) << result();
  EXPECT_NE(out.find("Board      zcu104\n"), std::string::npos);
  EXPECT_NE(out.find("PLL USMMCM"), std::string::npos);
}

TEST_F(TclCmdsTest, WriteConstraints)
{
  EXPECT_EQ(eval("write_constraints x.xdc"), TCL_ERROR);
  ASSERT_EQ(eval("compose_soc ecp5_dc_scm"), TCL_OK) << result();
  std::string filename = ::testing::TempDir() + "tcl_ecp5_dc_scm.lpf";
  std::string cmd = "write_constraints " + filename;
  ASSERT_EQ(eval(cmd.c_str()), TCL_OK) << result();
  EXPECT_TRUE(std::filesystem::is_regular_file(filename));
  EXPECT_EQ(bsp_->constraintsFilename("build"), "build/ecp5_dc_scm.lpf");
}

TEST_F(TclCmdsTest, ScanPll)
{
  Report *report = bsp_->report();
  report->redirectStringBegin();
  int status = eval("scan_pll digilent_arty 50e6 52e6 1e6");
  std::string out(report->redirectStringEnd());
  ASSERT_EQ(status, TCL_OK) << result();
  Tcl_Obj *freqs = Tcl_GetObjResult(interp_);
  Tcl_Obj *first;
  ASSERT_EQ(Tcl_ListObjIndex(interp_, freqs, 0, &first), TCL_OK);
  ASSERT_NE(first, nullptr);
  double freq;
  ASSERT_EQ(Tcl_GetDoubleFromObj(interp_, first, &freq), TCL_OK);
  EXPECT_DOUBLE_EQ(freq, 50e6);
  EXPECT_NE(out.find("Found PLL configs for:"), std::string::npos);
}

TEST_F(TclCmdsTest, ScanPllErrors)
{
  EXPECT_EQ(eval("scan_pll digilent_arty 50e6 52e6"), TCL_ERROR);
  EXPECT_EQ(eval("scan_pll digilent_arty fast 52e6 1e6"), TCL_ERROR);
  EXPECT_EQ(result(), "fmin is not a number: fast.");
  EXPECT_EQ(eval("scan_pll digilent_arty 50e6 52e6 0"), TCL_ERROR);
  EXPECT_EQ(eval("scan_pll digilent_arty 50e6 52e6 1e6 -variant a7-50"),
            TCL_ERROR);
}

TEST_F(TclCmdsTest, SuppressMsg)
{
  Report *report = bsp_->report();
  ASSERT_EQ(eval("suppress_msg {610 611}"), TCL_OK) << result();
  EXPECT_TRUE(report->isSuppressed(610));
  EXPECT_TRUE(report->isSuppressed(611));
  ASSERT_EQ(eval("unsuppress_msg 611"), TCL_OK) << result();
  EXPECT_TRUE(report->isSuppressed(610));
  EXPECT_FALSE(report->isSuppressed(611));
  EXPECT_EQ(eval("suppress_msg {610 many}"), TCL_ERROR);
  EXPECT_EQ(eval("suppress_msg"), TCL_ERROR);
}

TEST_F(TclCmdsTest, SetDebug)
{
  ASSERT_EQ(eval("set_debug pll 2"), TCL_OK);
  EXPECT_EQ(eval("set_debug pll high"), TCL_ERROR);
}

} // namespace
