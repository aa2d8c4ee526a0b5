#include <sstream>

#include <gtest/gtest.h>

#include "designs.hpp"
#include "lazy/tcl/console.hpp"

using lazy::tcl::Console;

class ConsoleTest : public ::testing::Test {
  protected:
    void SetUp() override { ASSERT_TRUE(mConsole.init()); }

    lazy::elab::DesignLib mLib = lazy::demo::builtinDesigns();
    std::ostringstream mDiag;
    Console mConsole{mLib, mDiag};
};

TEST_F(ConsoleTest, ElabAndInspect) {
    EXPECT_EQ(mConsole.evalLine("designs"), TCL_OK);
    ASSERT_EQ(mConsole.evalLine("elab fanout"), TCL_OK);
    ASSERT_NE(mConsole.session(), nullptr);
    EXPECT_EQ(mConsole.session()->mDesign, "fanout");
    EXPECT_EQ(mConsole.session()->mResult.mUnresolved.size(), 2u);

    mDiag.str("");
    EXPECT_EQ(mConsole.evalLine("boundary fanout.taps"), TCL_OK);
    EXPECT_NE(mDiag.str().find("debug_0"), std::string::npos);
    EXPECT_NE(mConsole.evalLine("boundary fanout.nothing"), TCL_OK);
    EXPECT_EQ(mConsole.evalLine("hierarchy"), TCL_OK);
    EXPECT_EQ(mConsole.evalLine("netlist"), TCL_OK);
}

TEST_F(ConsoleTest, FailedElabKeepsPreviousDesign) {
    ASSERT_EQ(mConsole.evalLine("elab pipeline"), TCL_OK);
    ASSERT_EQ(mConsole.evalLine("policy error"), TCL_OK);
    EXPECT_EQ(mConsole.options().mUnresolvedRoot,
              lazy::elab::UnresolvedPolicy::Error);

    mDiag.str("");
    EXPECT_EQ(mConsole.evalLine("elab fanout"), TCL_ERROR);
    EXPECT_NE(mDiag.str().find("elaboration failed"), std::string::npos);
    ASSERT_NE(mConsole.session(), nullptr);
    EXPECT_EQ(mConsole.session()->mDesign, "pipeline");

    EXPECT_EQ(mConsole.evalLine("elab nosuch"), TCL_ERROR);
    EXPECT_EQ(mConsole.evalLine("policy sometimes"), TCL_ERROR);
}

TEST_F(ConsoleTest, CommandsBeforeElabFail) {
    EXPECT_EQ(mConsole.evalLine("hierarchy"), TCL_ERROR);
    EXPECT_EQ(mConsole.evalLine("export-json out.json"), TCL_ERROR);
}

TEST_F(ConsoleTest, HelpAndCompletion) {
    EXPECT_TRUE(mConsole.hasCommand("export-graphml"));
    EXPECT_EQ(mConsole.evalLine("help elab"), TCL_OK);
    mDiag.str("");
    EXPECT_EQ(mConsole.evalLine("help hierarchi"), TCL_ERROR);
    EXPECT_NE(mDiag.str().find("hierarchy"), std::string::npos);

    EXPECT_EQ(mConsole.complete("bo"), std::vector<std::string>{"boundary"});
    EXPECT_EQ(mConsole.complete("elab f"), std::vector<std::string>{"fanout"});
    EXPECT_EQ(mConsole.complete("policy w"), std::vector<std::string>{"warn"});
}

TEST_F(ConsoleTest, TclScriptsDriveCommands) {
    EXPECT_EQ(
      mConsole.evalLine("foreach d {leaf pipeline} { elab $d }"), TCL_OK);
    EXPECT_EQ(mConsole.session()->mDesign, "pipeline");
}
