#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>

#include "surge/terminal.hpp"

using namespace ::testing;
using namespace ::surge;

TEST(TerminalTest, EraseFrameClearsBothLines)
{
    EXPECT_EQ(std::string {terminal::erase_frame},
              std::string {terminal::clear_line} + terminal::previous_line + terminal::clear_line
                  + terminal::column_zero);
}

TEST(TerminalTest, WriteAppendsText)
{
    std::ostringstream out;
    terminal::write(out, "frame");
    terminal::write(out, "");
    EXPECT_EQ(out.str(), "frame");
}

TEST(TerminalTest, WriteToBadStreamThrows)
{
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    EXPECT_THROW(terminal::write(out, "frame"), std::runtime_error);
}

TEST(TerminalTest, CursorGuardHidesAndRestores)
{
    std::ostringstream out;
    {
        terminal::CursorGuard guard {out};
        EXPECT_EQ(out.str(), terminal::hide_cursor);
        out << "body";
    }
    EXPECT_EQ(out.str(), std::string {terminal::hide_cursor} + "body" + terminal::show_cursor);
}

TEST(TerminalTest, CursorGuardRestoresAfterStreamFailure)
{
    std::ostringstream out;
    {
        terminal::CursorGuard guard {out};
        out.setstate(std::ios::failbit);
    }
    EXPECT_EQ(out.str(), std::string {terminal::hide_cursor} + terminal::show_cursor);
}
