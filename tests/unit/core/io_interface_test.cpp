#include <gtest/gtest.h>
#include "extmgr/core/io_interface.hpp"

using namespace extmgr::core;

TEST(BufferedIOTest, TranslatesAndBuffersLines) {
    BufferedIO io;
    io.write_error("DISABLING_EXTENSIONS", true, Verbosity::Quiet);
    io.write_error(Message("EXTENSIONS_NOT_INSTALLED", {"vendor/foo"}), true, Verbosity::Normal);

    ASSERT_EQ(io.lines().size(), 2u);
    EXPECT_EQ(io.lines()[0], "Disabling extensions...");
    EXPECT_EQ(io.lines()[1], "The extension(s) vendor/foo are not installed.");
}

TEST(BufferedIOTest, FiltersByVerbosity) {
    BufferedIO io(MessageCatalog::defaults(), Verbosity::Normal);
    io.write_error("SHOWN", true, Verbosity::Quiet);
    io.write_error("HIDDEN", true, Verbosity::Verbose);
    EXPECT_EQ(io.lines().size(), 1u);
    EXPECT_FALSE(io.is_verbose());

    io.set_verbosity(Verbosity::Debug);
    io.write_error("NOW_SHOWN", true, Verbosity::Verbose);
    EXPECT_EQ(io.lines().size(), 2u);
}

TEST(BufferedIOTest, PartialLines) {
    BufferedIO io(MessageCatalog{});
    io.write_error("A", false, Verbosity::Normal);
    io.write_error("B", true, Verbosity::Normal);
    io.write_error("C", false, Verbosity::Normal);

    ASSERT_EQ(io.lines().size(), 1u);
    EXPECT_EQ(io.lines()[0], "AB");
    EXPECT_EQ(io.output(), "AB\nC");

    io.clear();
    EXPECT_TRUE(io.output().empty());
}

TEST(NullIOTest, DiscardsEverything) {
    NullIO io;
    io.write_error("ANYTHING", true, Verbosity::Quiet);
    EXPECT_EQ(io.verbosity(), Verbosity::Quiet);
}
