#include <gtest/gtest.h>
#include "model/Command.hpp"

using namespace hl::model;

TEST(ArgTest, MultipleValuesImpliesTakesValue) {
    Arg a("paths");
    a.setProperty(Arg::Property::TakesMultipleValues);
    EXPECT_TRUE(a.hasProperty(Arg::Property::TakesValue));
    EXPECT_TRUE(a.hasProperty(Arg::Property::TakesMultipleValues));

    a.unsetProperty(Arg::Property::TakesMultipleValues);
    EXPECT_FALSE(a.hasProperty(Arg::Property::TakesMultipleValues));
    EXPECT_TRUE(a.hasProperty(Arg::Property::TakesValue));
}

TEST(ArgTest, BooleanOptionUsesNameAsLongName) {
    const auto help = Arg::booleanOption("help", 'h', "Print this help and exit");
    EXPECT_EQ(help.long_name, "help");
    EXPECT_EQ(help.short_name, 'h');
    EXPECT_FALSE(help.hasProperty(Arg::Property::TakesValue));
    EXPECT_TRUE(help.isOption());
    EXPECT_FALSE(Arg::positional("FILE").isOption());
}

TEST(CommandTest, ArgsAreRoutedByKind) {
    Command cmd("mycmd");
    cmd.addArgs({Arg::positional("SRC"), Arg::booleanOption("force", 'f'), Arg::positional("DST")});

    ASSERT_EQ(cmd.countPositionalArgs(), 2u);
    EXPECT_EQ(cmd.positionalArgs()[0].name, "SRC");
    EXPECT_EQ(cmd.positionalArgs()[1].name, "DST");
    ASSERT_EQ(cmd.countOptions(), 1u);
    EXPECT_EQ(cmd.options()[0].name, "force");
    EXPECT_FALSE(cmd.hasProperty(Command::Property::PositionalArgRequired));
}

TEST(CommandTest, RequiredPositionalMarksCommand) {
    Command cmd("mycmd");
    auto file = Arg::positional("FILE");
    file.setProperty(Arg::Property::Required);
    cmd.addArg(file);
    EXPECT_TRUE(cmd.hasProperty(Command::Property::PositionalArgRequired));
    EXPECT_FALSE(cmd.hasProperty(Command::Property::SubcommandRequired));
}

TEST(CommandTest, ClashingOptionNamesAreRejected) {
    Command cmd("mycmd");
    cmd.addArg(Arg::booleanOption("time", 't'));
    EXPECT_THROW(cmd.addArg(Arg::booleanOption("tick", 't')), std::invalid_argument);
    EXPECT_THROW(cmd.addArg(Arg::booleanOption("time", std::nullopt)), std::invalid_argument);
    EXPECT_EQ(cmd.countOptions(), 1u);
}

TEST(CommandTest, SubcommandsAreFoundByName) {
    Command cmd("mycmd");
    cmd.addSubcommand(Command("init", "Create"));
    cmd.addSubcommand(Command("status"));

    ASSERT_NE(cmd.findSubcommand("status"), nullptr);
    EXPECT_EQ(cmd.findSubcommand("init")->description, "Create");
    EXPECT_EQ(cmd.findSubcommand("push"), nullptr);
    EXPECT_THROW(cmd.addSubcommand(Command("init")), std::invalid_argument);
}
