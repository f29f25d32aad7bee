#include <gtest/gtest.h>
#include "help/ContentBlock.hpp"
#include "help/errors.hpp"
#include "test_utils.hpp"

using namespace hl::help;
using hl::test::pattern;

TEST(ContentBlockTest, FillPadsToWidthForAnyInputUpToWidth) {
    for (std::size_t len = 0; len <= 10; ++len) {
        ContentBlock block(10, true);
        block.append(pattern(len));
        const auto out = block.format();
        EXPECT_EQ(out.size(), 10u) << "input length " << len;
        EXPECT_EQ(out.substr(0, len), pattern(len));
        EXPECT_FALSE(block.overflow().has_value());
    }
}

TEST(ContentBlockTest, RaggedOutputMatchesVisibleContent) {
    ContentBlock block(10, false);
    block.append("abc");
    EXPECT_EQ(block.format(), "abc");
    EXPECT_EQ(block.format().size(), block.visible().size());

    ContentBlock empty(10, false);
    EXPECT_EQ(empty.format(), "");
}

TEST(ContentBlockTest, PaddingSaturatesAtRemainingCapacity) {
    ContentBlock block(10, false);
    block.appendPadding(4);
    EXPECT_EQ(block.visible(), "    ");
    block.appendPadding(20);
    EXPECT_EQ(block.visible(), std::string(10, ' '));
    EXPECT_EQ(block.remaining(), 0u);
    EXPECT_FALSE(block.overflow().has_value());

    block.appendPadding(3);
    EXPECT_EQ(block.visible().size(), 10u);
}

TEST(ContentBlockTest, AppendWithinRemainingNeverOverflows) {
    ContentBlock block(10, true);
    block.appendPadding(3);
    block.append("abcdefg");
    EXPECT_EQ(block.visible(), "   abcdefg");
    EXPECT_FALSE(block.overflow().has_value());
}

TEST(ContentBlockTest, ExcessBecomesOverflow) {
    ContentBlock block(10, true);
    block.appendPadding(3);
    block.append("abcdefghij");

    EXPECT_EQ(block.visible(), "   abcdefg");
    ASSERT_TRUE(block.overflow().has_value());
    EXPECT_EQ(*block.overflow(), "hij");
    EXPECT_EQ(block.overflow()->size(), 10u - 7u);
    EXPECT_EQ(block.format(), "   abcdefg");
}

TEST(ContentBlockTest, OverflowAccumulatesAcrossAppends) {
    ContentBlock block(10, false);
    block.append("0123456789AB");
    block.append("CD");
    EXPECT_EQ(block.visible(), "0123456789");
    EXPECT_EQ(*block.overflow(), "ABCD");
}

TEST(ContentBlockTest, ExactlyTwoWidthsFits) {
    ContentBlock block(10, false);
    block.append(pattern(20));
    EXPECT_EQ(block.visible(), pattern(10));
    EXPECT_EQ(*block.overflow(), pattern(20).substr(10));
}

TEST(ContentBlockTest, MoreThanOneOverflowLevelIsRejected) {
    ContentBlock block(10, false);
    EXPECT_THROW(block.append(pattern(21)), CapacityViolation);
}

TEST(ContentBlockTest, RejectedAppendLeavesBlockUntouched) {
    ContentBlock block(10, false);
    block.append(pattern(15));
    EXPECT_THROW(block.append("123456"), CapacityViolation);

    EXPECT_EQ(block.visible(), pattern(10));
    EXPECT_EQ(*block.overflow(), pattern(15).substr(10));

    block.append("12345");
    EXPECT_EQ(block.overflow()->size(), 10u);
}

TEST(ContentBlockTest, PrintFormatsBeforeAppending) {
    ContentBlock block(10, false);
    block.print("-{}, --{}", 't', "time");
    EXPECT_EQ(block.visible(), "-t, --time");
    EXPECT_FALSE(block.overflow().has_value());
}

TEST(ContentBlockTest, FormatToAppendsToExistingBuffer) {
    ContentBlock block(5, true);
    block.append("ab");
    std::string out = ">";
    block.formatTo(out);
    EXPECT_EQ(out, ">ab   ");
}
