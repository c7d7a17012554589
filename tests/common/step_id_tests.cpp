#include <gtest/gtest.h>
#include "stepview/common/step_id.hpp"

#include <algorithm>

using namespace stepview;

// ============================================================================
// Prefix parsing
// ============================================================================

TEST(StepIdTests, Prefix_NumberFollowedByDash)
{
    StepId id{"5-cadence-innovus-eco"};
    ASSERT_TRUE(id.order().has_value());
    EXPECT_EQ(*id.order(), 5u);
    EXPECT_EQ(id.text(), "5-cadence-innovus-eco");
}

TEST(StepIdTests, Prefix_MultipleDigits)
{
    StepId id{"123-synopsys-ptpx-genlibdb"};
    ASSERT_TRUE(id.order().has_value());
    EXPECT_EQ(*id.order(), 123u);
}

TEST(StepIdTests, Prefix_DigitsOnly)
{
    StepId id{"42"};
    ASSERT_TRUE(id.order().has_value());
    EXPECT_EQ(*id.order(), 42u);
}

TEST(StepIdTests, Prefix_LeadingZeros)
{
    StepId id{"007-step"};
    ASSERT_TRUE(id.order().has_value());
    EXPECT_EQ(*id.order(), 7u);
}

TEST(StepIdTests, NoPrefix_NoLeadingDigits)
{
    EXPECT_FALSE(StepId{"info"}.order().has_value());
    EXPECT_FALSE(StepId{"foo-5"}.order().has_value());
    EXPECT_FALSE(StepId{""}.order().has_value());
}

TEST(StepIdTests, NoPrefix_DigitsNotFollowedByDash)
{
    EXPECT_FALSE(StepId{"5foo"}.order().has_value());
    EXPECT_FALSE(StepId{"5_foo"}.order().has_value());
}

TEST(StepIdTests, NoPrefix_Overflow)
{
    EXPECT_FALSE(StepId{"99999999999999999999999-step"}.order().has_value());
}

TEST(StepIdTests, Equality_ComparesText)
{
    EXPECT_EQ(StepId{"5-foo"}, StepId{"5-foo"});
    EXPECT_NE(StepId{"5-foo"}, StepId{"05-foo"});
}

// ============================================================================
// Ordering
// ============================================================================

TEST(StepIdTests, Order_NumericNotLexicographic)
{
    EXPECT_TRUE(precedes_by_order(StepId{"9-a"}, StepId{"10-b"}));
    EXPECT_FALSE(precedes_by_order(StepId{"10-b"}, StepId{"9-a"}));
}

TEST(StepIdTests, Order_EqualPrefixesAreEquivalent)
{
    EXPECT_FALSE(precedes_by_order(StepId{"3-a"}, StepId{"3-b"}));
    EXPECT_FALSE(precedes_by_order(StepId{"3-b"}, StepId{"3-a"}));
}

TEST(StepIdTests, Order_PrefixedBeforeUnprefixed)
{
    EXPECT_TRUE(precedes_by_order(StepId{"100-a"}, StepId{"b"}));
    EXPECT_FALSE(precedes_by_order(StepId{"b"}, StepId{"100-a"}));
    EXPECT_FALSE(precedes_by_order(StepId{"a"}, StepId{"b"}));
}

TEST(StepIdTests, Order_StableSortKeepsListOrderForTies)
{
    std::vector<StepId> ids{StepId{"6-bar"}, StepId{"x"}, StepId{"5-foo"}, StepId{"5-alt"}, StepId{"a"}};
    std::stable_sort(ids.begin(), ids.end(), precedes_by_order);

    ASSERT_EQ(ids.size(), 5u);
    EXPECT_EQ(ids[0].text(), "5-foo");
    EXPECT_EQ(ids[1].text(), "5-alt");
    EXPECT_EQ(ids[2].text(), "6-bar");
    EXPECT_EQ(ids[3].text(), "x");
    EXPECT_EQ(ids[4].text(), "a");
}
