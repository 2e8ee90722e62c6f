#include <gtest/gtest.h>
#include <vector>

#include "../core/MeldValidator.hpp"
#include "../core/Exception.hpp"
#include "TestUtil.hpp"

using namespace rummikub::core;
using rummikub::test::Group;
using rummikub::test::Run;
using rummikub::test::T;
using RVC = error::RuleViolationCode;

namespace
{
    auto CodeOf(Meld const& m) -> RVC
    {
        auto const r = meld::ValidateAndPrice(m);
        EXPECT_FALSE(r.has_value()) << meld::CanonicalId(m);
        return r ? RVC::Internal_Unreachable : r.error().code;
    }
}

TEST(MeldValidator, Group_Of_Three_Tens_Is_Thirty)
{
    auto const r = meld::ValidateAndPrice(Group({"10ka", "10ra", "10ba"}));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->value, 30);
    EXPECT_TRUE(r->joker_assignment.empty());
}

TEST(MeldValidator, Group_Joker_Takes_First_Free_Color)
{
    auto const r = meld::ValidateAndPrice(Group({"5ra", "ja", "5ka"}));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->value, 15);
    ASSERT_EQ(r->joker_assignment.size(), 1u);
    EXPECT_EQ(r->joker_assignment.at(T("ja")), (meld::ResolvedFace{5, Color::Blue}));
}

TEST(MeldValidator, Group_Of_Four_With_Two_Jokers)
{
    auto const r = meld::ValidateAndPrice(Group({"9ob", "jb", "9kb", "ja"}));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->value, 36);
    EXPECT_EQ(r->joker_assignment.at(T("jb")), (meld::ResolvedFace{9, Color::Red}));
    EXPECT_EQ(r->joker_assignment.at(T("ja")), (meld::ResolvedFace{9, Color::Blue}));
}

TEST(MeldValidator, Group_Rejections)
{
    EXPECT_EQ(CodeOf(Group({"5ka", "5ra"})), RVC::SizeError);
    EXPECT_EQ(CodeOf(Group({"5ka", "5ra", "5ba", "5oa", "5kb"})), RVC::SizeError);
    // the same physical tile twice reads as a repeated color
    EXPECT_EQ(CodeOf(Group({"5ka", "5ka", "5ra"})), RVC::ColorDuplication);
    EXPECT_EQ(CodeOf(Group({"5ka", "ja", "ja"})), RVC::DuplicateTile);
    EXPECT_EQ(CodeOf(Group({"5ka", "6ra", "5ba"})), RVC::MixedNumbers);
    EXPECT_EQ(CodeOf(Group({"5ka", "5kb", "5ra"})), RVC::ColorDuplication);
    EXPECT_EQ(CodeOf(Meld{MeldKind::Group, {T("5ka"), TileId{200}, T("5ra")}}), RVC::UnknownTile);
}

TEST(MeldValidator, Size_Error_Reports_Attempted_Count)
{
    auto const r = meld::ValidateAndPrice(Group({"5ka", "5ra"}));
    ASSERT_FALSE(r.has_value());
    ASSERT_TRUE(r.error().attempted_count.has_value());
    EXPECT_EQ(*r.error().attempted_count, 2u);

    auto const empty = meld::ValidateAndPrice(MeldKind::Run, {});
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().code, RVC::SizeError);
}

TEST(MeldValidator, Run_Values_Sum_Positions)
{
    auto const r = meld::ValidateAndPrice(Run({"3ra", "4ra", "5ra"}));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->value, 12);

    auto const mid = meld::ValidateAndPrice(Run({"3ra", "ja", "5ra"}));
    ASSERT_TRUE(mid.has_value());
    EXPECT_EQ(mid->value, 12);
    EXPECT_EQ(mid->joker_assignment.at(T("ja")), (meld::ResolvedFace{4, Color::Red}));

    auto const front = meld::ValidateAndPrice(Run({"jb", "2ob", "3ob"}));
    ASSERT_TRUE(front.has_value());
    EXPECT_EQ(front->value, 6);
    EXPECT_EQ(front->joker_assignment.at(T("jb")), (meld::ResolvedFace{1, Color::Orange}));
}

TEST(MeldValidator, Run_Joker_Fills_Single_Gap)
{
    for (uint8_t const a : {1, 6, 11})
    {
        Meld const m{MeldKind::Run, {tiles::Encode(a, Color::Orange, Copy::B), T("ja"),
                                     tiles::Encode(a + 2, Color::Orange, Copy::A)}};
        auto const r = meld::ValidateAndPrice(m);
        ASSERT_TRUE(r.has_value()) << "a=" << int{a};
        EXPECT_EQ(r->value, 3 * (a + 1));
        EXPECT_EQ(r->joker_assignment.at(T("ja")), (meld::ResolvedFace{static_cast<uint8_t>(a + 1), Color::Orange}));
    }
}

TEST(MeldValidator, Full_Run_One_To_Thirteen)
{
    Meld m{MeldKind::Run, {}};
    for (uint8_t n = 1; n <= 13; ++n) m.tiles.push_back(tiles::Encode(n, Color::Black, Copy::A));

    auto const r = meld::ValidateAndPrice(m);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->value, 91);

    m.tiles.push_back(T("ja"));
    EXPECT_EQ(CodeOf(m), RVC::OutOfRange);

    // length is not checked before color
    m.tiles.back() = tiles::Encode(1, Color::Red, Copy::A);
    EXPECT_EQ(CodeOf(m), RVC::MixedColors);
}

TEST(MeldValidator, Run_Rejections)
{
    EXPECT_EQ(CodeOf(Run({"3ra", "4ba", "5ra"})), RVC::MixedColors);
    EXPECT_EQ(CodeOf(Run({"3ra", "5ra", "6ra"})), RVC::NonConsecutive);
    // order is significant for runs
    EXPECT_EQ(CodeOf(Run({"5ra", "4ra", "3ra"})), RVC::NonConsecutive);
    EXPECT_EQ(CodeOf(Run({"ja", "1ra", "2ra"})), RVC::OutOfRange);
    EXPECT_EQ(CodeOf(Run({"12ra", "13ra", "ja"})), RVC::OutOfRange);
    EXPECT_EQ(CodeOf(Run({"3ra", "4ra", "4ra"})), RVC::NonConsecutive);
    EXPECT_EQ(CodeOf(Run({"3ra", "ja", "ja"})), RVC::DuplicateTile);
    // one joker cannot bridge a gap of four
    EXPECT_EQ(CodeOf(Run({"3ra", "ja", "8ra"})), RVC::NonConsecutive);
    EXPECT_EQ(CodeOf(Run({"1ka", "jb", "4ka"})), RVC::NonConsecutive);
}

TEST(MeldValidator, Canonical_Group_Order_Ignores_Submission_Order)
{
    Meld const a = Group({"10ba", "ja", "10ka", "10ra"});
    Meld const b = Group({"10ra", "10ka", "10ba", "ja"});

    EXPECT_EQ(meld::CanonicalId(a), "10ka-10ra-10ba-ja");
    EXPECT_TRUE(meld::SameMeld(a, b));
}

TEST(MeldValidator, Canonical_Run_Keeps_Order)
{
    Meld const a = Run({"3ra", "ja", "5ra"});
    Meld const b = Run({"ja", "3ra", "5ra"});

    EXPECT_EQ(meld::CanonicalId(a), "3ra-ja-5ra");
    EXPECT_FALSE(meld::SameMeld(a, b));
    EXPECT_FALSE(meld::SameMeld(Group({"3ra", "4ra", "5ra"}), Run({"3ra", "4ra", "5ra"})));
    EXPECT_EQ(meld::KindName(MeldKind::Run), "run");
    EXPECT_EQ(meld::KindName(MeldKind::Group), "group");
}
