#include <gtest/gtest.h>
#include <algorithm>
#include <set>
#include <string>
#include <variant>

#include "../core/TileCodec.hpp"
#include "../core/Exception.hpp"
#include "TestUtil.hpp"

using namespace rummikub::core;
using rummikub::test::T;

TEST(TileCodec, Layout_Matches_Dense_Index)
{
    EXPECT_EQ(tiles::Encode(1, Color::Black, Copy::A).index, 0);
    EXPECT_EQ(tiles::Encode(1, Color::Black, Copy::B).index, 1);
    EXPECT_EQ(tiles::Encode(2, Color::Black, Copy::A).index, 2);
    EXPECT_EQ(tiles::Encode(1, Color::Red, Copy::A).index, 26);
    EXPECT_EQ(tiles::Encode(13, Color::Orange, Copy::B).index, 103);
    EXPECT_EQ(tiles::EncodeJoker(Copy::A).index, 104);
    EXPECT_EQ(tiles::EncodeJoker(Copy::B).index, 105);
}

TEST(TileCodec, Decode_Inverts_Encode_Over_Universe)
{
    auto const all = tiles::FullUniverse();
    ASSERT_EQ(all.size(), constants::TileCount);

    std::set<TileId> unique(all.begin(), all.end());
    EXPECT_EQ(unique.size(), constants::TileCount);

    size_t jokers = 0;
    for (TileId const id : all)
    {
        Tile const t = tiles::Decode(id);
        if (auto const* j = std::get_if<JokerTile>(&t))
        {
            ++jokers;
            EXPECT_EQ(tiles::EncodeJoker(j->copy), id);
            continue;
        }
        auto const& n = std::get<NumberedTile>(t);
        EXPECT_EQ(tiles::Encode(n.number, n.color, n.copy), id);
    }
    EXPECT_EQ(jokers, constants::JokerCount);
}

TEST(TileCodec, ToString_And_Parse_Agree)
{
    EXPECT_EQ(tiles::ToString(tiles::Encode(10, Color::Red, Copy::A)), "10ra");
    EXPECT_EQ(tiles::ToString(tiles::Encode(1, Color::Black, Copy::B)), "1kb");
    EXPECT_EQ(tiles::ToString(tiles::EncodeJoker(Copy::B)), "jb");

    for (TileId const id : tiles::FullUniverse())
    {
        auto const back = tiles::Parse(tiles::ToString(id));
        ASSERT_TRUE(back.has_value()) << tiles::ToString(id);
        EXPECT_EQ(*back, id);
    }
}

TEST(TileCodec, Parse_Rejects_Malformed_Text)
{
    for (std::string const bad : {"", "j", "jc", "ra", "0ra", "01ra", "14ra", "10xa", "10rc", "10ra ", " 1ra", "+1ra",
                                  "100ra"})
    {
        auto const r = tiles::Parse(bad);
        ASSERT_FALSE(r.has_value()) << "'" << bad << "'";
        EXPECT_EQ(r.error().code, error::RuleViolationCode::UnknownTile);
        ASSERT_TRUE(r.error().tile.has_value());
        EXPECT_EQ(*r.error().tile, bad);
    }
}

TEST(TileCodec, Value_Of_Joker_Is_Ambiguous)
{
    EXPECT_EQ(tiles::ValueOf(T("7ob")).value(), 7);

    auto const joker = tiles::ValueOf(T("ja"));
    ASSERT_FALSE(joker.has_value());
    EXPECT_EQ(joker.error().code, error::RuleViolationCode::AmbiguousValue);

    auto const junk = tiles::ValueOf(TileId{200});
    ASSERT_FALSE(junk.has_value());
    EXPECT_EQ(junk.error().code, error::RuleViolationCode::UnknownTile);
}

TEST(TileCodec, Accessors_And_Display)
{
    TileId const id = T("12bb");
    EXPECT_EQ(tiles::NumberOf(id), std::optional<uint8_t>{12});
    EXPECT_EQ(tiles::ColorOf(id), std::optional<Color>{Color::Blue});
    EXPECT_EQ(tiles::CopyOf(id), Copy::B);
    EXPECT_EQ(tiles::Format(id), "Blue 12");

    EXPECT_TRUE(tiles::IsJoker(T("ja")));
    EXPECT_FALSE(tiles::NumberOf(T("ja")).has_value());
    EXPECT_EQ(tiles::Format(T("ja")), "Joker");

    EXPECT_FALSE(tiles::IsValid(TileId{106}));
    EXPECT_FALSE(tiles::IsJoker(TileId{106}));
}

TEST(TileCodec, Encode_Out_Of_Range_Number_Asserts)
{
    EXPECT_THROW((void)tiles::Encode(0, Color::Red, Copy::A), error::AssertionError);
    EXPECT_THROW((void)tiles::Encode(14, Color::Red, Copy::A), error::AssertionError);
}
