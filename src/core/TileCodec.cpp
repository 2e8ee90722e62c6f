//
// Created by Malik T on 02/09/2025.
//

#include "TileCodec.hpp"

#include <charconv>
#include <format>
#include <type_traits>
#include <utility>
#include <variant>

namespace rummikub::core::tiles
{
    namespace
    {
        constexpr auto JokerBase = static_cast<uint8_t>(constants::NumberedTileCount);

        auto Unknown(std::string_view text) -> error::RuleViolation
        {
            error::RuleViolation v{};
            v.code = error::RuleViolationCode::UnknownTile;
            v.with_tile(std::string{text});
            return v;
        }

        auto ColorFromCode(char c) -> std::optional<Color>
        {
            switch (c)
            {
            case 'k': return Color::Black;
            case 'r': return Color::Red;
            case 'b': return Color::Blue;
            case 'o': return Color::Orange;
            default: return std::nullopt;
            }
        }

        auto CopyFromCode(char c) -> std::optional<Copy>
        {
            switch (c)
            {
            case 'a': return Copy::A;
            case 'b': return Copy::B;
            default: return std::nullopt;
            }
        }

        auto CopyCode(Copy c) -> char
        {
            return c == Copy::A ? 'a' : 'b';
        }
    }

    auto Encode(uint8_t number, Color color, Copy copy) -> TileId
    {
        RMK_ASSERT(number >= constants::MinNumber && number <= constants::MaxNumber,
                   std::format("tile number {} outside 1..13", number));
        auto const face = std::to_underlying(color) * constants::MaxNumber + (number - 1);
        return TileId{static_cast<uint8_t>(face * constants::CopyCount + std::to_underlying(copy))};
    }

    auto EncodeJoker(Copy copy) -> TileId
    {
        return TileId{static_cast<uint8_t>(JokerBase + std::to_underlying(copy))};
    }

    auto IsValid(TileId id) noexcept -> bool
    {
        return id.index < constants::TileCount;
    }

    auto IsJoker(TileId id) noexcept -> bool
    {
        return id.index >= JokerBase && IsValid(id);
    }

    auto NumberOf(TileId id) -> std::optional<uint8_t>
    {
        RMK_ASSERT(IsValid(id), std::format("tile index {} outside the tile set", id.index));
        if (IsJoker(id)) return std::nullopt;
        auto const face = id.index / constants::CopyCount;
        return static_cast<uint8_t>(face % constants::MaxNumber + 1);
    }

    auto ColorOf(TileId id) -> std::optional<Color>
    {
        RMK_ASSERT(IsValid(id), std::format("tile index {} outside the tile set", id.index));
        if (IsJoker(id)) return std::nullopt;
        auto const face = id.index / constants::CopyCount;
        return static_cast<Color>(face / constants::MaxNumber);
    }

    auto CopyOf(TileId id) -> Copy
    {
        RMK_ASSERT(IsValid(id), std::format("tile index {} outside the tile set", id.index));
        if (IsJoker(id)) return static_cast<Copy>(id.index - JokerBase);
        return static_cast<Copy>(id.index % constants::CopyCount);
    }

    auto ValueOf(TileId id) -> Result<int>
    {
        if (!IsValid(id)) return std::unexpected(Unknown(std::to_string(id.index)));
        if (IsJoker(id))
        {
            error::RuleViolation v{};
            v.code = error::RuleViolationCode::AmbiguousValue;
            v.with_tile(ToString(id));
            return std::unexpected(v);
        }
        return static_cast<int>(*NumberOf(id));
    }

    auto Decode(TileId id) -> Tile
    {
        if (IsJoker(id)) return JokerTile{CopyOf(id)};
        return NumberedTile{*NumberOf(id), *ColorOf(id), CopyOf(id)};
    }

    auto FullUniverse() -> std::vector<TileId>
    {
        std::vector<TileId> out;
        out.reserve(constants::TileCount);
        for (size_t i = 0; i < constants::TileCount; ++i)
            out.push_back(TileId{static_cast<uint8_t>(i)});
        return out;
    }

    auto ToString(TileId id) -> std::string
    {
        return std::visit([](auto const& t) -> std::string
        {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, JokerTile>)
            {
                return std::format("j{}", CopyCode(t.copy));
            }
            else
            {
                return std::format("{}{}{}", t.number, ColorCode(t.color), CopyCode(t.copy));
            }
        }, Decode(id));
    }

    auto Parse(std::string_view text) -> Result<TileId>
    {
        if (text.size() == 2 && text[0] == 'j')
        {
            if (auto const copy = CopyFromCode(text[1])) return EncodeJoker(*copy);
            return std::unexpected(Unknown(text));
        }
        // <number><color><copy>, number is one or two digits without a leading zero
        if (text.size() < 3 || text.size() > 4 || text[0] == '0')
            return std::unexpected(Unknown(text));

        auto const digits = text.substr(0, text.size() - 2);
        unsigned number{};
        auto const [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), number);
        if (ec != std::errc{} || ptr != digits.data() + digits.size())
            return std::unexpected(Unknown(text));
        if (number < constants::MinNumber || number > constants::MaxNumber)
            return std::unexpected(Unknown(text));

        auto const color = ColorFromCode(text[text.size() - 2]);
        auto const copy = CopyFromCode(text[text.size() - 1]);
        if (!color || !copy) return std::unexpected(Unknown(text));

        return Encode(static_cast<uint8_t>(number), *color, *copy);
    }

    auto Format(TileId id) -> std::string
    {
        if (IsJoker(id)) return "Joker";
        return std::format("{} {}", ColorName(*ColorOf(id)), *NumberOf(id));
    }

    auto ColorCode(Color c) -> char
    {
        switch (c)
        {
        case Color::Black: return 'k';
        case Color::Red: return 'r';
        case Color::Blue: return 'b';
        case Color::Orange: return 'o';
        }
        RMK_THROW(error::Code::Assertion, "unhandled color");
    }

    auto ColorName(Color c) -> std::string_view
    {
        switch (c)
        {
        case Color::Black: return "Black";
        case Color::Red: return "Red";
        case Color::Blue: return "Blue";
        case Color::Orange: return "Orange";
        }
        RMK_THROW(error::Code::Assertion, "unhandled color");
    }
}
