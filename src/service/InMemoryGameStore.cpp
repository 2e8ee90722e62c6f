//
// Created by Malik T on 09/09/2025.
//

#include "InMemoryGameStore.hpp"

#include <format>
#include <utility>

#include "../core/Exception.hpp"
#include "../net/codec.hpp"

namespace rummikub::service
{
    namespace
    {
        auto Decode(std::string_view game_id, std::vector<std::uint8_t> const& bytes) -> core::GameState
        {
            auto g = core::net::DecodeGameRecord(core::net::AsBytes(bytes));
            if (!g)
                RMK_THROW(core::error::Code::Serialization,
                          std::format("stored game {} is unreadable: {}", game_id, g.error().message));
            return std::move(*g);
        }
    }

    auto InMemoryGameStore::Load(std::string_view game_id) const -> core::GameState
    {
        std::vector<std::uint8_t> bytes;
        {
            std::lock_guard<std::mutex> lock(mx_);
            auto const it = games_.find(game_id);
            if (it == games_.end())
                RMK_THROW(core::error::Code::NotFound, std::format("Game {} not found", game_id));
            bytes = it->second;
        }
        return Decode(game_id, bytes);
    }

    auto InMemoryGameStore::Save(core::GameState const& state) -> void
    {
        auto bytes = core::net::EncodeGameRecord(state);
        std::lock_guard<std::mutex> lock(mx_);
        games_.insert_or_assign(state.game_id, std::move(bytes));
    }

    auto InMemoryGameStore::List() const -> std::vector<core::GameState>
    {
        std::map<std::string, std::vector<std::uint8_t>, std::less<>> copy;
        {
            std::lock_guard<std::mutex> lock(mx_);
            copy = games_;
        }

        std::vector<core::GameState> out;
        out.reserve(copy.size());
        for (auto const& [id, bytes] : copy) out.push_back(Decode(id, bytes));
        return out;
    }

    auto InMemoryGameStore::Size() const -> size_t
    {
        std::lock_guard<std::mutex> lock(mx_);
        return games_.size();
    }
}
