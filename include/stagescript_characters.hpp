// stagescript_characters.hpp - Stage Script - Character registry
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef STAGESCRIPT_CHARACTERS_HPP
#define STAGESCRIPT_CHARACTERS_HPP

#include "stagescript_core.hpp"

#include <span>
#include <unordered_map>

namespace stagescript
{
    struct character
    {
        character_id id;
        std::string  name;          // exact token, case-sensitive
        size_t       first_line;
        element_kind first_kind;    // dialogue (as speaker) or where first mentioned
        size_t       references = 0;

        bool operator==(character const &) const = default;
    };

//========================================================================
// Registry
//========================================================================
//
// Characters are registered on first reference. Identity is the name token
// exactly as written after '@'; ids are dense and follow first use.

    class character_registry
    {
    public:
        character_id lookup_or_create(std::string_view name, size_t line, element_kind kind)
        {
            if (auto it = index_.find(std::string(name)); it != index_.end())
            {
                ++characters_[it->second.val].references;
                return it->second;
            }

            character c;
            c.id         = character_id{ characters_.size() };
            c.name       = std::string(name);
            c.first_line = line;
            c.first_kind = kind;
            c.references = 1;

            index_.emplace(c.name, c.id);
            characters_.push_back(std::move(c));
            return characters_.back().id;
        }

        std::optional<character_id> find(std::string_view name) const
        {
            if (auto it = index_.find(std::string(name)); it != index_.end())
                return it->second;
            return std::nullopt;
        }

        const character* get(character_id id) const noexcept
        {
            if (id.val >= characters_.size())
                return nullptr;
            return &characters_[id.val];
        }

        std::string_view name(character_id id) const noexcept
        {
            auto c = get(id);
            return c ? std::string_view{ c->name } : std::string_view{};
        }

        size_t size() const noexcept { return characters_.size(); }
        bool empty() const noexcept { return characters_.empty(); }

        std::span<const character> all() const noexcept { return characters_; }

        bool operator==(character_registry const & other) const
        {
            return characters_ == other.characters_;
        }

    private:
        friend class interchange_reader;

        // Restores a character exactly as recorded, reference count included.
        character_id restore(character c)
        {
            c.id = character_id{ characters_.size() };
            index_.emplace(c.name, c.id);
            characters_.push_back(std::move(c));
            return characters_.back().id;
        }

        std::vector<character> characters_;
        std::unordered_map<std::string, character_id> index_;
    };

} // namespace stagescript

#endif // STAGESCRIPT_CHARACTERS_HPP
