// stagescript_document.hpp - Stage Script - Authoritative Document Model
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef STAGESCRIPT_DOCUMENT_HPP
#define STAGESCRIPT_DOCUMENT_HPP

#include "stagescript_core.hpp"
#include "stagescript_characters.hpp"

#include <span>

namespace stagescript
{
//========================================================================
// Inline content
//========================================================================

    struct text_segment
    {
        std::string text;

        bool operator==(text_segment const &) const = default;
    };

    struct character_mention
    {
        character_id               character;
        std::optional<std::string> declension;   // @(Gertrudu)gertrude

        bool operator==(character_mention const &) const = default;
    };

    // Inline directions do not nest; the type only admits text and mentions.
    using inline_segment = std::variant<text_segment, character_mention>;

    struct inline_direction
    {
        std::vector<inline_segment> segments;

        bool operator==(inline_direction const &) const = default;
    };

    using segment = std::variant<text_segment, inline_direction, character_mention>;

//========================================================================
// Elements
//========================================================================

    struct comment
    {
        std::string text;

        bool operator==(comment const &) const = default;
    };

    struct stage_direction
    {
        std::vector<segment> segments;
        bool                 implicit = false;   // opened by text outside any block

        bool operator==(stage_direction const &) const = default;
    };

    struct dialogue
    {
        std::vector<character_id> speakers;   // written order, no repeats
        std::vector<segment>      segments;

        bool operator==(dialogue const &) const = default;
    };

    struct cue
    {
        std::string                name;
        std::optional<std::string> argument;

        // "/introduce alice; Alice; the heroine" -> { "alice", "Alice", "the heroine" }
        std::vector<std::string> arguments() const
        {
            std::vector<std::string> out;
            if (!argument)
                return out;

            std::string_view rest = *argument;
            while (true)
            {
                size_t semi = rest.find(';');
                auto part = detail::trim_sv(rest.substr(0, semi));
                if (!part.empty())
                    out.emplace_back(part);
                if (semi == std::string_view::npos)
                    break;
                rest.remove_prefix(semi + 1);
            }
            return out;
        }

        bool operator==(cue const &) const = default;
    };

    // Alternative order matches element_kind.
    using element_body = std::variant<comment, stage_direction, dialogue, cue>;

    struct metadata_entry
    {
        std::string key;
        std::string value;
        size_t      line;

        bool operator==(metadata_entry const &) const = default;
    };

    // A top-level part of the document: an act, or a scene outside any act.
    using part = std::variant<act_id, scene_id>;

//========================================================================
// Document
//========================================================================

    class document
    {
    public:
        //------------------------------------------------------------------------
        // Public, read-only views
        //------------------------------------------------------------------------

        struct act_view;
        struct scene_view;
        struct element_view;

        document() = default;

        //------------------------------------------------------------------------
        // Front matter
        //------------------------------------------------------------------------

        std::optional<std::string_view> title() const noexcept
        {
            if (!title_)
                return std::nullopt;
            return std::string_view{ *title_ };
        }

        std::span<const metadata_entry> metadata() const noexcept
        {
            return metadata_;
        }

        std::optional<std::string_view> metadata_value(std::string_view key) const noexcept;

        //------------------------------------------------------------------------
        // Structure
        //------------------------------------------------------------------------

        // Elements that precede every act and scene.
        std::span<const element_id> elements() const noexcept
        {
            return elements_;
        }

        // Acts and orphan scenes in authored order.
        std::span<const part> parts() const noexcept
        {
            return parts_;
        }

        size_t act_count() const noexcept     { return acts_.size(); }
        size_t scene_count() const noexcept   { return scenes_.size(); }
        size_t element_count() const noexcept { return elements_store_.size(); }

        std::optional<act_view>     act(act_id id) const noexcept;
        std::optional<scene_view>   scene(scene_id id) const noexcept;
        std::optional<element_view> element(element_id id) const noexcept;

        const character_registry& characters() const noexcept
        {
            return characters_;
        }

        bool empty() const noexcept
        {
            return !title_ && metadata_.empty() && elements_store_.empty() && parts_.empty();
        }

        bool operator==(document const &) const = default;

    private:
        //------------------------------------------------------------------------
        // Internal storage (fully normalised)
        //------------------------------------------------------------------------

        struct act_node
        {
            act_id                  id;
            std::string             title;
            size_t                  line = 0;
            std::vector<element_id> elements;   // before the first scene
            std::vector<scene_id>   scenes;

            bool operator==(act_node const &) const = default;
        };

        struct scene_node
        {
            scene_id                id;
            std::string             title;
            size_t                  line = 0;
            std::optional<act_id>   owner;      // nullopt for orphan scenes
            std::vector<element_id> elements;

            bool operator==(scene_node const &) const = default;
        };

        struct element_node
        {
            element_id   id;
            line_range   lines;
            element_body body;

            bool operator==(element_node const &) const = default;
        };

        std::optional<std::string>  title_;
        std::vector<metadata_entry> metadata_;
        std::vector<element_id>     elements_;
        std::vector<part>           parts_;

        std::vector<act_node>       acts_;
        std::vector<scene_node>     scenes_;
        std::vector<element_node>   elements_store_;
        character_registry          characters_;

        friend class tree_builder;
        friend class interchange_reader;
    };

//========================================================================
// Views
//========================================================================

    struct document::element_view
    {
        const document* doc;
        const element_node* node;

        element_id id() const noexcept { return node->id; }

        element_kind kind() const noexcept
        {
            return static_cast<element_kind>(node->body.index());
        }

        line_range lines() const noexcept { return node->lines; }

        const element_body& body() const noexcept { return node->body; }

        template <typename T>
        const T* as() const noexcept
        {
            return std::get_if<T>(&node->body);
        }

        // Segments of a dialogue or stage direction; empty for other kinds.
        std::span<const segment> segments() const noexcept
        {
            if (auto d = as<dialogue>())        return d->segments;
            if (auto s = as<stage_direction>()) return s->segments;
            return {};
        }
    };

    struct document::scene_view
    {
        const document* doc;
        const scene_node* node;

        scene_id id() const noexcept { return node->id; }
        std::string_view title() const noexcept { return node->title; }
        size_t line() const noexcept { return node->line; }

        std::optional<act_id> owner() const noexcept { return node->owner; }
        bool is_orphan() const noexcept { return !node->owner.has_value(); }

        std::span<const element_id> elements() const noexcept
        {
            return node->elements;
        }
    };

    struct document::act_view
    {
        const document* doc;
        const act_node* node;

        act_id id() const noexcept { return node->id; }
        std::string_view title() const noexcept { return node->title; }
        size_t line() const noexcept { return node->line; }

        std::span<const element_id> elements() const noexcept
        {
            return node->elements;
        }

        std::span<const scene_id> scenes() const noexcept
        {
            return node->scenes;
        }
    };

//========================================================================
// document member implementations
//========================================================================

    inline std::optional<std::string_view>
    document::metadata_value(std::string_view key) const noexcept
    {
        for (auto const & m : metadata_)
            if (m.key == key)
                return std::string_view{ m.value };
        return std::nullopt;
    }

    inline std::optional<document::act_view>
    document::act(act_id id) const noexcept
    {
        if (id.val >= acts_.size())
            return std::nullopt;

        return act_view{ this, &acts_[id.val] };
    }

    inline std::optional<document::scene_view>
    document::scene(scene_id id) const noexcept
    {
        if (id.val >= scenes_.size())
            return std::nullopt;

        return scene_view{ this, &scenes_[id.val] };
    }

    inline std::optional<document::element_view>
    document::element(element_id id) const noexcept
    {
        if (id.val >= elements_store_.size())
            return std::nullopt;

        return element_view{ this, &elements_store_[id.val] };
    }

//========================================================================
// Text helpers
//========================================================================

    // Flattens segments to reading text. Mentions render as their declension
    // when present, else as the character name; inline directions are wrapped
    // in the given brackets.
    inline std::string plain_text(std::span<const segment> segments,
                                  character_registry const & characters,
                                  std::string_view open = "(",
                                  std::string_view close = ")")
    {
        std::string out;

        auto mention_text = [&](character_mention const & m)
        {
            if (m.declension) return std::string_view{ *m.declension };
            return characters.name(m.character);
        };

        for (auto const & seg : segments)
        {
            std::visit([&](auto const & s)
            {
                using T = std::decay_t<decltype(s)>;
                if constexpr (std::is_same_v<T, text_segment>)
                    out += s.text;
                else if constexpr (std::is_same_v<T, character_mention>)
                    out += mention_text(s);
                else
                {
                    out += open;
                    for (auto const & inner : s.segments)
                    {
                        if (auto t = std::get_if<text_segment>(&inner))
                            out += t->text;
                        else
                            out += mention_text(std::get<character_mention>(inner));
                    }
                    out += close;
                }
            }, seg);
        }

        return out;
    }

} // namespace stagescript

#endif // STAGESCRIPT_DOCUMENT_HPP
