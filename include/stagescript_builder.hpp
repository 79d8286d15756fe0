// stagescript_builder.hpp - Stage Script - Tree builder
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef STAGESCRIPT_BUILDER_HPP
#define STAGESCRIPT_BUILDER_HPP

#include "stagescript_core.hpp"
#include "stagescript_diagnostics.hpp"
#include "stagescript_document.hpp"
#include "stagescript_segmenter.hpp"

namespace stagescript
{
//========================================================================
// Blocks
//========================================================================

    enum class block_kind
    {
        metadata,
        comment,
        document_title,
        act_heading,
        scene_heading,
        cue,
        stage_direction,
        dialogue
    };

    struct block
    {
        block_kind                 kind;
        line_range                 lines;
        std::string                text;      // value, title, comment text or joined content
        std::string                name;      // metadata key or cue name
        std::optional<std::string> argument;  // cue argument
        std::vector<line_mark>     marks;     // multi-line blocks only
        bool                       implicit = false;   // stage direction opened by orphan text
    };

//========================================================================
// Parse state shared by scanner and builder
//========================================================================

    enum class parse_phase
    {
        pre_structural,
        open_document,
        open_act,
        open_scene
    };

    struct parse_state
    {
        explicit parse_state(parse_options opts)
            : options(std::move(opts))
            , diagnostics(options.mode)
        {}

        parse_options         options;
        diagnostics_collector diagnostics;
        parse_phase           phase = parse_phase::pre_structural;
    };

//========================================================================
// tree_builder
//========================================================================

    class tree_builder
    {
    public:
        explicit tree_builder(parse_state& state) : state_(state) {}

        // Metadata is only metadata before the first structural line. The
        // classifier decides the shape, this decides the eligibility.
        static bool accepts_metadata(parse_state const & state) noexcept
        {
            return state.phase == parse_phase::pre_structural;
        }

        static void mark_structural(parse_state& state) noexcept
        {
            if (state.phase == parse_phase::pre_structural)
                state.phase = parse_phase::open_document;
        }

        void consume(block&& b);

        document take() { return std::move(doc_); }

    private:
        parse_state& state_;
        document     doc_;

        std::optional<act_id>   current_act_;
        std::optional<scene_id> current_scene_;

        bool report(diagnostic_kind kind, size_t line, std::string message)
        {
            return state_.diagnostics.report(kind, line, std::move(message));
        }

        void handle_metadata(block const & b);
        void handle_title(block const & b);
        void handle_act(block const & b);
        void handle_scene(block const & b);
        void handle_element(block&& b);

        void append_element(element_body body, line_range lines);
    };

//========================================================================
// Implementation
//========================================================================

    inline void tree_builder::consume(block&& b)
    {
        if (state_.diagnostics.aborted())
            return;

        if (b.kind == block_kind::metadata)
        {
            handle_metadata(b);
            return;
        }

        mark_structural(state_);

        switch (b.kind)
        {
            case block_kind::document_title: handle_title(b); break;
            case block_kind::act_heading:    handle_act(b);   break;
            case block_kind::scene_heading:  handle_scene(b); break;
            default:                         handle_element(std::move(b)); break;
        }
    }

//---------------------------------------------------------------------------

    inline void tree_builder::handle_metadata(block const & b)
    {
        auto it = std::find_if(doc_.metadata_.begin(), doc_.metadata_.end(),
            [&](metadata_entry const & m) { return m.key == b.name; });

        if (it == doc_.metadata_.end())
        {
            doc_.metadata_.push_back(metadata_entry{ b.name, b.text, b.lines.first });
            return;
        }

        bool keep_first = state_.options.duplicate_keys == metadata_policy::first_write_wins;

        if (!report(diagnostic_kind::duplicate_metadata_key, b.lines.first,
                    "metadata key '" + b.name + "' was previously set on line " + std::to_string(it->line) +
                    (keep_first ? "; keeping the first value" : "; overriding")))
            return;

        if (!keep_first)
        {
            it->value = b.text;
            it->line  = b.lines.first;
        }
    }

//---------------------------------------------------------------------------

    inline void tree_builder::handle_title(block const & b)
    {
        if (doc_.title_)
        {
            if (!report(diagnostic_kind::duplicate_document_title, b.lines.first,
                        "document already had the title '" + *doc_.title_ + "'; overwriting"))
                return;
        }

        doc_.title_ = b.text;
    }

//---------------------------------------------------------------------------

    inline void tree_builder::handle_act(block const & b)
    {
        for (auto const & a : doc_.acts_)
        {
            if (a.title == b.text)
            {
                if (!report(diagnostic_kind::duplicate_act_title, b.lines.first,
                            "act '" + b.text + "' was previously opened on line " + std::to_string(a.line)))
                    return;
                break;
            }
        }

        document::act_node node;
        node.id    = act_id{ doc_.acts_.size() };
        node.title = b.text;
        node.line  = b.lines.first;

        doc_.acts_.push_back(std::move(node));
        doc_.parts_.push_back(doc_.acts_.back().id);

        current_act_   = doc_.acts_.back().id;
        current_scene_.reset();
        state_.phase   = parse_phase::open_act;
    }

//---------------------------------------------------------------------------

    inline void tree_builder::handle_scene(block const & b)
    {
        for (auto const & s : doc_.scenes_)
        {
            if (s.owner == current_act_ && s.title == b.text)
            {
                if (!report(diagnostic_kind::duplicate_scene_title, b.lines.first,
                            "scene '" + b.text + "' was previously opened on line " + std::to_string(s.line)))
                    return;
                break;
            }
        }

        document::scene_node node;
        node.id    = scene_id{ doc_.scenes_.size() };
        node.title = b.text;
        node.line  = b.lines.first;
        node.owner = current_act_;

        doc_.scenes_.push_back(std::move(node));
        scene_id sid = doc_.scenes_.back().id;

        if (current_act_)
        {
            doc_.acts_[current_act_->val].scenes.push_back(sid);
        }
        else
        {
            doc_.parts_.push_back(sid);
            if (!report(diagnostic_kind::orphan_scene, b.lines.first,
                        "scene '" + b.text + "' has no enclosing act"))
                return;
        }

        current_scene_ = sid;
        state_.phase   = parse_phase::open_scene;
    }

//---------------------------------------------------------------------------

    inline void tree_builder::handle_element(block&& b)
    {
        auto& characters = doc_.characters_;
        auto& diags      = state_.diagnostics;

        switch (b.kind)
        {
            case block_kind::comment:
                append_element(comment{ std::move(b.text) }, b.lines);
                break;

            case block_kind::cue:
                append_element(cue{ std::move(b.name), std::move(b.argument) }, b.lines);
                break;

            case block_kind::stage_direction:
            {
                inline_segmenter seg(characters, diags, element_kind::stage_direction, b.marks);
                stage_direction sd{ seg.segment_text(b.text), b.implicit };
                if (diags.aborted())
                    return;
                append_element(std::move(sd), b.lines);
                break;
            }

            case block_kind::dialogue:
            {
                inline_segmenter seg(characters, diags, element_kind::dialogue, b.marks);
                dialogue dl = seg.segment_dialogue(b.text);
                if (diags.aborted())
                    return;
                append_element(std::move(dl), b.lines);
                break;
            }

            default:
                break;
        }
    }

//---------------------------------------------------------------------------

    inline void tree_builder::append_element(element_body body, line_range lines)
    {
        document::element_node node;
        node.id    = element_id{ doc_.elements_store_.size() };
        node.lines = lines;
        node.body  = std::move(body);

        element_id eid = node.id;

        if (current_scene_)
        {
            doc_.elements_store_.push_back(std::move(node));
            doc_.scenes_[current_scene_->val].elements.push_back(eid);
            return;
        }

        if (current_act_)
        {
            if (state_.options.act_elements == act_level_policy::reject)
            {
                if (!report(diagnostic_kind::element_outside_scene, lines.first,
                            "element appears in act '" + doc_.acts_[current_act_->val].title + "' before any scene"))
                    return;
            }

            doc_.elements_store_.push_back(std::move(node));
            doc_.acts_[current_act_->val].elements.push_back(eid);
            return;
        }

        doc_.elements_store_.push_back(std::move(node));
        doc_.elements_.push_back(eid);
    }

} // namespace stagescript

#endif // STAGESCRIPT_BUILDER_HPP
