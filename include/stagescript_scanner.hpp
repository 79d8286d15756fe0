// stagescript_scanner.hpp - Stage Script - Block scanner
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef STAGESCRIPT_SCANNER_HPP
#define STAGESCRIPT_SCANNER_HPP

#include "stagescript_core.hpp"
#include "stagescript_classifier.hpp"
#include "stagescript_builder.hpp"

#include <functional>

namespace stagescript
{
//========================================================================
// block_scanner
//========================================================================
//
// Walks the line sequence and emits one block per construct. Stage
// directions and dialogue have no terminator: the open block is closed
// when the next structural line is classified, or at end of input.
// Blocks are handed to the sink as soon as they close.

    class block_scanner
    {
    public:
        using sink = std::function<void(block&&)>;

        block_scanner(parse_state& state, sink emit)
            : state_(state)
            , emit_(std::move(emit))
        {}

        void feed(std::string_view line, size_t line_no);
        void finish();

    private:
        struct open_block
        {
            block b;
            bool  pending_break = false;   // blank line seen since the last content
        };

        parse_state&              state_;
        sink                      emit_;
        std::optional<open_block> open_;

        bool report(diagnostic_kind kind, size_t line, std::string message)
        {
            return state_.diagnostics.report(kind, line, std::move(message));
        }

        void close_open();
        void emit_single(block_kind kind, line_class const & lc, size_t line_no);
        void open(block_kind kind, std::string_view text, size_t line_no, bool implicit = false);
        void append(std::string_view text, size_t line_no);
        void continuation(std::string_view text, size_t line_no);
    };

//========================================================================
// Implementation
//========================================================================

    inline void block_scanner::close_open()
    {
        if (!open_)
            return;

        block b = std::move(open_->b);
        open_.reset();
        emit_(std::move(b));
    }

//---------------------------------------------------------------------------

    inline void block_scanner::emit_single(block_kind kind, line_class const & lc, size_t line_no)
    {
        block b;
        b.kind  = kind;
        b.lines = { line_no, line_no };
        b.text  = std::string(lc.text);
        b.name  = std::string(lc.name);
        if (lc.argument)
            b.argument = std::string(*lc.argument);

        emit_(std::move(b));
    }

//---------------------------------------------------------------------------

    inline void block_scanner::open(block_kind kind, std::string_view text, size_t line_no, bool implicit)
    {
        open_block ob;
        ob.b.kind     = kind;
        ob.b.lines    = { line_no, line_no };
        ob.b.text     = std::string(text);
        ob.b.implicit = implicit;
        ob.b.marks.push_back({ 0, line_no });

        open_ = std::move(ob);
    }

//---------------------------------------------------------------------------

    inline void block_scanner::append(std::string_view text, size_t line_no)
    {
        auto& ob = *open_;

        if (!ob.b.text.empty())
            ob.b.text += ob.pending_break ? '\n' : ' ';

        ob.pending_break = false;
        ob.b.marks.push_back({ ob.b.text.size(), line_no });
        ob.b.text += text;
        ob.b.lines.last = line_no;
    }

//---------------------------------------------------------------------------

    inline void block_scanner::continuation(std::string_view text, size_t line_no)
    {
        if (open_)
        {
            append(text, line_no);
            return;
        }

        open(block_kind::stage_direction, text, line_no, true);
    }

//---------------------------------------------------------------------------

    inline void block_scanner::feed(std::string_view line, size_t line_no)
    {
        if (state_.diagnostics.aborted())
            return;

        line_class lc = classify_line(line);

        switch (lc.kind)
        {
            case line_kind::blank:
                if (open_ && !open_->b.text.empty())
                    open_->pending_break = true;
                return;

            case line_kind::metadata:
                if (tree_builder::accepts_metadata(state_))
                {
                    emit_single(block_kind::metadata, lc, line_no);
                    return;
                }

                if (!report(diagnostic_kind::metadata_after_structural_content, line_no,
                            "'" + std::string(lc.name) + "' looks like metadata but follows structural content; kept as text"))
                    return;

                continuation(detail::trim_sv(line), line_no);
                return;

            default:
                break;
        }

        tree_builder::mark_structural(state_);

        switch (lc.kind)
        {
            case line_kind::comment:
                close_open();
                emit_single(block_kind::comment, lc, line_no);
                return;

            case line_kind::document_title:
                close_open();
                emit_single(block_kind::document_title, lc, line_no);
                return;

            case line_kind::act_heading:
                close_open();
                emit_single(block_kind::act_heading, lc, line_no);
                return;

            case line_kind::scene_heading:
                close_open();
                emit_single(block_kind::scene_heading, lc, line_no);
                return;

            case line_kind::cue:
                close_open();
                emit_single(block_kind::cue, lc, line_no);
                return;

            case line_kind::stage_direction_open:
                close_open();
                open(block_kind::stage_direction, lc.text, line_no);
                return;

            case line_kind::dialogue_open:
                close_open();
                open(block_kind::dialogue, detail::trim_sv(line), line_no);
                return;

            default:
                break;
        }

        // Continuation line
        if (!open_)
        {
            if (!report(diagnostic_kind::orphan_text_line, line_no,
                        "text line outside of any dialogue or stage direction"))
                return;
        }

        continuation(lc.text, line_no);
    }

//---------------------------------------------------------------------------

    inline void block_scanner::finish()
    {
        if (state_.diagnostics.aborted() || !open_)
            return;

        auto const & b = open_->b;
        if (!report(diagnostic_kind::unterminated_block_at_eof, b.lines.first,
                    std::string(b.kind == block_kind::dialogue ? "dialogue" : "stage direction") +
                    " block closed at end of input"))
            return;

        close_open();
    }

} // namespace stagescript

#endif // STAGESCRIPT_SCANNER_HPP
