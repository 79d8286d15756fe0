// stagescript_segmenter.hpp - Stage Script - Inline segmentation
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef STAGESCRIPT_SEGMENTER_HPP
#define STAGESCRIPT_SEGMENTER_HPP

#include "stagescript_core.hpp"
#include "stagescript_classifier.hpp"
#include "stagescript_diagnostics.hpp"
#include "stagescript_document.hpp"

namespace stagescript
{
    // Maps an offset in joined block text back to the source line it came from.
    struct line_mark
    {
        size_t offset;
        size_t line;
    };

//========================================================================
// Segmenter
//========================================================================
//
//   text {inline direction} more text @mention @(Declension)name
//
// Braces nest one level only. Anything that fails to parse as markup is
// kept as literal text.

    class inline_segmenter
    {
    public:
        inline_segmenter(character_registry& characters,
                         diagnostics_collector& diagnostics,
                         element_kind owner,
                         std::span<const line_mark> marks)
            : characters_(characters)
            , diagnostics_(diagnostics)
            , owner_(owner)
            , marks_(marks)
        {}

        std::vector<segment> segment_text(std::string_view text, size_t base_offset = 0);

        // Splits "@a, @b: text" into speakers and segments.
        dialogue segment_dialogue(std::string_view text);

    private:
        character_registry&        characters_;
        diagnostics_collector&     diagnostics_;
        element_kind               owner_;
        std::span<const line_mark> marks_;

        size_t line_at(size_t offset) const;

        struct mention_match
        {
            std::string_view            name;
            std::optional<std::string>  declension;
            size_t                      end;
        };

        static std::optional<mention_match> match_mention(std::string_view s, size_t at);
    };

//========================================================================
// Implementation
//========================================================================

    namespace detail
    {
        template <typename Seq>
        void append_text(Seq& seq, std::string_view text)
        {
            if (text.empty())
                return;

            if (!seq.empty())
            {
                if (auto last = std::get_if<text_segment>(&seq.back()))
                {
                    last->text += text;
                    return;
                }
            }
            seq.push_back(text_segment{ std::string(text) });
        }
    }

//---------------------------------------------------------------------------

    inline size_t inline_segmenter::line_at(size_t offset) const
    {
        size_t line = marks_.empty() ? 0 : marks_.front().line;
        for (auto const & m : marks_)
        {
            if (m.offset > offset)
                break;
            line = m.line;
        }
        return line;
    }

//---------------------------------------------------------------------------

    inline std::optional<inline_segmenter::mention_match>
    inline_segmenter::match_mention(std::string_view s, size_t at)
    {
        using namespace detail;

        // s[at] == '@'
        size_t pos = at + 1;
        mention_match m;

        if (pos < s.size() && s[pos] == '(')
        {
            size_t close = s.find(')', pos + 1);
            if (close == std::string_view::npos || close == pos + 1)
                return std::nullopt;

            auto decl = s.substr(pos + 1, close - pos - 1);
            if (decl.find_first_of("{}\n") != std::string_view::npos)
                return std::nullopt;

            m.declension = std::string(decl);
            pos = close + 1;
        }

        size_t end = scan_while(s, pos, is_name_char);
        if (end == pos)
            return std::nullopt;

        m.name = s.substr(pos, end - pos);
        m.end  = end;
        return m;
    }

//---------------------------------------------------------------------------

    inline std::vector<segment> inline_segmenter::segment_text(std::string_view s, size_t base_offset)
    {
        std::vector<segment>            out;
        std::optional<inline_direction> open;
        size_t                          open_at = 0;
        std::string                     pending;

        auto flush = [&]
        {
            if (open)
                detail::append_text(open->segments, pending);
            else
                detail::append_text(out, pending);
            pending.clear();
        };

        for (size_t i = 0; i < s.size(); ++i)
        {
            char c = s[i];

            if (c == '{')
            {
                if (open)
                {
                    if (!diagnostics_.report(diagnostic_kind::nested_inline_direction, line_at(base_offset + i),
                                             "nested inline direction not supported; '{' kept as text"))
                        return out;
                    pending += c;
                    continue;
                }

                flush();
                open.emplace();
                open_at = i;
                continue;
            }

            if (c == '}')
            {
                if (!open)
                {
                    if (!diagnostics_.report(diagnostic_kind::unmatched_closing_brace, line_at(base_offset + i),
                                             "unmatched closing brace; '}' kept as text"))
                        return out;
                    pending += c;
                    continue;
                }

                flush();
                out.push_back(std::move(*open));
                open.reset();
                continue;
            }

            if (c == '@')
            {
                if (auto m = match_mention(s, i))
                {
                    flush();

                    character_mention mention;
                    mention.character  = characters_.lookup_or_create(m->name, line_at(base_offset + i), owner_);
                    mention.declension = std::move(m->declension);

                    if (open)
                        open->segments.push_back(std::move(mention));
                    else
                        out.push_back(std::move(mention));

                    i = m->end - 1;
                    continue;
                }
            }

            pending += c;
        }

        flush();

        if (open)
        {
            diagnostics_.report(diagnostic_kind::unterminated_inline_direction, line_at(base_offset + open_at),
                                "unterminated inline direction; closed at end of block");
            out.push_back(std::move(*open));
        }

        return out;
    }

//---------------------------------------------------------------------------

    inline dialogue inline_segmenter::segment_dialogue(std::string_view s)
    {
        dialogue out;

        std::vector<std::string_view> names;
        size_t body = match_speaker_prefix(s, &names);
        if (body == npos())
        {
            // Not a dialogue opener; keep everything as spoken text.
            out.segments = segment_text(s);
            return out;
        }

        for (auto name : names)
        {
            auto existing = characters_.find(name);
            if (existing && std::find(out.speakers.begin(), out.speakers.end(), *existing) != out.speakers.end())
            {
                if (!diagnostics_.report(diagnostic_kind::duplicate_speaker_in_cue, line_at(0),
                                         "speaker '" + std::string(name) + "' repeated in cue"))
                    return out;
                continue;
            }

            out.speakers.push_back(characters_.lookup_or_create(name, line_at(0), element_kind::dialogue));
        }

        size_t start = detail::scan_while(s, body, detail::is_space);
        out.segments = segment_text(s.substr(start), start);
        return out;
    }

} // namespace stagescript

#endif // STAGESCRIPT_SEGMENTER_HPP
