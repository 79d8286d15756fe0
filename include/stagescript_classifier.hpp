// stagescript_classifier.hpp - Stage Script - Line Classifier
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef STAGESCRIPT_CLASSIFIER_HPP
#define STAGESCRIPT_CLASSIFIER_HPP

#include "stagescript_core.hpp"

namespace stagescript
{
//========================================================================
// Line classification
//========================================================================
//
// Priority order, first match wins:
//
//   %comment            comment
//   ### Scene           scene heading
//   ## Act              act heading
//   # Title             document title
//   /name argument      cue
//   key: value          metadata (shape only, see tree_builder::accepts_metadata)
//   > text              stage direction opener
//   @a, @b: text        dialogue opener
//   (whitespace)        blank
//   anything else       continuation
//
// All patterns are anchored at column 0.

    enum class line_kind
    {
        comment,
        scene_heading,
        act_heading,
        document_title,
        cue,
        metadata,
        stage_direction_open,
        dialogue_open,
        blank,
        continuation
    };

    struct line_class
    {
        line_kind                  kind = line_kind::continuation;
        std::string_view           text;       // comment text, heading title, metadata value, opener content
        std::string_view           name;       // cue name or metadata key
        std::optional<std::string_view> argument;  // cue argument
        std::vector<std::string_view>   speakers;  // dialogue opener names, as written
    };

    inline line_class classify_line(std::string_view line);

    // Matches "@a(,\s*@b)*:" at the start of `s`. Returns the offset just past
    // the colon, or npos.
    inline size_t match_speaker_prefix(std::string_view s, std::vector<std::string_view>* speakers = nullptr);

//========================================================================
// Implementation
//========================================================================

    namespace detail
    {
        inline bool match_heading(std::string_view line, size_t level, line_class& out)
        {
            if (line.size() < level + 1)
                return false;

            for (size_t i = 0; i < level; ++i)
                if (line[i] != '#') return false;

            if (line[level] != ' ')
                return false;

            out.text = trim_sv(line.substr(level + 1));
            return true;
        }

        inline bool match_cue(std::string_view line, line_class& out)
        {
            if (!line.starts_with('/'))
                return false;

            size_t end = scan_while(line, 1, is_cue_char);
            if (end == 1)
                return false;

            if (end < line.size() && !is_space(line[end]))
                return false;

            out.name = line.substr(1, end - 1);

            auto arg = trim_sv(line.substr(end));
            if (!arg.empty())
                out.argument = arg;

            return true;
        }

        inline bool match_metadata(std::string_view line, line_class& out)
        {
            size_t end = scan_while(line, 0, is_key_char);
            if (end == 0 || end >= line.size() || line[end] != ':')
                return false;

            out.name = line.substr(0, end);

            auto value = line.substr(end + 1);
            if (value.starts_with(' '))
                value.remove_prefix(1);

            out.text = rtrim_sv(value);
            return true;
        }
    }

//---------------------------------------------------------------------------

    inline size_t match_speaker_prefix(std::string_view s, std::vector<std::string_view>* speakers)
    {
        using namespace detail;

        size_t pos = 0;
        std::vector<std::string_view> found;

        while (true)
        {
            if (pos >= s.size() || s[pos] != '@')
                return npos();

            size_t end = scan_while(s, pos + 1, is_name_char);
            if (end == pos + 1)
                return npos();

            found.push_back(s.substr(pos + 1, end - pos - 1));
            pos = end;

            if (pos < s.size() && s[pos] == ':')
                break;

            if (pos >= s.size() || s[pos] != ',')
                return npos();

            pos = scan_while(s, pos + 1, is_space);
        }

        if (speakers)
            *speakers = std::move(found);

        return pos + 1;
    }

//---------------------------------------------------------------------------

    inline line_class classify_line(std::string_view raw)
    {
        using namespace detail;

        line_class out;
        std::string_view line = rtrim_sv(raw);

        if (line.empty())
        {
            out.kind = line_kind::blank;
            return out;
        }

        if (line.starts_with('%'))
        {
            out.kind = line_kind::comment;
            out.text = trim_sv(line.substr(1));
            return out;
        }

        if (match_heading(line, 3, out))
        {
            out.kind = line_kind::scene_heading;
            return out;
        }

        if (match_heading(line, 2, out))
        {
            out.kind = line_kind::act_heading;
            return out;
        }

        if (match_heading(line, 1, out))
        {
            out.kind = line_kind::document_title;
            return out;
        }

        if (match_cue(line, out))
        {
            out.kind = line_kind::cue;
            return out;
        }

        if (match_metadata(line, out))
        {
            out.kind = line_kind::metadata;
            return out;
        }

        if (raw.starts_with("> "))
        {
            out.kind = line_kind::stage_direction_open;
            out.text = trim_sv(raw.substr(2));
            return out;
        }

        if (size_t end = match_speaker_prefix(line, &out.speakers); end != npos())
        {
            out.kind = line_kind::dialogue_open;
            out.text = trim_sv(line.substr(end));
            return out;
        }

        out.kind = line_kind::continuation;
        out.text = trim_sv(line);
        return out;
    }

} // namespace stagescript

#endif // STAGESCRIPT_CLASSIFIER_HPP
