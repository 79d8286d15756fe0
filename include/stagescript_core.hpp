// stagescript_core.hpp - Stage Script - Core Data Structures
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef STAGESCRIPT_CORE_HPP
#define STAGESCRIPT_CORE_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <variant>
#include <optional>
#include <algorithm>

namespace stagescript
{
//========================================================================
// IDs
//========================================================================

    inline constexpr size_t npos() { return static_cast<size_t>(-1); }

    template <typename Tag>
    struct id
    {
        size_t val;

        explicit id(size_t v = npos()) : val(v) {}
        operator size_t() const { return val; }
        auto operator<=>(id const &) const = default;
    };

    struct act_tag;
    struct scene_tag;
    struct element_tag;
    struct character_tag;

    using act_id       = id<act_tag>;
    using scene_id     = id<scene_tag>;
    using element_id   = id<element_tag>;
    using character_id = id<character_tag>;

//========================================================================
// Source locations
//========================================================================

    struct line_range
    {
        size_t first = 0;   // 1-based
        size_t last  = 0;   // inclusive

        bool operator==(line_range const &) const = default;
    };

//========================================================================
// Element kinds
//========================================================================

    enum class element_kind
    {
        comment,
        stage_direction,
        dialogue,
        cue
    };

//========================================================================
// Diagnostics
//========================================================================

    enum class severity
    {
        note,
        warning,
        error
    };

    enum class diagnostic_kind
    {
        duplicate_metadata_key,
        metadata_after_structural_content,
        duplicate_document_title,
        duplicate_act_title,
        duplicate_scene_title,
        orphan_text_line,
        orphan_scene,
        element_outside_scene,
        duplicate_speaker_in_cue,
        nested_inline_direction,
        unmatched_closing_brace,
        unterminated_inline_direction,
        unterminated_block_at_eof,
    };

    struct diagnostic
    {
        diagnostic_kind kind;
        severity        level;
        size_t          line;
        std::string     message;

        bool operator==(diagnostic const &) const = default;
    };

//========================================================================
// Parse options
//========================================================================

    enum class parse_mode
    {
        lenient,   // collect everything, return a best-effort tree
        strict     // stop on the first error
    };

    enum class metadata_policy
    {
        last_write_wins,
        first_write_wins
    };

    enum class act_level_policy
    {
        permit,   // elements between an act heading and its first scene belong to the act
        reject
    };

    struct parse_options
    {
        parse_mode       mode             = parse_mode::lenient;
        metadata_policy  duplicate_keys   = metadata_policy::last_write_wins;
        act_level_policy act_elements     = act_level_policy::permit;
        std::string      source_name      = "<input>";
    };

//========================================================================
// Document generation context
//========================================================================

    template <typename T, typename Error>
    struct context
    {
        T document;
        std::vector<Error> errors;

        bool has_errors() const { return !errors.empty(); }
    };

//========================================================================
// UTILITY FUNCTIONS
//========================================================================

    namespace detail
    {
        inline std::string_view trim_sv(std::string_view s)
        {
            size_t start = s.find_first_not_of(" \t\r\n");
            if (start == std::string_view::npos) return {};
            size_t end = s.find_last_not_of(" \t\r\n");
            return s.substr(start, end - start + 1);
        }

        inline std::string_view rtrim_sv(std::string_view s)
        {
            size_t end = s.find_last_not_of(" \t\r\n");
            if (end == std::string_view::npos) return {};
            return s.substr(0, end + 1);
        }

        inline bool is_alnum(char c)
        {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
        }

        // Character names: [A-Za-z0-9]
        inline bool is_name_char(char c) { return is_alnum(c); }

        // Cue names: [A-Za-z0-9_]
        inline bool is_cue_char(char c) { return is_alnum(c) || c == '_'; }

        // Metadata keys: [A-Za-z0-9_-]
        inline bool is_key_char(char c) { return is_alnum(c) || c == '_' || c == '-'; }

        inline bool is_space(char c) { return c == ' ' || c == '\t'; }

        inline size_t scan_while(std::string_view s, size_t pos, bool (*pred)(char))
        {
            while (pos < s.size() && pred(s[pos]))
                ++pos;
            return pos;
        }

        // CRLF and lone CR become LF; a leading UTF-8 BOM is dropped.
        inline std::string normalise_newlines(std::string_view text)
        {
            if (text.starts_with("\xEF\xBB\xBF"))
                text.remove_prefix(3);

            std::string out;
            out.reserve(text.size());

            for (size_t i = 0; i < text.size(); ++i)
            {
                char c = text[i];
                if (c == '\r')
                {
                    out += '\n';
                    if (i + 1 < text.size() && text[i + 1] == '\n')
                        ++i;
                    continue;
                }
                out += c;
            }
            return out;
        }

        inline std::vector<std::string_view> split_lines(std::string_view text)
        {
            std::vector<std::string_view> lines;
            if (text.empty())
                return lines;

            size_t start = 0;
            while (start <= text.size())
            {
                size_t nl = text.find('\n', start);
                if (nl == std::string_view::npos)
                {
                    if (start < text.size())
                        lines.push_back(text.substr(start));
                    break;
                }
                lines.push_back(text.substr(start, nl - start));
                start = nl + 1;
            }
            return lines;
        }

        inline std::string_view element_kind_name(element_kind kind)
        {
            switch (kind)
            {
                case element_kind::comment:         return "comment";
                case element_kind::stage_direction: return "stage_direction";
                case element_kind::dialogue:        return "dialogue";
                case element_kind::cue:             return "cue";
            }
            return "comment";
        }

        inline std::optional<element_kind> element_kind_from_name(std::string_view s)
        {
            if (s == "comment")         return element_kind::comment;
            if (s == "stage_direction") return element_kind::stage_direction;
            if (s == "dialogue")        return element_kind::dialogue;
            if (s == "cue")             return element_kind::cue;
            return std::nullopt;
        }
    }

} // namespace stagescript

#endif // STAGESCRIPT_CORE_HPP
