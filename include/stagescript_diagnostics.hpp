// stagescript_diagnostics.hpp - Stage Script - Diagnostics collection
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef STAGESCRIPT_DIAGNOSTICS_HPP
#define STAGESCRIPT_DIAGNOSTICS_HPP

#include "stagescript_core.hpp"

#include <sstream>

namespace stagescript
{
    inline constexpr severity severity_of(diagnostic_kind kind)
    {
        switch (kind)
        {
            case diagnostic_kind::orphan_text_line:
            case diagnostic_kind::element_outside_scene:
            case diagnostic_kind::nested_inline_direction:
            case diagnostic_kind::unmatched_closing_brace:
                return severity::error;

            case diagnostic_kind::orphan_scene:
            case diagnostic_kind::unterminated_block_at_eof:
                return severity::note;

            default:
                return severity::warning;
        }
    }

    inline std::string_view to_string(diagnostic_kind kind)
    {
        switch (kind)
        {
            case diagnostic_kind::duplicate_metadata_key:            return "duplicate_metadata_key";
            case diagnostic_kind::metadata_after_structural_content: return "metadata_after_structural_content";
            case diagnostic_kind::duplicate_document_title:          return "duplicate_document_title";
            case diagnostic_kind::duplicate_act_title:               return "duplicate_act_title";
            case diagnostic_kind::duplicate_scene_title:             return "duplicate_scene_title";
            case diagnostic_kind::orphan_text_line:                  return "orphan_text_line";
            case diagnostic_kind::orphan_scene:                      return "orphan_scene";
            case diagnostic_kind::element_outside_scene:             return "element_outside_scene";
            case diagnostic_kind::duplicate_speaker_in_cue:          return "duplicate_speaker_in_cue";
            case diagnostic_kind::nested_inline_direction:           return "nested_inline_direction";
            case diagnostic_kind::unmatched_closing_brace:           return "unmatched_closing_brace";
            case diagnostic_kind::unterminated_inline_direction:     return "unterminated_inline_direction";
            case diagnostic_kind::unterminated_block_at_eof:         return "unterminated_block_at_eof";
        }
        return "unknown";
    }

    inline std::string_view to_string(severity level)
    {
        switch (level)
        {
            case severity::note:    return "note";
            case severity::warning: return "warning";
            case severity::error:   return "error";
        }
        return "error";
    }

    // File "act1.play", line 12: warning: speaker 'alice' repeated in cue [duplicate_speaker_in_cue]
    inline std::string format_diagnostic(diagnostic const & d, std::string_view source_name)
    {
        std::ostringstream out;
        out << "File \"" << source_name << "\", line " << d.line << ": "
            << to_string(d.level) << ": " << d.message
            << " [" << to_string(d.kind) << "]";
        return out.str();
    }

//========================================================================
// Collector
//========================================================================

    class diagnostics_collector
    {
    public:
        explicit diagnostics_collector(parse_mode mode) : mode_(mode) {}

        // Returns false once the pass must stop (strict mode, first error).
        bool report(diagnostic_kind kind, size_t line, std::string message)
        {
            if (aborted_)
                return false;

            diagnostic d{ kind, severity_of(kind), line, std::move(message) };

            if (d.level == severity::error && mode_ == parse_mode::strict)
            {
                // The error is the sole surfaced failure.
                diagnostics_.clear();
                diagnostics_.push_back(std::move(d));
                aborted_ = true;
                return false;
            }

            diagnostics_.push_back(std::move(d));
            return true;
        }

        bool aborted() const noexcept { return aborted_; }

        size_t count(severity level) const noexcept
        {
            return static_cast<size_t>(std::count_if(diagnostics_.begin(), diagnostics_.end(),
                [level](diagnostic const & d) { return d.level == level; }));
        }

        std::vector<diagnostic> const & diagnostics() const noexcept { return diagnostics_; }
        std::vector<diagnostic> take() { return std::move(diagnostics_); }

    private:
        parse_mode              mode_;
        bool                    aborted_ = false;
        std::vector<diagnostic> diagnostics_;
    };

} // namespace stagescript

#endif // STAGESCRIPT_DIAGNOSTICS_HPP
