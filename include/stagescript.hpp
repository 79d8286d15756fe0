// stagescript.hpp - Stage Script
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

//========================================================================
// Stage Script Core Principles:
//========================================================================
//
// The Performance-Order Principle
// -------------------------------
// The order in which things are written is the order in which they are
// performed. Every element keeps its place and its source lines.
//
//
// The Recoverability Principle
// ----------------------------
// A malformed script is still a script. Lenient parsing always yields a
// tree, and every problem is reported with its line.
//
//
// The Cue-as-Data Principle
// -------------------------
// Cues are recorded, never executed. Renderers decide what they mean.
//
//========================================================================

#ifndef STAGESCRIPT_STAGE_SCRIPT
#define STAGESCRIPT_STAGE_SCRIPT

#include "stagescript_core.hpp"
#include "stagescript_classifier.hpp"
#include "stagescript_diagnostics.hpp"
#include "stagescript_characters.hpp"
#include "stagescript_document.hpp"
#include "stagescript_segmenter.hpp"
#include "stagescript_builder.hpp"
#include "stagescript_scanner.hpp"

namespace stagescript
{
//========================================================================
// Parse result
//========================================================================

    struct parse_context : context<document, diagnostic>
    {
        bool aborted = false;   // strict mode stopped on an error

        bool failed() const noexcept { return aborted; }

        // The error that stopped a strict parse.
        std::optional<diagnostic> failure() const
        {
            if (!aborted || errors.empty())
                return std::nullopt;
            return errors.back();
        }

        size_t count(severity level) const noexcept
        {
            return static_cast<size_t>(std::count_if(errors.begin(), errors.end(),
                [level](diagnostic const & d) { return d.level == level; }));
        }

        size_t count(diagnostic_kind kind) const noexcept
        {
            return static_cast<size_t>(std::count_if(errors.begin(), errors.end(),
                [kind](diagnostic const & d) { return d.kind == kind; }));
        }

        // Only error-severity diagnostics count; notes and warnings do not.
        bool has_errors() const noexcept { return count(severity::error) > 0; }
    };

    inline parse_context parse(std::string_view text, parse_options options = {});
    inline parse_context parse(std::string_view text, parse_mode mode);

//========================================================================
// Implementation
//========================================================================

    inline parse_context parse(std::string_view text, parse_options options)
    {
        parse_context out;

        std::string normalised = detail::normalise_newlines(text);
        auto lines = detail::split_lines(normalised);

        parse_state   state(std::move(options));
        tree_builder  builder(state);
        block_scanner scanner(state, [&builder](block&& b) { builder.consume(std::move(b)); });

        for (size_t i = 0; i < lines.size() && !state.diagnostics.aborted(); ++i)
            scanner.feed(lines[i], i + 1);

        scanner.finish();

        out.aborted = state.diagnostics.aborted();
        if (!out.aborted)
            out.document = builder.take();

        out.errors = state.diagnostics.take();
        return out;
    }

    inline parse_context parse(std::string_view text, parse_mode mode)
    {
        parse_options options;
        options.mode = mode;
        return parse(text, std::move(options));
    }

} // namespace stagescript

#endif // STAGESCRIPT_STAGE_SCRIPT
