#ifndef STAGESCRIPT_TESTS_PARSER__
#define STAGESCRIPT_TESTS_PARSER__

#include "stagescript_test_harness.hpp"
#include "../include/stagescript.hpp"

namespace stagescript::tests
{
//------------------------------------------
// HELPERS
//------------------------------------------

    inline std::optional<document::element_view> element_at(document const & doc, std::span<const element_id> ids, size_t i)
    {
        if (i >= ids.size())
            return std::nullopt;
        return doc.element(ids[i]);
    }

    inline std::optional<document::scene_view> only_scene(document const & doc)
    {
        if (doc.parts().empty())
            return std::nullopt;

        if (auto sid = std::get_if<scene_id>(&doc.parts().front()))
            return doc.scene(*sid);

        auto act = doc.act(std::get<act_id>(doc.parts().front()));
        if (!act || act->scenes().empty())
            return std::nullopt;
        return doc.scene(act->scenes().front());
    }

//------------------------------------------
// TESTS
//------------------------------------------

static bool parser_builds_basic_structure()
{
    auto ctx = parse(
        "title: A Play\n"
        "% A note\n"
        "# The Title\n"
        "## Act One\n"
        "### Scene One\n"
        "@alice: Hello, {waving} world!\n"
        "> Alice exits.\n"
        "/lights off\n");

    auto const & doc = ctx.document;

    EXPECT(ctx.errors.empty(), "No diagnostics expected");
    EXPECT(doc.metadata().size() == 1, "Expected one metadata entry");
    EXPECT(doc.metadata_value("title") == std::optional<std::string_view>("A Play"), "Metadata value incorrect");
    EXPECT(doc.title() == std::optional<std::string_view>("The Title"), "Document title incorrect");

    EXPECT(doc.elements().size() == 1, "Expected one top-level element");
    auto note = element_at(doc, doc.elements(), 0);
    EXPECT(note && note->as<comment>() && note->as<comment>()->text == "A note", "Top-level comment incorrect");

    EXPECT(doc.parts().size() == 1 && doc.act_count() == 1, "Expected one act");
    auto act = doc.act(std::get<act_id>(doc.parts().front()));
    EXPECT(act && act->title() == "Act One", "Act title incorrect");
    EXPECT(act->elements().empty(), "Act should hold no direct elements");
    EXPECT(act->scenes().size() == 1, "Expected one scene");

    auto scene = doc.scene(act->scenes().front());
    EXPECT(scene && scene->title() == "Scene One", "Scene title incorrect");
    EXPECT(!scene->is_orphan(), "Scene should belong to the act");
    EXPECT(scene->elements().size() == 3, "Expected three scene elements");

    auto dl = element_at(doc, scene->elements(), 0);
    EXPECT(dl && dl->kind() == element_kind::dialogue, "Expected dialogue");
    auto const * d = dl->as<dialogue>();
    EXPECT(d->speakers.size() == 1 && doc.characters().name(d->speakers[0]) == "alice", "Speaker incorrect");
    EXPECT(d->segments.size() == 3, "Expected three dialogue segments");
    EXPECT(std::holds_alternative<inline_direction>(d->segments[1]), "Expected inline direction");
    EXPECT(dl->lines().first == 6 && dl->lines().last == 6, "Dialogue lines incorrect");

    auto sd = element_at(doc, scene->elements(), 1);
    EXPECT(sd && sd->kind() == element_kind::stage_direction, "Expected stage direction");
    EXPECT(plain_text(sd->segments(), doc.characters()) == "Alice exits.", "Stage direction text incorrect");

    auto cu = element_at(doc, scene->elements(), 2);
    EXPECT(cu && cu->as<cue>(), "Expected cue");
    EXPECT(cu->as<cue>()->name == "lights", "Cue name incorrect");
    EXPECT(cu->as<cue>()->argument == std::optional<std::string>("off"), "Cue argument incorrect");

    return true;
}

static bool parser_keeps_multi_speaker_dialogue()
{
    auto ctx = parse("@alice, @bob: We agree.\n/x");
    auto const & doc = ctx.document;

    auto dl = element_at(doc, doc.elements(), 0);
    EXPECT(dl && dl->as<dialogue>(), "Expected dialogue");
    EXPECT(dl->as<dialogue>()->speakers.size() == 2, "Expected two speakers");
    EXPECT(ctx.count(diagnostic_kind::duplicate_speaker_in_cue) == 0, "No duplicate speaker warning expected");
    EXPECT(ctx.errors.empty(), "No diagnostics expected");

    return true;
}

static bool parser_closes_unterminated_brace()
{
    auto ctx = parse("@alice: Wait, {something");
    auto const & doc = ctx.document;

    auto dl = element_at(doc, doc.elements(), 0);
    EXPECT(dl, "Dialogue should be kept");
    auto segs = dl->segments();
    EXPECT(segs.size() == 2, "Expected text and inline direction");
    EXPECT(std::holds_alternative<text_segment>(segs[0]), "Expected leading text");
    EXPECT(std::holds_alternative<inline_direction>(segs[1]), "Expected partial inline direction");

    EXPECT(ctx.count(diagnostic_kind::unterminated_inline_direction) == 1, "Expected unterminated warning");
    EXPECT(ctx.count(diagnostic_kind::unterminated_block_at_eof) == 1, "Expected end-of-input note");
    EXPECT(!ctx.has_errors(), "Warnings and notes are not errors");

    return true;
}

static bool parser_attaches_orphan_scene_to_document()
{
    auto ctx = parse("### Lonely\n> A bare stage.\n/end");
    auto const & doc = ctx.document;

    EXPECT(doc.act_count() == 0, "No act expected");
    EXPECT(doc.parts().size() == 1, "Expected one part");
    EXPECT(std::holds_alternative<scene_id>(doc.parts().front()), "Part should be a scene");

    auto scene = only_scene(doc);
    EXPECT(scene && scene->is_orphan(), "Scene should be orphaned");
    EXPECT(scene->elements().size() == 2, "Scene should collect the following elements");

    EXPECT(ctx.errors.size() == 1, "Expected one diagnostic");
    EXPECT(ctx.errors[0].kind == diagnostic_kind::orphan_scene, "Expected orphan scene note");
    EXPECT(ctx.errors[0].level == severity::note, "Orphan scene is informational");

    return true;
}

static bool parser_demotes_metadata_after_content()
{
    auto ctx = parse("/cue\nheading: value");
    auto const & doc = ctx.document;

    EXPECT(doc.metadata().empty(), "Late line must not become metadata");
    EXPECT(doc.elements().size() == 2, "Expected cue and stage direction");

    auto sd = element_at(doc, doc.elements(), 1);
    EXPECT(sd && sd->kind() == element_kind::stage_direction, "Expected stage direction");
    EXPECT(plain_text(sd->segments(), doc.characters()) == "heading: value", "Demoted text incorrect");

    EXPECT(ctx.count(diagnostic_kind::metadata_after_structural_content) == 1, "Expected late metadata warning");
    EXPECT(ctx.count(diagnostic_kind::orphan_text_line) == 0, "Demoted metadata is not orphan text");

    return true;
}

//----------------------------------------------------------------------
// Structure
//----------------------------------------------------------------------

static bool parser_orders_acts_and_scenes()
{
    auto ctx = parse(
        "## One\n"
        "### A\n"
        "/a\n"
        "### B\n"
        "/b\n"
        "## Two\n"
        "### C\n"
        "/c\n");
    auto const & doc = ctx.document;

    EXPECT(ctx.errors.empty(), "No diagnostics expected");
    EXPECT(doc.act_count() == 2 && doc.scene_count() == 3, "Act and scene counts incorrect");

    auto one = doc.act(std::get<act_id>(doc.parts()[0]));
    auto two = doc.act(std::get<act_id>(doc.parts()[1]));
    EXPECT(one->scenes().size() == 2, "First act should hold two scenes");
    EXPECT(two->scenes().size() == 1, "Second act should hold one scene");
    EXPECT(doc.scene(two->scenes()[0])->title() == "C", "Scene order incorrect");

    auto b = doc.scene(one->scenes()[1]);
    auto cu = element_at(doc, b->elements(), 0);
    EXPECT(cu && cu->as<cue>()->name == "b", "Elements should follow their scene");

    return true;
}

static bool parser_attaches_act_level_elements()
{
    auto ctx = parse("## One\n> Prologue.\n### A\n/go");
    auto const & doc = ctx.document;

    auto act = doc.act(act_id{ 0 });
    EXPECT(act, "Expected an act");
    EXPECT(act->elements().size() == 1, "Stage direction should attach to the act");
    EXPECT(doc.scene(act->scenes()[0])->elements().size() == 1, "Cue should attach to the scene");
    EXPECT(!ctx.has_errors(), "Act-level elements are permitted by default");

    return true;
}

static bool parser_rejects_act_level_elements_by_policy()
{
    parse_options opts;
    opts.act_elements = act_level_policy::reject;

    auto ctx = parse("## One\n/early\n### A\n/go", opts);

    EXPECT(ctx.count(diagnostic_kind::element_outside_scene) == 1, "Expected element outside scene error");
    EXPECT(ctx.has_errors(), "Rejected act-level element is an error");
    EXPECT(ctx.document.act(act_id{ 0 })->elements().size() == 1, "Lenient parse still keeps the element");

    opts.mode = parse_mode::strict;
    auto strict = parse("## One\n/early\n### A\n/go", opts);
    EXPECT(strict.failed(), "Strict parse should stop");
    EXPECT(strict.document.empty(), "Failed parse yields an empty document");

    return true;
}

static bool parser_warns_on_duplicate_titles()
{
    auto ctx = parse(
        "# First\n"
        "# Second\n"
        "## Act\n"
        "### Scene\n"
        "### Scene\n"
        "## Act\n"
        "### Scene\n");
    auto const & doc = ctx.document;

    EXPECT(doc.title() == std::optional<std::string_view>("Second"), "Last title should win");
    EXPECT(ctx.count(diagnostic_kind::duplicate_document_title) == 1, "Expected duplicate title warning");
    EXPECT(ctx.count(diagnostic_kind::duplicate_act_title) == 1, "Expected duplicate act warning");
    EXPECT(ctx.count(diagnostic_kind::duplicate_scene_title) == 1, "Scene titles are compared within one act");
    EXPECT(doc.act_count() == 2 && doc.scene_count() == 3, "Duplicates are still kept");

    return true;
}

//----------------------------------------------------------------------
// Metadata
//----------------------------------------------------------------------

static bool parser_overrides_duplicate_metadata()
{
    auto ctx = parse("author: A\nauthor: B\n/x");

    EXPECT(ctx.document.metadata().size() == 1, "Duplicate key should not add an entry");
    EXPECT(ctx.document.metadata_value("author") == std::optional<std::string_view>("B"), "Last value should win");
    EXPECT(ctx.document.metadata()[0].line == 2, "Entry should point at the winning line");
    EXPECT(ctx.count(diagnostic_kind::duplicate_metadata_key) == 1, "Expected duplicate key warning");

    return true;
}

static bool parser_keeps_first_metadata_by_policy()
{
    parse_options opts;
    opts.duplicate_keys = metadata_policy::first_write_wins;

    auto ctx = parse("author: A\nauthor: B\n", opts);

    EXPECT(ctx.document.metadata_value("author") == std::optional<std::string_view>("A"), "First value should win");
    EXPECT(ctx.count(diagnostic_kind::duplicate_metadata_key) == 1, "Warning is still reported");

    return true;
}

static bool parser_keeps_title_separate_from_metadata()
{
    auto ctx = parse("title: Meta\n# Heading\n");

    EXPECT(ctx.document.metadata_value("title") == std::optional<std::string_view>("Meta"), "Metadata title kept");
    EXPECT(ctx.document.title() == std::optional<std::string_view>("Heading"), "Heading title kept");
    EXPECT(ctx.errors.empty(), "No conflict expected");

    return true;
}

//----------------------------------------------------------------------
// Characters and text
//----------------------------------------------------------------------

static bool parser_shares_character_identity()
{
    auto ctx = parse("@alice: Hi @bob.\n@bob: Hi {to @alice}.\n/x");
    auto const & chars = ctx.document.characters();

    EXPECT(chars.size() == 2, "Expected two characters");

    auto alice = chars.find("alice");
    auto bob   = chars.find("bob");
    EXPECT(alice && bob, "Both characters should be registered");
    EXPECT(chars.get(*alice)->references == 2, "alice reference count incorrect");
    EXPECT(chars.get(*bob)->references == 2, "bob reference count incorrect");
    EXPECT(chars.get(*bob)->first_line == 1, "bob first seen on line 1");

    auto second = element_at(ctx.document, ctx.document.elements(), 1);
    EXPECT(second->as<dialogue>()->speakers[0] == *bob, "Speaker and mention share identity");

    return true;
}

static bool parser_renders_plain_text()
{
    auto ctx = parse("> @(Gertrudu)gertrude looks at @hamlet {sighing}\n/x");
    auto sd = element_at(ctx.document, ctx.document.elements(), 0);

    EXPECT(sd, "Expected stage direction");
    EXPECT(plain_text(sd->segments(), ctx.document.characters()) == "Gertrudu looks at hamlet (sighing)",
           "Plain text rendering incorrect");
    EXPECT(plain_text(sd->segments(), ctx.document.characters(), "[", "]") == "Gertrudu looks at hamlet [sighing]",
           "Custom brackets not applied");

    return true;
}

static bool parser_keeps_paragraph_breaks()
{
    auto ctx = parse("@alice: One.\n\nTwo.\n/x");
    auto dl = element_at(ctx.document, ctx.document.elements(), 0);

    EXPECT(plain_text(dl->segments(), ctx.document.characters()) == "One.\nTwo.", "Expected paragraph break");
    EXPECT(dl->lines().first == 1 && dl->lines().last == 3, "Line range should span the paragraph");

    return true;
}

static bool parser_splits_cue_arguments()
{
    auto ctx = parse("/sound thunder; rain ;wind\n/blackout");
    auto const & doc = ctx.document;

    auto c1 = element_at(doc, doc.elements(), 0)->as<cue>();
    auto c2 = element_at(doc, doc.elements(), 1)->as<cue>();

    auto args = c1->arguments();
    EXPECT(args.size() == 3, "Expected three arguments");
    EXPECT(args[0] == "thunder" && args[1] == "rain" && args[2] == "wind", "Arguments incorrect");
    EXPECT(c2->arguments().empty(), "Bare cue has no arguments");

    return true;
}

static bool parser_marks_implicit_stage_directions()
{
    auto ctx = parse("stray words\n> Opened.\n/x");
    auto const & doc = ctx.document;

    auto stray  = element_at(doc, doc.elements(), 0);
    auto opened = element_at(doc, doc.elements(), 1);
    EXPECT(stray && stray->as<stage_direction>(), "Orphan text should become a stage direction");
    EXPECT(stray->as<stage_direction>()->implicit, "Orphan stage direction should be marked implicit");
    EXPECT(opened && !opened->as<stage_direction>()->implicit, "Explicit stage direction is not implicit");

    return true;
}

//----------------------------------------------------------------------
// Modes and input handling
//----------------------------------------------------------------------

static bool parser_strict_mode_stops_at_first_error()
{
    auto ctx = parse("## Act\n/ok\nstray text\n} also bad\n", parse_mode::strict);

    EXPECT(ctx.failed(), "Strict parse should fail");
    EXPECT(ctx.errors.size() == 1, "Only one error is reported");
    EXPECT(ctx.failure() && ctx.failure()->kind == diagnostic_kind::orphan_text_line, "Wrong failure");
    EXPECT(ctx.failure()->line == 3, "Failure line incorrect");
    EXPECT(ctx.document.empty(), "No partial document on failure");

    return true;
}

static bool parser_strict_mode_keeps_warnings()
{
    auto ctx = parse("@alice, @alice: hi\n/x", parse_mode::strict);

    EXPECT(!ctx.failed(), "Warnings do not stop a strict parse");
    EXPECT(ctx.count(severity::warning) == 1, "Warning should be reported");
    EXPECT(ctx.document.element_count() == 2, "Document should be complete");

    return true;
}

static bool parser_lenient_mode_collects_everything()
{
    auto ctx = parse("stray\n## Act\n/ok\n@a: x} {y {z}\n");

    EXPECT(!ctx.failed(), "Lenient parse never fails");
    EXPECT(ctx.count(diagnostic_kind::orphan_text_line) == 1, "Expected orphan text error");
    EXPECT(ctx.count(diagnostic_kind::unmatched_closing_brace) == 1, "Expected unmatched brace error");
    EXPECT(ctx.count(diagnostic_kind::nested_inline_direction) == 1, "Expected nested brace error");
    EXPECT(ctx.count(severity::error) == 3, "Expected three errors");
    EXPECT(ctx.document.element_count() == 3, "Best-effort tree should hold every element");

    return true;
}

static bool parser_accepts_empty_input()
{
    auto ctx = parse("");

    EXPECT(ctx.document.empty(), "Empty input gives an empty document");
    EXPECT(ctx.errors.empty(), "Empty input has no diagnostics");

    auto blank = parse("\n\n   \n");
    EXPECT(blank.document.empty() && blank.errors.empty(), "Blank input gives an empty document");

    return true;
}

static bool parser_reports_crlf_lines_correctly()
{
    auto ctx = parse("\xEF\xBB\xBFtitle: x\r\n## Act\r\nstray\r\n");

    EXPECT(ctx.document.metadata_value("title") == std::optional<std::string_view>("x"), "BOM should be skipped");
    EXPECT(ctx.errors.size() >= 1 && ctx.errors[0].line == 3, "Line numbers should ignore CR");

    return true;
}

static bool parser_formats_diagnostics()
{
    parse_options opts;
    opts.source_name = "act1.play";

    auto ctx = parse("@alice, @alice: hi\n/x", opts);
    EXPECT(ctx.errors.size() == 1, "Expected one diagnostic");

    std::string line = format_diagnostic(ctx.errors[0], opts.source_name);
    EXPECT(line.starts_with("File \"act1.play\", line 1: warning: "), "Diagnostic prefix incorrect");
    EXPECT(line.ends_with(" [duplicate_speaker_in_cue]"), "Diagnostic kind suffix incorrect");

    return true;
}

static bool parser_runs_concurrently_without_shared_state()
{
    auto a = parse("@alice: Hi.\n/x");
    auto b = parse("@bob: Hi.\n/x");

    EXPECT(a.document.characters().size() == 1, "First parse has one character");
    EXPECT(!a.document.characters().find("bob"), "Parses must not share a registry");
    EXPECT(b.document.characters().find("bob").has_value(), "Second parse has its own character");

    return true;
}

//----------------------------------------------------------------------------

inline void run_parser_tests()
{
    SUBCAT("Reference scripts");
    RUN_TEST(parser_builds_basic_structure);
    RUN_TEST(parser_keeps_multi_speaker_dialogue);
    RUN_TEST(parser_closes_unterminated_brace);
    RUN_TEST(parser_attaches_orphan_scene_to_document);
    RUN_TEST(parser_demotes_metadata_after_content);

    SUBCAT("Structure");
    RUN_TEST(parser_orders_acts_and_scenes);
    RUN_TEST(parser_attaches_act_level_elements);
    RUN_TEST(parser_rejects_act_level_elements_by_policy);
    RUN_TEST(parser_warns_on_duplicate_titles);

    SUBCAT("Metadata");
    RUN_TEST(parser_overrides_duplicate_metadata);
    RUN_TEST(parser_keeps_first_metadata_by_policy);
    RUN_TEST(parser_keeps_title_separate_from_metadata);

    SUBCAT("Characters and text");
    RUN_TEST(parser_shares_character_identity);
    RUN_TEST(parser_renders_plain_text);
    RUN_TEST(parser_keeps_paragraph_breaks);
    RUN_TEST(parser_splits_cue_arguments);
    RUN_TEST(parser_marks_implicit_stage_directions);

    SUBCAT("Modes and input");
    RUN_TEST(parser_strict_mode_stops_at_first_error);
    RUN_TEST(parser_strict_mode_keeps_warnings);
    RUN_TEST(parser_lenient_mode_collects_everything);
    RUN_TEST(parser_accepts_empty_input);
    RUN_TEST(parser_reports_crlf_lines_correctly);
    RUN_TEST(parser_formats_diagnostics);
    RUN_TEST(parser_runs_concurrently_without_shared_state);
}

} // ns stagescript::tests

#endif
