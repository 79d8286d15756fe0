#include "include/stagescript.hpp"
#include "include/stagescript_serializer.hpp"
#include "include/stagescript_reader.hpp"

#include <iostream>

// Example Stage Script play
const char* example_play = R"(title: The Lighthouse
author: A. Keeper
% First draft, lenient parse expected

# The Lighthouse

## Act One

> The lamp room at dusk. Wind against the glass.
/lights dim; amber

### The Lamp Room

@keeper: Another night, {checks the lamp} another storm.
@(Mara)mara has not come back.
@mara: I'm here, father.
  I took the long path.
@keeper, @mara: {together} Let it blow.
> @keeper trims the wick. @mara watches the sea.
/sound thunder; distant

### The Stairs

@mara: Who's there?
/blackout

## Act Two

### The Rocks

> Morning. Wreckage on the rocks.
@keeper: {quietly} Nothing left.
)";

void print_separator(const std::string& title)
{
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(70, '=') << "\n\n";
}

std::string describe(stagescript::document const & doc, stagescript::element_id id)
{
    using namespace stagescript;

    auto el = doc.element(id);
    if (!el)
        return "?";

    std::string out(detail::element_kind_name(el->kind()));
    out += " [" + std::to_string(el->lines().first) + "-" + std::to_string(el->lines().last) + "] ";

    if (auto c = el->as<comment>())
        out += c->text;
    else if (auto q = el->as<cue>())
    {
        out += "/" + q->name;
        for (auto const & arg : q->arguments())
            out += " <" + arg + ">";
    }
    else if (auto d = el->as<dialogue>())
    {
        for (size_t i = 0; i < d->speakers.size(); ++i)
            out += (i ? ", " : "") + std::string(doc.characters().name(d->speakers[i]));
        out += ": " + plain_text(el->segments(), doc.characters());
    }
    else
        out += plain_text(el->segments(), doc.characters());

    return out;
}

void print_outline(stagescript::document const & doc)
{
    using namespace stagescript;

    print_separator("Outline");

    std::cout << "Title: " << doc.title().value_or("(untitled)") << "\n";
    for (auto const & m : doc.metadata())
        std::cout << "  " << m.key << " = " << m.value << "\n";

    for (auto id : doc.elements())
        std::cout << "  " << describe(doc, id) << "\n";

    auto print_scene = [&](scene_id sid, std::string const & indent)
    {
        auto scene = doc.scene(sid);
        std::cout << indent << "Scene: " << scene->title() << (scene->is_orphan() ? " (orphan)" : "") << "\n";
        for (auto id : scene->elements())
            std::cout << indent << "  " << describe(doc, id) << "\n";
    };

    for (auto const & p : doc.parts())
    {
        if (auto sid = std::get_if<scene_id>(&p))
        {
            print_scene(*sid, "  ");
            continue;
        }

        auto act = doc.act(std::get<act_id>(p));
        std::cout << "  Act: " << act->title() << "\n";
        for (auto id : act->elements())
            std::cout << "    " << describe(doc, id) << "\n";
        for (auto sid : act->scenes())
            print_scene(sid, "    ");
    }

    std::cout << "\nCharacters:\n";
    for (auto const & c : doc.characters().all())
    {
        std::cout << "  " << c.name << " (first on line " << c.first_line << " in "
                  << detail::element_kind_name(c.first_kind) << ", "
                  << c.references << " references)\n";
    }
}

void print_diagnostics(stagescript::parse_context const & ctx, std::string_view source_name)
{
    print_separator("Diagnostics");

    if (ctx.errors.empty())
    {
        std::cout << "✓ No diagnostics\n";
        return;
    }

    for (auto const & d : ctx.errors)
        std::cerr << stagescript::format_diagnostic(d, source_name) << "\n";

    std::cout << ctx.count(stagescript::severity::error) << " errors, "
              << ctx.count(stagescript::severity::warning) << " warnings, "
              << ctx.count(stagescript::severity::note) << " notes\n";
}

int main()
{
    using namespace stagescript;

    std::cout << "Stage Script - Example\nVersion 0.1.0\n";

    parse_options options;
    options.source_name = "lighthouse.play";

    auto ctx = parse(example_play, options);
    if (ctx.failed())
    {
        std::cerr << format_diagnostic(*ctx.failure(), options.source_name) << "\n";
        return 1;
    }

    print_outline(ctx.document);
    print_diagnostics(ctx, options.source_name);

    print_separator("Interchange");
    std::string json = to_interchange(ctx.document);
    std::cout << json;

    auto back = read_interchange(json);
    if (back.has_errors() || !(back.document == ctx.document))
    {
        for (auto const & e : back.errors)
            std::cerr << "interchange error at " << e.offset << ": " << e.message << "\n";
        std::cout << "✗ Round trip failed\n";
        return 1;
    }

    std::cout << "\n✓ Round trip reproduced the document\n";

    options.mode = parse_mode::strict;
    auto strict = parse("## Act\nstray line\n", options);
    print_separator("Strict mode");
    if (strict.failed())
        std::cout << "Stopped: " << format_diagnostic(*strict.failure(), options.source_name) << "\n";

    return 0;
}
