// stagescript_serializer.hpp - Stage Script - Interchange serializer
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef STAGESCRIPT_SERIALIZER_HPP
#define STAGESCRIPT_SERIALIZER_HPP

#include "stagescript_core.hpp"
#include "stagescript_document.hpp"

#include <cstdio>
#include <ostream>
#include <sstream>

namespace stagescript
{
//========================================================================
// Interchange format
//========================================================================
//
// A JSON object. Every element, segment and part carries an explicit
// "kind". Characters are referenced by name. Sequences are written in
// document order; "title", "argument" and "declension" are omitted when
// absent, and "implicit" is only written when true.
//
//   {
//     "format": "stagescript", "version": 1,
//     "title": "...",
//     "metadata":   [ { "key", "value", "line" } ],
//     "characters": [ { "name", "first_line", "first_kind", "references" } ],
//     "elements":   [ element ],
//     "parts":      [ { "kind": "act", "title", "line", "elements", "scenes": [ scene ] }
//                   | { "kind": "scene", "title", "line", "elements" } ]
//   }

    inline constexpr std::string_view INTERCHANGE_FORMAT  = "stagescript";
    inline constexpr size_t           INTERCHANGE_VERSION = 1;

    namespace detail
    {
        inline std::string json_escape(std::string_view s)
        {
            std::string o;
            o.reserve(s.size() + 2);
            o += '"';
            for (char c : s)
            {
                switch (c)
                {
                    case '"':  o += "\\\""; break;
                    case '\\': o += "\\\\"; break;
                    case '\n': o += "\\n";  break;
                    case '\r': o += "\\r";  break;
                    case '\t': o += "\\t";  break;
                    default:
                        if (static_cast<unsigned char>(c) < 0x20)
                        {
                            char buf[7];
                            std::snprintf(buf, sizeof(buf), "\\u%04X", static_cast<unsigned>(static_cast<unsigned char>(c)));
                            o += buf;
                        }
                        else
                        {
                            o += c;
                        }
                        break;
                }
            }
            o += '"';
            return o;
        }

        class json_writer
        {
        public:
            json_writer(std::ostream& out, bool pretty) : out_(out), pretty_(pretty) {}

            void begin_object() { prefix(); out_ << '{'; first_.push_back(true); }
            void end_object()   { close('}'); }
            void begin_array()  { prefix(); out_ << '['; first_.push_back(true); }
            void end_array()    { close(']'); }

            void key(std::string_view k)
            {
                prefix();
                out_ << json_escape(k) << (pretty_ ? ": " : ":");
                after_key_ = true;
            }

            void string(std::string_view s)  { prefix(); out_ << json_escape(s); }
            void number(size_t n)            { prefix(); out_ << n; }
            void boolean(bool b)             { prefix(); out_ << (b ? "true" : "false"); }

            void field(std::string_view k, std::string_view s) { key(k); string(s); }
            void field(std::string_view k, size_t n)           { key(k); number(n); }

        private:
            std::ostream&     out_;
            bool              pretty_;
            bool              after_key_ = false;
            std::vector<bool> first_;

            void newline()
            {
                if (!pretty_)
                    return;
                out_ << '\n' << std::string(first_.size() * 2, ' ');
            }

            void prefix()
            {
                if (after_key_)
                {
                    after_key_ = false;
                    return;
                }

                if (first_.empty())
                    return;

                if (!first_.back())
                    out_ << ',';
                first_.back() = false;
                newline();
            }

            void close(char c)
            {
                bool was_empty = first_.back();
                first_.pop_back();
                if (!was_empty)
                    newline();
                out_ << c;
            }
        };
    }

//========================================================================
// serializer
//========================================================================

    class serializer
    {
    public:
        explicit serializer(document const & doc, bool pretty_print = true)
            : doc_(doc)
            , pretty_(pretty_print)
        {}

        void write(std::ostream& out) const;

    private:
        document const & doc_;
        bool             pretty_;

        void write_element(detail::json_writer& w, element_id id) const;
        void write_elements(detail::json_writer& w, std::span<const element_id> ids) const;
        void write_segments(detail::json_writer& w, std::span<const segment> segs) const;
        void write_mention(detail::json_writer& w, character_mention const & m) const;
        void write_scene(detail::json_writer& w, scene_id id) const;
    };

//---------------------------------------------------------------------------

    inline void serializer::write(std::ostream& out) const
    {
        detail::json_writer w(out, pretty_);

        w.begin_object();
        w.field("format", INTERCHANGE_FORMAT);
        w.field("version", INTERCHANGE_VERSION);

        if (auto title = doc_.title())
            w.field("title", *title);

        w.key("metadata");
        w.begin_array();
        for (auto const & m : doc_.metadata())
        {
            w.begin_object();
            w.field("key", m.key);
            w.field("value", m.value);
            w.field("line", m.line);
            w.end_object();
        }
        w.end_array();

        w.key("characters");
        w.begin_array();
        for (auto const & c : doc_.characters().all())
        {
            w.begin_object();
            w.field("name", c.name);
            w.field("first_line", c.first_line);
            w.field("first_kind", detail::element_kind_name(c.first_kind));
            w.field("references", c.references);
            w.end_object();
        }
        w.end_array();

        w.key("elements");
        write_elements(w, doc_.elements());

        w.key("parts");
        w.begin_array();
        for (auto const & p : doc_.parts())
        {
            if (auto sid = std::get_if<scene_id>(&p))
            {
                write_scene(w, *sid);
                continue;
            }

            auto act = doc_.act(std::get<act_id>(p));
            if (!act)
                continue;

            w.begin_object();
            w.field("kind", "act");
            w.field("title", act->title());
            w.field("line", act->line());
            w.key("elements");
            write_elements(w, act->elements());
            w.key("scenes");
            w.begin_array();
            for (auto sid : act->scenes())
                write_scene(w, sid);
            w.end_array();
            w.end_object();
        }
        w.end_array();

        w.end_object();

        if (pretty_)
            out << '\n';
    }

//---------------------------------------------------------------------------

    inline void serializer::write_scene(detail::json_writer& w, scene_id id) const
    {
        auto scene = doc_.scene(id);
        if (!scene)
            return;

        w.begin_object();
        w.field("kind", "scene");
        w.field("title", scene->title());
        w.field("line", scene->line());
        w.key("elements");
        write_elements(w, scene->elements());
        w.end_object();
    }

//---------------------------------------------------------------------------

    inline void serializer::write_elements(detail::json_writer& w, std::span<const element_id> ids) const
    {
        w.begin_array();
        for (auto id : ids)
            write_element(w, id);
        w.end_array();
    }

//---------------------------------------------------------------------------

    inline void serializer::write_element(detail::json_writer& w, element_id id) const
    {
        auto el = doc_.element(id);
        if (!el)
            return;

        w.begin_object();
        w.field("kind", detail::element_kind_name(el->kind()));
        w.field("first_line", el->lines().first);
        w.field("last_line", el->lines().last);

        std::visit([&](auto const & body)
        {
            using T = std::decay_t<decltype(body)>;
            if constexpr (std::is_same_v<T, comment>)
            {
                w.field("text", body.text);
            }
            else if constexpr (std::is_same_v<T, cue>)
            {
                w.field("name", body.name);
                if (body.argument)
                    w.field("argument", *body.argument);
            }
            else if constexpr (std::is_same_v<T, stage_direction>)
            {
                if (body.implicit)
                {
                    w.key("implicit");
                    w.boolean(true);
                }
                w.key("segments");
                write_segments(w, body.segments);
            }
            else
            {
                w.key("speakers");
                w.begin_array();
                for (auto sp : body.speakers)
                    w.string(doc_.characters().name(sp));
                w.end_array();

                w.key("segments");
                write_segments(w, body.segments);
            }
        }, el->body());

        w.end_object();
    }

//---------------------------------------------------------------------------

    inline void serializer::write_mention(detail::json_writer& w, character_mention const & m) const
    {
        w.begin_object();
        w.field("kind", "mention");
        w.field("character", doc_.characters().name(m.character));
        if (m.declension)
            w.field("declension", *m.declension);
        w.end_object();
    }

//---------------------------------------------------------------------------

    inline void serializer::write_segments(detail::json_writer& w, std::span<const segment> segs) const
    {
        w.begin_array();
        for (auto const & seg : segs)
        {
            if (auto t = std::get_if<text_segment>(&seg))
            {
                w.begin_object();
                w.field("kind", "text");
                w.field("text", t->text);
                w.end_object();
            }
            else if (auto m = std::get_if<character_mention>(&seg))
            {
                write_mention(w, *m);
            }
            else
            {
                auto const & dir = std::get<inline_direction>(seg);

                w.begin_object();
                w.field("kind", "inline_direction");
                w.key("segments");
                w.begin_array();
                for (auto const & inner : dir.segments)
                {
                    if (auto it = std::get_if<text_segment>(&inner))
                    {
                        w.begin_object();
                        w.field("kind", "text");
                        w.field("text", it->text);
                        w.end_object();
                    }
                    else
                    {
                        write_mention(w, std::get<character_mention>(inner));
                    }
                }
                w.end_array();
                w.end_object();
            }
        }
        w.end_array();
    }

//========================================================================
// Convenience
//========================================================================

    inline std::string to_interchange(document const & doc, bool pretty_print = true)
    {
        std::ostringstream out;
        serializer(doc, pretty_print).write(out);
        return out.str();
    }

} // namespace stagescript

#endif // STAGESCRIPT_SERIALIZER_HPP
