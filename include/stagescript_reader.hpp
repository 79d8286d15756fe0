// stagescript_reader.hpp - Stage Script - Interchange reader
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef STAGESCRIPT_READER_HPP
#define STAGESCRIPT_READER_HPP

#include "stagescript_core.hpp"
#include "stagescript_document.hpp"
#include "stagescript_serializer.hpp"

#include <cmath>
#include <cstdlib>

namespace stagescript
{
    enum class interchange_error_kind
    {
        malformed_json,
        unsupported_format,
        missing_field,
        invalid_field,
        unknown_kind,
        unknown_character,
    };

    struct interchange_error
    {
        interchange_error_kind kind;
        size_t                 offset;    // byte offset for JSON errors, 0 otherwise
        std::string            message;
    };

    using interchange_context = context<document, interchange_error>;

    inline interchange_context read_interchange(std::string_view json);

//========================================================================
// JSON value tree
//========================================================================

    namespace detail
    {
        struct json_value
        {
            enum class type { null, boolean, number, string, array, object };

            type                     t = type::null;
            bool                     b = false;
            double                   n = 0.0;
            std::string              s;
            std::vector<json_value>  items;     // array items or object values
            std::vector<std::string> keys;      // object keys, parallel to items

            const json_value* get(std::string_view key) const
            {
                if (t != type::object)
                    return nullptr;
                for (size_t i = 0; i < keys.size(); ++i)
                    if (keys[i] == key)
                        return &items[i];
                return nullptr;
            }
        };

        class json_parser
        {
        public:
            explicit json_parser(std::string_view text) : src_(text) {}

            std::optional<json_value> parse()
            {
                json_value v;
                skip_ws();
                if (!parse_value(v, 0))
                    return std::nullopt;
                skip_ws();
                if (pos_ != src_.size())
                    return fail("trailing characters after JSON value");
                return v;
            }

            size_t error_offset() const noexcept { return pos_; }
            std::string const & error_message() const noexcept { return error_; }

        private:
            static constexpr size_t MAX_DEPTH = 256;

            std::string_view src_;
            size_t           pos_ = 0;
            std::string      error_;

            std::nullopt_t fail(std::string msg)
            {
                if (error_.empty())
                    error_ = std::move(msg);
                return std::nullopt;
            }

            bool failed(std::string msg)
            {
                fail(std::move(msg));
                return false;
            }

            void skip_ws()
            {
                while (pos_ < src_.size() &&
                       (src_[pos_] == ' ' || src_[pos_] == '\t' || src_[pos_] == '\n' || src_[pos_] == '\r'))
                    ++pos_;
            }

            bool consume(char c)
            {
                if (pos_ < src_.size() && src_[pos_] == c)
                {
                    ++pos_;
                    return true;
                }
                return false;
            }

            bool literal(std::string_view word)
            {
                if (src_.substr(pos_).starts_with(word))
                {
                    pos_ += word.size();
                    return true;
                }
                return false;
            }

            bool parse_value(json_value& v, size_t depth)
            {
                if (depth > MAX_DEPTH)
                    return failed("nesting too deep");

                if (pos_ >= src_.size())
                    return failed("unexpected end of input");

                char c = src_[pos_];
                switch (c)
                {
                    case '{': return parse_object(v, depth);
                    case '[': return parse_array(v, depth);
                    case '"': v.t = json_value::type::string; return parse_string(v.s);
                    case 't':
                        if (!literal("true")) return failed("invalid literal");
                        v.t = json_value::type::boolean; v.b = true;
                        return true;
                    case 'f':
                        if (!literal("false")) return failed("invalid literal");
                        v.t = json_value::type::boolean; v.b = false;
                        return true;
                    case 'n':
                        if (!literal("null")) return failed("invalid literal");
                        v.t = json_value::type::null;
                        return true;
                    default:
                        if (c == '-' || (c >= '0' && c <= '9'))
                            return parse_number(v);
                        return failed(std::string("unexpected character '") + c + "'");
                }
            }

            bool parse_object(json_value& v, size_t depth)
            {
                v.t = json_value::type::object;
                ++pos_;
                skip_ws();
                if (consume('}'))
                    return true;

                while (true)
                {
                    skip_ws();
                    std::string key;
                    if (pos_ >= src_.size() || src_[pos_] != '"')
                        return failed("expected object key");
                    if (!parse_string(key))
                        return false;

                    skip_ws();
                    if (!consume(':'))
                        return failed("expected ':' after object key");
                    skip_ws();

                    json_value item;
                    if (!parse_value(item, depth + 1))
                        return false;

                    v.keys.push_back(std::move(key));
                    v.items.push_back(std::move(item));

                    skip_ws();
                    if (consume(','))
                        continue;
                    if (consume('}'))
                        return true;
                    return failed("expected ',' or '}' in object");
                }
            }

            bool parse_array(json_value& v, size_t depth)
            {
                v.t = json_value::type::array;
                ++pos_;
                skip_ws();
                if (consume(']'))
                    return true;

                while (true)
                {
                    skip_ws();
                    json_value item;
                    if (!parse_value(item, depth + 1))
                        return false;
                    v.items.push_back(std::move(item));

                    skip_ws();
                    if (consume(','))
                        continue;
                    if (consume(']'))
                        return true;
                    return failed("expected ',' or ']' in array");
                }
            }

            // -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
            bool scan_number_grammar()
            {
                auto digit = [this] { return pos_ < src_.size() && src_[pos_] >= '0' && src_[pos_] <= '9'; };
                auto digits = [&]
                {
                    if (!digit())
                        return false;
                    while (digit())
                        ++pos_;
                    return true;
                };

                consume('-');

                if (consume('0'))
                {
                    if (digit())
                        return false;
                }
                else if (!digits())
                {
                    return false;
                }

                if (consume('.') && !digits())
                    return false;

                if (consume('e') || consume('E'))
                {
                    if (!consume('+'))
                        consume('-');
                    if (!digits())
                        return false;
                }
                return true;
            }

            bool parse_number(json_value& v)
            {
                size_t start = pos_;
                if (!scan_number_grammar())
                {
                    pos_ = start;
                    return failed("invalid number");
                }

                std::string literal_text(src_.substr(start, pos_ - start));
                char* end = nullptr;
                double d = std::strtod(literal_text.c_str(), &end);
                if (end != literal_text.c_str() + literal_text.size())
                {
                    pos_ = start;
                    return failed("invalid number");
                }

                v.t = json_value::type::number;
                v.n = d;
                return true;
            }

            static void append_utf8(std::string& out, unsigned long cp)
            {
                if (cp < 0x80)
                {
                    out += static_cast<char>(cp);
                }
                else if (cp < 0x800)
                {
                    out += static_cast<char>(0xC0 | (cp >> 6));
                    out += static_cast<char>(0x80 | (cp & 0x3F));
                }
                else if (cp < 0x10000)
                {
                    out += static_cast<char>(0xE0 | (cp >> 12));
                    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
                    out += static_cast<char>(0x80 | (cp & 0x3F));
                }
                else
                {
                    out += static_cast<char>(0xF0 | (cp >> 18));
                    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
                    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
                    out += static_cast<char>(0x80 | (cp & 0x3F));
                }
            }

            bool parse_hex4(unsigned long& cp)
            {
                if (pos_ + 4 > src_.size())
                    return failed("truncated \\u escape");

                cp = 0;
                for (size_t i = 0; i < 4; ++i)
                {
                    char h = src_[pos_++];
                    cp <<= 4;
                    if (h >= '0' && h <= '9')      cp |= static_cast<unsigned long>(h - '0');
                    else if (h >= 'a' && h <= 'f') cp |= static_cast<unsigned long>(h - 'a' + 10);
                    else if (h >= 'A' && h <= 'F') cp |= static_cast<unsigned long>(h - 'A' + 10);
                    else return failed("invalid \\u escape");
                }
                return true;
            }

            bool parse_string(std::string& out)
            {
                ++pos_;   // opening quote

                while (pos_ < src_.size())
                {
                    char c = src_[pos_++];

                    if (c == '"')
                        return true;

                    if (static_cast<unsigned char>(c) < 0x20)
                        return failed("control character in string");

                    if (c != '\\')
                    {
                        out += c;
                        continue;
                    }

                    if (pos_ >= src_.size())
                        break;

                    char e = src_[pos_++];
                    switch (e)
                    {
                        case '"':  out += '"';  break;
                        case '\\': out += '\\'; break;
                        case '/':  out += '/';  break;
                        case 'b':  out += '\b'; break;
                        case 'f':  out += '\f'; break;
                        case 'n':  out += '\n'; break;
                        case 'r':  out += '\r'; break;
                        case 't':  out += '\t'; break;
                        case 'u':
                        {
                            unsigned long cp = 0;
                            if (!parse_hex4(cp))
                                return false;

                            if (cp >= 0xD800 && cp <= 0xDBFF)
                            {
                                unsigned long low = 0;
                                if (!literal("\\u") || !parse_hex4(low) || low < 0xDC00 || low > 0xDFFF)
                                    return failed("invalid surrogate pair");
                                cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                            }

                            append_utf8(out, cp);
                            break;
                        }
                        default:
                            return failed("invalid escape sequence");
                    }
                }

                return failed("unterminated string");
            }
        };
    }

//========================================================================
// interchange_reader
//========================================================================

    class interchange_reader
    {
    public:
        explicit interchange_reader(std::string_view text) : text_(text) {}

        interchange_context read();

    private:
        using json_value = detail::json_value;

        std::string_view    text_;
        interchange_context out_;

        // A failed read never hands out a partial document.
        interchange_context finish()
        {
            if (out_.has_errors())
                out_.document = document{};
            return std::move(out_);
        }

        bool error(interchange_error_kind kind, std::string message, size_t offset = 0)
        {
            out_.errors.push_back(interchange_error{ kind, offset, std::move(message) });
            return false;
        }

        const json_value* field(json_value const & obj, std::string_view name, json_value::type t, bool required = true);
        std::optional<std::string> string_field(json_value const & obj, std::string_view name, bool required = true);
        std::optional<size_t> count_field(json_value const & obj, std::string_view name);

        bool read_metadata(json_value const & arr);
        bool read_characters(json_value const & arr);
        bool read_elements(json_value const & arr, std::vector<element_id>& into);
        std::optional<element_body> read_body(json_value const & obj, element_kind kind);
        bool read_segments(json_value const & arr, std::vector<segment>& into);
        std::optional<character_mention> read_mention(json_value const & obj);
        bool read_part(json_value const & obj);
        bool read_scene(json_value const & obj, std::optional<act_id> owner);
    };

//---------------------------------------------------------------------------

    inline const detail::json_value*
    interchange_reader::field(json_value const & obj, std::string_view name, json_value::type t, bool required)
    {
        auto v = obj.get(name);
        if (!v)
        {
            if (required)
                error(interchange_error_kind::missing_field, "missing field '" + std::string(name) + "'");
            return nullptr;
        }
        if (v->t != t)
        {
            error(interchange_error_kind::invalid_field, "field '" + std::string(name) + "' has the wrong type");
            return nullptr;
        }
        return v;
    }

    inline std::optional<std::string>
    interchange_reader::string_field(json_value const & obj, std::string_view name, bool required)
    {
        auto v = field(obj, name, json_value::type::string, required);
        if (!v)
            return std::nullopt;
        return v->s;
    }

    inline constexpr double MAX_EXACT_COUNT = 9007199254740991.0;   // 2^53 - 1

    inline std::optional<size_t>
    interchange_reader::count_field(json_value const & obj, std::string_view name)
    {
        auto v = field(obj, name, json_value::type::number);
        if (!v)
            return std::nullopt;

        // Counts must be integral and exactly representable as doubles.
        if (!std::isfinite(v->n) || v->n < 0 || v->n > MAX_EXACT_COUNT || std::floor(v->n) != v->n)
        {
            error(interchange_error_kind::invalid_field, "field '" + std::string(name) + "' is not a count");
            return std::nullopt;
        }
        return static_cast<size_t>(v->n);
    }

//---------------------------------------------------------------------------

    inline interchange_context interchange_reader::read()
    {
        detail::json_parser parser(text_);
        auto root = parser.parse();
        if (!root)
        {
            error(interchange_error_kind::malformed_json, parser.error_message(), parser.error_offset());
            return finish();
        }

        if (root->t != json_value::type::object)
        {
            error(interchange_error_kind::malformed_json, "top-level value is not an object");
            return finish();
        }

        auto format = string_field(*root, "format");
        auto version = count_field(*root, "version");
        if (!format || !version)
            return finish();

        if (*format != INTERCHANGE_FORMAT || *version != INTERCHANGE_VERSION)
        {
            error(interchange_error_kind::unsupported_format,
                  "unsupported interchange format '" + *format + "' version " + std::to_string(*version));
            return finish();
        }

        document& doc = out_.document;

        if (root->get("title"))
        {
            auto title = string_field(*root, "title");
            if (!title)
                return finish();
            doc.title_ = std::move(*title);
        }

        auto metadata   = field(*root, "metadata", json_value::type::array);
        auto characters = field(*root, "characters", json_value::type::array);
        auto elements   = field(*root, "elements", json_value::type::array);
        auto parts      = field(*root, "parts", json_value::type::array);

        if (!metadata || !characters || !elements || !parts)
            return finish();

        if (!read_metadata(*metadata) || !read_characters(*characters) ||
            !read_elements(*elements, doc.elements_))
            return finish();

        for (auto const & p : parts->items)
        {
            if (!read_part(p))
                break;
        }

        return finish();
    }

//---------------------------------------------------------------------------

    inline bool interchange_reader::read_metadata(json_value const & arr)
    {
        for (auto const & item : arr.items)
        {
            auto key   = string_field(item, "key");
            auto value = string_field(item, "value");
            auto line  = count_field(item, "line");
            if (!key || !value || !line)
                return false;

            out_.document.metadata_.push_back(metadata_entry{ std::move(*key), std::move(*value), *line });
        }
        return true;
    }

//---------------------------------------------------------------------------

    inline bool interchange_reader::read_characters(json_value const & arr)
    {
        for (auto const & item : arr.items)
        {
            auto name       = string_field(item, "name");
            auto first_line = count_field(item, "first_line");
            auto first_kind = string_field(item, "first_kind");
            auto references = count_field(item, "references");
            if (!name || !first_line || !first_kind || !references)
                return false;

            auto kind = detail::element_kind_from_name(*first_kind);
            if (!kind)
                return error(interchange_error_kind::unknown_kind, "unknown element kind '" + *first_kind + "'");

            if (out_.document.characters_.find(*name))
                return error(interchange_error_kind::invalid_field, "character '" + *name + "' listed twice");

            character c;
            c.name       = std::move(*name);
            c.first_line = *first_line;
            c.first_kind = *kind;
            c.references = *references;

            out_.document.characters_.restore(std::move(c));
        }
        return true;
    }

//---------------------------------------------------------------------------

    inline bool interchange_reader::read_elements(json_value const & arr, std::vector<element_id>& into)
    {
        document& doc = out_.document;

        for (auto const & item : arr.items)
        {
            auto kind_name  = string_field(item, "kind");
            auto first_line = count_field(item, "first_line");
            auto last_line  = count_field(item, "last_line");
            if (!kind_name || !first_line || !last_line)
                return false;

            auto kind = detail::element_kind_from_name(*kind_name);
            if (!kind)
                return error(interchange_error_kind::unknown_kind, "unknown element kind '" + *kind_name + "'");

            auto body = read_body(item, *kind);
            if (!body)
                return false;

            document::element_node node;
            node.id    = element_id{ doc.elements_store_.size() };
            node.lines = line_range{ *first_line, *last_line };
            node.body  = std::move(*body);

            into.push_back(node.id);
            doc.elements_store_.push_back(std::move(node));
        }
        return true;
    }

//---------------------------------------------------------------------------

    inline std::optional<element_body> interchange_reader::read_body(json_value const & obj, element_kind kind)
    {
        switch (kind)
        {
            case element_kind::comment:
            {
                auto text = string_field(obj, "text");
                if (!text)
                    return std::nullopt;
                return element_body{ comment{ std::move(*text) } };
            }

            case element_kind::cue:
            {
                auto name = string_field(obj, "name");
                if (!name)
                    return std::nullopt;

                cue c;
                c.name = std::move(*name);
                if (obj.get("argument"))
                {
                    auto arg = string_field(obj, "argument");
                    if (!arg)
                        return std::nullopt;
                    c.argument = std::move(*arg);
                }
                return element_body{ std::move(c) };
            }

            case element_kind::stage_direction:
            {
                auto segs = field(obj, "segments", json_value::type::array);
                stage_direction sd;
                if (!segs || !read_segments(*segs, sd.segments))
                    return std::nullopt;

                if (obj.get("implicit"))
                {
                    auto flag = field(obj, "implicit", json_value::type::boolean);
                    if (!flag)
                        return std::nullopt;
                    sd.implicit = flag->b;
                }
                return element_body{ std::move(sd) };
            }

            case element_kind::dialogue:
            {
                auto speakers = field(obj, "speakers", json_value::type::array);
                auto segs     = field(obj, "segments", json_value::type::array);
                if (!speakers || !segs)
                    return std::nullopt;

                dialogue dl;
                for (auto const & sp : speakers->items)
                {
                    if (sp.t != json_value::type::string)
                    {
                        error(interchange_error_kind::invalid_field, "speaker is not a string");
                        return std::nullopt;
                    }

                    auto id = out_.document.characters_.find(sp.s);
                    if (!id)
                    {
                        error(interchange_error_kind::unknown_character, "unknown speaker '" + sp.s + "'");
                        return std::nullopt;
                    }
                    dl.speakers.push_back(*id);
                }

                if (!read_segments(*segs, dl.segments))
                    return std::nullopt;
                return element_body{ std::move(dl) };
            }
        }

        return std::nullopt;
    }

//---------------------------------------------------------------------------

    inline std::optional<character_mention> interchange_reader::read_mention(json_value const & obj)
    {
        auto name = string_field(obj, "character");
        if (!name)
            return std::nullopt;

        auto id = out_.document.characters_.find(*name);
        if (!id)
        {
            error(interchange_error_kind::unknown_character, "unknown character '" + *name + "'");
            return std::nullopt;
        }

        character_mention m;
        m.character = *id;

        if (obj.get("declension"))
        {
            auto decl = string_field(obj, "declension");
            if (!decl)
                return std::nullopt;
            m.declension = std::move(*decl);
        }
        return m;
    }

//---------------------------------------------------------------------------

    inline bool interchange_reader::read_segments(json_value const & arr, std::vector<segment>& into)
    {
        for (auto const & item : arr.items)
        {
            auto kind = string_field(item, "kind");
            if (!kind)
                return false;

            if (*kind == "text")
            {
                auto text = string_field(item, "text");
                if (!text)
                    return false;
                into.push_back(text_segment{ std::move(*text) });
            }
            else if (*kind == "mention")
            {
                auto m = read_mention(item);
                if (!m)
                    return false;
                into.push_back(std::move(*m));
            }
            else if (*kind == "inline_direction")
            {
                auto inner = field(item, "segments", json_value::type::array);
                if (!inner)
                    return false;

                inline_direction dir;
                for (auto const & seg : inner->items)
                {
                    auto inner_kind = string_field(seg, "kind");
                    if (!inner_kind)
                        return false;

                    if (*inner_kind == "text")
                    {
                        auto text = string_field(seg, "text");
                        if (!text)
                            return false;
                        dir.segments.push_back(text_segment{ std::move(*text) });
                    }
                    else if (*inner_kind == "mention")
                    {
                        auto m = read_mention(seg);
                        if (!m)
                            return false;
                        dir.segments.push_back(std::move(*m));
                    }
                    else
                    {
                        return error(interchange_error_kind::unknown_kind,
                                     "segment kind '" + *inner_kind + "' is not allowed inside an inline direction");
                    }
                }
                into.push_back(std::move(dir));
            }
            else
            {
                return error(interchange_error_kind::unknown_kind, "unknown segment kind '" + *kind + "'");
            }
        }
        return true;
    }

//---------------------------------------------------------------------------

    inline bool interchange_reader::read_scene(json_value const & obj, std::optional<act_id> owner)
    {
        document& doc = out_.document;

        auto kind  = string_field(obj, "kind");
        auto title = string_field(obj, "title");
        auto line  = count_field(obj, "line");
        auto elems = field(obj, "elements", json_value::type::array);
        if (!kind || !title || !line || !elems)
            return false;

        if (*kind != "scene")
            return error(interchange_error_kind::unknown_kind, "expected a scene, found '" + *kind + "'");

        document::scene_node node;
        node.id    = scene_id{ doc.scenes_.size() };
        node.title = std::move(*title);
        node.line  = *line;
        node.owner = owner;

        scene_id sid = node.id;
        doc.scenes_.push_back(std::move(node));

        if (owner)
            doc.acts_[owner->val].scenes.push_back(sid);
        else
            doc.parts_.push_back(sid);

        std::vector<element_id> ids;
        if (!read_elements(*elems, ids))
            return false;

        doc.scenes_[sid.val].elements = std::move(ids);
        return true;
    }

//---------------------------------------------------------------------------

    inline bool interchange_reader::read_part(json_value const & obj)
    {
        auto kind = string_field(obj, "kind");
        if (!kind)
            return false;

        if (*kind == "scene")
            return read_scene(obj, std::nullopt);

        if (*kind != "act")
            return error(interchange_error_kind::unknown_kind, "unknown part kind '" + *kind + "'");

        document& doc = out_.document;

        auto title  = string_field(obj, "title");
        auto line   = count_field(obj, "line");
        auto elems  = field(obj, "elements", json_value::type::array);
        auto scenes = field(obj, "scenes", json_value::type::array);
        if (!title || !line || !elems || !scenes)
            return false;

        document::act_node node;
        node.id    = act_id{ doc.acts_.size() };
        node.title = std::move(*title);
        node.line  = *line;

        act_id aid = node.id;
        doc.acts_.push_back(std::move(node));
        doc.parts_.push_back(aid);

        std::vector<element_id> ids;
        if (!read_elements(*elems, ids))
            return false;
        doc.acts_[aid.val].elements = std::move(ids);

        for (auto const & s : scenes->items)
        {
            if (!read_scene(s, aid))
                return false;
        }
        return true;
    }

//========================================================================
// Public API
//========================================================================

    inline interchange_context read_interchange(std::string_view json)
    {
        return interchange_reader(json).read();
    }

} // namespace stagescript

#endif // STAGESCRIPT_READER_HPP
