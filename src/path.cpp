#include <fieldpath-cpp/path.hpp>
#include <fieldpath-cpp/error.hpp>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace fieldpath_cpp {

namespace {

auto is_ident_start(char c) -> bool {
    auto u = static_cast<unsigned char>(c);
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || u >= 0x80;
}

auto is_ident_char(char c) -> bool {
    return is_ident_start(c) || (c >= '0' && c <= '9') || c == '-';
}

void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// Recursive-descent parser over the path text. Every failure is reported
// as a PathSyntaxError naming the offending position.
class PathParser {
public:
    explicit PathParser(std::string_view input) : input_{input} {}

    auto parse() -> std::vector<Selector> {
        skip_ws();
        if (peek() != '$') {
            throw error("path must start with '$'");
        }
        ++pos_;

        auto selectors = std::vector<Selector>{};
        while (true) {
            skip_ws();
            if (at_end()) break;
            auto c = peek();
            if (c == '.') {
                if (peek_next() == '.') {
                    parse_descendant(selectors);
                } else {
                    parse_dot(selectors);
                }
            } else if (c == '[') {
                selectors.push_back(parse_bracket());
            } else {
                throw error(std::string{"unexpected character '"} + c + "'");
            }
        }
        return selectors;
    }

private:
    std::string_view input_;
    std::size_t pos_ = 0;

    auto at_end() const -> bool { return pos_ >= input_.size(); }

    auto peek() const -> char {
        return at_end() ? '\0' : input_[pos_];
    }

    auto peek_next() const -> char {
        return pos_ + 1 >= input_.size() ? '\0' : input_[pos_ + 1];
    }

    auto get() -> char {
        if (at_end()) throw error("unexpected end of path");
        return input_[pos_++];
    }

    void skip_ws() {
        while (!at_end()) {
            auto c = input_[pos_];
            if (c != ' ' && c != '\t' && c != '\r' && c != '\n') break;
            ++pos_;
        }
    }

    void expect(char c) {
        skip_ws();
        if (peek() != c) {
            if (at_end()) throw error(std::string{"expected '"} + c + "' before end of path");
            throw error(std::string{"expected '"} + c + "'");
        }
        ++pos_;
    }

    auto error(const std::string& message) const -> PathSyntaxError {
        return PathSyntaxError{"invalid path expression '" + std::string{input_} + "': " +
                               message + " at position " + std::to_string(pos_)};
    }

    // .name  .'name'  .*
    void parse_dot(std::vector<Selector>& selectors) {
        get();
        if (peek() == '*') {
            get();
            selectors.emplace_back(WildcardSelector{});
            return;
        }
        selectors.emplace_back(FieldSelector{parse_name()});
    }

    // ..name  ..*  ..[...]
    void parse_descendant(std::vector<Selector>& selectors) {
        get();
        get();
        selectors.emplace_back(RecursiveDescentSelector{});
        auto c = peek();
        if (c == '*') {
            get();
            selectors.emplace_back(WildcardSelector{});
        } else if (c == '[') {
            selectors.push_back(parse_bracket());
        } else {
            selectors.emplace_back(FieldSelector{parse_name()});
        }
    }

    auto parse_name() -> std::string {
        auto c = peek();
        if (c == '\'' || c == '"') return parse_quoted_name();
        return parse_identifier();
    }

    auto parse_quoted_name() -> std::string {
        auto start = pos_;
        auto name = parse_quoted();
        if (name.empty()) {
            pos_ = start;
            throw error("empty field name");
        }
        return name;
    }

    auto parse_identifier() -> std::string {
        if (!is_ident_start(peek())) {
            throw error("expected field name");
        }
        auto start = pos_;
        while (!at_end() && is_ident_char(input_[pos_])) ++pos_;
        return std::string{input_.substr(start, pos_ - start)};
    }

    auto parse_quoted() -> std::string {
        auto quote = get();
        auto result = std::string{};
        while (true) {
            if (at_end()) throw error("unterminated quoted string");
            auto c = get();
            if (c == quote) break;
            if (c != '\\') {
                result.push_back(c);
                continue;
            }
            if (at_end()) throw error("unterminated escape sequence");
            auto e = get();
            switch (e) {
                case 'n': result.push_back('\n'); break;
                case 't': result.push_back('\t'); break;
                case 'r': result.push_back('\r'); break;
                case 'b': result.push_back('\b'); break;
                case 'f': result.push_back('\f'); break;
                case 'u': append_utf8(result, parse_unicode_escape()); break;
                default:  result.push_back(e); break;
            }
        }
        return result;
    }

    auto parse_hex4() -> std::uint32_t {
        if (pos_ + 4 > input_.size()) throw error("truncated \\u escape");
        auto value = std::uint32_t{0};
        auto digits = input_.substr(pos_, 4);
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + 4, value, 16);
        if (ec != std::errc{} || ptr != digits.data() + 4) throw error("invalid \\u escape");
        pos_ += 4;
        return value;
    }

    auto parse_unicode_escape() -> std::uint32_t {
        auto cp = parse_hex4();
        if (cp >= 0xDC00 && cp <= 0xDFFF) throw error("unpaired surrogate in \\u escape");
        if (cp >= 0xD800 && cp <= 0xDBFF) {
            if (peek() != '\\' || peek_next() != 'u') throw error("unpaired surrogate in \\u escape");
            pos_ += 2;
            auto low = parse_hex4();
            if (low < 0xDC00 || low > 0xDFFF) throw error("invalid low surrogate in \\u escape");
            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
        }
        return cp;
    }

    auto parse_int() -> std::optional<std::int64_t> {
        auto start = pos_;
        if (peek() == '-') ++pos_;
        while (!at_end() && input_[pos_] >= '0' && input_[pos_] <= '9') ++pos_;
        if (pos_ == start) return std::nullopt;
        auto text = input_.substr(start, pos_ - start);
        auto value = std::int64_t{0};
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec == std::errc::result_out_of_range) {
            pos_ = start;
            throw error("index out of range");
        }
        if (ec != std::errc{} || ptr != text.data() + text.size()) {
            pos_ = start;
            throw error("invalid integer");
        }
        return value;
    }

    auto parse_bracket() -> Selector {
        get();
        skip_ws();
        auto c = peek();

        if (c == '*') {
            get();
            expect(']');
            return WildcardSelector{};
        }
        if (c == '\'' || c == '"') {
            auto name = parse_quoted_name();
            expect(']');
            return FieldSelector{std::move(name)};
        }
        if (c == '?') {
            get();
            auto filter = parse_filter();
            expect(']');
            return filter;
        }
        if (c == '-' || c == ':' || (c >= '0' && c <= '9')) {
            auto first = parse_int();
            skip_ws();
            if (peek() == ':') {
                get();
                skip_ws();
                auto second = parse_int();
                skip_ws();
                if (peek() == ':') throw error("slice step is not supported");
                expect(']');
                return SliceSelector{first, second};
            }
            if (!first) throw error("expected index");
            expect(']');
            return IndexSelector{*first};
        }
        if (at_end()) throw error("unterminated '['");
        throw error(std::string{"unexpected character '"} + c + "' in brackets");
    }

    // (@.field OP literal)
    auto parse_filter() -> FilterSelector {
        expect('(');
        expect('@');
        auto filter = FilterSelector{};
        if (peek() == '.') {
            get();
            filter.field = parse_name();
        } else if (peek() == '[') {
            get();
            skip_ws();
            if (peek() != '\'' && peek() != '"') throw error("expected quoted field name");
            filter.field = parse_quoted_name();
            expect(']');
        } else {
            throw error("expected '.' or '[' after '@'");
        }
        skip_ws();
        filter.op = parse_operator();
        skip_ws();
        filter.literal = parse_filter_literal();
        expect(')');
        return filter;
    }

    auto parse_operator() -> CompareOp {
        auto two = input_.substr(pos_, 2);
        if (two == "==") { pos_ += 2; return CompareOp::eq; }
        if (two == "!=") { pos_ += 2; return CompareOp::ne; }
        if (two == "<=") { pos_ += 2; return CompareOp::le; }
        if (two == ">=") { pos_ += 2; return CompareOp::ge; }
        if (peek() == '<') { ++pos_; return CompareOp::lt; }
        if (peek() == '>') { ++pos_; return CompareOp::gt; }
        throw error("expected comparison operator");
    }

    auto parse_filter_literal() -> Json {
        auto c = peek();
        if (c == '\'' || c == '"') return Json(parse_quoted());

        auto start = pos_;
        while (!at_end()) {
            auto d = input_[pos_];
            auto word = (d >= 'a' && d <= 'z') || (d >= '0' && d <= '9') ||
                        d == '-' || d == '+' || d == '.' || d == 'E';
            if (!word) break;
            ++pos_;
        }
        auto token = input_.substr(start, pos_ - start);
        if (token.empty()) throw error("expected literal");
        auto value = Json::parse(token, nullptr, false);
        if (value.is_discarded() || value.is_structured() || value.is_string()) {
            pos_ = start;
            throw error("invalid literal '" + std::string{token} + "'");
        }
        return value;
    }
};

auto quote_name(const std::string& name) -> std::string {
    auto result = std::string{"'"};
    for (char c : name) {
        if (c == '\'' || c == '\\') result.push_back('\\');
        result.push_back(c);
    }
    result.push_back('\'');
    return result;
}

}  // anonymous namespace

auto PathExpression::to_string() const -> std::string {
    auto out = std::string{"$"};
    for (const auto& selector : selectors_) {
        std::visit(overload{
            [&](const FieldSelector& s) { out += "[" + quote_name(s.name) + "]"; },
            [&](const IndexSelector& s) { out += "[" + std::to_string(s.index) + "]"; },
            [&](const WildcardSelector&) { out += "[*]"; },
            [&](const RecursiveDescentSelector&) { out += ".."; },
            [&](const SliceSelector& s) {
                out += "[";
                if (s.start) out += std::to_string(*s.start);
                out += ":";
                if (s.stop) out += std::to_string(*s.stop);
                out += "]";
            },
            [&](const FilterSelector& s) {
                out += "[?(@[" + quote_name(s.field) + "] ";
                out += to_string_view(s.op);
                out += " ";
                out += s.literal.is_string() ? quote_name(s.literal.get_ref<const std::string&>())
                                             : s.literal.dump();
                out += ")]";
            },
        }, selector);
    }
    return out;
}

auto PathExpression::is_definite() const -> bool {
    return std::ranges::all_of(selectors_, [](const Selector& s) {
        return fieldpath_cpp::is_definite(s);
    });
}

auto compile(std::string_view path) -> PathExpression {
    auto parser = PathParser{path};
    return PathExpression{std::string{path}, parser.parse()};
}

}  // namespace fieldpath_cpp
