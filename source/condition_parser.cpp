// condition_parser.cpp - recursive-descent parser for condition text

#include <lager_delta/condition.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>

namespace lager_delta {

namespace {

enum class TokenKind : uint8_t {
    LParen,
    RParen,
    Comma,
    Operator,
    String,
    Number,
    Ident,
    And,
    Or,
    Not,
    True,
    False,
    Null,
    End,
};

struct Token {
    TokenKind kind = TokenKind::End;
    std::string text;
    std::size_t offset = 0;
};

std::string upper(std::string_view s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::string describe(const Token& tok)
{
    return tok.kind == TokenKind::End ? std::string("end of input") : tok.text;
}

bool is_ident_start(char c)
{
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '/';
}

/// "/" alone names the root inside condition text.
Path field_path(std::string_view text)
{
    return text == "/" ? Path{} : parse_path(text);
}

std::optional<CompareOp> folded_compare_op(std::string_view name)
{
    if (name == "eqi") return CompareOp::Eq;
    if (name == "nei") return CompareOp::Ne;
    if (name == "lti") return CompareOp::Lt;
    if (name == "gti") return CompareOp::Gt;
    if (name == "lei") return CompareOp::Le;
    if (name == "gei") return CompareOp::Ge;
    return std::nullopt;
}

bool is_ident_char(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '[' ||
           c == ']' || c == '/' || c == '~';
}

// ============================================================
// Lexer
// ============================================================

std::vector<Token> tokenize(std::string_view input)
{
    std::vector<Token> tokens;
    std::size_t i = 0;

    while (i < input.size()) {
        char c = input[i];
        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
            continue;
        }
        std::size_t start = i;

        switch (c) {
            case '(':
                tokens.push_back({TokenKind::LParen, "(", start});
                ++i;
                continue;
            case ')':
                tokens.push_back({TokenKind::RParen, ")", start});
                ++i;
                continue;
            case ',':
                tokens.push_back({TokenKind::Comma, ",", start});
                ++i;
                continue;
            case '=':
            case '!':
                if (i + 1 < input.size() && input[i + 1] == '=') {
                    tokens.push_back({TokenKind::Operator, std::string(input.substr(i, 2)), start});
                    i += 2;
                    continue;
                }
                throw ConditionParseError("unexpected character: " + std::string(1, c),
                                          std::string(input.substr(i)));
            case '<':
            case '>':
                if (i + 1 < input.size() && input[i + 1] == '=') {
                    tokens.push_back({TokenKind::Operator, std::string(input.substr(i, 2)), start});
                    i += 2;
                } else {
                    tokens.push_back({TokenKind::Operator, std::string(1, c), start});
                    ++i;
                }
                continue;
            default:
                break;
        }

        if (c == '\'' || c == '"') {
            char quote = c;
            std::string text;
            ++i;
            bool closed = false;
            while (i < input.size()) {
                char ch = input[i++];
                if (ch == '\\' && i < input.size()) {
                    text += input[i++];
                } else if (ch == quote) {
                    closed = true;
                    break;
                } else {
                    text += ch;
                }
            }
            if (!closed) {
                throw ConditionParseError("unterminated string literal",
                                          std::string(input.substr(start)));
            }
            tokens.push_back({TokenKind::String, std::move(text), start});
            continue;
        }

        bool negative_number = c == '-' && i + 1 < input.size() &&
                               std::isdigit(static_cast<unsigned char>(input[i + 1]));
        if (std::isdigit(static_cast<unsigned char>(c)) || negative_number) {
            ++i;
            while (i < input.size() &&
                   (std::isdigit(static_cast<unsigned char>(input[i])) || input[i] == '.')) {
                ++i;
            }
            tokens.push_back({TokenKind::Number, std::string(input.substr(start, i - start)), start});
            continue;
        }

        if (is_ident_start(c)) {
            while (i < input.size() && is_ident_char(input[i])) {
                ++i;
            }
            std::string text(input.substr(start, i - start));
            std::string keyword = upper(text);
            TokenKind kind = TokenKind::Ident;
            if (keyword == "AND") kind = TokenKind::And;
            else if (keyword == "OR") kind = TokenKind::Or;
            else if (keyword == "NOT") kind = TokenKind::Not;
            else if (keyword == "TRUE") kind = TokenKind::True;
            else if (keyword == "FALSE") kind = TokenKind::False;
            else if (keyword == "NULL") kind = TokenKind::Null;
            tokens.push_back({kind, std::move(text), start});
            continue;
        }

        throw ConditionParseError("unexpected character: " + std::string(1, c),
                                  std::string(input.substr(i)));
    }

    tokens.push_back({TokenKind::End, "", input.size()});
    return tokens;
}

Value parse_number(const Token& tok)
{
    const std::string& s = tok.text;
    if (s.find('.') == std::string::npos) {
        int64_t v = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
        if (ec == std::errc{} && ptr == s.data() + s.size()) {
            if (v >= std::numeric_limits<int32_t>::min() && v <= std::numeric_limits<int32_t>::max()) {
                return Value{static_cast<int32_t>(v)};
            }
            return Value{v};
        }
    } else if (std::count(s.begin(), s.end(), '.') == 1 && s.back() != '.') {
        try {
            std::size_t used = 0;
            double d = std::stod(s, &used);
            if (used == s.size()) {
                return Value{d};
            }
        } catch (const std::exception&) {
            // fall through to the error below
        }
    }
    throw ConditionParseError("invalid number: " + s, s);
}

std::optional<CompareOp> compare_op(const std::string& text)
{
    if (text == "==") return CompareOp::Eq;
    if (text == "!=") return CompareOp::Ne;
    if (text == "<") return CompareOp::Lt;
    if (text == ">") return CompareOp::Gt;
    if (text == "<=") return CompareOp::Le;
    if (text == ">=") return CompareOp::Ge;
    return std::nullopt;
}

// ============================================================
// Parser
// ============================================================

class Parser {
public:
    explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    ConditionPtr parse()
    {
        auto result = parse_or();
        if (peek().kind != TokenKind::End) {
            throw ConditionParseError("unexpected token: " + describe(peek()), peek().text);
        }
        return result;
    }

private:
    const Token& peek() const { return tokens_[pos_]; }

    const Token& peek_next() const
    {
        return tokens_[std::min(pos_ + 1, tokens_.size() - 1)];
    }

    Token next()
    {
        Token tok = tokens_[pos_];
        if (pos_ + 1 < tokens_.size()) {
            ++pos_;
        }
        return tok;
    }

    void expect(TokenKind kind, std::string_view what)
    {
        if (peek().kind != kind) {
            throw ConditionParseError("expected '" + std::string(what) + "', got " + describe(peek()),
                                      peek().text);
        }
        next();
    }

    ConditionPtr parse_or()
    {
        std::vector<ConditionPtr> subs{parse_and()};
        while (peek().kind == TokenKind::Or) {
            next();
            subs.push_back(parse_and());
        }
        return subs.size() == 1 ? subs.front() : cond::any_of(std::move(subs));
    }

    ConditionPtr parse_and()
    {
        std::vector<ConditionPtr> subs{parse_factor()};
        while (peek().kind == TokenKind::And) {
            next();
            subs.push_back(parse_factor());
        }
        return subs.size() == 1 ? subs.front() : cond::all_of(std::move(subs));
    }

    ConditionPtr parse_factor()
    {
        const Token& tok = peek();
        switch (tok.kind) {
            case TokenKind::Not:
                next();
                return cond::negate(parse_factor());
            case TokenKind::LParen: {
                next();
                auto inner = parse_or();
                expect(TokenKind::RParen, ")");
                return inner;
            }
            case TokenKind::True:
                next();
                return cond::all_of({});
            case TokenKind::False:
                next();
                return cond::any_of({});
            case TokenKind::Ident:
                if (peek_next().kind == TokenKind::LParen) {
                    return parse_call();
                }
                return parse_comparison();
            default:
                throw ConditionParseError("unexpected token: " + describe(tok), tok.text);
        }
    }

    ConditionPtr parse_comparison()
    {
        Path lhs = field_path(next().text);

        const Token& op_tok = peek();
        std::optional<CompareOp> op;
        if (op_tok.kind == TokenKind::Operator) {
            op = compare_op(op_tok.text);
        }
        if (!op) {
            throw ConditionParseError("expected comparison operator, got " + describe(op_tok),
                                      op_tok.text);
        }
        next();

        if (peek().kind == TokenKind::Ident) {
            Path rhs = field_path(next().text);
            return cond::make(Condition{CompareFields{std::move(lhs), std::move(rhs), *op, false}});
        }
        Value literal = parse_literal();
        return cond::make(Condition{Compare{std::move(lhs), std::move(literal), *op, false}});
    }

    Value parse_literal()
    {
        const Token& tok = peek();
        switch (tok.kind) {
            case TokenKind::String:
                return Value{next().text};
            case TokenKind::Number:
                return parse_number(next());
            case TokenKind::True:
                next();
                return Value{true};
            case TokenKind::False:
                next();
                return Value{false};
            case TokenKind::Null:
                next();
                return Value{};
            default:
                throw ConditionParseError("expected value or field, got " + describe(tok), tok.text);
        }
    }

    Path parse_path_arg()
    {
        if (peek().kind != TokenKind::Ident) {
            throw ConditionParseError("expected field, got " + describe(peek()), peek().text);
        }
        return field_path(next().text);
    }

    std::string parse_string_arg()
    {
        if (peek().kind != TokenKind::String) {
            throw ConditionParseError("expected string, got " + describe(peek()), peek().text);
        }
        return next().text;
    }

    void comma()
    {
        expect(TokenKind::Comma, ",");
    }

    ConditionPtr parse_call()
    {
        Token name_tok = next();
        std::string name = name_tok.text;
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        expect(TokenKind::LParen, "(");

        ConditionPtr result;
        if (name == "log") {
            result = cond::log(parse_string_arg());
        } else if (name == "defined" || name == "undefined") {
            Path p = parse_path_arg();
            result = name == "defined" ? cond::make(Condition{Defined{std::move(p)}})
                                       : cond::make(Condition{Undefined{std::move(p)}});
        } else if (name == "type") {
            Path p = parse_path_arg();
            comma();
            result = cond::make(Condition{TypeOf{std::move(p), parse_string_arg()}});
        } else if (auto folded = folded_compare_op(name)) {
            Path p = parse_path_arg();
            comma();
            if (peek().kind == TokenKind::Ident) {
                Path rhs = parse_path_arg();
                result = cond::make(Condition{CompareFields{std::move(p), std::move(rhs), *folded, true}});
            } else {
                result = cond::make(Condition{Compare{std::move(p), parse_literal(), *folded, true}});
            }
        } else if (name == "in" || name == "ini") {
            Path p = parse_path_arg();
            std::vector<Value> literals;
            while (peek().kind == TokenKind::Comma) {
                next();
                literals.push_back(parse_literal());
            }
            result = cond::make(Condition{Membership{std::move(p), std::move(literals), name == "ini"}});
        } else {
            bool fold = name.size() > 1 && name.back() == 'i';
            std::string base = fold ? name.substr(0, name.size() - 1) : name;
            std::optional<StringOp> op;
            if (base == "contains") op = StringOp::Contains;
            else if (base == "starts") op = StringOp::Starts;
            else if (base == "ends") op = StringOp::Ends;
            else if (base == "matches") op = StringOp::Matches;
            if (!op) {
                throw ConditionParseError("unknown function: " + name_tok.text, name_tok.text);
            }
            Path p = parse_path_arg();
            comma();
            result = cond::make(Condition{StringPredicate{std::move(p), parse_string_arg(), *op, fold}});
        }

        expect(TokenKind::RParen, ")");
        return result;
    }

    std::vector<Token> tokens_;
    std::size_t pos_ = 0;
};

} // anonymous namespace

ConditionPtr parse_condition(std::string_view text)
{
    auto tokens = tokenize(text);
    if (tokens.size() == 1) {
        throw ConditionParseError("empty condition", std::string(text));
    }
    return Parser(std::move(tokens)).parse();
}

} // namespace lager_delta
