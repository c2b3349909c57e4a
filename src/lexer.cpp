// ============================================================================
// lexer.cpp — truthtab tokeniser implementation
// ============================================================================

#include "truthtab/lexer.hpp"

#include <algorithm>
#include <cctype>

namespace truthtab {

namespace {

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

}  // namespace

// ── token_kind_name ─────────────────────────────────────────────────────────

const char* token_kind_name(TokenKind k) noexcept {
    switch (k) {
        case TokenKind::Variable:     return "variable";
        case TokenKind::KwTrue:       return "TRUE";
        case TokenKind::KwFalse:      return "FALSE";
        case TokenKind::KwNot:        return "NOT";
        case TokenKind::KwAnd:        return "AND";
        case TokenKind::KwOr:         return "OR";
        case TokenKind::KwXor:        return "XOR";
        case TokenKind::KwNand:       return "NAND";
        case TokenKind::KwNor:        return "NOR";
        case TokenKind::KwImplies:    return "IMPLIES";
        case TokenKind::KwEquiv:      return "EQUIV";
        case TokenKind::Bang:         return "!";
        case TokenKind::Amp:          return "&";
        case TokenKind::Pipe:         return "|";
        case TokenKind::Caret:        return "^";
        case TokenKind::Arrow:        return "->";
        case TokenKind::DoubleArrow:  return "<->";
        case TokenKind::LParen:       return "(";
        case TokenKind::RParen:       return ")";
        case TokenKind::Comma:        return ",";
        case TokenKind::Unknown:      return "unknown";
        case TokenKind::Eof:          return "end of input";
    }
    return "?";
}

// ── normalize ───────────────────────────────────────────────────────────────

std::string normalize(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return out;
}

// ── extract_variables ───────────────────────────────────────────────────────

std::vector<Variable> extract_variables(std::string_view text) {
    std::string norm = normalize(text);
    bool seen[26] = {};

    std::size_t i = 0;
    while (i < norm.size()) {
        if (!is_word_char(norm[i])) {
            ++i;
            continue;
        }
        std::size_t begin = i;
        while (i < norm.size() && is_word_char(norm[i])) ++i;
        char c = norm[begin];
        if (i - begin == 1 && c >= 'A' && c <= 'Z') {
            seen[c - 'A'] = true;
        }
    }

    std::vector<Variable> vars;
    for (int k = 0; k < 26; ++k) {
        if (seen[k]) vars.push_back(static_cast<Variable>('A' + k));
    }
    return vars;
}

// ── Lexer ───────────────────────────────────────────────────────────────────

Lexer::Lexer(std::string_view source, std::uint32_t line)
    : src_(normalize(source)), pos_{line, 1} {}

SourcePos Lexer::current_pos() const noexcept {
    return pos_;
}

Token Lexer::make_token(TokenKind kind, std::string text, SourcePos pos) {
    return Token{kind, std::move(text), pos};
}

void Lexer::skip_whitespace() {
    while (idx_ < src_.size()) {
        char c = src_[idx_];
        if (c == '\n') {
            ++idx_;
            pos_.line++;
            pos_.column = 1;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            ++idx_;
            ++pos_.column;
        } else {
            break;
        }
    }
}

// ── read_word ───────────────────────────────────────────────────────────────
// Read [A-Z0-9_]+ and classify as variable, keyword or unknown.

Token Lexer::read_word() {
    SourcePos start = pos_;
    std::size_t begin = idx_;

    while (idx_ < src_.size() && is_word_char(src_[idx_])) {
        ++idx_;
        ++pos_.column;
    }

    std::string text = src_.substr(begin, idx_ - begin);

    TokenKind kind = TokenKind::Unknown;

    if (text.size() == 1 && text[0] >= 'A' && text[0] <= 'Z')
        kind = TokenKind::Variable;
    else if (text == "AND")     kind = TokenKind::KwAnd;
    else if (text == "OR")      kind = TokenKind::KwOr;
    else if (text == "NOT")     kind = TokenKind::KwNot;
    else if (text == "XOR")     kind = TokenKind::KwXor;
    else if (text == "NAND")    kind = TokenKind::KwNand;
    else if (text == "NOR")     kind = TokenKind::KwNor;
    else if (text == "IMPLIES") kind = TokenKind::KwImplies;
    else if (text == "EQUIV")   kind = TokenKind::KwEquiv;
    else if (text == "TRUE")    kind = TokenKind::KwTrue;
    else if (text == "FALSE")   kind = TokenKind::KwFalse;

    return make_token(kind, std::move(text), start);
}

// ── next ────────────────────────────────────────────────────────────────────

Token Lexer::next() {
    if (has_peeked_) {
        has_peeked_ = false;
        return std::move(peeked_);
    }

    skip_whitespace();

    if (idx_ >= src_.size()) {
        return make_token(TokenKind::Eof, "", pos_);
    }

    SourcePos start = pos_;
    char c = src_[idx_];

    // ── single-character tokens ─────────────────────────────────────────
    if (c == '!') { ++idx_; ++pos_.column; return make_token(TokenKind::Bang,   "!", start); }
    if (c == '&') { ++idx_; ++pos_.column; return make_token(TokenKind::Amp,    "&", start); }
    if (c == '|') { ++idx_; ++pos_.column; return make_token(TokenKind::Pipe,   "|", start); }
    if (c == '^') { ++idx_; ++pos_.column; return make_token(TokenKind::Caret,  "^", start); }
    if (c == '(') { ++idx_; ++pos_.column; return make_token(TokenKind::LParen, "(", start); }
    if (c == ')') { ++idx_; ++pos_.column; return make_token(TokenKind::RParen, ")", start); }
    if (c == ',') { ++idx_; ++pos_.column; return make_token(TokenKind::Comma,  ",", start); }

    // ── multi-character operators ───────────────────────────────────────
    if (c == '<' && idx_ + 2 < src_.size() &&
        src_[idx_ + 1] == '-' && src_[idx_ + 2] == '>') {
        idx_ += 3; pos_.column += 3;
        return make_token(TokenKind::DoubleArrow, "<->", start);
    }

    if (c == '-' && idx_ + 1 < src_.size() && src_[idx_ + 1] == '>') {
        idx_ += 2; pos_.column += 2;
        return make_token(TokenKind::Arrow, "->", start);
    }

    // ── words ───────────────────────────────────────────────────────────
    if (is_word_char(c)) {
        return read_word();
    }

    ++idx_; ++pos_.column;
    return make_token(TokenKind::Unknown, std::string(1, c), start);
}

// ── peek ────────────────────────────────────────────────────────────────────

const Token& Lexer::peek() {
    if (!has_peeked_) {
        peeked_ = next();
        has_peeked_ = true;
    }
    return peeked_;
}

// ── tokenise (convenience) ──────────────────────────────────────────────────

std::vector<Token> tokenise(std::string_view source, std::uint32_t line) {
    Lexer lex(source, line);
    std::vector<Token> toks;
    for (;;) {
        Token t = lex.next();
        toks.push_back(t);
        if (t.kind == TokenKind::Eof) break;
    }
    return toks;
}

}  // namespace truthtab
