#include "storie.hpp"
#include <sstream>
#include <stdexcept>
#include <vector>
#include <cstdint>
#include <cstdlib>
#include <cctype>
#include <cerrno>
#include <climits>

using namespace storie;
using namespace storie::ast;

#define ARRLEN(arr) (sizeof(arr)/sizeof(*arr))

// two-character operators must come first
static const char *const operators[] = {
    "==", "!=", "<=", ">=",
    "+", "-", "*", "/", "%", "=", "<", ">",
};

class lex_exception : public std::runtime_error {
public:
    pos_info pos;
    std::string msg;

    lex_exception(pos_info pos, const std::string &what = "")
        : std::runtime_error(what), pos(pos), msg(what) { }
};

token token::make_integer(int32_t v, const std::string &lexeme,
                          const pos_info &pos) {
    token tok;
    tok.pos = pos;
    tok.type = TOKEN_INTEGER;
    tok.str = lexeme;
    tok.integer = v;
    return tok;
}

token token::make_float(double v, const std::string &lexeme,
                        const pos_info &pos) {
    token tok;
    tok.pos = pos;
    tok.type = TOKEN_FLOAT;
    tok.str = lexeme;
    tok.number = v;
    return tok;
}

token token::make_string(const std::string &v, const pos_info &pos) {
    token tok;
    tok.pos = pos;
    tok.type = TOKEN_STRING;
    tok.str = v;
    tok.integer = 0;
    return tok;
}

token token::make_identifier(const std::string &v, const pos_info &pos) {
    token tok;
    tok.pos = pos;
    tok.type = TOKEN_IDENTIFIER;
    tok.str = v;
    tok.integer = 0;
    return tok;
}

token token::make_operator(const std::string &v, const pos_info &pos) {
    token tok;
    tok.pos = pos;
    tok.type = TOKEN_OPERATOR;
    tok.str = v;
    tok.integer = 0;
    return tok;
}

token token::make_simple(token_type type, const pos_info &pos) {
    token tok;
    tok.pos = pos;
    tok.type = type;
    tok.integer = 0;

    switch (type) {
        case TOKEN_LPAREN: tok.str = "("; break;
        case TOKEN_RPAREN: tok.str = ")"; break;
        case TOKEN_COMMA: tok.str = ","; break;
        case TOKEN_COLON: tok.str = ":"; break;
        default: break;
    }

    return tok;
}

std::string storie::ast::token_to_str(const token &tok) {
    std::stringstream out;

    out << token_type_str(tok.type);

    switch (tok.type) {
        case TOKEN_IDENTIFIER:
        case TOKEN_OPERATOR:
            out << " '";
            out << tok.str;
            out << "'";
            break;

        case TOKEN_INTEGER:
        case TOKEN_FLOAT:
            out << " ";
            out << tok.str;
            break;

        case TOKEN_STRING:
            out << " \"";
            out << tok.str;
            out << "\"";
            break;

        default:
            break;
    }

    return out.str();
}

static inline bool is_ident_start(char ch) {
    return isalpha((unsigned char)ch) || ch == '_';
}

static inline bool is_ident_char(char ch) {
    return isalnum((unsigned char)ch) || ch == '_';
}

static inline bool is_digit(char ch) {
    return isdigit((unsigned char)ch) != 0;
}

// scans the tokens of one logical line, starting after its indentation.
static void scan_line(const std::string &line, size_t i, int line_no,
                      std::vector<token> &tokens) {
    while (i < line.size()) {
        char ch = line[i];
        pos_info pos { line_no, (int)i + 1 };

        if (ch == ' ' || ch == '\t') {
            ++i;
            continue;
        }

        // comment runs to end of line
        if (ch == '#') break;

        if (is_digit(ch)) {
            size_t start = i;
            bool is_float = false;

            while (i < line.size() && is_digit(line[i])) ++i;
            if (i + 1 < line.size() && line[i] == '.' && is_digit(line[i + 1])) {
                is_float = true;
                ++i;
                while (i < line.size() && is_digit(line[i])) ++i;
            }

            // 12abc, 1.5.2 and friends
            if (i < line.size() && (is_ident_char(line[i]) || line[i] == '.')) {
                while (i < line.size() && (is_ident_char(line[i]) || line[i] == '.'))
                    ++i;

                throw lex_exception(pos,
                    "could not parse number literal " + line.substr(start, i - start));
            }

            std::string lexeme = line.substr(start, i - start);
            if (is_float) {
                tokens.push_back(token::make_float(strtod(lexeme.c_str(), nullptr),
                                                   lexeme, pos));
            } else {
                errno = 0;
                long long v = strtoll(lexeme.c_str(), nullptr, 10);

                // too wide for an integer value, keep it as a float
                if (errno == ERANGE || v > INT32_MAX) {
                    tokens.push_back(token::make_float(strtod(lexeme.c_str(), nullptr),
                                                       lexeme, pos));
                } else {
                    tokens.push_back(token::make_integer((int32_t)v, lexeme, pos));
                }
            }

            continue;
        }

        if (is_ident_start(ch)) {
            size_t start = i;
            while (i < line.size() && is_ident_char(line[i])) ++i;

            tokens.push_back(token::make_identifier(line.substr(start, i - start), pos));
            continue;
        }

        if (ch == '"' || ch == '\'') {
            size_t end = line.find(ch, i + 1);
            if (end == std::string::npos) {
                throw lex_exception(pos, "unterminated string literal");
            }

            tokens.push_back(token::make_string(line.substr(i + 1, end - i - 1), pos));
            i = end + 1;
            continue;
        }

        switch (ch) {
            case '(':
                tokens.push_back(token::make_simple(TOKEN_LPAREN, pos));
                ++i;
                continue;

            case ')':
                tokens.push_back(token::make_simple(TOKEN_RPAREN, pos));
                ++i;
                continue;

            case ',':
                tokens.push_back(token::make_simple(TOKEN_COMMA, pos));
                ++i;
                continue;

            case ':':
                tokens.push_back(token::make_simple(TOKEN_COLON, pos));
                ++i;
                continue;

            default:
                break;
        }

        bool found = false;
        for (size_t k = 0; k < ARRLEN(operators); ++k) {
            const std::string op = operators[k];
            if (line.compare(i, op.size(), op) == 0) {
                tokens.push_back(token::make_operator(op, pos));
                i += op.size();
                found = true;
                break;
            }
        }

        if (!found) {
            throw lex_exception(pos,
                std::string("invalid character '") + ch + "'");
        }
    }
}

bool storie::ast::parse_tokens(std::istream &stream, std::vector<token> &tokens,
                               script_error *error) {
    std::vector<int> indent_stack { 0 };
    std::string line;
    int line_no = 0;

    try {
        while (std::getline(stream, line)) {
            ++line_no;

            if (!line.empty() && line.back() == '\r')
                line.pop_back();

            // measure leading whitespace. tabs and spaces are one column each.
            size_t first = 0;
            while (first < line.size() && (line[first] == ' ' || line[first] == '\t'))
                ++first;

            // blank and comment-only lines don't take part in indentation
            if (first == line.size() || line[first] == '#')
                continue;

            int width = (int)first;
            pos_info line_pos { line_no, 1 };

            if (width > indent_stack.back()) {
                indent_stack.push_back(width);
                tokens.push_back(token::make_simple(TOKEN_INDENT, line_pos));
            } else {
                while (width < indent_stack.back()) {
                    indent_stack.pop_back();
                    tokens.push_back(token::make_simple(TOKEN_DEDENT, line_pos));
                }

                if (width != indent_stack.back()) {
                    throw lex_exception(
                        pos_info { line_no, width + 1 },
                        "indentation does not match any outer block");
                }
            }

            scan_line(line, first, line_no, tokens);
            tokens.push_back(token::make_simple(
                TOKEN_NEWLINE, pos_info { line_no, (int)line.size() + 1 }));
        }
    } catch (const lex_exception &except) {
        if (error) {
            *error = script_error { ERROR_LEXICAL, except.pos, except.msg };
        }

        return false;
    }

    pos_info end_pos { line_no + 1, 1 };
    while (indent_stack.size() > 1) {
        indent_stack.pop_back();
        tokens.push_back(token::make_simple(TOKEN_DEDENT, end_pos));
    }

    tokens.push_back(token::make_simple(TOKEN_EOF, end_pos));
    return true;
}
