#include "storie.hpp"
#include <sstream>
#include <stdexcept>

using namespace storie;
using namespace storie::ast;

#define ARRLEN(arr) (sizeof(arr)/sizeof(*arr))

// binds tighter than every binary operator
static constexpr int UNARY_PRECEDENCE = 100;

// bounds parser recursion, and with it the depth of every AST the
// evaluator walks
static constexpr int MAX_NESTING = 256;

struct { const char *str; ast_binop op; int precedence; } static const binop_info[] = {
    { "or", EXPR_BINOP_OR, 1 },
    { "and", EXPR_BINOP_AND, 2 },

    { "==", EXPR_BINOP_EQ, 3 },
    { "!=", EXPR_BINOP_NEQ, 3 },
    { "<", EXPR_BINOP_LT, 3 },
    { "<=", EXPR_BINOP_LE, 3 },
    { ">", EXPR_BINOP_GT, 3 },
    { ">=", EXPR_BINOP_GE, 3 },

    { "+", EXPR_BINOP_ADD, 4 },
    { "-", EXPR_BINOP_SUB, 4 },

    { "*", EXPR_BINOP_MUL, 5 },
    { "/", EXPR_BINOP_DIV, 5 },
    { "%", EXPR_BINOP_MOD, 5 },
};

const char* storie::ast::binop_to_str(ast_binop op) {
    for (size_t i = 0; i < ARRLEN(binop_info); ++i) {
        if (binop_info[i].op == op)
            return binop_info[i].str;
    }

    return "???";
}

const char* storie::ast::unop_to_str(ast_unop op) {
    switch (op) {
        case EXPR_UNOP_NEG: return "-";
        case EXPR_UNOP_NOT: return "not";
        default: return "???";
    }
}

class parse_exception : public std::runtime_error {
public:
    pos_info pos;
    std::string msg;

    parse_exception(pos_info pos, const std::string &what = "")
        : std::runtime_error(what), pos(pos), msg(what) { }
};

class token_reader {
private:
    const std::vector<token> &tokens;
    size_t index;
    int nesting;

public:
    token_reader(const std::vector<token> &tokens)
        : tokens(tokens), index(0), nesting(0)
    { }

    void enter(const pos_info &pos, const char *what) {
        if (++nesting > MAX_NESTING)
            throw parse_exception(pos, std::string(what) + " nested too deeply");
    }

    void leave(int count) {
        nesting -= count;
    }

    bool eof() const {
        return index >= tokens.size() || tokens[index].is_a(TOKEN_EOF);
    }

    const token& pop() {
        if (index >= tokens.size())
            throw parse_exception(end_pos(), "unexpected end of input");

        return tokens[index++];
    }

    const token& peek() const {
        if (index >= tokens.size())
            throw parse_exception(end_pos(), "unexpected end of input");

        return tokens[index];
    }

    const token& peek(int offset) const {
        if (index + offset >= tokens.size())
            throw parse_exception(end_pos(), "unexpected end of input");

        return tokens[index + offset];
    }

private:
    pos_info end_pos() const {
        return tokens.empty() ? pos_info { 1, 1 } : tokens.back().pos;
    }
};

static inline const token& tok_expect(const token &tok, token_type type) {
    if (tok.type != type) {
        std::stringstream buf;
        buf << "expected ";
        buf << token_type_str(type);
        buf << ", got ";
        buf << token_to_str(tok);
        buf << " instead";
        throw parse_exception(tok.pos, buf.str());
    }

    return tok;
}

static inline const token& tok_expect_word(const token &tok, const char *word) {
    if (!tok.is_word(word)) {
        std::stringstream buf;
        buf << "expected '";
        buf << word;
        buf << "', got ";
        buf << token_to_str(tok);
        buf << " instead";
        throw parse_exception(tok.pos, buf.str());
    }

    return tok;
}

static inline const token& tok_expect_op(const token &tok, const char *op) {
    if (!tok.is_op(op)) {
        std::stringstream buf;
        buf << "expected operator '";
        buf << op;
        buf << "', got ";
        buf << token_to_str(tok);
        buf << " instead";
        throw parse_exception(tok.pos, buf.str());
    }

    return tok;
}

// returns false if the token is not a binary operator. and/or arrive as
// identifiers.
static bool identify_binop(const token &tok, ast_binop *op, int *precedence) {
    if (!tok.is_a(TOKEN_OPERATOR) && !tok.is_a(TOKEN_IDENTIFIER))
        return false;

    for (size_t i = 0; i < ARRLEN(binop_info); ++i) {
        if (tok.str == binop_info[i].str) {
            *op = binop_info[i].op;
            *precedence = binop_info[i].precedence;
            return true;
        }
    }

    return false;
}

// counts nesting levels entered through a reader, releasing them on scope
// exit
struct nesting_guard {
    token_reader &reader;
    int count;

    nesting_guard(token_reader &reader) : reader(reader), count(0) { }
    ~nesting_guard() { reader.leave(count); }

    void enter(const pos_info &pos, const char *what) {
        ++count;
        reader.enter(pos, what);
    }
};

static std::unique_ptr<ast_expr>
parse_expression(token_reader &reader, int min_precedence = 0);

static std::unique_ptr<ast_expr> parse_prefix(token_reader &reader) {
    const token &tok = reader.pop();

    switch (tok.type) {
        case TOKEN_INTEGER:
            return ast_expr_literal::make_int(tok.pos, tok.integer);

        case TOKEN_FLOAT:
            return ast_expr_literal::make_float(tok.pos, tok.number);

        case TOKEN_STRING:
            return ast_expr_literal::make_string(tok.pos, tok.str);

        case TOKEN_LPAREN: {
            auto expr = parse_expression(reader);
            tok_expect(reader.pop(), TOKEN_RPAREN);
            return expr;
        }

        case TOKEN_OPERATOR: {
            if (tok.str != "-") break;

            auto ret = std::make_unique<ast_expr_unop>();
            ret->pos = tok.pos;
            ret->op = EXPR_UNOP_NEG;
            ret->expr = parse_expression(reader, UNARY_PRECEDENCE);
            return ret;
        }

        case TOKEN_IDENTIFIER: {
            if (tok.str == "true")
                return ast_expr_literal::make_bool(tok.pos, true);

            if (tok.str == "false")
                return ast_expr_literal::make_bool(tok.pos, false);

            if (tok.str == "not") {
                auto ret = std::make_unique<ast_expr_unop>();
                ret->pos = tok.pos;
                ret->op = EXPR_UNOP_NOT;
                ret->expr = parse_expression(reader, UNARY_PRECEDENCE);
                return ret;
            }

            // func call
            if (reader.peek().is_a(TOKEN_LPAREN)) {
                reader.pop();

                auto call = std::make_unique<ast_expr_call>();
                call->pos = tok.pos;
                call->name = tok.str;

                if (!reader.peek().is_a(TOKEN_RPAREN)) {
                    while (true) {
                        call->arguments.push_back(parse_expression(reader));
                        if (!reader.peek().is_a(TOKEN_COMMA)) break;
                        reader.pop();
                    }
                }

                tok_expect(reader.pop(), TOKEN_RPAREN);
                return call;
            }

            auto ret = std::make_unique<ast_expr_identifier>();
            ret->pos = tok.pos;
            ret->identifier = tok.str;
            return ret;
        }

        default:
            break;
    }

    throw parse_exception(
        tok.pos,
        "unexpected " + token_to_str(tok) + " in expression");
}

// precedence climbing. operators of equal precedence associate to the left.
static std::unique_ptr<ast_expr>
parse_expression(token_reader &reader, int min_precedence) {
    nesting_guard guard(reader);
    guard.enter(reader.peek().pos, "expression");

    std::unique_ptr<ast_expr> left = parse_prefix(reader);

    while (true) {
        ast_binop op;
        int precedence;
        if (!identify_binop(reader.peek(), &op, &precedence) ||
            precedence <= min_precedence)
            break;

        const token &op_tok = reader.pop();

        // each operator in a chain deepens the left operand by one
        guard.enter(op_tok.pos, "expression");
        std::unique_ptr<ast_expr> right = parse_expression(reader, precedence);

        auto tmp = std::make_unique<ast_expr_binop>();
        tmp->pos = op_tok.pos;
        tmp->op = op;
        tmp->left = std::move(left);
        tmp->right = std::move(right);
        left = std::move(tmp);
    }

    return left;
}

static std::unique_ptr<ast_statement> parse_statement(token_reader &reader);

// ':' newline indent stmt+ dedent
static stmt_list parse_block(token_reader &reader) {
    tok_expect(reader.pop(), TOKEN_COLON);
    tok_expect(reader.pop(), TOKEN_NEWLINE);

    const token &indent = reader.pop();
    if (!indent.is_a(TOKEN_INDENT)) {
        throw parse_exception(indent.pos, "expected an indented block");
    }

    nesting_guard guard(reader);
    guard.enter(indent.pos, "block");

    stmt_list body;
    while (!reader.peek().is_a(TOKEN_DEDENT)) {
        body.push_back(parse_statement(reader));
    }

    reader.pop(); // pop off dedent
    return body;
}

static std::unique_ptr<ast_statement> parse_var(token_reader &reader) {
    const token &kw = reader.pop();

    auto stm = std::make_unique<ast_statement_var>();
    stm->pos = kw.pos;
    stm->is_let = kw.str == "let";
    stm->name = tok_expect(reader.pop(), TOKEN_IDENTIFIER).str;
    tok_expect_op(reader.pop(), "=");
    stm->value = parse_expression(reader);
    tok_expect(reader.pop(), TOKEN_NEWLINE);

    return stm;
}

static std::unique_ptr<ast_statement> parse_if(token_reader &reader) {
    auto stm = std::make_unique<ast_statement_if>();
    stm->pos = reader.pop().pos;

    stm->if_branch.condition = parse_expression(reader);
    stm->if_branch.body = parse_block(reader);

    while (reader.peek().is_word("elif")) {
        reader.pop();

        ast_if_branch branch;
        branch.condition = parse_expression(reader);
        branch.body = parse_block(reader);
        stm->elif_branches.push_back(std::move(branch));
    }

    if (reader.peek().is_word("else")) {
        reader.pop();
        stm->else_branch = parse_block(reader);
    }

    return stm;
}

// for <ident> in range(<start>, <end>):
static std::unique_ptr<ast_statement> parse_for(token_reader &reader) {
    auto stm = std::make_unique<ast_statement_for>();
    stm->pos = reader.pop().pos;

    stm->iterator = tok_expect(reader.pop(), TOKEN_IDENTIFIER).str;
    tok_expect_word(reader.pop(), "in");
    tok_expect_word(reader.pop(), "range");
    tok_expect(reader.pop(), TOKEN_LPAREN);
    stm->start = parse_expression(reader);
    tok_expect(reader.pop(), TOKEN_COMMA);
    stm->end = parse_expression(reader);
    tok_expect(reader.pop(), TOKEN_RPAREN);

    stm->body = parse_block(reader);
    return stm;
}

// proc <name>(<param>: <type>, ...):
static std::unique_ptr<ast_statement> parse_proc(token_reader &reader) {
    auto stm = std::make_unique<ast_statement_proc>();
    stm->pos = reader.pop().pos;

    stm->name = tok_expect(reader.pop(), TOKEN_IDENTIFIER).str;
    tok_expect(reader.pop(), TOKEN_LPAREN);

    if (!reader.peek().is_a(TOKEN_RPAREN)) {
        while (true) {
            ast_param param;
            param.name = tok_expect(reader.pop(), TOKEN_IDENTIFIER).str;
            tok_expect(reader.pop(), TOKEN_COLON);
            param.type_name = tok_expect(reader.pop(), TOKEN_IDENTIFIER).str;
            stm->params.push_back(std::move(param));

            if (!reader.peek().is_a(TOKEN_COMMA)) break;
            reader.pop();
        }
    }

    tok_expect(reader.pop(), TOKEN_RPAREN);

    stm->body = std::make_shared<stmt_list>(parse_block(reader));
    return stm;
}

static std::unique_ptr<ast_statement> parse_return(token_reader &reader) {
    auto stm = std::make_unique<ast_statement_return>();
    stm->pos = reader.pop().pos;

    if (!reader.peek().is_a(TOKEN_NEWLINE)) {
        stm->expr = parse_expression(reader);
    }

    tok_expect(reader.pop(), TOKEN_NEWLINE);
    return stm;
}

static std::unique_ptr<ast_statement> parse_statement(token_reader &reader) {
    const token &tok = reader.peek();

    if (tok.is_a(TOKEN_IDENTIFIER)) {
        if (tok.str == "var" || tok.str == "let")
            return parse_var(reader);

        if (tok.str == "if")
            return parse_if(reader);

        if (tok.str == "for")
            return parse_for(reader);

        if (tok.str == "proc")
            return parse_proc(reader);

        if (tok.str == "return")
            return parse_return(reader);

        if (tok.str == "elif" || tok.str == "else") {
            throw parse_exception(
                tok.pos,
                "'" + tok.str + "' without a matching 'if'");
        }

        // assignment
        if (reader.peek(1).is_op("=")) {
            const token &id_tok = reader.pop();
            reader.pop(); // pop equals

            auto stm = std::make_unique<ast_statement_assign>();
            stm->pos = id_tok.pos;
            stm->target = id_tok.str;
            stm->value = parse_expression(reader);
            tok_expect(reader.pop(), TOKEN_NEWLINE);
            return stm;
        }
    }

    if (tok.is_a(TOKEN_INDENT)) {
        throw parse_exception(tok.pos, "unexpected indent");
    }

    // expression evaluation
    auto stm = std::make_unique<ast_statement_expr>();
    stm->pos = tok.pos;
    stm->expr = parse_expression(reader);
    tok_expect(reader.pop(), TOKEN_NEWLINE);
    return stm;
}

bool storie::ast::parse_ast(const std::vector<token> &tokens,
                            ast_program &program, script_error *error) {
    try {
        token_reader reader(tokens);

        while (!reader.eof()) {
            program.statements.push_back(parse_statement(reader));
        }
    } catch (const parse_exception &except) {
        if (error) {
            *error = script_error { ERROR_SYNTAX, except.pos, except.msg };
        }

        return false;
    }

    return true;
}

bool storie::compile_program(std::istream &istream, ast::ast_program &program,
                             script_error *error) {
    std::vector<token> tokens;
    if (!ast::parse_tokens(istream, tokens, error))
        return false;

    return ast::parse_ast(tokens, program, error);
}

bool storie::compile_program(const std::string &source,
                             ast::ast_program &program, script_error *error) {
    std::istringstream stream(source);
    return compile_program(stream, program, error);
}
