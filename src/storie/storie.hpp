#pragma once
#include <string>
#include <cstdint>
#include <istream>
#include <vector>
#include <utility>
#include <memory>

namespace storie {
    struct pos_info {
        int line; // 1-indexed
        int column; // 1-indexed
    };

    enum error_kind : uint8_t {
        ERROR_LEXICAL,
        ERROR_SYNTAX,
        ERROR_RUNTIME
    };

    struct script_error {
        error_kind kind;
        pos_info pos;
        std::string errmsg;
    };

    constexpr const char* error_kind_str(error_kind kind) {
        switch (kind) {
            case ERROR_LEXICAL:
                return "lexical error";

            case ERROR_SYNTAX:
                return "syntax error";

            case ERROR_RUNTIME:
                return "runtime error";

            default: return "???";
        }
    }

    namespace ast {
        // tokens
        enum token_type : uint8_t {
            TOKEN_INTEGER,
            TOKEN_FLOAT,
            TOKEN_STRING,
            TOKEN_IDENTIFIER,
            TOKEN_OPERATOR,
            TOKEN_LPAREN,
            TOKEN_RPAREN,
            TOKEN_COMMA,
            TOKEN_COLON,
            TOKEN_NEWLINE,
            TOKEN_INDENT,
            TOKEN_DEDENT,
            TOKEN_EOF
        };

        // keywords are plain identifiers as far as the lexer is concerned.
        // the parser gives them meaning by comparing the lexeme.
        struct token {
            token_type type;
            pos_info pos;

            std::string str; // lexeme, or string contents for TOKEN_STRING
            union {
                double number;
                int32_t integer;
            };

            static token make_integer(int32_t v, const std::string &lexeme,
                                      const pos_info &pos);
            static token make_float(double v, const std::string &lexeme,
                                    const pos_info &pos);
            static token make_string(const std::string &v, const pos_info &pos);
            static token make_identifier(const std::string &v,
                                         const pos_info &pos);
            static token make_operator(const std::string &v,
                                       const pos_info &pos);
            static token make_simple(token_type type, const pos_info &pos);

            constexpr bool is_a(token_type t) const noexcept {
                return type == t;
            }

            bool is_word(const char *word) const {
                return type == TOKEN_IDENTIFIER && str == word;
            }

            bool is_op(const char *op) const {
                return type == TOKEN_OPERATOR && str == op;
            }
        };

        constexpr const char* token_type_str(token_type type) {
            switch (type) {
                case TOKEN_INTEGER:
                    return "integer";

                case TOKEN_FLOAT:
                    return "float";

                case TOKEN_STRING:
                    return "string";

                case TOKEN_IDENTIFIER:
                    return "identifier";

                case TOKEN_OPERATOR:
                    return "operator";

                case TOKEN_LPAREN:
                    return "'('";

                case TOKEN_RPAREN:
                    return "')'";

                case TOKEN_COMMA:
                    return "','";

                case TOKEN_COLON:
                    return "':'";

                case TOKEN_NEWLINE:
                    return "newline";

                case TOKEN_INDENT:
                    return "indent";

                case TOKEN_DEDENT:
                    return "dedent";

                case TOKEN_EOF:
                    return "end of input";

                default: return "???";
            }
        }

        bool parse_tokens(std::istream &stream, std::vector<token> &tokens,
                          script_error *error);

        std::string token_to_str(const token &tok);

        // AST expressions
        enum ast_expr_type : uint8_t {
            EXPR_LITERAL,
            EXPR_IDENTIFIER,
            EXPR_UNOP, // ? X
            EXPR_BINOP, // X ? Y
            EXPR_CALL, // name(...)
        };

        enum ast_binop : uint8_t {
            EXPR_BINOP_ADD, // X + Y
            EXPR_BINOP_SUB, // X - Y
            EXPR_BINOP_MUL, // X * Y
            EXPR_BINOP_DIV, // X / Y
            EXPR_BINOP_MOD, // X % Y

            EXPR_BINOP_EQ, // X == Y
            EXPR_BINOP_NEQ, // X != Y
            EXPR_BINOP_LT, // X < Y
            EXPR_BINOP_LE, // X <= Y
            EXPR_BINOP_GT, // X > Y
            EXPR_BINOP_GE, // X >= Y

            EXPR_BINOP_AND, // X and Y
            EXPR_BINOP_OR, // X or Y
        };

        enum ast_unop : uint8_t {
            EXPR_UNOP_NEG, // -X
            EXPR_UNOP_NOT // not X
        };

        enum ast_literal_type : uint8_t {
            EXPR_LITERAL_INTEGER,
            EXPR_LITERAL_FLOAT,
            EXPR_LITERAL_STRING,
            EXPR_LITERAL_BOOL
        };

        const char* binop_to_str(ast_binop op);
        const char* unop_to_str(ast_unop op);

        struct ast_expr {
            ast_expr_type type;
            pos_info pos;

            virtual ~ast_expr() = default;
        };

        struct ast_expr_literal : public ast_expr {
            inline ast_expr_literal() { type = EXPR_LITERAL; }

            ast_literal_type literal_type;
            std::string str;
            union {
                int32_t intv;
                double floatv;
                bool boolv;
            };

            static inline std::unique_ptr<ast_expr_literal>
            make_int(pos_info pos, int32_t v) {
                auto ret = std::make_unique<ast_expr_literal>();
                ret->pos = pos;
                ret->literal_type = EXPR_LITERAL_INTEGER;
                ret->intv = v;
                return ret;
            }

            static inline std::unique_ptr<ast_expr_literal>
            make_float(pos_info pos, double v) {
                auto ret = std::make_unique<ast_expr_literal>();
                ret->pos = pos;
                ret->literal_type = EXPR_LITERAL_FLOAT;
                ret->floatv = v;
                return ret;
            }

            static inline std::unique_ptr<ast_expr_literal>
            make_string(pos_info pos, const std::string &v) {
                auto ret = std::make_unique<ast_expr_literal>();
                ret->pos = pos;
                ret->literal_type = EXPR_LITERAL_STRING;
                ret->str = v;
                return ret;
            }

            static inline std::unique_ptr<ast_expr_literal>
            make_bool(pos_info pos, bool v) {
                auto ret = std::make_unique<ast_expr_literal>();
                ret->pos = pos;
                ret->literal_type = EXPR_LITERAL_BOOL;
                ret->boolv = v;
                return ret;
            }
        };

        struct ast_expr_identifier : public ast_expr {
            inline ast_expr_identifier() { type = EXPR_IDENTIFIER; }

            std::string identifier;
        };

        struct ast_expr_unop : public ast_expr {
            inline ast_expr_unop() { type = EXPR_UNOP; }

            std::unique_ptr<ast_expr> expr;
            ast_unop op;
        };

        struct ast_expr_binop : public ast_expr {
            inline ast_expr_binop() { type = EXPR_BINOP; }

            std::unique_ptr<ast_expr> left;
            std::unique_ptr<ast_expr> right;
            ast_binop op;
        };

        struct ast_expr_call : public ast_expr {
            inline ast_expr_call() { type = EXPR_CALL; }

            std::string name;
            std::vector<std::unique_ptr<ast_expr>> arguments;
        };

        // AST statements
        enum ast_statement_type : uint8_t {
            STATEMENT_EXPR,
            STATEMENT_VAR, // var and let
            STATEMENT_ASSIGN,
            STATEMENT_IF,
            STATEMENT_FOR,
            STATEMENT_PROC,
            STATEMENT_RETURN
        };

        struct ast_statement {
            ast_statement_type type;
            pos_info pos;

            virtual ~ast_statement() = default;
        };

        typedef std::vector<std::unique_ptr<ast_statement>> stmt_list;

        struct ast_statement_expr : public ast_statement {
            inline ast_statement_expr() { type = STATEMENT_EXPR; }

            std::unique_ptr<ast_expr> expr;
        };

        struct ast_statement_var : public ast_statement {
            inline ast_statement_var() { type = STATEMENT_VAR; }

            std::string name;
            std::unique_ptr<ast_expr> value;
            bool is_let = false; // not enforced at runtime
        };

        struct ast_statement_assign : public ast_statement {
            inline ast_statement_assign() { type = STATEMENT_ASSIGN; }

            std::string target;
            std::unique_ptr<ast_expr> value;
        };

        struct ast_if_branch {
            std::unique_ptr<ast_expr> condition;
            stmt_list body;
        };

        struct ast_statement_if : public ast_statement {
            inline ast_statement_if() { type = STATEMENT_IF; }

            ast_if_branch if_branch;
            std::vector<ast_if_branch> elif_branches;
            stmt_list else_branch; // empty if there is no else
        };

        struct ast_statement_for : public ast_statement {
            inline ast_statement_for() { type = STATEMENT_FOR; }

            std::string iterator;
            std::unique_ptr<ast_expr> start;
            std::unique_ptr<ast_expr> end; // exclusive
            stmt_list body;
        };

        struct ast_param {
            std::string name;
            std::string type_name; // documentation only, never checked
        };

        struct ast_statement_proc : public ast_statement {
            inline ast_statement_proc() { type = STATEMENT_PROC; }

            std::string name;
            std::vector<ast_param> params;

            // shared so function values can outlive the program that
            // declared them
            std::shared_ptr<stmt_list> body;
        };

        struct ast_statement_return : public ast_statement {
            inline ast_statement_return() { type = STATEMENT_RETURN; }

            std::unique_ptr<ast_expr> expr; // nullptr returns nil
        };

        // AST root
        struct ast_program {
            stmt_list statements;
        };

        bool parse_ast(const std::vector<token> &tokens, ast_program &program,
                       script_error *error);
    } // namespace ast

    // tokenize and parse in one go
    bool compile_program(std::istream &istream, ast::ast_program &program,
                         script_error *error);
    bool compile_program(const std::string &source, ast::ast_program &program,
                         script_error *error);

    namespace story {
        // a fenced code block tagged as an event handler:
        //   ```nim on:render
        //   ...
        //   ```
        struct event_script {
            std::string event;
            std::string code;
            int line; // document line of the first code line
        };

        std::vector<event_script> extract_event_scripts(std::istream &stream);
    } // namespace story
} // namespace storie
