#include "storie/storie.hpp"
#include <gtest/gtest.h>
#include <sstream>

using namespace storie;
using namespace storie::ast;

static std::vector<token> lex(const std::string &source) {
    std::istringstream stream(source);
    std::vector<token> tokens;
    script_error error;

    bool ok = parse_tokens(stream, tokens, &error);
    EXPECT_TRUE(ok) << error.pos.line << ":" << error.pos.column << ": "
                    << error.errmsg;
    return tokens;
}

static bool lex_fails(const std::string &source, script_error *error) {
    std::istringstream stream(source);
    std::vector<token> tokens;
    return !parse_tokens(stream, tokens, error);
}

static std::vector<token_type> types_of(const std::vector<token> &tokens) {
    std::vector<token_type> out;
    for (auto &tok : tokens) out.push_back(tok.type);
    return out;
}

TEST(LexerTest, SimpleDeclaration) {
    auto tokens = lex("var x = 40\n");

    std::vector<token_type> expected {
        TOKEN_IDENTIFIER, TOKEN_IDENTIFIER, TOKEN_OPERATOR, TOKEN_INTEGER,
        TOKEN_NEWLINE, TOKEN_EOF
    };
    ASSERT_EQ(types_of(tokens), expected);

    EXPECT_EQ(tokens[0].str, "var");
    EXPECT_EQ(tokens[1].str, "x");
    EXPECT_EQ(tokens[2].str, "=");
    EXPECT_EQ(tokens[3].integer, 40);
    EXPECT_EQ(tokens[3].str, "40");
}

TEST(LexerTest, KeywordsAreIdentifiers) {
    auto tokens = lex("if not true and false:\n  return\n");

    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(tokens[i].type, TOKEN_IDENTIFIER) << "token " << i;
    }
    EXPECT_EQ(tokens[5].type, TOKEN_COLON);
}

TEST(LexerTest, TracksLineAndColumn) {
    auto tokens = lex("a\n  \nfoo(1, 2.5)\n");

    // a NL foo ( 1 , 2.5 ) NL EOF
    ASSERT_EQ(tokens.size(), 10u);
    EXPECT_EQ(tokens[2].str, "foo");
    EXPECT_EQ(tokens[2].pos.line, 3);
    EXPECT_EQ(tokens[2].pos.column, 1);
    EXPECT_EQ(tokens[6].type, TOKEN_FLOAT);
    EXPECT_EQ(tokens[6].pos.column, 8);
}

TEST(LexerTest, NumberLiterals) {
    auto tokens = lex("12 3.25 0.5\n");

    EXPECT_EQ(tokens[0].type, TOKEN_INTEGER);
    EXPECT_EQ(tokens[0].integer, 12);
    EXPECT_EQ(tokens[1].type, TOKEN_FLOAT);
    EXPECT_DOUBLE_EQ(tokens[1].number, 3.25);
    EXPECT_EQ(tokens[2].type, TOKEN_FLOAT);
    EXPECT_DOUBLE_EQ(tokens[2].number, 0.5);
}

TEST(LexerTest, StringsWithoutEscapes) {
    auto tokens = lex("print(\"it's\", 'say \"hi\"', 'a\\n')\n");

    EXPECT_EQ(tokens[2].type, TOKEN_STRING);
    EXPECT_EQ(tokens[2].str, "it's");
    EXPECT_EQ(tokens[4].str, "say \"hi\"");
    EXPECT_EQ(tokens[6].str, "a\\n");
}

TEST(LexerTest, Operators) {
    auto tokens = lex("a <= b != c == d >= e < f > g % h\n");

    std::vector<std::string> ops;
    for (auto &tok : tokens) {
        if (tok.is_a(TOKEN_OPERATOR)) ops.push_back(tok.str);
    }

    std::vector<std::string> expected { "<=", "!=", "==", ">=", "<", ">", "%" };
    EXPECT_EQ(ops, expected);
}

TEST(LexerTest, CommentsAndBlankLinesProduceNothing) {
    auto tokens = lex("\n\n# leading comment\nx # trailing\n\n   # indented comment\n");

    std::vector<token_type> expected { TOKEN_IDENTIFIER, TOKEN_NEWLINE, TOKEN_EOF };
    EXPECT_EQ(types_of(tokens), expected);
}

TEST(LexerTest, MissingFinalNewline) {
    auto tokens = lex("x");

    std::vector<token_type> expected { TOKEN_IDENTIFIER, TOKEN_NEWLINE, TOKEN_EOF };
    EXPECT_EQ(types_of(tokens), expected);
}

TEST(LexerTest, IndentAndDedent) {
    auto tokens = lex("if a:\n  b\nc\n");

    std::vector<token_type> expected {
        TOKEN_IDENTIFIER, TOKEN_IDENTIFIER, TOKEN_COLON, TOKEN_NEWLINE,
        TOKEN_INDENT, TOKEN_IDENTIFIER, TOKEN_NEWLINE,
        TOKEN_DEDENT, TOKEN_IDENTIFIER, TOKEN_NEWLINE,
        TOKEN_EOF
    };
    EXPECT_EQ(types_of(tokens), expected);
}

TEST(LexerTest, UnwindsSeveralLevelsAtOnce) {
    auto tokens = lex("if a:\n  if b:\n    c\nd\n");

    int dedents_before_d = 0;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (tokens[i].is_word("d")) {
            for (size_t k = i; k-- > 0 && tokens[k].is_a(TOKEN_DEDENT);)
                ++dedents_before_d;
        }
    }

    EXPECT_EQ(dedents_before_d, 2);
}

TEST(LexerTest, UnwindsAtEndOfInput) {
    auto tokens = lex("if a:\n  if b:\n    c\n");

    ASSERT_GE(tokens.size(), 3u);
    EXPECT_EQ(tokens[tokens.size() - 1].type, TOKEN_EOF);
    EXPECT_EQ(tokens[tokens.size() - 2].type, TOKEN_DEDENT);
    EXPECT_EQ(tokens[tokens.size() - 3].type, TOKEN_DEDENT);
}

TEST(LexerTest, BlankLinesInsideBlockKeepIndentation) {
    auto tokens = lex("if a:\n  b\n\n  c\n");

    int indents = 0, dedents = 0;
    for (auto &tok : tokens) {
        if (tok.is_a(TOKEN_INDENT)) ++indents;
        if (tok.is_a(TOKEN_DEDENT)) ++dedents;
    }

    EXPECT_EQ(indents, 1);
    EXPECT_EQ(dedents, 1);
}

TEST(LexerTest, IndentationMismatchIsAnError) {
    script_error error;
    ASSERT_TRUE(lex_fails("if a:\n    b\n  c\n", &error));

    EXPECT_EQ(error.kind, ERROR_LEXICAL);
    EXPECT_EQ(error.pos.line, 3);
}

TEST(LexerTest, InvalidCharacter) {
    script_error error;
    ASSERT_TRUE(lex_fails("x = 3 $ 4\n", &error));

    EXPECT_EQ(error.kind, ERROR_LEXICAL);
    EXPECT_EQ(error.pos.line, 1);
    EXPECT_EQ(error.pos.column, 7);
}

TEST(LexerTest, LoneBangIsInvalid) {
    script_error error;
    EXPECT_TRUE(lex_fails("!x\n", &error));
}

TEST(LexerTest, UnterminatedString) {
    script_error error;
    ASSERT_TRUE(lex_fails("x = \"abc\ny = 1\n", &error));

    EXPECT_EQ(error.kind, ERROR_LEXICAL);
    EXPECT_EQ(error.pos.line, 1);
    EXPECT_EQ(error.pos.column, 5);
}

TEST(LexerTest, MalformedNumbers) {
    script_error error;
    EXPECT_TRUE(lex_fails("x = 1.\n", &error));
    EXPECT_TRUE(lex_fails("x = 12abc\n", &error));
}

TEST(LexerTest, WideIntegersBecomeFloats) {
    auto tokens = lex("2147483647 2147483648 99999999999999999999\n");

    EXPECT_EQ(tokens[0].type, TOKEN_INTEGER);
    EXPECT_EQ(tokens[0].integer, 2147483647);

    EXPECT_EQ(tokens[1].type, TOKEN_FLOAT);
    EXPECT_DOUBLE_EQ(tokens[1].number, 2147483648.0);
    EXPECT_EQ(tokens[1].str, "2147483648");

    EXPECT_EQ(tokens[2].type, TOKEN_FLOAT);
    EXPECT_DOUBLE_EQ(tokens[2].number, 1e20);
}

TEST(LexerTest, TokenToStr) {
    auto tokens = lex("foo = 'bar'\n");

    EXPECT_EQ(token_to_str(tokens[0]), "identifier 'foo'");
    EXPECT_EQ(token_to_str(tokens[1]), "operator '='");
    EXPECT_EQ(token_to_str(tokens[2]), "string \"bar\"");
    EXPECT_EQ(token_to_str(tokens[3]), "newline");
}
