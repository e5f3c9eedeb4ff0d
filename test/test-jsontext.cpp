#include "jsontext.hpp"
#include "test-util.hpp"

#include <catch2/catch.hpp>

using namespace JsonMut;

TEST_CASE( "Tokenizer reports strings, numbers, literals and punctuation" )
{
    Bytes doc = B("{\"a\": [1, -2.5e3, true, null]}");
    auto tokens = scanTokens(doc);

    REQUIRE( tokens.size() == 13 );
    REQUIRE( tokens[0].kind == TokenKind::Punct );
    REQUIRE( tokens[1].kind == TokenKind::String );
    REQUIRE( S(Bytes(doc.begin() + tokens[1].begin,
                     doc.begin() + tokens[1].end)) == "\"a\"" );
    REQUIRE( tokens[4].kind == TokenKind::Number );
    REQUIRE( tokens[6].kind == TokenKind::Number );
    REQUIRE( tokens[6].size() == 6 );
    REQUIRE( isLiteral(doc, tokens[8], "true") );
    REQUIRE( isLiteral(doc, tokens[10], "null") );
    REQUIRE_FALSE( isLiteral(doc, tokens[10], "true") );
}


TEST_CASE( "Tokenizer survives broken and binary input" )
{
    Bytes broken = B("{\"a\":\"unterminated \\\" still");
    auto tokens = scanTokens(broken);

    REQUIRE( tokens.back().kind == TokenKind::String );
    REQUIRE_FALSE( tokens.back().terminated );
    REQUIRE( tokens.back().end == broken.size() );

    Bytes binary = {0xff, 0x00, 0xfe, '{', 0x80};
    tokens = scanTokens(binary);
    REQUIRE( tokens.size() == 5 );
    REQUIRE( tokens[0].kind == TokenKind::Invalid );
    REQUIRE( tokens[3].kind == TokenKind::Punct );

    REQUIRE( scanTokens(Bytes{}).empty() );
}


TEST_CASE( "Nesting depth ignores brackets inside strings" )
{
    REQUIRE( nestingDepth(B("[]")) == 1 );
    REQUIRE( nestingDepth(B("{\"a\":[[1]],\"b\":{}}")) == 3 );
    REQUIRE( nestingDepth(B("[\"[[[[\"]")) == 1 );
    REQUIRE( nestingDepth(B("]]]")) == 0 );
    REQUIRE( nestingDepth(B("42")) == 0 );
}


TEST_CASE( "Validity check rejects documents nested past the parse limit" )
{
    std::string ok(MAX_PARSE_DEPTH, '[');
    ok += std::string(MAX_PARSE_DEPTH, ']');
    REQUIRE( isValidJson(B(ok)) );

    std::string deep(MAX_PARSE_DEPTH + 1, '[');
    deep += std::string(MAX_PARSE_DEPTH + 1, ']');
    REQUIRE_FALSE( isValidJson(B(deep)) );
    REQUIRE_FALSE( parseJson(B(deep)).has_value() );
}


TEST_CASE( "Validity check" )
{
    REQUIRE( isValidJson(B("{}")) );
    REQUIRE( isValidJson(B(" [1, 2, {\"x\": null}] ")) );
    REQUIRE( isValidJson(B("\"s\"")) );
    REQUIRE_FALSE( isValidJson(Bytes{}) );
    REQUIRE_FALSE( isValidJson(B("{")) );
    REQUIRE_FALSE( isValidJson(B("[1,]")) );
    REQUIRE_FALSE( isValidJson(Bytes{0xff, 0xfe}) );
}


TEST_CASE( "Dump respects the size bound" )
{
    auto doc = parseJson(B("{\"key\":[1,2,3]}"));
    REQUIRE( doc.has_value() );

    auto fits = dumpJson(*doc, 64);
    REQUIRE( fits.has_value() );
    REQUIRE( S(*fits) == "{\"key\":[1,2,3]}" );
    REQUIRE_FALSE( dumpJson(*doc, 5).has_value() );
}


TEST_CASE( "Clip and placeholder" )
{
    Bytes data = B("abcdef");
    REQUIRE( S(clip(data, 3)) == "abc" );
    REQUIRE( clip(data, 100) == data );
    REQUIRE( clip(data, 0).empty() );

    REQUIRE( S(placeholder(10)) == "{}" );
    REQUIRE( S(placeholder(1)) == "{" );
    REQUIRE( placeholder(0).empty() );
}


TEST_CASE( "Span replacement" )
{
    Bytes data = B("[true]");
    REQUIRE( S(replaceSpan(data, 1, 5, "false")) == "[false]" );
    REQUIRE( S(replaceSpan(data, 1, 1, "0,")) == "[0,true]" );
}
