//
// reader_tests.cpp
//
// Turning source text into tokens.
//

#include "cxxstack.h"

#include <catch2/catch.hpp>

using namespace cxxstack;

namespace {

Tokens read(const Engine& engine, const std::string& source) {
    return engine.parse(source).tokens;
}

ParseError parseFailure(const Engine& engine, const std::string& source) {
    try {
        engine.parse(source);
    }
    catch (const ParseError& ex) {
        return ex;
    }
    FAIL("expected a parse error for: " << source);
    throw std::logic_error("unreachable");
}

} // end anonymous namespace


TEST_CASE("Number literals", "[reader]") {
    Engine engine;

    CHECK(read(engine, "42") == Tokens{Value::ofNumber(42)});
    CHECK(read(engine, ".5") == Tokens{Value::ofNumber(0.5)});
    CHECK(read(engine, "12 34") == (Tokens{Value::ofNumber(12), Value::ofNumber(34)}));
    CHECK(read(engine, "1_000.5") == read(engine, "1000.5"));
    CHECK(read(engine, "1_000_000") == Tokens{Value::ofNumber(1000000)});
}

TEST_CASE("Malformed number literals", "[reader]") {
    Engine engine;

    auto dot = parseFailure(engine, ".");
    CHECK(dot.error().kind() == ErrorKind::InvalidNumberLit);
    CHECK(dot.error().detail() == ".");

    auto twoDots = parseFailure(engine, "1 1.2.3");
    CHECK(twoDots.error().kind() == ErrorKind::InvalidNumberLit);
    CHECK(twoDots.error().detail() == "1.2.3");
    CHECK(twoDots.hasPosition());
    CHECK(twoDots.position() == 7);

    // The raw text keeps its underscores.
    auto underscore = parseFailure(engine, "_");
    CHECK(underscore.error().detail() == "_");
}

TEST_CASE("Parenthesized numbers", "[reader]") {
    Engine engine;

    CHECK(read(engine, "(-2.5)") == Tokens{Value::ofNumber(-2.5)});
    CHECK(read(engine, "(1e3)") == Tokens{Value::ofNumber(1000)});
    CHECK(read(engine, "(1_0)") == Tokens{Value::ofNumber(10)});

    auto bad = parseFailure(engine, "(abc)");
    CHECK(bad.error().kind() == ErrorKind::InvalidNumberLit);
    CHECK(bad.error().detail() == "abc");

    CHECK(parseFailure(engine, "( 1)").error().kind() == ErrorKind::InvalidNumberLit);
    CHECK(parseFailure(engine, "(0x10)").error().kind() == ErrorKind::InvalidNumberLit);
}

TEST_CASE("Strings keep their characters exactly", "[reader]") {
    Engine engine;

    CHECK(read(engine, R"("hello, world")") == Tokens{Value::ofString("hello, world")});
    CHECK(read(engine, R"("a\nb")") == Tokens{Value::ofString("a\\nb")});
    CHECK(read(engine, R"("")") == Tokens{Value::ofString("")});
    CHECK(read(engine, R"("{1 [x] T}")") == Tokens{Value::ofString("{1 [x] T}")});
}

TEST_CASE("Function references are not checked at read time", "[reader]") {
    Engine engine;

    CHECK(read(engine, "[add]") == Tokens{Value::ofFunctionRef("add")});
    CHECK(read(engine, "[no such thing]") == Tokens{Value::ofFunctionRef("no such thing")});
}

TEST_CASE("Nested blocks", "[reader]") {
    Engine engine;

    auto tokens = read(engine, "{1 2{3}4}");
    REQUIRE(tokens.size() == 1);
    REQUIRE(tokens[0].is(Value::Type::Block));

    Tokens expected{
        Value::ofNumber(1),
        Value::ofNumber(2),
        Value::ofBlock(Tokens{Value::ofNumber(3)}),
        Value::ofNumber(4),
    };
    CHECK(tokens[0].tokens() == expected);

    CHECK(read(engine, "{}") == Tokens{Value::ofBlock(Tokens{})});
    CHECK(read(engine, "{{}}5") == (Tokens{Value::ofBlock(Tokens{Value::ofBlock(Tokens{})}), Value::ofNumber(5)}));
}

TEST_CASE("A stray closing brace ends the parse", "[reader]") {
    Engine engine;

    auto result = engine.parse("1 2}3");
    CHECK(result.tokens == (Tokens{Value::ofNumber(1), Value::ofNumber(2)}));
    CHECK(result.cursor == 3);
}

TEST_CASE("Whitespace and comments", "[reader]") {
    Engine engine;
    Tokens oneTwo{Value::ofNumber(1), Value::ofNumber(2)};

    CHECK(read(engine, " \t1\n2 ") == oneTwo);
    CHECK(read(engine, "1 \\ a comment \\ 2") == oneTwo);
    CHECK(read(engine, "1 \\ to the end of the line\n2") == oneTwo);
    CHECK(read(engine, "1 2 \\ unterminated") == oneTwo);
}

TEST_CASE("A carriage return is not whitespace", "[reader]") {
    Engine engine;

    auto failure = parseFailure(engine, "1\r\n2");
    CHECK(failure.error().kind() == ErrorKind::UnknownFunction);
    CHECK(failure.error().detail() == "'\r'");
    CHECK(failure.position() == 1);
}

TEST_CASE("Boolean literals", "[reader]") {
    Engine engine;

    CHECK(read(engine, "T F") == (Tokens{Value::ofBoolean(true), Value::ofBoolean(false)}));
    CHECK(read(engine, "TF") == (Tokens{Value::ofBoolean(true), Value::ofBoolean(false)}));
}

TEST_CASE("Operators must be registered aliases", "[reader]") {
    Engine engine;
    engine.defineOperator(U'+', "add");

    CHECK(read(engine, "1 2+") ==
          (Tokens{Value::ofNumber(1), Value::ofNumber(2), Value::ofOperator(U'+')}));

    auto unknown = parseFailure(engine, "1 ?");
    CHECK(unknown.error().kind() == ErrorKind::UnknownFunction);
    CHECK(unknown.error().detail() == "'?'");
    CHECK(unknown.position() == 2);
    CHECK(std::string(unknown.what()) == "at character 2: unknown function: '?'");

    // Positions inside blocks count from the start of the whole input.
    CHECK(parseFailure(engine, "{1 ?}").position() == 3);
}

TEST_CASE("Operator aliases need no function behind them at read time", "[reader]") {
    Engine engine;
    engine.defineOperator(U'%', "not yet defined");

    CHECK(read(engine, "%") == Tokens{Value::ofOperator(U'%')});
}

TEST_CASE("Cursor positions count code points", "[reader]") {
    Engine engine;
    engine.defineOperator(U'\u03BB', "lambda");

    // "é" λ
    CHECK(read(engine, "\"\xC3\xA9\"\xCE\xBB") ==
          (Tokens{Value::ofString("\xC3\xA9"), Value::ofOperator(U'\u03BB')}));

    // "éé" ¿
    auto unknown = parseFailure(engine, "\"\xC3\xA9\xC3\xA9\" \xC2\xBF");
    CHECK(unknown.position() == 5);
    CHECK(unknown.error().detail() == "'\xC2\xBF'");
}

TEST_CASE("Malformed UTF-8 reads as replacement characters", "[reader]") {
    Engine engine;
    const std::string replacement = "'\xEF\xBF\xBD'";

    auto stray = parseFailure(engine, "\x80");
    CHECK(stray.error().kind() == ErrorKind::UnknownFunction);
    CHECK(stray.error().detail() == replacement);
    CHECK(stray.position() == 0);

    auto truncated = parseFailure(engine, "1 \xCE");
    CHECK(truncated.error().detail() == replacement);
    CHECK(truncated.position() == 2);

    // A broken sequence costs one position; the byte after it is read normally.
    auto broken = parseFailure(engine, "\xCE" "1");
    CHECK(broken.error().detail() == replacement);
    CHECK(broken.position() == 0);

    CHECK(decodeUtf8("\xCE" "1") == std::u32string{0xFFFD, U'1'});
    CHECK(read(engine, "\"\xCE\"") == Tokens{Value::ofString("\xEF\xBF\xBD")});
}

TEST_CASE("Unterminated forms run to the end of input", "[reader]") {
    Engine engine;

    auto string = engine.parse("\"abc");
    CHECK(string.tokens == Tokens{Value::ofString("abc")});
    CHECK(string.cursor == 4);

    CHECK(read(engine, "[abc") == Tokens{Value::ofFunctionRef("abc")});
    CHECK(read(engine, "{1 2") ==
          Tokens{Value::ofBlock(Tokens{Value::ofNumber(1), Value::ofNumber(2)})});
}

TEST_CASE("Rendering literals", "[reader][value]") {
    Engine engine;

    CHECK(read(engine, "3.0")[0].str() == "3");
    CHECK(read(engine, "1_000.5")[0].str() == "1000.5");
    CHECK(read(engine, ".1")[0].str() == "0.1");
    CHECK(read(engine, "\"say \\hi\"")[0].str() == R"("say \\hi")");
    CHECK(read(engine, "[add]")[0].str() == "<fn add>");
    CHECK(read(engine, "T")[0].str() == "(true)");
    CHECK(read(engine, "F")[0].str() == "(false)");
    CHECK(read(engine, "{1}")[0].str().compare(0, 5, "<mac ") == 0);

    CHECK(Value::ofOperator(U'+').str() == "<sym '+'>");
    CHECK(Value::ofString("tab\there").str() == R"("tab\there")");
    CHECK(Value::ofString("a\"b").str() == R"("a\"b")");
    CHECK(Value::ofNumber(-0.0).str() == "-0");
}

TEST_CASE("Numbers render without an exponent", "[reader][value]") {
    Engine engine;

    CHECK(read(engine, "10")[0].str() == "10");
    CHECK(read(engine, "20")[0].str() == "20");
    CHECK(read(engine, "100000")[0].str() == "100000");
    CHECK(read(engine, "1_000")[0].str() == "1000");
    CHECK(read(engine, "(1e21)")[0].str() == "1000000000000000000000");
    CHECK(read(engine, "(1.5e-7)")[0].str() == "0.00000015");
    CHECK(read(engine, "(-2.5)")[0].str() == "-2.5");
    CHECK(read(engine, "123.456")[0].str() == "123.456");
    CHECK(formatNumber(-1250) == "-1250");

    // What is shown can be typed back in.
    for (auto text: {"10", "1_000", "0.1", "(1e21)", "(1.5e-7)", "(2e-300)", "12345.678"}) {
        auto number = read(engine, text)[0];
        CHECK(read(engine, number.str()) == Tokens{number});
    }
}
