/****

Built-in Words
==============

The core knows nothing about arithmetic or stack shuffling.  Everything a
program does beyond pushing literals is a named function registered here, most
of them with a single-character operator alias.  Each one pulls its arguments
off the stack with the engine's typed accessors and pushes its results; a
failure is an `Error` thrown from inside the word, after which the engine puts
the stack back the way it was before the call.

For each word we note the stack effect in the usual Forth style, with the top
of the stack on the right.

****/

#include "builtins.h"

#include <cmath>
#include <iostream>
#include <memory>

namespace cxxstack {

namespace {

using Word = void(*)(Engine&);

// Largest double below which every integer is exact.
constexpr Number MaxExactInteger = 9007199254740992.0;

std::size_t popCount(Engine& engine, const char* what) {
    auto n = engine.popNumber();
    if (!(n >= 0) || n > MaxExactInteger || std::floor(n) != n)
        throw Error::invalidArgumentType(what, formatNumber(n));
    return static_cast<std::size_t>(n);
}

/****

Arithmetic and Comparison
-------------------------

Division and modulo follow IEEE rules, so dividing by zero gives an infinity
or NaN rather than an error.

****/

// add ( a b -- a+b )
void add(Engine& engine) {
    auto b = engine.popNumber();
    auto a = engine.popNumber();
    engine.push(Value::ofNumber(a + b));
}

// sub ( a b -- a-b )
void sub(Engine& engine) {
    auto b = engine.popNumber();
    auto a = engine.popNumber();
    engine.push(Value::ofNumber(a - b));
}

// mul ( a b -- a*b )
void mul(Engine& engine) {
    auto b = engine.popNumber();
    auto a = engine.popNumber();
    engine.push(Value::ofNumber(a * b));
}

// div ( a b -- a/b )
void divide(Engine& engine) {
    auto b = engine.popNumber();
    auto a = engine.popNumber();
    engine.push(Value::ofNumber(a / b));
}

// mod ( a b -- a%b )
void mod(Engine& engine) {
    auto b = engine.popNumber();
    auto a = engine.popNumber();
    engine.push(Value::ofNumber(std::fmod(a, b)));
}

// pow ( a b -- a^b )
void power(Engine& engine) {
    auto b = engine.popNumber();
    auto a = engine.popNumber();
    engine.push(Value::ofNumber(std::pow(a, b)));
}

// eq ( x y -- flag )
void equals(Engine& engine) {
    auto y = engine.pop();
    auto x = engine.pop();
    engine.push(Value::ofBoolean(x == y));
}

// lt ( a b -- flag )
void lessThan(Engine& engine) {
    auto b = engine.popNumber();
    auto a = engine.popNumber();
    engine.push(Value::ofBoolean(a < b));
}

// gt ( a b -- flag )
void greaterThan(Engine& engine) {
    auto b = engine.popNumber();
    auto a = engine.popNumber();
    engine.push(Value::ofBoolean(a > b));
}

// not ( x -- flag )
void logicalNot(Engine& engine) {
    engine.push(Value::ofBoolean(!engine.popBoolean()));
}

// and ( x y -- flag )
void logicalAnd(Engine& engine) {
    auto y = engine.popBoolean();
    auto x = engine.popBoolean();
    engine.push(Value::ofBoolean(x && y));
}

// or ( x y -- flag )
void logicalOr(Engine& engine) {
    auto y = engine.popBoolean();
    auto x = engine.popBoolean();
    engine.push(Value::ofBoolean(x || y));
}

/****

Stack Manipulation
------------------

****/

// dup ( x -- x x )
void dup(Engine& engine) {
    auto x = engine.pop();
    engine.push(x);
    engine.push(x);
}

// drop ( x -- )
void drop(Engine& engine) {
    engine.pop();
}

// swap ( x1 x2 -- x2 x1 )
void swap(Engine& engine) {
    auto x2 = engine.pop();
    auto x1 = engine.pop();
    engine.push(x2);
    engine.push(x1);
}

// over ( x1 x2 -- x1 x2 x1 )
void over(Engine& engine) {
    auto x2 = engine.pop();
    auto x1 = engine.pop();
    engine.push(x1);
    engine.push(x2);
    engine.push(x1);
}

// rot ( x1 x2 x3 -- x2 x3 x1 )
void rot(Engine& engine) {
    auto x3 = engine.pop();
    auto x2 = engine.pop();
    auto x1 = engine.pop();
    engine.push(x2);
    engine.push(x3);
    engine.push(x1);
}

// pick ( xu ... x0 u -- xu ... x0 xu )
void pick(Engine& engine) {
    auto index = popCount(engine, "index");
    auto value = engine.peekAt(index);
    engine.push(value);
}

// set ( xu ... x0 x u -- x ... x0 )
// Overwrites the value at depth u, counted after x and u are popped.
void set(Engine& engine) {
    auto index = popCount(engine, "index");
    auto value = engine.pop();
    engine.setAt(index, value);
}

// size ( -- n )
void size(Engine& engine) {
    auto depth = engine.stack().size();
    engine.push(Value::ofNumber(static_cast<Number>(depth)));
}

// clear ( i*x -- )
void clear(Engine& engine) {
    engine.clearStack();
}

/****

Control
-------

These are the higher-order words.  They take function references or blocks
off the stack and run them through `Engine::invoke()`, the same path the core
uses, so each inner call is rolled back on its own and a failure anywhere
unwinds the whole word.

****/

// exec ( i*x f -- j*x )
void exec(Engine& engine) {
    auto f = engine.pop();
    engine.invoke(f);
}

// if ( i*x flag f -- j*x )
void ifTrue(Engine& engine) {
    auto f = engine.pop();
    if (engine.popBoolean())
        engine.invoke(f);
}

// ifelse ( i*x flag f g -- j*x )
void ifElse(Engine& engine) {
    auto g = engine.pop();
    auto f = engine.pop();
    if (engine.popBoolean())
        engine.invoke(f);
    else
        engine.invoke(g);
}

// times ( i*x f n -- j*x )
void times(Engine& engine) {
    auto n = popCount(engine, "count");
    auto f = engine.pop();
    for (std::size_t i = 0; i < n; ++i)
        engine.invoke(f);
}

// while ( i*x body cond -- j*x )
// Runs cond, which must leave a flag, and then body, until the flag is false.
void whileLoop(Engine& engine) {
    auto cond = engine.pop();
    auto body = engine.pop();
    for (;;) {
        engine.invoke(cond);
        if (!engine.popBoolean())
            break;
        engine.invoke(body);
    }
}

/****

Extending the Registry
----------------------

Programs can add to the function table and the alias table while they run.
`def` turns a block into a named function; `alias` gives a name a
single-character operator, which the reader accepts from the next parse on.

****/

bool isReservedCharacter(char32_t c) {
    switch (c) {
    case U'(': case U'"': case U'[': case U'{': case U'}':
    case U' ': case U'\t': case U'\n': case U'\\':
    case U'.': case U'_': case U'T': case U'F':
        return true;
    default:
        return c >= U'0' && c <= U'9';
    }
}

// def ( block name -- )
void def(Engine& engine) {
    auto name = engine.popString();
    auto block = engine.popMacro();
    engine.define(name, std::make_shared<BlockFunction>(Value::ofBlock(std::move(block))));
}

// alias ( name char -- )
void alias(Engine& engine) {
    auto text = engine.popString();
    auto name = engine.popString();

    auto chars = decodeUtf8(text);
    if (chars.size() != 1 || isReservedCharacter(chars[0]))
        throw Error::invalidArgumentType("operator character", Value::ofString(text).str());

    engine.defineOperator(chars[0], name);
}

/****

Conversion
----------

****/

// str ( x -- string )
void toString(Engine& engine) {
    auto x = engine.pop();
    if (x.is(Value::Type::String))
        engine.push(x);
    else
        engine.push(Value::ofString(x.str()));
}

// num ( string -- n )
void toNumber(Engine& engine) {
    auto text = engine.popString();
    Number n;
    if (!parseNumber(text, n))
        throw Error::invalidNumberLit(text);
    engine.push(Value::ofNumber(n));
}

// print ( x -- )
void print(Engine& engine, std::ostream& out) {
    auto x = engine.pop();
    out << (x.is(Value::Type::String) ? x.text() : x.str()) << std::endl;
}

} // end anonymous namespace

void loadStandardLibrary(Engine& engine, std::ostream& out) {
    static const struct {
        char32_t    alias;
        const char* name;
        Word        code;
    } words[] = {
        // alias  name       code
        // ------------------------------
        {U'+',    "add",     add},
        {U'-',    "sub",     sub},
        {U'*',    "mul",     mul},
        {U'/',    "div",     divide},
        {U'%',    "mod",     mod},
        {U'^',    "pow",     power},
        {U'=',    "eq",      equals},
        {U'<',    "lt",      lessThan},
        {U'>',    "gt",      greaterThan},
        {U'~',    "not",     logicalNot},
        {U'&',    "and",     logicalAnd},
        {U'|',    "or",      logicalOr},
        {U':',    "dup",     dup},
        {U';',    "drop",    drop},
        {U'$',    "swap",    swap},
        {U'@',    "pick",    pick},
        {U'#',    "size",    size},
        {U'!',    "exec",    exec},
        {U'?',    "if",      ifTrue},
        {0,       "over",    over},
        {0,       "rot",     rot},
        {0,       "set",     set},
        {0,       "clear",   clear},
        {0,       "ifelse",  ifElse},
        {0,       "times",   times},
        {0,       "while",   whileLoop},
        {0,       "def",     def},
        {0,       "alias",   alias},
        {0,       "str",     toString},
        {0,       "num",     toNumber},
    };
    for (auto& w: words) {
        if (w.alias)
            engine.define(w.alias, w.name, native(w.code));
        else
            engine.define(w.name, native(w.code));
    }

    auto stream = &out;
    engine.define(U',', "print", native([stream](Engine& e) { print(e, *stream); }));
}

void loadStandardLibrary(Engine& engine) {
    loadStandardLibrary(engine, std::cout);
}

} // namespace cxxstack
