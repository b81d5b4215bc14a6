/****

cxxstack: A Small Concatenative Language in C++
===============================================

----

This is free and unencumbered software released into the public domain.

Anyone is free to copy, modify, publish, use, compile, sell, or distribute this
software, either in source code form or as a compiled binary, for any purpose,
commercial or non-commercial, and by any means.

In jurisdictions that recognize copyright laws, the author or authors of this
software dedicate any and all copyright interest in the software to the public
domain. We make this dedication for the benefit of the public at large and to
the detriment of our heirs and successors. We intend this dedication to be an
overt act of relinquishment in perpetuity of all present and future rights to
this software under copyright law.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT.  IN NO EVENT SHALL THE
AUTHORS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN
ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION
WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

For more information, please refer to <http://unlicense.org/>

----

A cxxstack program is a sequence of literals and operators.  Literals are
pushed onto a single operand stack; operators pop their arguments from that
stack and push their results.  There are no variables and no syntax beyond
the literal forms, so the whole interpreter is two pieces: a reader that turns
source text into a sequence of `Value`s, and an `Engine` that runs such a
sequence against the stack.

    1 2+              \ pushes 3 \
    {:*}"sq"[def]!    \ defines a function named sq \
    4[sq]!            \ pushes 16 \

This file holds the core.  The built-in words live in `builtins.cpp`, the stack
display in `output.cpp`, and the interactive shell in `main.cpp`.

****/

#include "cxxstack.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace cxxstack {

const char* version = "1.0.0";

/****

Text Utilities
--------------

The reader works on code points rather than bytes, so that cursor positions
and the single-character operator aliases stay correct when the source text
contains non-ASCII characters.  We decode UTF-8 ourselves; malformed bytes
become U+FFFD rather than errors, since the reader will reject them anyway as
unknown operators.

****/

namespace {

constexpr char32_t ReplacementCharacter = 0xFFFD;

bool isContinuationByte(unsigned char byte) {
    return (byte & 0xC0) == 0x80;
}

} // end anonymous namespace

std::u32string decodeUtf8(const std::string& text) {
    std::u32string result;
    result.reserve(text.size());

    std::size_t i = 0;
    const auto size = text.size();
    while (i < size) {
        auto lead = static_cast<unsigned char>(text[i]);

        std::size_t extra;
        char32_t codePoint;
        if (lead < 0x80) {
            result.push_back(lead);
            ++i;
            continue;
        }
        else if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            codePoint = lead & 0x1F;
        }
        else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            codePoint = lead & 0x0F;
        }
        else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            codePoint = lead & 0x07;
        }
        else {
            result.push_back(ReplacementCharacter);
            ++i;
            continue;
        }

        if (i + extra >= size) {
            result.push_back(ReplacementCharacter);
            ++i;
            continue;
        }

        bool valid = true;
        for (std::size_t k = 1; k <= extra; ++k) {
            auto byte = static_cast<unsigned char>(text[i + k]);
            if (!isContinuationByte(byte)) {
                valid = false;
                break;
            }
            codePoint = (codePoint << 6) | (byte & 0x3F);
        }

        if (!valid) {
            result.push_back(ReplacementCharacter);
            ++i;
            continue;
        }

        result.push_back(codePoint);
        i += extra + 1;
    }

    return result;
}

std::string encodeUtf8(char32_t codePoint) {
    std::string result;
    if (codePoint < 0x80) {
        result.push_back(static_cast<char>(codePoint));
    }
    else if (codePoint < 0x800) {
        result.push_back(static_cast<char>(0xC0 | (codePoint >> 6)));
        result.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    }
    else if (codePoint < 0x10000) {
        result.push_back(static_cast<char>(0xE0 | (codePoint >> 12)));
        result.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    }
    else {
        result.push_back(static_cast<char>(0xF0 | (codePoint >> 18)));
        result.push_back(static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    }
    return result;
}

std::string encodeUtf8(const std::u32string& codePoints) {
    std::string result;
    for (auto c: codePoints)
        result += encodeUtf8(c);
    return result;
}

std::size_t utf8Length(const std::string& text) {
    std::size_t length = 0;
    for (auto c: text) {
        if (!isContinuationByte(static_cast<unsigned char>(c)))
            ++length;
    }
    return length;
}

/****

Numbers are 64-bit floats.  `parseNumber()` accepts the usual decimal
spellings (`12`, `.5`, `-3e4`, `inf`, `nan`) but, unlike a bare `strtod()`,
rejects leading whitespace, hexadecimal forms and trailing characters, so that
a literal either parses completely or not at all.

`formatNumber()` produces the shortest digits that read back as the same
number and writes them without an exponent, so `3.0` displays as `3`, `1e3` as
`1000` and `0.1` as `0.1`.  The result is always something the reader accepts
as a number literal (negative numbers need the parenthesized form).

****/

bool parseNumber(const std::string& text, Number& result) {
    if (text.empty() || std::isspace(static_cast<unsigned char>(text[0])))
        return false;
    if (text.find_first_of("xXpP") != std::string::npos)
        return false;

    const char* begin = text.c_str();
    char* end = nullptr;
    auto value = std::strtod(begin, &end);
    if (end != begin + text.size())
        return false;

    result = value;
    return true;
}

std::string formatNumber(Number number) {
    if (std::isnan(number))
        return "NaN";
    if (std::isinf(number))
        return number > 0 ? "inf" : "-inf";
    if (number == 0.0)
        return std::signbit(number) ? "-0" : "0";

    // Shortest scientific form that reads back exactly.
    std::string scientific;
    for (int precision = 0; precision <= 16; ++precision) {
        std::ostringstream out;
        out << std::scientific << std::setprecision(precision) << number;
        scientific = out.str();
        if (std::strtod(scientific.c_str(), nullptr) == number)
            break;
    }

    // Spell it out positionally: "-1.25e+02" becomes "-125".
    auto negative = scientific[0] == '-';
    auto e = scientific.find('e');
    auto exponent = std::stoi(scientific.substr(e + 1));
    auto digits = scientific.substr(negative ? 1 : 0, e - (negative ? 1 : 0));
    digits.erase(std::remove(digits.begin(), digits.end(), '.'), digits.end());
    while (digits.size() > 1 && digits.back() == '0')
        digits.pop_back();

    auto point = exponent + 1;
    auto count = static_cast<int>(digits.size());
    std::string text;
    if (point <= 0)
        text = "0." + std::string(-point, '0') + digits;
    else if (point >= count)
        text = digits + std::string(point - count, '0');
    else
        text = digits.substr(0, point) + "." + digits.substr(point);

    return negative ? "-" + text : text;
}

/****

Values
------

A `Value` is a tagged union of the six kinds of thing that can sit on the
stack or in a token sequence.  We keep one member per payload rather than
reaching for a variant type; the tag says which member is meaningful.

A block's token sequence is held through a `shared_ptr<const Tokens>`.  Blocks
are immutable once read, so every copy of a block value can share one
sequence, and pushing a block or snapshotting the stack does not copy the code
inside it.

****/

namespace {

std::string quote(const std::string& text) {
    std::ostringstream out;
    out << '"';
    for (auto c: text) {
        switch (c) {
        case '"':  out << "\\\""; break;
        case '\\': out << "\\\\"; break;
        case '\n': out << "\\n";  break;
        case '\r': out << "\\r";  break;
        case '\t': out << "\\t";  break;
        default:
            if (static_cast<unsigned char>(c) < 0x20 || c == 0x7F)
                out << "\\u{" << std::hex << static_cast<int>(c) << std::dec << "}";
            else
                out << c;
            break;
        }
    }
    out << '"';
    return out.str();
}

} // end anonymous namespace

Value Value::ofString(std::string text) {
    Value v(Type::String);
    v.text_ = std::move(text);
    return v;
}

Value Value::ofNumber(Number number) {
    Value v(Type::Number);
    v.number_ = number;
    return v;
}

Value Value::ofFunctionRef(std::string name) {
    Value v(Type::FunctionRef);
    v.text_ = std::move(name);
    return v;
}

Value Value::ofBlock(Tokens tokens) {
    Value v(Type::Block);
    v.tokens_ = std::make_shared<const Tokens>(std::move(tokens));
    return v;
}

Value Value::ofOperator(char32_t character) {
    Value v(Type::Operator);
    v.character_ = character;
    return v;
}

Value Value::ofBoolean(bool boolean) {
    Value v(Type::Boolean);
    v.boolean_ = boolean;
    return v;
}

std::string Value::str() const {
    switch (type_) {
    case Type::String:
        return quote(text_);
    case Type::Number:
        return formatNumber(number_);
    case Type::FunctionRef:
        return "<fn " + text_ + ">";
    case Type::Block: {
        std::ostringstream out;
        out << "<mac " << static_cast<const void*>(tokens_.get()) << ">";
        return out.str();
    }
    case Type::Operator:
        return "<sym '" + encodeUtf8(character_) + "'>";
    case Type::Boolean:
        return boolean_ ? "(true)" : "(false)";
    }
    return "<?>";
}

bool Value::operator==(const Value& other) const {
    if (type_ != other.type_)
        return false;

    switch (type_) {
    case Type::String:
    case Type::FunctionRef:
        return text_ == other.text_;
    case Type::Number:
        return number_ == other.number_;
    case Type::Block:
        return tokens_ == other.tokens_ || *tokens_ == *other.tokens_;
    case Type::Operator:
        return character_ == other.character_;
    case Type::Boolean:
        return boolean_ == other.boolean_;
    }
    return false;
}

std::ostream& operator<<(std::ostream& out, const Value& value) {
    return out << value.str();
}

/****

Errors
------

Like the `AbortException` of a Forth outer interpreter, our errors are C++
exceptions.  `Error` is what a built-in function throws; it carries one of a
closed set of kinds plus whatever details that kind needs, and its `what()`
is ready to show to the user.

Two wrappers add context on the way out.  `ParseError` adds the character
offset where the reader gave up.  `EvalError` adds a copy of the stack as the
failing function left it (the live stack has already been rolled back by then)
and, when the failure came from an operator in the source, that operator.

****/

Error::Error(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind)
{
}

Error Error::unknownFunction(const std::string& name) {
    Error e(ErrorKind::UnknownFunction, "unknown function: " + name);
    e.detail_ = name;
    return e;
}

Error Error::invalidArgumentType(const std::string& expected, const std::string& actual) {
    Error e(ErrorKind::InvalidArgumentType,
            "invalid argument type: expected " + expected + ", got " + actual);
    e.detail_ = expected;
    e.actual_ = actual;
    return e;
}

Error Error::invalidNumberLit(const std::string& text) {
    Error e(ErrorKind::InvalidNumberLit, "invalid number literal: " + text);
    e.detail_ = text;
    return e;
}

Error Error::outOfBounds(std::size_t index, std::size_t length) {
    Error e(ErrorKind::OutOfBounds,
            "index " + std::to_string(index) + " out of bounds (stack length "
            + std::to_string(length) + ")");
    e.index_ = index;
    e.length_ = length;
    return e;
}

Error Error::notEnoughArguments() {
    return Error(ErrorKind::NotEnoughArguments, "not enough arguments");
}

Error Error::invalidBoolean(const Value& value) {
    Error e(ErrorKind::InvalidBoolean, "cannot use " + value.str() + " as a boolean");
    e.value_ = value;
    return e;
}

ParseError::ParseError(const Error& error)
    : std::runtime_error(error.what()), hasPosition_(false), position_(0), error_(error)
{
}

ParseError::ParseError(std::size_t position, const Error& error)
    : std::runtime_error("at character " + std::to_string(position) + ": " + error.what()),
      hasPosition_(true), position_(position), error_(error)
{
}

EvalError::EvalError(Stack stack, const Error& error)
    : std::runtime_error(error.what()),
      stack_(std::move(stack)), hasToken_(false), token_(Value::ofBoolean(false)), error_(error)
{
}

EvalError::EvalError(Stack stack, const Value& token, const Error& error)
    : std::runtime_error(token.str() + ": " + error.what()),
      stack_(std::move(stack)), hasToken_(true), token_(token), error_(error)
{
}

/****

Functions
---------

Every named function is an object implementing `Function::execute()`.  The
registry holds them through `shared_ptr`, and the engine copies that pointer
before making a call, so a function that redefines itself (or anything else)
while it runs keeps running the code it started with.

****/

void NativeFunction::execute(Engine& engine) const {
    code_(engine);
}

void BlockFunction::execute(Engine& engine) const {
    engine.invoke(block_);
}

FunctionPtr native(NativeCode code) {
    return std::make_shared<NativeFunction>(std::move(code));
}

/****

The Reader
----------

`parse()` makes a single left-to-right pass over the source with an explicit
cursor.  The character under the cursor picks the lexical form:

- a digit, `.` or `_` starts a number; underscores are separators and are
  dropped before conversion
- `(` starts an alternate number spelling that runs to the next `)`, handy for
  signs and exponents: `(-1.5e3)`
- `"` starts a string that runs to the next `"`; there are no escapes
- `[` starts a function reference that runs to the next `]`
- `{` starts a block, read by a recursive call
- `}` ends the current level
- space, tab, carriage return and newline are skipped
- `\` starts a comment that ends at the next `\` or newline
- `T` and `F` are the boolean literals
- anything else must be a registered operator alias

The recursive call for a block starts just past the `{` and returns how far
it got, relative to where it started, when it meets the closing `}`.  The
outer level then skips that many characters plus the two braces.  At the top
level a stray `}` simply ends the parse; whatever follows it is ignored.

Operator characters are checked against the alias table as it is when the
text is read.  The language grows by defining new single-character operators,
and a character is only valid once something has claimed it.

****/

namespace {

bool isNumberCharacter(char32_t c) {
    return (c >= U'0' && c <= U'9') || c == U'.' || c == U'_';
}

template<typename Predicate>
std::size_t chomp(const std::u32string& chars, std::size_t from, Predicate until) {
    while (from < chars.size() && !until(chars[from]))
        ++from;
    return from;
}

Number numberLiteral(const std::string& raw, std::size_t position) {
    auto text = raw;
    text.erase(std::remove(text.begin(), text.end(), '_'), text.end());

    Number number;
    if (!parseNumber(text, number))
        throw ParseError(position, Error::invalidNumberLit(raw));
    return number;
}

std::string quotedCharacter(char32_t c) {
    return "'" + encodeUtf8(c) + "'";
}

} // end anonymous namespace

ParseResult Engine::parse(const std::string& source) const {
    auto chars = decodeUtf8(source);

    ParseResult result;
    auto cursor = parseFrom(chars, 0, result.tokens);
    result.cursor = std::min(cursor, chars.size());
    return result;
}

std::size_t Engine::parseFrom(const std::u32string& chars, std::size_t begin, Tokens& tokens) const {
    const auto length = chars.size();
    auto i = begin;

    while (i < length) {
        auto c = chars[i];

        if (isNumberCharacter(c)) {
            auto end = chomp(chars, i, [](char32_t ch) { return !isNumberCharacter(ch); });
            auto raw = encodeUtf8(chars.substr(i, end - i));
            i = end;
            tokens.push_back(Value::ofNumber(numberLiteral(raw, i)));
            continue;
        }

        switch (c) {
        case U'(': {
            auto end = chomp(chars, i + 1, [](char32_t ch) { return ch == U')'; });
            auto raw = encodeUtf8(chars.substr(i + 1, end - i - 1));
            i = end + 1;
            tokens.push_back(Value::ofNumber(numberLiteral(raw, i)));
            break;
        }

        case U'"': {
            auto end = chomp(chars, i + 1, [](char32_t ch) { return ch == U'"'; });
            tokens.push_back(Value::ofString(encodeUtf8(chars.substr(i + 1, end - i - 1))));
            i = end + 1;
            break;
        }

        case U'[': {
            auto end = chomp(chars, i + 1, [](char32_t ch) { return ch == U']'; });
            tokens.push_back(Value::ofFunctionRef(encodeUtf8(chars.substr(i + 1, end - i - 1))));
            i = end + 1;
            break;
        }

        case U'{': {
            Tokens inner;
            auto consumed = parseFrom(chars, i + 1, inner);
            tokens.push_back(Value::ofBlock(std::move(inner)));
            i += consumed + 2;
            break;
        }

        case U'}':
            return i - begin;

        case U' ':
        case U'\t':
        case U'\n':
            ++i;
            break;

        case U'\\':
            i = chomp(chars, i + 1, [](char32_t ch) { return ch == U'\n' || ch == U'\\'; }) + 1;
            break;

        case U'T':
            tokens.push_back(Value::ofBoolean(true));
            ++i;
            break;

        case U'F':
            tokens.push_back(Value::ofBoolean(false));
            ++i;
            break;

        default:
            if (!hasOperator(c))
                throw ParseError(i, Error::unknownFunction(quotedCharacter(c)));
            tokens.push_back(Value::ofOperator(c));
            ++i;
            break;
        }
    }

    return i - begin;
}

/****

The Engine
----------

`evaluate()` walks a token sequence.  Literals, including function references
and blocks, are pushed as they are.  Only an operator token runs anything: its
alias is looked up now, not when the text was read, and the named function is
executed.  If that fails, the error picks up the operator so the user can see
which symbol broke.

Effects of tokens that completed before the failure stay on the stack.  Only
the failing call itself is undone.

****/

void Engine::evaluate(const Tokens& tokens) {
    for (const auto& token: tokens) {
        if (!token.is(Value::Type::Operator)) {
            push(token);
            continue;
        }

        auto alias = operators_.find(token.character());
        if (alias == operators_.end())
            throw EvalError(stack_, token, Error::unknownFunction(quotedCharacter(token.character())));

        try {
            execute(Value::ofFunctionRef(alias->second));
        }
        catch (const EvalError& ex) {
            throw EvalError(ex.stack(), token, ex.error());
        }
    }
}

/****

`execute()` is where calls become transactional.  Before calling a named
function we copy the stack.  If the function throws, whatever it left on the
stack is kept for the error report and the copy becomes the live stack again,
so a half-finished call never shows through to the next command.

A block is run by evaluating its tokens.  The calls inside it are each
transactional on their own; a failure is passed up with its kind and
diagnostic stack but without the inner operator.

****/

void Engine::execute(const Value& callable) {
    switch (callable.type()) {
    case Value::Type::FunctionRef: {
        auto found = functions_.find(callable.text());
        if (found == functions_.end())
            throw EvalError(stack_, Error::unknownFunction(callable.text()));

        auto function = found->second;
        auto backup = stack_;
        try {
            function->execute(*this);
        }
        catch (const Error& ex) {
            auto failed = std::move(stack_);
            stack_ = std::move(backup);
            throw EvalError(std::move(failed), ex);
        }
        catch (const EvalError& ex) {
            auto failed = std::move(stack_);
            stack_ = std::move(backup);
            throw EvalError(std::move(failed), ex.error());
        }
        catch (...) {
            stack_ = std::move(backup);
            throw;
        }
        break;
    }

    case Value::Type::Block: {
        auto block = callable;
        try {
            evaluate(block.tokens());
        }
        catch (const EvalError& ex) {
            throw EvalError(ex.stack(), ex.error());
        }
        break;
    }

    default:
        throw EvalError(stack_, Error::invalidArgumentType("macro/function", callable.str()));
    }
}

// Public entry point for built-ins: failures are reported by kind only.
void Engine::invoke(const Value& callable) {
    try {
        execute(callable);
    }
    catch (const EvalError& ex) {
        throw ex.error();
    }
}

void Engine::define(const std::string& name, FunctionPtr function) {
    functions_[name] = std::move(function);
}

void Engine::define(char32_t alias, const std::string& name, FunctionPtr function) {
    operators_[alias] = name;
    define(name, std::move(function));
}

void Engine::defineOperator(char32_t alias, const std::string& name) {
    operators_[alias] = name;
}

bool Engine::hasFunction(const std::string& name) const {
    return functions_.find(name) != functions_.end();
}

std::vector<std::string> Engine::functionNames() const {
    std::vector<std::string> names;
    names.reserve(functions_.size());
    for (const auto& entry: functions_)
        names.push_back(entry.first);
    return names;
}

bool Engine::hasOperator(char32_t alias) const {
    return operators_.find(alias) != operators_.end();
}

/****

Stack Primitives
----------------

These are the accessors every built-in is written with.  The typed `pop`
variants remove the value before checking its type, so a mismatch leaves the
value gone; callers that want to look first use `peekAt()`.

`popBoolean()` is looser than the others: empty strings and zero are false,
other strings and numbers are true.

Depth indexes count from the top, 0 being the most recently pushed value.

****/

void Engine::push(Value value) {
    stack_.push_back(std::move(value));
}

Value Engine::pop() {
    if (stack_.empty())
        throw Error::notEnoughArguments();

    auto value = std::move(stack_.back());
    stack_.pop_back();
    return value;
}

Number Engine::popNumber() {
    auto value = pop();
    if (!value.is(Value::Type::Number))
        throw Error::invalidArgumentType("number", value.str());
    return value.number();
}

std::string Engine::popString() {
    auto value = pop();
    if (!value.is(Value::Type::String))
        throw Error::invalidArgumentType("string", value.str());
    return value.text();
}

Tokens Engine::popMacro() {
    auto value = pop();
    if (!value.is(Value::Type::Block))
        throw Error::invalidArgumentType("macro", value.str());
    return value.tokens();
}

bool Engine::popBoolean() {
    auto value = pop();
    switch (value.type()) {
    case Value::Type::String:
        return !value.text().empty();
    case Value::Type::Number:
        return value.number() != 0.0;
    case Value::Type::Boolean:
        return value.boolean();
    default:
        throw Error::invalidBoolean(value);
    }
}

const Value& Engine::peekAt(std::size_t index) const {
    if (index >= stack_.size())
        throw Error::outOfBounds(index, stack_.size());
    return stack_[stack_.size() - 1 - index];
}

void Engine::setAt(std::size_t index, Value value) {
    if (index >= stack_.size())
        throw Error::outOfBounds(index, stack_.size());
    stack_[stack_.size() - 1 - index] = std::move(value);
}

} // namespace cxxstack
