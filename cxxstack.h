#ifndef cxxstack_hpp_included
#define cxxstack_hpp_included

#include "cxxstackconfig.h"

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace cxxstack {

extern const char* version;

using Number = double;

class Value;
using Tokens = std::vector<Value>;
using Stack = std::vector<Value>;

/// A literal, operator or deferred block. Blocks share their token sequence,
/// so copying a Value is cheap.
class Value {
public:
    enum class Type {
        String,
        Number,
        FunctionRef,
        Block,
        Operator,
        Boolean
    };

    static Value ofString(std::string text);
    static Value ofNumber(Number number);
    static Value ofFunctionRef(std::string name);
    static Value ofBlock(Tokens tokens);
    static Value ofOperator(char32_t character);
    static Value ofBoolean(bool boolean);

    Type type() const { return type_; }
    bool is(Type type) const { return type_ == type; }

    // Payload accessors. Each is only meaningful for the matching type().
    const std::string& text() const { return text_; }
    Number number() const { return number_; }
    const Tokens& tokens() const { return *tokens_; }
    char32_t character() const { return character_; }
    bool boolean() const { return boolean_; }

    std::string str() const;

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    explicit Value(Type type): type_(type) {}

    Type                          type_;
    std::string                   text_;
    Number                        number_    = 0;
    std::shared_ptr<const Tokens> tokens_;
    char32_t                      character_ = 0;
    bool                          boolean_   = false;
};

std::ostream& operator<<(std::ostream& out, const Value& value);

// Errors

enum class ErrorKind {
    UnknownFunction,
    InvalidArgumentType,
    InvalidNumberLit,
    OutOfBounds,
    NotEnoughArguments,
    InvalidBoolean
};

class Error: public std::runtime_error {
public:
    static Error unknownFunction(const std::string& name);
    static Error invalidArgumentType(const std::string& expected, const std::string& actual);
    static Error invalidNumberLit(const std::string& text);
    static Error outOfBounds(std::size_t index, std::size_t length);
    static Error notEnoughArguments();
    static Error invalidBoolean(const Value& value);

    ErrorKind kind() const { return kind_; }

    // Function name, expected type name, or literal text, depending on kind().
    const std::string& detail() const { return detail_; }
    // Rendered offending value for InvalidArgumentType.
    const std::string& actual() const { return actual_; }
    std::size_t index() const { return index_; }
    std::size_t length() const { return length_; }
    // Offending value for InvalidBoolean.
    const Value& value() const { return value_; }

private:
    Error(ErrorKind kind, const std::string& message);

    ErrorKind   kind_;
    std::string detail_;
    std::string actual_;
    std::size_t index_  = 0;
    std::size_t length_ = 0;
    Value       value_  = Value::ofBoolean(false);
};

class ParseError: public std::runtime_error {
public:
    explicit ParseError(const Error& error);
    ParseError(std::size_t position, const Error& error);

    bool hasPosition() const { return hasPosition_; }
    std::size_t position() const { return position_; }
    const Error& error() const { return error_; }

private:
    bool        hasPosition_;
    std::size_t position_;
    Error       error_;
};

class EvalError: public std::runtime_error {
public:
    EvalError(Stack stack, const Error& error);
    EvalError(Stack stack, const Value& token, const Error& error);

    // The stack as the failing invocation left it, before rollback.
    const Stack& stack() const { return stack_; }
    bool hasToken() const { return hasToken_; }
    const Value& token() const { return token_; }
    const Error& error() const { return error_; }

private:
    Stack stack_;
    bool  hasToken_;
    Value token_;
    Error error_;
};

// Functions

class Engine;

class Function {
public:
    virtual ~Function() = default;

    // Reports failure by throwing Error.
    virtual void execute(Engine& engine) const = 0;
};

using FunctionPtr = std::shared_ptr<const Function>;
using NativeCode = std::function<void(Engine&)>;

class NativeFunction: public Function {
public:
    explicit NativeFunction(NativeCode code): code_(std::move(code)) {}
    void execute(Engine& engine) const override;

private:
    NativeCode code_;
};

// A function defined by interpreted code: runs its block on each call.
class BlockFunction: public Function {
public:
    explicit BlockFunction(Value block): block_(std::move(block)) {}
    void execute(Engine& engine) const override;

private:
    Value block_;
};

FunctionPtr native(NativeCode code);

// Engine

struct ParseResult {
    std::size_t cursor = 0;
    Tokens      tokens;
};

class Engine {
public:
    ParseResult parse(const std::string& source) const;
    void evaluate(const Tokens& tokens);
    void invoke(const Value& callable);

    void define(const std::string& name, FunctionPtr function);
    void define(char32_t alias, const std::string& name, FunctionPtr function);
    void defineOperator(char32_t alias, const std::string& name);

    void push(Value value);
    Value pop();
    Number popNumber();
    std::string popString();
    Tokens popMacro();
    bool popBoolean();
    const Value& peekAt(std::size_t index) const;
    void setAt(std::size_t index, Value value);
    void clearStack() { stack_.clear(); }

    // Bottom first, top last.
    const Stack& stack() const { return stack_; }

    bool hasFunction(const std::string& name) const;
    std::vector<std::string> functionNames() const;
    bool hasOperator(char32_t alias) const;

private:
    std::size_t parseFrom(const std::u32string& chars, std::size_t begin, Tokens& tokens) const;
    void execute(const Value& callable);

    Stack                                stack_;
    std::map<std::string, FunctionPtr>   functions_;
    std::map<char32_t, std::string>      operators_;
};

// Text utilities

std::u32string decodeUtf8(const std::string& text);
std::string encodeUtf8(char32_t codePoint);
std::string encodeUtf8(const std::u32string& codePoints);
std::size_t utf8Length(const std::string& text);

// Parses a complete decimal float literal. Returns false on any trailing or
// leading garbage.
bool parseNumber(const std::string& text, Number& result);
std::string formatNumber(Number number);

} // namespace cxxstack

#endif // cxxstack_hpp_included
