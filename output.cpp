/****

Stack Display
=============

After every command the shell shows the stack.  On a terminal we draw each
value in a fixed-width colored cell, top of stack first, with the depth index
of each cell printed underneath, and we stop with a `»` marker once the row
would run past the right edge of the window.  When output goes to a pipe or a
file we print the plain rendering of each value on one line instead, bottom
first, so the result is easy to read back with other tools.

****/

#include "output.h"

#include <iomanip>
#include <iostream>
#include <sstream>

#include <sys/ioctl.h>
#include <unistd.h>

#ifndef CXXSTACK_CELL_WIDTH
#define CXXSTACK_CELL_WIDTH (11)
#endif

#ifndef CXXSTACK_DEFAULT_TERMINAL_WIDTH
#define CXXSTACK_DEFAULT_TERMINAL_WIDTH (80)
#endif

namespace cxxstack {

namespace {

const char* const Reset       = "\x1b[0m";
const char* const Red         = "\x1b[31m";
const char* const Yellow      = "\x1b[33m";
const char* const Cyan        = "\x1b[36m";
const char* const White       = "\x1b[37m";
const char* const BrightBlack = "\x1b[90m";
const char* const BrightWhite = "\x1b[97m";

const char* const Overflow = " \xC2\xBB";  // " »"

constexpr std::size_t CellWidth = CXXSTACK_CELL_WIDTH;

const char* colorOf(const Value& value, const Engine& engine) {
    switch (value.type()) {
    case Value::Type::String:
        return Cyan;
    case Value::Type::Number:
        return BrightWhite;
    case Value::Type::Boolean:
        return Yellow;
    case Value::Type::FunctionRef:
        return engine.hasFunction(value.text()) ? White : Red;
    default:
        return White;
    }
}

void formatHuman(std::ostream& out, const Engine& engine, std::size_t width) {
    const auto& stack = engine.stack();
    if (stack.empty()) {
        out << "(empty stack)" << std::endl;
        return;
    }

    std::ostringstream items;
    std::ostringstream indexes;
    indexes << BrightBlack;

    std::size_t used = 0;
    std::size_t depth = 0;
    for (auto it = stack.rbegin(); it != stack.rend(); ++it, ++depth) {
        auto text = it->str();
        auto length = utf8Length(text);
        auto padding = length < CellWidth ? CellWidth - length : 0;
        auto cellWidth = padding + length + 2;

        if (used + cellWidth + 1 >= width) {
            items << Overflow;
            break;
        }

        items << BrightBlack << "[" << Reset
              << colorOf(*it, engine) << std::string(padding, ' ') << text << Reset
              << BrightBlack << "]" << Reset;
        indexes << std::setw(static_cast<int>(cellWidth)) << depth;
        used += cellWidth;
    }

    indexes << Reset;
    out << items.str() << "\n" << indexes.str() << std::endl;
}

void formatSimple(std::ostream& out, const Engine& engine) {
    const auto& stack = engine.stack();
    for (std::size_t i = 0; i < stack.size(); ++i) {
        if (i > 0)
            out << " ";
        out << stack[i];
    }
    out << std::endl;
}

} // end anonymous namespace

OutputMode autoOutputMode() {
    return isatty(STDOUT_FILENO) ? OutputMode::Human : OutputMode::Simple;
}

std::size_t terminalWidth() {
    struct winsize size;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &size) == 0 && size.ws_col > 0)
        return size.ws_col;
    return CXXSTACK_DEFAULT_TERMINAL_WIDTH;
}

void formatStack(std::ostream& out, const Engine& engine, OutputMode mode, std::size_t width) {
    switch (mode) {
    case OutputMode::Human:
        formatHuman(out, engine, width);
        break;
    case OutputMode::Simple:
        formatSimple(out, engine);
        break;
    }
}

void formatStack(std::ostream& out, const Engine& engine, OutputMode mode) {
    formatStack(out, engine, mode, terminalWidth());
}

} // namespace cxxstack
