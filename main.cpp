/****

The Shell
=========

`cxxstack CODE` runs one line of code and prints the resulting stack.  With no
arguments we read lines interactively, run each one, and show the stack after
every line.  Errors are reported and the session carries on; the engine has
already rolled back the failing call, so the stack shown is the one the next
line will see.

cxxstack can use the GNU Readline library for user input if it is available.
The CMake build will detect whether the library is available, and if so define
`CXXSTACK_USE_READLINE`.  You can pass `-DCXXSTACK_DISABLE_READLINE=ON` to
`cmake` to prevent it from searching for the library.

****/

#include "cxxstack.h"
#include "output.h"
#include "builtins.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#ifdef CXXSTACK_USE_READLINE
#include "readline/readline.h"
#include "readline/history.h"
#endif

#ifndef CXXSTACK_PROMPT
#define CXXSTACK_PROMPT "cxxstack> "
#endif

using namespace cxxstack;

namespace {

/****

Tab completion offers the names of registered functions.  Readline calls the
generator repeatedly with `state` counting up from zero; we take a snapshot of
the names on the first call and hand back one match per call after that.

****/

#ifdef CXXSTACK_USE_READLINE

const Engine* completionEngine = nullptr;

char* completeFunctionName(const char* text, int state) {
    static std::vector<std::string> names;
    static std::size_t next = 0;

    if (state == 0) {
        names = completionEngine ? completionEngine->functionNames() : std::vector<std::string>();
        next = 0;
    }

    auto length = std::strlen(text);
    while (next < names.size()) {
        const auto& name = names[next++];
        if (name.compare(0, length, text) == 0)
            return strdup(name.c_str());
    }
    return nullptr;
}

char** completeLine(const char* text, int, int) {
    rl_attempted_completion_over = 1;
    rl_completion_append_character = ']';
    return rl_completion_matches(text, completeFunctionName);
}

void initializeReadline(const Engine& engine) {
    completionEngine = &engine;
    rl_readline_name = "cxxstack";
    rl_basic_word_break_characters = const_cast<char*>(" \t\n\"\\[]{}()");
    rl_attempted_completion_function = completeLine;
}

#else

void initializeReadline(const Engine&) {
}

#endif

bool readLine(std::string& line) {
#ifdef CXXSTACK_USE_READLINE
    char* input = readline(CXXSTACK_PROMPT);
    if (!input)
        return false;

    line = input;
    if (*input)
        add_history(input);
    std::free(input);
    return true;
#else
    std::cout << CXXSTACK_PROMPT << std::flush;
    return static_cast<bool>(std::getline(std::cin, line));
#endif
}

// Parses and evaluates one line, reporting any failure.
bool interpret(Engine& engine, const std::string& line) {
    try {
        auto parsed = engine.parse(line);
        engine.evaluate(parsed.tokens);
        return true;
    }
    catch (const std::exception& ex) {
        std::cout << "error: " << ex.what() << std::endl;
    }
    return false;
}

int runOnce(Engine& engine, const std::string& code) {
    if (!interpret(engine, code))
        return EXIT_FAILURE;

    formatStack(std::cout, engine, autoOutputMode());
    return EXIT_SUCCESS;
}

void repl(Engine& engine) {
    auto mode = autoOutputMode();
    initializeReadline(engine);

    std::string line;
    while (readLine(line)) {
        interpret(engine, line);
        formatStack(std::cout, engine, mode);
    }
}

} // end anonymous namespace

int main(int argc, const char** argv) {
    try {
        Engine engine;
        loadStandardLibrary(engine);

        if (argc > 1)
            return runOnce(engine, argv[1]);

        std::cout << "cxxstack " << cxxstack::version << "\n"
                  << "Press Ctrl-D to exit." << std::endl;
        repl(engine);
        return EXIT_SUCCESS;
    }
    catch (const std::exception& ex) {
        std::cerr << "cxxstack: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
}
