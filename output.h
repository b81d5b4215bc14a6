#ifndef cxxstack_output_hpp_included
#define cxxstack_output_hpp_included

#include "cxxstack.h"

#include <cstddef>
#include <iosfwd>

namespace cxxstack {

enum class OutputMode {
    Human,  // colored cells with depth indexes, sized to the terminal
    Simple  // one plain line, bottom to top
};

// Human when standard output is a terminal, Simple otherwise.
OutputMode autoOutputMode();

std::size_t terminalWidth();

void formatStack(std::ostream& out, const Engine& engine, OutputMode mode, std::size_t width);
void formatStack(std::ostream& out, const Engine& engine, OutputMode mode);

} // namespace cxxstack

#endif // cxxstack_output_hpp_included
