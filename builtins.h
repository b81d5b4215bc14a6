#ifndef cxxstack_builtins_hpp_included
#define cxxstack_builtins_hpp_included

#include "cxxstack.h"

#include <iosfwd>

namespace cxxstack {

// Registers the built-in words and their operator aliases. The print word
// writes to `out`.
void loadStandardLibrary(Engine& engine, std::ostream& out);
void loadStandardLibrary(Engine& engine);

} // namespace cxxstack

#endif // cxxstack_builtins_hpp_included
