#pragma once

// Built-in assembly definitions for the viewer, the replay tool and the tests.
//
//   "bearing_housing"  housing fixture + bearing, side-inserted shaft, cover, 4 bolts
//                      (8 parts, 4 steps; the last step places four parts)
//   "bracket_stack"    four stacked brackets, one part per step
//   "empty"            no parts, no steps (inert)

#include <string>
#include <vector>

#include "AssemblyTypes.h"

namespace seqviz {

// Returns false for unknown names; out is untouched then.
bool makeDemoAssembly(const std::string& name, AssemblyDefinition& out);

const std::vector<std::string>& demoAssemblyNames();

} // namespace seqviz
