#include "DemoAssemblies.h"

#include <utility>

namespace seqviz {

namespace {

Part makePart(const char* id, const char* name, const Vec3d& pos_m, const Vec3d& half_m) {
    Part p;
    p.id = id;
    p.name = name;
    p.assembled_pos_m = pos_m;
    p.half_extents_m = half_m;
    return p;
}

AssemblyStep makeStep(const char* id, const char* name, std::vector<std::string> part_ids) {
    AssemblyStep s;
    s.id = id;
    s.name = name;
    s.part_ids = std::move(part_ids);
    return s;
}

AssemblyDefinition bearingHousing() {
    AssemblyDefinition d;
    d.id = "bearing_housing";
    d.name = "Bearing Housing";

    // Housing is the fixture everything else is assembled onto.
    d.parts.push_back(makePart("housing", "Housing", v3(0.0, 0.04, 0.0), v3(0.08, 0.04, 0.08)));
    d.parts.push_back(makePart("bearing", "Bearing", v3(0.0, 0.09, 0.0), v3(0.03, 0.01, 0.03)));

    Part shaft = makePart("shaft", "Shaft", v3(0.0, 0.13, 0.0), v3(0.01, 0.05, 0.01));
    shaft.has_approach_dir = true;
    shaft.approach_dir = v3(1.0, 0.0, 0.0);
    shaft.approach_offset_m = 0.15;
    d.parts.push_back(shaft);

    d.parts.push_back(makePart("cover", "Cover Plate", v3(0.0, 0.19, 0.0), v3(0.06, 0.01, 0.06)));

    const double b = 0.05;
    const Vec3d bolt_half = v3(0.005, 0.015, 0.005);
    d.parts.push_back(makePart("bolt_1", "Bolt 1", v3( b, 0.215,  b), bolt_half));
    d.parts.push_back(makePart("bolt_2", "Bolt 2", v3(-b, 0.215,  b), bolt_half));
    d.parts.push_back(makePart("bolt_3", "Bolt 3", v3(-b, 0.215, -b), bolt_half));
    d.parts.push_back(makePart("bolt_4", "Bolt 4", v3( b, 0.215, -b), bolt_half));

    d.steps.push_back(makeStep("step_001", "Insert bearing", {"bearing"}));
    d.steps.push_back(makeStep("step_002", "Insert shaft", {"shaft"}));
    d.steps.push_back(makeStep("step_003", "Place cover", {"cover"}));
    d.steps.push_back(makeStep("step_004", "Fasten bolts", {"bolt_1", "bolt_2", "bolt_3", "bolt_4"}));
    return d;
}

AssemblyDefinition bracketStack() {
    AssemblyDefinition d;
    d.id = "bracket_stack";
    d.name = "Bracket Stack";

    const Vec3d half = v3(0.06, 0.01, 0.04);
    d.parts.push_back(makePart("base_bracket", "Base Bracket", v3(0.0, 0.01, 0.0), half));
    d.parts.push_back(makePart("spacer", "Spacer", v3(0.0, 0.03, 0.0), v3(0.03, 0.01, 0.03)));
    d.parts.push_back(makePart("mid_bracket", "Mid Bracket", v3(0.0, 0.05, 0.0), half));
    d.parts.push_back(makePart("top_cap", "Top Cap", v3(0.0, 0.07, 0.0), v3(0.04, 0.01, 0.04)));

    d.steps.push_back(makeStep("step_001", "Place base bracket", {"base_bracket"}));
    d.steps.push_back(makeStep("step_002", "Stack spacer", {"spacer"}));
    d.steps.push_back(makeStep("step_003", "Stack mid bracket", {"mid_bracket"}));
    d.steps.push_back(makeStep("step_004", "Cap", {"top_cap"}));
    return d;
}

AssemblyDefinition emptyAssembly() {
    AssemblyDefinition d;
    d.id = "empty";
    d.name = "Empty";
    return d;
}

} // namespace

const std::vector<std::string>& demoAssemblyNames() {
    static const std::vector<std::string> names = {"bearing_housing", "bracket_stack", "empty"};
    return names;
}

bool makeDemoAssembly(const std::string& name, AssemblyDefinition& out) {
    if (name == "bearing_housing") { out = bearingHousing(); return true; }
    if (name == "bracket_stack")   { out = bracketStack();   return true; }
    if (name == "empty")           { out = emptyAssembly();  return true; }
    return false;
}

} // namespace seqviz
