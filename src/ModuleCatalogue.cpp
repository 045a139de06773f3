#include "ModuleCatalogue.hpp"
#include <stdexcept>
#include <string>
#include <utility>

ModuleCatalogue::ModuleCatalogue(std::vector<Module> initial) {
    modules.reserve(initial.size());
    for (auto& m : initial) add(std::move(m));
}

void ModuleCatalogue::add(Module module) {
    if (find(module.get_id()) != nullptr) {
        throw std::invalid_argument("Duplicate module id: " + std::to_string(module.get_id()));
    }
    modules.push_back(std::move(module));
}

const Module* ModuleCatalogue::find(int id) const {
    for (const auto& m : modules) {
        if (m.get_id() == id) return &m;
    }
    return nullptr;
}

std::vector<int> ModuleCatalogue::ids_for_color(Color color) const {
    std::vector<int> ids;
    for (const auto& m : modules) {
        if (m.get_color() == color) ids.push_back(m.get_id());
    }
    return ids;
}
