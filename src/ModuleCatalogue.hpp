#ifndef MODULE_CATALOGUE_HPP
#define MODULE_CATALOGUE_HPP

#pragma once
#include "Module.hpp"
#include <vector>

// Conjunto de módulos disponíveis para a montagem, endereçados por id.
class ModuleCatalogue {
public:
    ModuleCatalogue() = default;
    explicit ModuleCatalogue(std::vector<Module> modules);

    // Lança std::invalid_argument se o id já existir.
    void add(Module module);

    // nullptr se não existir.
    const Module* find(int id) const;

    std::size_t size() const { return modules.size(); }
    bool empty() const { return modules.empty(); }
    const std::vector<Module>& all() const { return modules; }

    // Ids dos módulos de uma cor (por ordem de inserção).
    std::vector<int> ids_for_color(Color color) const;

private:
    std::vector<Module> modules;
};

// Conjunto standard de oito módulos (dois por cor, ids 0..7):
//   0,1 red | 2,3 yellow | 4,5 blue | 6,7 green
ModuleCatalogue standard_catalogue();

#endif // MODULE_CATALOGUE_HPP
