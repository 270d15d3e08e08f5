//
// DemoCatalog.hpp
//

#ifndef LTCG_DEMO_CATALOG_HPP
#define LTCG_DEMO_CATALOG_HPP

#include <cstddef>
#include <vector>

#include "Cards.hpp"

// Small built-in card pool used by the server and self-play when no catalog is supplied.
namespace ltcg::core::demo
{
    auto Cards() -> std::vector<CardDefinition>;
    auto Registry() -> RegistryCSP;

    // `size` definition ids cycling through the pool in catalog order.
    auto Deck(std::size_t size) -> std::vector<DefinitionId>;
}

#endif //LTCG_DEMO_CATALOG_HPP
