/**
 * @file resolver_tables.hpp
 * @brief Static lookup tables injected into the resolvers
 */

#pragma once

#include <classify/attribute_classifier.hpp>
#include <classify/superclass_table.hpp>
#include <classify/valence_resolver.hpp>

namespace Lexicode {

struct ResolverTables {
    SuperclassTable superclasses = SuperclassTable::defaults();
    PosFallbacks fallbacks;
    ReferenceSets references = ReferenceSets::defaults();
    OverrideTable overrides = OverrideTable::defaults();
};

} // namespace Lexicode
