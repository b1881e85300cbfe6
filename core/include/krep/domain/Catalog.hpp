#pragma once

#include "krep/domain/Types.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace krep {

struct Config;

struct Catalog {
    std::unordered_map<std::string, Movement> movements;
    std::unordered_map<std::string, MicrodoseDefinition> microdoses;

    const MicrodoseDefinition* findDefinition(const std::string& id) const;
    const Movement* findMovement(const std::string& id) const;

    // Definitions of one category, sorted by id.
    std::vector<const MicrodoseDefinition*> definitionsIn(MicrodoseCategory c) const;

    // Empty when the catalog is consistent.
    std::vector<std::string> validate() const;
};

// Built-in movements and microdoses. Fresh copy on every call.
Catalog buildDefaultCatalog();

// Built once on first use and shared read-only for the life of the process.
const Catalog& defaultCatalog();

// Default catalog plus one mobility movement and definition per configured
// custom drill. Custom definitions get the id "mobility_custom_<drill id>".
Catalog buildCatalog(const Config& cfg);

// Throws CatalogValidationError listing every problem.
void requireValid(const Catalog& catalog);

// Category of a definition id: the catalog entry when there is one, else the
// id's markers ("vo2" or "emom", "gtg", "mobility"). Ids archived before a
// definition was renamed or removed still classify this way.
std::optional<MicrodoseCategory> inferCategory(const Catalog& catalog,
                                               const std::string& definition_id);

} // namespace krep
