/**
 * @file IdGenerator.hpp
 * @brief Random identifiers for artifacts and diagrams.
 */

#pragma once
#include <string>

namespace docgen::infrastructure {

class IdGenerator {
public:
    /** @brief Lower-case canonical UUIDv4 string (36 chars). */
    static std::string NewUuid();
};

} // namespace docgen::infrastructure
