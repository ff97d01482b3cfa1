#include "infrastructure/IdGenerator.hpp"
#include <uuid/uuid.h>

namespace docgen::infrastructure {

std::string IdGenerator::NewUuid() {
    uuid_t raw;
    uuid_generate_random(raw);
    char text[37];
    uuid_unparse_lower(raw, text);
    return std::string(text);
}

} // namespace docgen::infrastructure
