#ifndef MESHGATE_CORE_JSON_HPP
#define MESHGATE_CORE_JSON_HPP

#include <nlohmann/json.hpp>

namespace meshgate {

typedef nlohmann::json Json;

} // namespace meshgate

#endif // MESHGATE_CORE_JSON_HPP
