/// @file module.cpp
/// @brief Module information for strata_ecs

#include <strata/ecs/ecs.hpp>

namespace strata_ecs {

const char* version() noexcept {
    return "0.1.0";
}

const char* module_name() noexcept {
    return "strata_ecs";
}

} // namespace strata_ecs
