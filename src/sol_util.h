#pragma once

#include "sol/sol.hpp"

#include <memory>
#include <string_view>

namespace anvil {

using sol_state_ptr = std::unique_ptr<sol::state>;

// State with the libraries a formula script may use (base, string, table, math, os).
sol_state_ptr sol_util_make_lua_state();

std::string_view sol_util_type_name(sol::type type);

}  // namespace anvil
