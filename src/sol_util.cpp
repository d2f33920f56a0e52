#include "sol_util.h"

namespace graft {

sol_state_ptr sol_util_make_lua_state() {
  auto lua{ std::make_unique<sol::state>() };
  lua->open_libraries(sol::lib::base, sol::lib::string, sol::lib::table, sol::lib::math);
  return lua;
}

std::vector<std::string> sol_util_get_string_list(sol::table const &table,
                                                  std::string_view key,
                                                  std::string_view context) {
  std::vector<std::string> result;
  auto const list{ sol_util_get_optional<sol::table>(table, key, context) };
  if (!list) { return result; }

  for (std::size_t i{ 1 }; i <= list->size(); ++i) {
    sol::object const item{ (*list)[i] };
    if (!item.is<std::string>()) {
      throw std::runtime_error(std::string(context) + ": " + std::string(key) + "[" +
                               std::to_string(i) + "] must be a string");
    }
    result.push_back(item.as<std::string>());
  }
  return result;
}

}  // namespace graft
