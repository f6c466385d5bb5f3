#include "sol_util.h"

#include "doctest/doctest.h"

#include <string>

TEST_CASE("sol_util_make_lua_state opens formula libraries") {
  auto lua{ anvil::sol_util_make_lua_state() };
  REQUIRE(lua);

  lua->script("x = 10 + 20");
  int const x{ (*lua)["x"] };
  CHECK(x == 30);

  lua->script("z = string.upper('hello') .. table.concat({'a', 'b'}, ',')");
  std::string const z{ (*lua)["z"] };
  CHECK(z == "HELLOa,b");

  for (char const *global : { "io", "os", "debug", "dofile", "loadfile" }) {
    CAPTURE(global);
    lua->script(std::string{ "reachable = " } + global + " ~= nil");
    bool const reachable{ (*lua)["reachable"] };
    CHECK_FALSE(reachable);
  }
}

TEST_CASE("sol_util_make_lua_state error() includes stack trace") {
  auto lua{ anvil::sol_util_make_lua_state() };

  auto result{ lua->safe_script(R"lua(
    function foo()
      error("test error")
    end
    foo()
  )lua",
                                sol::script_pass_on_error) };

  CHECK_FALSE(result.valid());
  sol::error err = result;
  std::string const msg{ err.what() };
  CHECK(msg.find("test error") != std::string::npos);
  CHECK(msg.find("stack traceback:") != std::string::npos);
}

TEST_CASE("sol_util_type_name") {
  CHECK(anvil::sol_util_type_name(sol::type::string) == "string");
  CHECK(anvil::sol_util_type_name(sol::type::table) == "table");
  CHECK(anvil::sol_util_type_name(sol::type::lua_nil) == "nil");
}
