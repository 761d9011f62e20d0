#pragma once
#include "vm/vm.hpp"
#include <istream>
#include <string>

struct lua_State;

namespace storie {
    // Loads native functions written in Lua. Every function stored in the
    // global table `host` of the loaded chunk becomes a native of the same
    // name once bound to a runner:
    //
    //   host = {}
    //   function host.clamp(v, lo, hi) ... end
    //
    // Arguments and return values may be nil, booleans, numbers or strings.
    // The lua_host must outlive every runner it was bound to.
    class lua_host {
    private:
        lua_State *_L;

    public:
        lua_host();
        lua_host(const lua_host&) = delete;
        lua_host(lua_host&&) = delete;
        ~lua_host();

        bool load(std::istream &stream, const char *chunk_name,
                  std::string *errmsg);
        bool load_file(const char *path, std::string *errmsg);

        // returns the number of natives registered
        int bind(vm::runner &runner);
    };
} // namespace storie
