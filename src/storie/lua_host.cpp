#include "lua_host.hpp"
#include <lua.hpp>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace storie;

static int lua_panic(lua_State *L) {
    throw std::runtime_error(lua_tostring(L, -1));
    return 0;
}

static bool push_value(lua_State *L, const vm::value &v, std::string *errmsg) {
    switch (v.type) {
        case vm::TYPE_NIL:
            lua_pushnil(L);
            return true;

        case vm::TYPE_INT:
            lua_pushinteger(L, (lua_Integer)v.i32);
            return true;

        case vm::TYPE_FLOAT:
            lua_pushnumber(L, (lua_Number)v.f64);
            return true;

        case vm::TYPE_BOOL:
            lua_pushboolean(L, v.b ? 1 : 0);
            return true;

        case vm::TYPE_STRING:
            lua_pushlstring(L, v.str.data(), v.str.size());
            return true;

        default:
            *errmsg = std::string("cannot pass a ") + vm::vtype_str(v.type) +
                      " value to Lua";
            return false;
    }
}

static bool read_value(lua_State *L, int idx, vm::value *out,
                       std::string *errmsg) {
    switch (lua_type(L, idx)) {
        case LUA_TNONE:
        case LUA_TNIL:
            *out = vm::value();
            return true;

        case LUA_TBOOLEAN:
            *out = vm::value::make_bool(lua_toboolean(L, idx) != 0);
            return true;

        case LUA_TNUMBER: {
            double n = (double)lua_tonumber(L, idx);

            // integral numbers that fit come back as integers
            if (std::floor(n) == n && n >= (double)INT32_MIN && n <= (double)INT32_MAX) {
                *out = vm::value::make_int((int32_t)n);
            } else {
                *out = vm::value::make_float(n);
            }

            return true;
        }

        case LUA_TSTRING: {
            size_t len;
            const char *str = lua_tolstring(L, idx, &len);
            *out = vm::value::make_string(std::string(str, len));
            return true;
        }

        default:
            *errmsg = std::string("cannot return a Lua ") +
                      lua_typename(L, lua_type(L, idx)) + " value";
            return false;
    }
}

static vm::value call_lua_native(lua_State *L, int ref,
                                 const std::vector<vm::value> &args) {
    int top = lua_gettop(L);
    std::string errmsg;

    if (!lua_checkstack(L, (int)args.size() + 1)) {
        throw vm::native_error("too many arguments");
    }

    lua_rawgeti(L, LUA_REGISTRYINDEX, ref);
    for (auto &arg : args) {
        if (!push_value(L, arg, &errmsg)) {
            lua_settop(L, top);
            throw vm::native_error(errmsg);
        }
    }

    if (lua_pcall(L, (int)args.size(), 1, 0) != 0) {
        const char *msg = lua_tostring(L, -1);
        errmsg = msg ? msg : "unknown Lua error";
        lua_settop(L, top);
        throw vm::native_error(errmsg);
    }

    vm::value ret;
    bool ok = read_value(L, -1, &ret, &errmsg);
    lua_settop(L, top);

    if (!ok)
        throw vm::native_error(errmsg);

    return ret;
}

lua_host::lua_host() {
    _L = luaL_newstate();
    if (!_L)
        throw std::runtime_error("could not create Lua state");

    lua_atpanic(_L, lua_panic);
    luaL_openlibs(_L);
}

lua_host::~lua_host() {
    lua_close(_L);
}

bool lua_host::load(std::istream &stream, const char *chunk_name,
                    std::string *errmsg) {
    std::stringstream buf;
    buf << stream.rdbuf();
    std::string code = buf.str();

    if (luaL_loadbuffer(_L, code.c_str(), code.size(), chunk_name) != 0 ||
        lua_pcall(_L, 0, 0, 0) != 0)
    {
        const char *msg = lua_tostring(_L, -1);
        if (errmsg)
            *errmsg = msg ? msg : "unknown Lua error";

        lua_pop(_L, 1);
        return false;
    }

    return true;
}

bool lua_host::load_file(const char *path, std::string *errmsg) {
    std::ifstream f(path);
    if (!f.is_open()) {
        if (errmsg)
            *errmsg = std::string("could not open ") + path;

        return false;
    }

    std::string chunk_name = std::string("@") + path;
    return load(f, chunk_name.c_str(), errmsg);
}

int lua_host::bind(vm::runner &runner) {
    lua_getglobal(_L, "host");
    if (!lua_istable(_L, -1)) {
        lua_pop(_L, 1);
        return 0;
    }

    int count = 0;
    lua_pushnil(_L);
    while (lua_next(_L, -2) != 0) {
        // key at -2, value at -1
        if (lua_type(_L, -2) == LUA_TSTRING && lua_isfunction(_L, -1)) {
            std::string name = lua_tostring(_L, -2);

            lua_pushvalue(_L, -1);
            int ref = luaL_ref(_L, LUA_REGISTRYINDEX);

            lua_State *L = _L;
            runner.register_native(name,
                [L, ref](vm::environment &, const std::vector<vm::value> &args) {
                    return call_lua_native(L, ref, args);
                });

            ++count;
        }

        lua_pop(_L, 1); // pop value, keep key for lua_next
    }

    lua_pop(_L, 1); // pop host table
    return count;
}
