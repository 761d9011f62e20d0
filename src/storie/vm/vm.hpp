#pragma once
#include "../storie.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

// data structures
namespace storie::vm {
    enum vtype : uint8_t {
        TYPE_NIL,
        TYPE_INT, // int32_t
        TYPE_FLOAT, // double
        TYPE_BOOL,
        TYPE_STRING,
        TYPE_FUNCTION, // ref
    }; // enum vtype

    constexpr const char* vtype_str(vtype type) {
        switch (type) {
            case TYPE_NIL: return "nil";
            case TYPE_INT: return "int";
            case TYPE_FLOAT: return "float";
            case TYPE_BOOL: return "bool";
            case TYPE_STRING: return "string";
            case TYPE_FUNCTION: return "function";
            default: return "???";
        }
    }

    class environment;
    struct value;

    // natives get the environment of the call site, not the global one
    typedef std::function<value(environment &env, const std::vector<value> &args)>
        native_func;

    struct function {
        std::string name;
        bool is_native;

        native_func native;

        std::vector<std::string> params;
        std::shared_ptr<const ast::stmt_list> body;
    };

    struct value {
        vtype type;
        union {
            int32_t i32;
            double f64;
            bool b;
        };

        std::string str;
        std::shared_ptr<const function> fn;

        value() : type(TYPE_NIL), i32(0) { }

        static inline value make_int(int32_t v) {
            value ret;
            ret.type = TYPE_INT;
            ret.i32 = v;
            return ret;
        }

        static inline value make_float(double v) {
            value ret;
            ret.type = TYPE_FLOAT;
            ret.f64 = v;
            return ret;
        }

        static inline value make_bool(bool v) {
            value ret;
            ret.type = TYPE_BOOL;
            ret.b = v;
            return ret;
        }

        static inline value make_string(const std::string &v) {
            value ret;
            ret.type = TYPE_STRING;
            ret.str = v;
            return ret;
        }

        static inline value make_function(std::shared_ptr<const function> fn) {
            value ret;
            ret.type = TYPE_FUNCTION;
            ret.fn = std::move(fn);
            return ret;
        }

        constexpr bool is_a(vtype t) const noexcept {
            return type == t;
        }
    }; // struct value

    // thrown by native functions to fail the current evaluation
    class native_error : public std::runtime_error {
    public:
        native_error(const std::string &what) : std::runtime_error(what) { }
    };

    // nil, false, 0, 0.0 and "" are false. everything else is true.
    bool truthy(const value &v);

    // these throw native_error on non-numeric values
    double to_float(const value &v);
    int32_t to_int(const value &v);

    std::string to_string(const value &v);

    // a frame of variables. lookups walk outward through the parent chain.
    class environment {
    private:
        std::unordered_map<std::string, value> _vars;
        environment *_parent;

    public:
        explicit environment(environment *parent = nullptr) : _parent(parent)
        { }

        environment(const environment&) = delete;
        environment& operator=(const environment&) = delete;

        inline environment* parent() const noexcept { return _parent; }

        // bind in this frame only, replacing any binding already here
        void define(const std::string &name, value v);

        // mutate the nearest binding in the chain, or create one in this
        // frame if the name is bound nowhere
        void set(const std::string &name, value v);

        // nullptr if the name is not bound anywhere in the chain
        const value* find(const std::string &name) const;

        bool has_local(const std::string &name) const;
    };
} // namespace storie::vm

// runner class
namespace storie::vm {
    class runner {
    public:
        static constexpr int MAX_CALL_DEPTH = 256;

    private:
        struct exec_result {
            bool has_return;
            value ret;
        };

        environment _globals;
        std::unordered_map<std::string,
                           std::shared_ptr<const ast::ast_program>> _events;
        int _call_depth;

        value eval_expr(const ast::ast_expr *expr, environment &env);
        value eval_binop(const ast::ast_expr_binop *expr, environment &env);
        value eval_call(const ast::ast_expr_call *expr, environment &env);
        value invoke(const function &fn, const std::vector<value> &args,
                     environment &env, pos_info pos);

        exec_result exec_statement(const ast::ast_statement *stm,
                                   environment &env);
        exec_result exec_block(const ast::stmt_list &stms, environment &env);

    public:
        runner();
        runner(const runner&) = delete;
        runner(runner&&) = delete;
        ~runner();

        inline environment& globals() noexcept { return _globals; }

        void register_native(const std::string &name, native_func fn);

        void register_event(const std::string &name, ast::ast_program &&program);
        void register_event(const std::string &name,
                            std::shared_ptr<const ast::ast_program> program);
        bool has_event(const std::string &name) const;

        // unknown events are a no-op and succeed. the return value of a
        // top-level return is discarded.
        bool trigger_event(const std::string &name, script_error *error);

        // execute a program against the global environment, or against a
        // caller-supplied one
        bool run(const ast::ast_program &program, script_error *error);
        bool run(const ast::ast_program &program, environment &env,
                 script_error *error);

        // call a global function from the host
        bool call(const std::string &name, const std::vector<value> &args,
                  value *result, script_error *error);

        void set_global(const std::string &name, value v);
        void set_global_int(const std::string &name, int32_t v);
        void set_global_float(const std::string &name, double v);
        void set_global_bool(const std::string &name, bool v);
        void set_global_string(const std::string &name, const std::string &v);
    };
} // namespace storie::vm
