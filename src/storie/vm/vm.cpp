#include "vm.hpp"
#include <cmath>
#include <cstdio>
#include <cstring>
#include <sstream>
using namespace storie;

class runtime_exception : public std::runtime_error {
public:
    pos_info pos;
    std::string msg;

    runtime_exception(pos_info pos, const std::string &what = "")
        : std::runtime_error(what), pos(pos), msg(what) { }
};

bool vm::truthy(const value &v) {
    switch (v.type) {
        case TYPE_NIL:
            return false;

        case TYPE_INT:
            return v.i32 != 0;

        case TYPE_FLOAT:
            return v.f64 != 0.0;

        case TYPE_BOOL:
            return v.b;

        case TYPE_STRING:
            return !v.str.empty();

        case TYPE_FUNCTION:
            return true;

        default:
            return false;
    }
}

double vm::to_float(const value &v) {
    switch (v.type) {
        case TYPE_INT:
            return (double)v.i32;

        case TYPE_FLOAT:
            return v.f64;

        default:
            throw native_error(
                std::string("expected numeric value, got ") + vtype_str(v.type));
    }
}

int32_t vm::to_int(const value &v) {
    switch (v.type) {
        case TYPE_INT:
            return v.i32;

        case TYPE_FLOAT: {
            double t = std::trunc(v.f64);
            if (!(t >= (double)INT32_MIN && t <= (double)INT32_MAX)) {
                throw native_error(
                    "numeric value " + to_string(v) + " does not fit in an integer");
            }

            return (int32_t)t;
        }

        default:
            throw native_error(
                std::string("expected numeric value, got ") + vtype_str(v.type));
    }
}

std::string vm::to_string(const value &v) {
    switch (v.type) {
        case TYPE_NIL:
            return "nil";

        case TYPE_INT:
            return std::to_string(v.i32);

        case TYPE_FLOAT: {
            char buf[64];
            snprintf(buf, 64, "%.15g", v.f64);

            // keep floats recognizable: 7 -> 7.0
            if (std::isfinite(v.f64) && !strpbrk(buf, ".e"))
                strcat(buf, ".0");

            return buf;
        }

        case TYPE_BOOL:
            return v.b ? "true" : "false";

        case TYPE_STRING:
            return v.str;

        case TYPE_FUNCTION:
            return "<function>";

        default:
            return "???";
    }
}

////////////////
// environment
////////////////

void vm::environment::define(const std::string &name, value v) {
    _vars[name] = std::move(v);
}

void vm::environment::set(const std::string &name, value v) {
    for (environment *env = this; env; env = env->_parent) {
        auto it = env->_vars.find(name);
        if (it != env->_vars.end()) {
            it->second = std::move(v);
            return;
        }
    }

    _vars[name] = std::move(v);
}

const vm::value* vm::environment::find(const std::string &name) const {
    for (const environment *env = this; env; env = env->_parent) {
        auto it = env->_vars.find(name);
        if (it != env->_vars.end())
            return &it->second;
    }

    return nullptr;
}

bool vm::environment::has_local(const std::string &name) const {
    return _vars.find(name) != _vars.end();
}

////////////////
// runner
////////////////

vm::runner::runner() : _call_depth(0) { }

vm::runner::~runner() {}

// coerce an operand for arithmetic, attributing failures to the operator
static double operand_float(const vm::value &v, const ast::ast_expr *expr) {
    if (!v.is_a(vm::TYPE_INT) && !v.is_a(vm::TYPE_FLOAT)) {
        throw runtime_exception(
            expr->pos,
            std::string("unsupported operand of type ") + vm::vtype_str(v.type));
    }

    return vm::to_float(v);
}

vm::value vm::runner::eval_expr(const ast::ast_expr *expr, environment &env) {
    switch (expr->type) {
        case ast::EXPR_LITERAL: {
            auto data = static_cast<const ast::ast_expr_literal*>(expr);

            switch (data->literal_type) {
                case ast::EXPR_LITERAL_INTEGER:
                    return value::make_int(data->intv);

                case ast::EXPR_LITERAL_FLOAT:
                    return value::make_float(data->floatv);

                case ast::EXPR_LITERAL_STRING:
                    return value::make_string(data->str);

                case ast::EXPR_LITERAL_BOOL:
                    return value::make_bool(data->boolv);
            }

            break;
        }

        case ast::EXPR_IDENTIFIER: {
            auto data = static_cast<const ast::ast_expr_identifier*>(expr);

            const value *v = env.find(data->identifier);
            if (!v) {
                throw runtime_exception(
                    data->pos,
                    "undefined variable '" + data->identifier + "'");
            }

            return *v;
        }

        case ast::EXPR_UNOP: {
            auto data = static_cast<const ast::ast_expr_unop*>(expr);
            value v = eval_expr(data->expr.get(), env);

            switch (data->op) {
                case ast::EXPR_UNOP_NEG:
                    return value::make_float(-operand_float(v, data));

                case ast::EXPR_UNOP_NOT:
                    return value::make_bool(!truthy(v));
            }

            break;
        }

        case ast::EXPR_BINOP:
            return eval_binop(static_cast<const ast::ast_expr_binop*>(expr), env);

        case ast::EXPR_CALL:
            return eval_call(static_cast<const ast::ast_expr_call*>(expr), env);
    }

    throw runtime_exception(expr->pos, "invalid expression");
}

vm::value vm::runner::eval_binop(const ast::ast_expr_binop *expr,
                                 environment &env) {
    // short-circuiting logic
    if (expr->op == ast::EXPR_BINOP_AND) {
        if (!truthy(eval_expr(expr->left.get(), env)))
            return value::make_bool(false);

        return value::make_bool(truthy(eval_expr(expr->right.get(), env)));
    }

    if (expr->op == ast::EXPR_BINOP_OR) {
        if (truthy(eval_expr(expr->left.get(), env)))
            return value::make_bool(true);

        return value::make_bool(truthy(eval_expr(expr->right.get(), env)));
    }

    // everything else works on floats
    value l = eval_expr(expr->left.get(), env);
    value r = eval_expr(expr->right.get(), env);
    double a = operand_float(l, expr);
    double b = operand_float(r, expr);

    switch (expr->op) {
        case ast::EXPR_BINOP_ADD: return value::make_float(a + b);
        case ast::EXPR_BINOP_SUB: return value::make_float(a - b);
        case ast::EXPR_BINOP_MUL: return value::make_float(a * b);
        case ast::EXPR_BINOP_DIV: return value::make_float(a / b);
        case ast::EXPR_BINOP_MOD: return value::make_float(std::fmod(a, b));

        case ast::EXPR_BINOP_EQ: return value::make_bool(a == b);
        case ast::EXPR_BINOP_NEQ: return value::make_bool(a != b);
        case ast::EXPR_BINOP_LT: return value::make_bool(a < b);
        case ast::EXPR_BINOP_LE: return value::make_bool(a <= b);
        case ast::EXPR_BINOP_GT: return value::make_bool(a > b);
        case ast::EXPR_BINOP_GE: return value::make_bool(a >= b);

        default: break;
    }

    throw runtime_exception(
        expr->pos,
        std::string("unknown binary operator ") + ast::binop_to_str(expr->op));
}

vm::value vm::runner::eval_call(const ast::ast_expr_call *expr,
                                environment &env) {
    const value *callee = env.find(expr->name);
    if (!callee) {
        throw runtime_exception(
            expr->pos,
            "undefined function '" + expr->name + "'");
    }

    if (!callee->is_a(TYPE_FUNCTION)) {
        throw runtime_exception(
            expr->pos,
            "'" + expr->name + "' is not callable");
    }

    // hold on to the function in case a native rebinds the name mid-call
    std::shared_ptr<const function> fn = callee->fn;

    std::vector<value> args;
    args.reserve(expr->arguments.size());
    for (auto &arg : expr->arguments) {
        args.push_back(eval_expr(arg.get(), env));
    }

    return invoke(*fn, args, env, expr->pos);
}

vm::value vm::runner::invoke(const function &fn, const std::vector<value> &args,
                             environment &env, pos_info pos) {
    if (fn.is_native) {
        try {
            return fn.native(env, args);
        } catch (const std::exception &except) {
            // native_error, or anything a native lets slip through
            throw runtime_exception(pos, fn.name + ": " + except.what());
        }
    }

    if (_call_depth >= MAX_CALL_DEPTH) {
        throw runtime_exception(
            pos,
            "stack overflow while calling '" + fn.name + "'");
    }

    struct depth_guard {
        int &depth;
        depth_guard(int &depth) : depth(depth) { ++depth; }
        ~depth_guard() { --depth; }
    } guard(_call_depth);

    // the frame chains to the caller, not to the declaration site
    environment frame(&env);
    for (size_t i = 0; i < fn.params.size(); ++i) {
        frame.define(fn.params[i], i < args.size() ? args[i] : value());
    }

    exec_result res = exec_block(*fn.body, frame);
    return res.has_return ? res.ret : value();
}

vm::runner::exec_result vm::runner::exec_block(const ast::stmt_list &stms,
                                               environment &env) {
    for (auto &stm : stms) {
        exec_result res = exec_statement(stm.get(), env);
        if (res.has_return)
            return res;
    }

    return exec_result { false, value() };
}

vm::runner::exec_result vm::runner::exec_statement(const ast::ast_statement *stm,
                                                   environment &env) {
    switch (stm->type) {
        case ast::STATEMENT_EXPR: {
            auto data = static_cast<const ast::ast_statement_expr*>(stm);
            eval_expr(data->expr.get(), env);
            break;
        }

        case ast::STATEMENT_VAR: {
            auto data = static_cast<const ast::ast_statement_var*>(stm);
            env.define(data->name, eval_expr(data->value.get(), env));
            break;
        }

        case ast::STATEMENT_ASSIGN: {
            auto data = static_cast<const ast::ast_statement_assign*>(stm);
            env.set(data->target, eval_expr(data->value.get(), env));
            break;
        }

        case ast::STATEMENT_IF: {
            auto data = static_cast<const ast::ast_statement_if*>(stm);

            if (truthy(eval_expr(data->if_branch.condition.get(), env)))
                return exec_block(data->if_branch.body, env);

            for (auto &branch : data->elif_branches) {
                if (truthy(eval_expr(branch.condition.get(), env)))
                    return exec_block(branch.body, env);
            }

            return exec_block(data->else_branch, env);
        }

        case ast::STATEMENT_FOR: {
            auto data = static_cast<const ast::ast_statement_for*>(stm);

            int32_t start, end;
            try {
                start = to_int(eval_expr(data->start.get(), env));
                end = to_int(eval_expr(data->end.get(), env));
            } catch (const native_error &except) {
                throw runtime_exception(data->pos,
                    std::string("invalid range bound: ") + except.what());
            }

            for (int32_t i = start; i < end; ++i) {
                env.define(data->iterator, value::make_int(i));

                exec_result res = exec_block(data->body, env);
                if (res.has_return)
                    return res;
            }

            break;
        }

        case ast::STATEMENT_PROC: {
            auto data = static_cast<const ast::ast_statement_proc*>(stm);

            auto fn = std::make_shared<function>();
            fn->name = data->name;
            fn->is_native = false;
            fn->body = data->body;
            for (auto &param : data->params) {
                fn->params.push_back(param.name);
            }

            env.define(data->name, value::make_function(std::move(fn)));
            break;
        }

        case ast::STATEMENT_RETURN: {
            auto data = static_cast<const ast::ast_statement_return*>(stm);

            value v;
            if (data->expr)
                v = eval_expr(data->expr.get(), env);

            return exec_result { true, std::move(v) };
        }
    }

    return exec_result { false, value() };
}

void vm::runner::register_native(const std::string &name, native_func fn) {
    auto func = std::make_shared<function>();
    func->name = name;
    func->is_native = true;
    func->native = std::move(fn);

    _globals.define(name, value::make_function(std::move(func)));
}

void vm::runner::register_event(const std::string &name,
                                ast::ast_program &&program) {
    register_event(name, std::make_shared<const ast::ast_program>(std::move(program)));
}

void vm::runner::register_event(const std::string &name,
                                std::shared_ptr<const ast::ast_program> program) {
    _events[name] = std::move(program);
}

bool vm::runner::has_event(const std::string &name) const {
    return _events.find(name) != _events.end();
}

bool vm::runner::trigger_event(const std::string &name, script_error *error) {
    auto it = _events.find(name);
    if (it == _events.end())
        return true;

    // keep the program alive even if it re-registers itself while running
    std::shared_ptr<const ast::ast_program> program = it->second;
    return run(*program, _globals, error);
}

bool vm::runner::run(const ast::ast_program &program, script_error *error) {
    return run(program, _globals, error);
}

bool vm::runner::run(const ast::ast_program &program, environment &env,
                     script_error *error) {
    try {
        exec_block(program.statements, env);
    } catch (const runtime_exception &except) {
        if (error) {
            *error = script_error { ERROR_RUNTIME, except.pos, except.msg };
        }

        return false;
    }

    return true;
}

bool vm::runner::call(const std::string &name, const std::vector<value> &args,
                      value *result, script_error *error) {
    pos_info pos { 0, 0 };

    try {
        const value *callee = _globals.find(name);
        if (!callee) {
            throw runtime_exception(pos, "undefined function '" + name + "'");
        }

        if (!callee->is_a(TYPE_FUNCTION)) {
            throw runtime_exception(pos, "'" + name + "' is not callable");
        }

        std::shared_ptr<const function> fn = callee->fn;
        value ret = invoke(*fn, args, _globals, pos);
        if (result)
            *result = std::move(ret);
    } catch (const runtime_exception &except) {
        if (error) {
            *error = script_error { ERROR_RUNTIME, except.pos, except.msg };
        }

        return false;
    }

    return true;
}

void vm::runner::set_global(const std::string &name, value v) {
    _globals.define(name, std::move(v));
}

void vm::runner::set_global_int(const std::string &name, int32_t v) {
    set_global(name, value::make_int(v));
}

void vm::runner::set_global_float(const std::string &name, double v) {
    set_global(name, value::make_float(v));
}

void vm::runner::set_global_bool(const std::string &name, bool v) {
    set_global(name, value::make_bool(v));
}

void vm::runner::set_global_string(const std::string &name,
                                   const std::string &v) {
    set_global(name, value::make_string(v));
}
