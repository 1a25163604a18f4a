/*
** Test program for calls
** Bytecode and native calls, result adjustment, varargs, tail calls,
** upvalues, protected calls, error positions and collaborators
*/

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

#include "lrt.h"
#include "lauxlib.h"
#include "lcode.h"
#include "lstate.h"


static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

/* resolver that reads handlers from fields of the operand (tables only) */
static int field_resolver(lrt_State* L, void* ud, int idx, int event) {
    static const char* const names[LRT_NUMTMS] = {
        "__index", "__newindex", "__eq", "__add", "__sub", "__mul", "__mod",
        "__div", "__idiv", "__unm", "__lt", "__le", "__call"
    };
    (void)ud;
    if (!lrt_istable(L, idx))
        return 0;
    lrt_pushstring(L, names[event]);
    lrt_rawget(L, idx);
    return 1;
}

/* function(a, b) return a + b, a - b end */
static void push_addsub(lrt_State* L) {
    FuncBuilder fb(L, "=test", 2);
    fb.setLine(1);
    fb.codeABC(OP_ADD, 2, 0, 1);
    fb.codeABC(OP_SUB, 3, 0, 1);
    fb.ret(2, 2);
    fb.pushClosure();
}

// Test 1: Arguments and result adjustment
static bool test_results(lrt_State* L) {
    std::cout << "Test 1: Arguments and result adjustment... ";
    lrt_settop(L, 0);

    push_addsub(L);
    lrt_pushinteger(L, 5);
    lrt_pushinteger(L, 3);
    lrt_call(L, 2, LRT_MULTRET);
    if (lrt_gettop(L) != 2 || lrt_tointeger(L, 1) != 8 || lrt_tointeger(L, 2) != 2) {
        std::cout << "FAILED: MULTRET results" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    push_addsub(L);
    lrt_pushinteger(L, 5);
    lrt_pushinteger(L, 3);
    lrt_call(L, 2, 4);  /* pad with nil */
    if (lrt_gettop(L) != 4 || !lrt_isnil(L, 3) || !lrt_isnil(L, 4)) {
        std::cout << "FAILED: results not padded" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    push_addsub(L);
    lrt_pushinteger(L, 5);
    lrt_pushinteger(L, 3);
    lrt_call(L, 2, 1);  /* truncate */
    if (lrt_gettop(L) != 1 || lrt_tointeger(L, 1) != 8) {
        std::cout << "FAILED: results not truncated" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    std::cout << "PASSED" << std::endl;
    return true;
}

static int check_missing(lrt_State* L) {
    push_addsub(L);
    lrt_pushinteger(L, 1);
    lrt_call(L, 1, 1);  /* b is nil */
    return 1;
}

// Test 2: Missing parameters are nil
static bool test_missing_params(lrt_State* L) {
    std::cout << "Test 2: Missing parameters... ";
    lrt_settop(L, 0);

    lrt_pushcfunction(L, check_missing);
    int status = lrt_pcall(L, 0, 1, 0);
    std::string msg = lrt_tostring(L, -1);
    if (status != LRT_ERRRUN ||
        !starts_with(msg, "test:1: attempt to perform arithmetic on a nil value")) {
        std::cout << "FAILED: '" << msg << "'" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    std::cout << "PASSED" << std::endl;
    return true;
}

/* function(a, ...) return ... end */
static void push_dropfirst(lrt_State* L) {
    FuncBuilder fb(L, "=varargs", 1, true);
    fb.codeABC(OP_VARARGPREP, 1, 0, 0);
    fb.codeABC(OP_VARARG, 1, 0, 0);
    fb.codeABC(OP_RETURN, 1, 0, 0);
    fb.pushClosure();
}

// Test 3: Variable arguments
static bool test_varargs(lrt_State* L) {
    std::cout << "Test 3: Variable arguments... ";
    lrt_settop(L, 0);

    push_dropfirst(L);
    for (int i = 1; i <= 4; i++)
        lrt_pushinteger(L, i * 10);
    lrt_call(L, 4, LRT_MULTRET);
    if (lrt_gettop(L) != 3 || lrt_tointeger(L, 1) != 20 || lrt_tointeger(L, 3) != 40) {
        std::cout << "FAILED: got " << lrt_gettop(L) << " results" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    push_dropfirst(L);
    lrt_call(L, 0, LRT_MULTRET);
    if (lrt_gettop(L) != 0) {
        std::cout << "FAILED: empty vararg list gave results" << std::endl;
        return false;
    }

    std::cout << "PASSED" << std::endl;
    return true;
}

static int count_levels(lrt_State* L) {
    lrt_Debug ar;
    int n = 0;
    while (lrt_getstack(L, n, &ar))
        n++;
    lrt_pushinteger(L, n);
    return 1;
}

/*
** function loop(n)
**   if n == 0 then return count_levels() end
**   return loop(n - 1)
** end
*/
static void define_loop(lrt_State* L) {
    FuncBuilder fb(L, "=loop", 1);
    fb.setLine(1);
    fb.codeABCk(OP_EQI, 0, int2sC(0), 0, 0);
    int j = fb.jump();
    fb.setLine(2);
    fb.getGlobal(1, "count_levels");
    fb.call(1, 0, 1);
    fb.ret(1, 1);
    fb.patchtohere(j);
    fb.setLine(3);
    fb.getGlobal(1, "loop");
    fb.codeABC(OP_ADDI, 2, 0, int2sC(-1));
    fb.tailcall(1, 1);
    fb.pushClosure();
    lrt_setglobal(L, "loop");
    lrt_register(L, "count_levels", count_levels);
}

// Test 4: Tail calls run in constant space
static bool test_tailcall(lrt_State* L) {
    std::cout << "Test 4: Deep tail recursion... ";
    lrt_settop(L, 0);

    define_loop(L);
    lrt_getglobal(L, "loop");
    lrt_pushinteger(L, 100000);
    lrt_call(L, 1, 1);
    lrt_Integer levels = lrt_tointeger(L, -1);
    if (levels > 3) {
        std::cout << "FAILED: " << levels << " active levels" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    std::cout << "PASSED" << std::endl;
    return true;
}

/* function rec(n) return rec(n) + 0 end (never ends) */
static void define_rec(lrt_State* L) {
    FuncBuilder fb(L, "=rec", 1);
    fb.setLine(7);
    fb.getGlobal(1, "rec");
    fb.codeABC(OP_MOVE, 2, 0, 0);
    fb.call(1, 1, 1);
    fb.codeABC(OP_ADDI, 1, 1, int2sC(0));
    fb.ret(1, 1);
    fb.pushClosure();
    lrt_setglobal(L, "rec");
}

// Test 5: Stack overflow is recoverable
static bool test_stack_overflow(lrt_State* L) {
    std::cout << "Test 5: Stack overflow recovery... ";
    lrt_settop(L, 0);

    int old = lrt_setstacklimit(L, 20000);
    define_rec(L);
    lrt_getglobal(L, "rec");
    lrt_pushinteger(L, 1);
    int status = lrt_pcall(L, 1, 1, 0);
    std::string msg = lrt_tostring(L, -1);
    if (status != LRT_ERRSTACK || msg.find("stack overflow") == std::string::npos) {
        std::cout << "FAILED: " << lrt_statusname(status) << " '" << msg << "'" << std::endl;
        return false;
    }
    if (!starts_with(msg, "rec:7:")) {
        std::cout << "FAILED: no position in '" << msg << "'" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    /* the thread still works */
    lrt_getglobal(L, "loop");
    lrt_pushinteger(L, 10);
    lrt_call(L, 1, 1);
    if (!lrt_isinteger(L, -1)) {
        std::cout << "FAILED: thread unusable after overflow" << std::endl;
        return false;
    }
    lrt_settop(L, 0);
    lrt_setstacklimit(L, old);

    std::cout << "PASSED" << std::endl;
    return true;
}

/*
** function maker()
**   local c = 0
**   return function() c = c + 1; return c end, function() return c end
** end
*/
static void push_maker(lrt_State* L) {
    FuncBuilder maker(L, "=maker");
    maker.loadInt(0, 0);
    {
        FuncBuilder inc(maker);
        inc.addUpvalue("c", true, 0);
        inc.codeABC(OP_GETUPVAL, 0, 0, 0);
        inc.codeABC(OP_ADDI, 0, 0, int2sC(1));
        inc.codeABC(OP_SETUPVAL, 0, 0, 0);
        inc.ret(0, 1);
        maker.codeABx(OP_CLOSURE, 1, inc.finish());
    }
    {
        FuncBuilder get(maker);
        get.addUpvalue("c", true, 0);
        get.codeABC(OP_GETUPVAL, 0, 0, 0);
        get.ret(0, 1);
        maker.codeABx(OP_CLOSURE, 2, get.finish());
    }
    maker.ret(1, 2);
    maker.pushClosure();
}

// Test 6: Shared upvalues survive the frame that created them
static bool test_upvalues(lrt_State* L) {
    std::cout << "Test 6: Shared and closed upvalues... ";
    lrt_settop(L, 0);

    push_maker(L);
    lrt_call(L, 0, 2);  /* inc, get */
    for (int i = 0; i < 3; i++) {
        lrt_pushvalue(L, 1);
        lrt_call(L, 0, 0);
    }
    lrt_pushvalue(L, 2);
    lrt_call(L, 0, 1);
    if (lrt_tointeger(L, -1) != 3) {
        std::cout << "FAILED: counter is " << lrt_tointeger(L, -1) << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    /* a second pair has its own variable */
    push_maker(L);
    lrt_call(L, 0, 2);
    lrt_pushvalue(L, 2);
    lrt_call(L, 0, 1);
    if (lrt_tointeger(L, -1) != 0) {
        std::cout << "FAILED: upvalue shared between instances" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    std::cout << "PASSED" << std::endl;
    return true;
}

static int raiser(lrt_State* L) {
    lrt_pushstring(L, "boom");
    return lrt_error(L);
}

static int handler(lrt_State* L) {
    lrt_pushfstring(L, "handled: %s", lrt_tostring(L, 1));
    return 1;
}

// Test 7: Protected calls and message handlers
static bool test_pcall(lrt_State* L) {
    std::cout << "Test 7: Protected calls... ";
    lrt_settop(L, 0);

    lrt_pushcfunction(L, handler);
    lrt_pushcfunction(L, raiser);
    int status = lrt_pcall(L, 0, 1, 1);
    if (status != LRT_ERRRUN || std::strcmp(lrt_tostring(L, -1), "handled: boom") != 0) {
        std::cout << "FAILED: '" << lrt_tostring(L, -1) << "'" << std::endl;
        return false;
    }
    if (lrt_gettop(L) != 2) {
        std::cout << "FAILED: stack not restored" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    std::cout << "PASSED" << std::endl;
    return true;
}

/* function() return undefined_global() end */
static void push_call_nil(lrt_State* L) {
    FuncBuilder fb(L, "=caller");
    fb.setLine(4);
    fb.getGlobal(0, "undefined_global");
    fb.call(0, 0, 1);
    fb.ret(0, 1);
    fb.pushClosure();
}

// Test 8: Calling a non-function value
static bool test_call_error(lrt_State* L) {
    std::cout << "Test 8: Calling a non-function... ";
    lrt_settop(L, 0);

    push_call_nil(L);
    int status = lrt_pcall(L, 0, 1, 0);
    std::string msg = lrt_tostring(L, -1);
    if (status != LRT_ERRRUN ||
        msg != "caller:4: attempt to call a nil value (global 'undefined_global')") {
        std::cout << "FAILED: '" << msg << "'" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    std::cout << "PASSED" << std::endl;
    return true;
}

static int call_handler(lrt_State* L) {
    /* self, argument */
    lrt_pushinteger(L, lrt_istable(L, 1) ? lrt_tointeger(L, 2) * 2 : -1);
    return 1;
}

static int add_handler(lrt_State* L) {
    lrt_pushstring(L, "added");
    return 1;
}

// Test 9: Handlers supplied by the resolver
static bool test_resolver(lrt_State* L) {
    std::cout << "Test 9: Metamethod resolver... ";
    lrt_settop(L, 0);

    lrt_setmetaresolver(L, field_resolver, nullptr);
    lrt_newtable(L);
    lrt_pushcfunction(L, call_handler);
    lrt_setfield(L, 1, "__call");
    lrt_pushcfunction(L, add_handler);
    lrt_setfield(L, 1, "__add");

    lrt_pushvalue(L, 1);
    lrt_pushinteger(L, 21);
    lrt_call(L, 1, 1);
    if (lrt_tointeger(L, -1) != 42) {
        std::cout << "FAILED: __call gave " << lrt_tointeger(L, -1) << std::endl;
        return false;
    }
    lrt_pop(L, 1);

    lrt_pushinteger(L, 1);
    lrt_pushvalue(L, 1);
    lrt_arith(L, LRT_OPADD);
    if (lrt_type(L, -1) != LRT_TSTRING || std::strcmp(lrt_tostring(L, -1), "added") != 0) {
        std::cout << "FAILED: __add not used" << std::endl;
        return false;
    }
    lrt_settop(L, 0);
    lrt_setmetaresolver(L, nullptr, nullptr);

    std::cout << "PASSED" << std::endl;
    return true;
}

static int recurse_native(lrt_State* L) {
    lrt_pushcfunction(L, recurse_native);
    lrt_call(L, 0, 0);
    return 0;
}

// Test 10: Nested native calls are limited
static bool test_c_stack(lrt_State* L) {
    std::cout << "Test 10: Native call depth limit... ";
    lrt_settop(L, 0);

    lrt_pushcfunction(L, recurse_native);
    int status = lrt_pcall(L, 0, 0, 0);
    if (status != LRT_ERRSTACK ||
        std::strcmp(lrt_tostring(L, -1), "C stack overflow") != 0) {
        std::cout << "FAILED: " << lrt_statusname(status) << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    std::cout << "PASSED" << std::endl;
    return true;
}

static int answer(lrt_State* L) {
    lrt_pushinteger(L, 42);
    return 1;
}

// Test 11: Cancellation at the next call boundary
static bool test_cancel(lrt_State* L) {
    std::cout << "Test 11: Thread cancellation... ";
    lrt_settop(L, 0);

    lrt_cancel(L);
    lrt_pushcfunction(L, answer);
    int status = lrt_pcall(L, 0, 1, 0);
    if (status != LRT_ERRRUN || std::strcmp(lrt_tostring(L, -1), "thread cancelled") != 0) {
        std::cout << "FAILED: " << lrt_statusname(status) << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    /* the request is consumed */
    lrt_pushcfunction(L, answer);
    status = lrt_pcall(L, 0, 1, 0);
    if (status != LRT_OK || lrt_tointeger(L, -1) != 42) {
        std::cout << "FAILED: cancellation not consumed" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    std::cout << "PASSED" << std::endl;
    return true;
}

/* compiles an integer literal into a function returning it */
static int integer_compiler(lrt_State* L, void* ud, const char* text, size_t len,
                            const char* chunkname) {
    (void)ud;
    std::string s(text, len);
    char* end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (s.empty() || *end != '\0') {
        lrt_pushfstring(L, "%s: '%s' is not an integer", chunkname, s.c_str());
        return LRT_ERRSYNTAX;
    }
    FuncBuilder fb(L, chunkname);
    fb.loadInt(0, v);
    fb.ret(0, 1);
    fb.pushClosure();
    return LRT_OK;
}

/* builds an invalid function */
static int broken_compiler(lrt_State* L, void* ud, const char* text, size_t len,
                           const char* chunkname) {
    (void)ud; (void)text; (void)len;
    FuncBuilder fb(L, chunkname, 0, true);  /* vararg without VARARGPREP */
    fb.ret(0, 0);
    fb.pushClosure();
    return LRT_OK;
}

// Test 12: Loading through the compiler collaborator
static bool test_load(lrt_State* L) {
    std::cout << "Test 12: Loading code... ";
    lrt_settop(L, 0);

    int status = lrt_load(L, "1", 1, "=one");
    if (status != LRT_ERRSYNTAX) {
        std::cout << "FAILED: load without compiler gave " << lrt_statusname(status) << std::endl;
        return false;
    }
    lrt_pop(L, 1);

    lrt_setcompiler(L, integer_compiler, nullptr);
    status = lrt_load(L, "123", 3, "=num");
    if (status != LRT_OK) {
        std::cout << "FAILED: " << lrt_tostring(L, -1) << std::endl;
        return false;
    }
    lrt_call(L, 0, 1);
    if (lrt_tointeger(L, -1) != 123) {
        std::cout << "FAILED: loaded function returned " << lrt_tointeger(L, -1) << std::endl;
        return false;
    }
    lrt_pop(L, 1);

    status = lrt_load(L, "12x", 3, "=num");
    if (status != LRT_ERRSYNTAX ||
        std::strcmp(lrt_tostring(L, -1), "=num: '12x' is not an integer") != 0) {
        std::cout << "FAILED: bad text gave " << lrt_statusname(status) << std::endl;
        return false;
    }
    lrt_pop(L, 1);

    lrt_setcompiler(L, broken_compiler, nullptr);
    status = lrt_load(L, "", 0, "=broken");
    if (status != LRT_ERRSYNTAX) {
        std::cout << "FAILED: invalid code accepted" << std::endl;
        return false;
    }
    lrt_pop(L, 1);
    lrt_setcompiler(L, nullptr, nullptr);

    std::cout << "PASSED" << std::endl;
    return true;
}

struct WarnLog {
    std::string text;
};

static void collect_warnings(void* ud, const char* msg, int tocont) {
    WarnLog* log = static_cast<WarnLog*>(ud);
    log->text += msg;
    if (!tocont)
        log->text += '\n';
}

static int quiet_panic(lrt_State* L) {
    (void)L;
    return 0;
}

// Test 13: Errors without a protected call reach the host
static bool test_unprotected(lrt_State* L) {
    std::cout << "Test 13: Unprotected errors... ";
    lrt_settop(L, 0);

    WarnLog log;
    lrt_setwarnf(L, collect_warnings, &log);
    lrt_CFunction oldpanic = lrt_atpanic(L, quiet_panic);
    int status = LRT_OK;
    try {
        lrt_pushcfunction(L, raiser);
        lrt_call(L, 0, 0);
    } catch (const LrtException& e) {
        status = e.status();
    }
    lrt_atpanic(L, oldpanic);
    if (status != LRT_ERRRUN) {
        std::cout << "FAILED: host did not receive the error" << std::endl;
        return false;
    }
    if (std::strcmp(lrt_tostring(L, -1), "boom") != 0) {
        std::cout << "FAILED: error object lost" << std::endl;
        return false;
    }
    if (log.text != "error in unprotected call (boom)\n") {
        std::cout << "FAILED: warning '" << log.text << "'" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    /* state is still usable */
    lrt_pushcfunction(L, answer);
    lrt_call(L, 0, 1);
    if (lrt_tointeger(L, -1) != 42) {
        std::cout << "FAILED: state unusable after unprotected error" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    std::cout << "PASSED" << std::endl;
    return true;
}

static int where_am_i(lrt_State* L) {
    lrt_Debug ar;
    if (!lrt_getstack(L, 1, &ar))
        return 0;
    lrt_getinfo(L, "Sl", &ar);
    lrt_pushfstring(L, "%s:%d", ar.short_src, ar.currentline);
    return 1;
}

// Test 14: Activation records
static bool test_debug_info(lrt_State* L) {
    std::cout << "Test 14: Activation records... ";
    lrt_settop(L, 0);

    lrt_register(L, "where_am_i", where_am_i);
    FuncBuilder fb(L, "@script.lrt");
    fb.setLine(12);
    fb.getGlobal(0, "where_am_i");
    fb.call(0, 0, 1);
    fb.ret(0, 1);
    fb.pushClosure();
    lrt_call(L, 0, 1);
    if (std::strcmp(lrt_tostring(L, -1), "script.lrt:12") != 0) {
        std::cout << "FAILED: '" << lrt_tostring(L, -1) << "'" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    std::cout << "PASSED" << std::endl;
    return true;
}

int main() {
    std::cout << "=== Calls Test Suite ===" << std::endl;
    std::cout << std::endl;

    lrt_State* L = lrtL_newstate();
    if (!L) {
        std::cerr << "Failed to create state" << std::endl;
        return 1;
    }

    int failures = 0;
    failures += !test_results(L);
    failures += !test_missing_params(L);
    failures += !test_varargs(L);
    failures += !test_tailcall(L);
    failures += !test_stack_overflow(L);
    failures += !test_upvalues(L);
    failures += !test_pcall(L);
    failures += !test_call_error(L);
    failures += !test_resolver(L);
    failures += !test_c_stack(L);
    failures += !test_cancel(L);
    failures += !test_load(L);
    failures += !test_unprotected(L);
    failures += !test_debug_info(L);

    std::cout << std::endl;
    std::cout << "=== " << failures << " test(s) failed ===" << std::endl;

    lrt_close(L);
    return failures;
}
