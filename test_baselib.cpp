/*
** Test program for the basic library
** Base functions and the coroutine table, called from the host and
** from bytecode
*/

#include <cstring>
#include <iostream>
#include <string>

#include "lrt.h"
#include "lauxlib.h"
#include "lrtlib.h"
#include "lcode.h"


static bool is_string(lrt_State* L, int idx, const char* s) {
    return lrt_type(L, idx) == LRT_TSTRING && std::strcmp(lrt_tostring(L, idx), s) == 0;
}

/* call global function 'name' with the 'nargs' values on top */
static int call_global(lrt_State* L, const char* name, int nargs) {
    lrt_getglobal(L, name);
    lrt_insert(L, -(nargs + 1));
    return lrt_pcall(L, nargs, LRT_MULTRET, 0);
}

// Test 1: Library registration
static bool test_open(lrt_State* L) {
    std::cout << "Test 1: Library registration... ";
    lrt_settop(L, 0);

    lrt_getglobal(L, "_G");
    lrt_pushglobaltable(L);
    if (!lrt_istable(L, 1) || !lrt_rawequal(L, 1, 2)) {
        std::cout << "FAILED: _G is not the globals table" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    const char* const names[] = {"error", "pcall", "select", "tostring", "type", "warn"};
    for (const char* name : names) {
        if (lrt_getglobal(L, name) != LRT_TFUNCTION) {
            std::cout << "FAILED: missing '" << name << "'" << std::endl;
            return false;
        }
        lrt_pop(L, 1);
    }
    lrt_getglobal(L, LRT_COLIBNAME);
    if (lrt_getfield(L, -1, "wrap") != LRT_TFUNCTION) {
        std::cout << "FAILED: coroutine table incomplete" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    std::cout << "PASSED" << std::endl;
    return true;
}

// Test 2: type and tostring
static bool test_type_tostring(lrt_State* L) {
    std::cout << "Test 2: type and tostring... ";
    lrt_settop(L, 0);

    lrt_pushnil(L);
    if (call_global(L, "type", 1) != LRT_OK || !is_string(L, -1, "nil")) {
        std::cout << "FAILED: type(nil)" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    if (call_global(L, "type", 0) != LRT_ERRRUN ||
        std::strncmp(lrt_tostring(L, -1), "bad argument #1", 15) != 0) {
        std::cout << "FAILED: type() accepted no argument" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    lrt_pushnumber(L, 1.5);
    call_global(L, "tostring", 1);
    lrt_pushboolean(L, 1);
    call_global(L, "tostring", 1);
    lrt_pushinteger(L, 10);
    call_global(L, "tostring", 1);
    if (!is_string(L, 1, "1.5") || !is_string(L, 2, "true") || !is_string(L, 3, "10")) {
        std::cout << "FAILED: tostring results" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    std::cout << "PASSED" << std::endl;
    return true;
}

// Test 3: select
static bool test_select(lrt_State* L) {
    std::cout << "Test 3: select... ";
    lrt_settop(L, 0);

    lrt_pushstring(L, "#");
    lrt_pushstring(L, "a");
    lrt_pushstring(L, "b");
    lrt_pushstring(L, "c");
    call_global(L, "select", 4);
    if (lrt_gettop(L) != 1 || lrt_tointeger(L, 1) != 3) {
        std::cout << "FAILED: select('#')" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    lrt_pushinteger(L, 2);
    lrt_pushstring(L, "a");
    lrt_pushstring(L, "b");
    lrt_pushstring(L, "c");
    call_global(L, "select", 4);
    if (lrt_gettop(L) != 2 || !is_string(L, 1, "b") || !is_string(L, 2, "c")) {
        std::cout << "FAILED: select(2, ...)" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    lrt_pushinteger(L, -1);
    lrt_pushstring(L, "a");
    lrt_pushstring(L, "b");
    call_global(L, "select", 3);
    if (lrt_gettop(L) != 1 || !is_string(L, 1, "b")) {
        std::cout << "FAILED: select(-1, ...)" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    lrt_pushinteger(L, 0);
    if (call_global(L, "select", 1) != LRT_ERRRUN) {
        std::cout << "FAILED: select(0) accepted" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    std::cout << "PASSED" << std::endl;
    return true;
}

/* function() error(msg, level) end, with 'error' called on line 5 */
static void push_thrower(lrt_State* L, const char* msg, int level) {
    FuncBuilder fb(L, "=script");
    fb.setLine(5);
    fb.getGlobal(0, "error");
    fb.loadString(1, msg);
    fb.loadInt(2, level);
    fb.call(0, 2, 0);
    fb.ret(0, 0);
    fb.pushClosure();
}

// Test 4: error and its position prefix
static bool test_error(lrt_State* L) {
    std::cout << "Test 4: error levels... ";
    lrt_settop(L, 0);

    push_thrower(L, "bad", 1);
    if (lrt_pcall(L, 0, 0, 0) != LRT_ERRRUN || !is_string(L, -1, "script:5: bad")) {
        std::cout << "FAILED: level 1 gave '" << lrt_tostring(L, -1) << "'" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    push_thrower(L, "bad", 0);
    if (lrt_pcall(L, 0, 0, 0) != LRT_ERRRUN || !is_string(L, -1, "bad")) {
        std::cout << "FAILED: level 0 gave '" << lrt_tostring(L, -1) << "'" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    /* non-string error objects pass unchanged */
    lrt_newtable(L);
    lrt_pushvalue(L, 1);
    if (call_global(L, "error", 1) != LRT_ERRRUN || !lrt_rawequal(L, 1, 2)) {
        std::cout << "FAILED: table error object changed" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    std::cout << "PASSED" << std::endl;
    return true;
}

// Test 5: pcall
static bool test_pcall(lrt_State* L) {
    std::cout << "Test 5: pcall... ";
    lrt_settop(L, 0);

    lrt_getglobal(L, "type");
    lrt_pushinteger(L, 1);
    call_global(L, "pcall", 2);
    if (lrt_gettop(L) != 2 || !lrt_toboolean(L, 1) || !is_string(L, 2, "number")) {
        std::cout << "FAILED: successful pcall" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    lrt_getglobal(L, "error");
    lrt_pushstring(L, "oops");
    int status = call_global(L, "pcall", 2);
    if (status != LRT_OK || lrt_gettop(L) != 2 || lrt_toboolean(L, 1) ||
        !is_string(L, 2, "oops")) {
        std::cout << "FAILED: failing pcall" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    std::cout << "PASSED" << std::endl;
    return true;
}

static void collect_warnings(void* ud, const char* msg, int tocont) {
    std::string* log = static_cast<std::string*>(ud);
    *log += msg;
    if (!tocont)
        *log += '\n';
}

// Test 6: warn
static bool test_warn(lrt_State* L) {
    std::cout << "Test 6: warn... ";
    lrt_settop(L, 0);

    std::string log;
    lrt_setwarnf(L, collect_warnings, &log);
    lrt_pushstring(L, "disk ");
    lrt_pushstring(L, "almost full");
    call_global(L, "warn", 2);
    lrt_pushstring(L, "done");
    call_global(L, "warn", 1);
    if (log != "disk almost full\ndone\n") {
        std::cout << "FAILED: '" << log << "'" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    lrt_newtable(L);
    if (call_global(L, "warn", 1) == LRT_OK || log != "disk almost full\ndone\n") {
        std::cout << "FAILED: non-string warning accepted" << std::endl;
        return false;
    }
    lrt_settop(L, 0);
    lrt_setwarnf(L, nullptr, nullptr);

    std::cout << "PASSED" << std::endl;
    return true;
}

/* function(a) coroutine.yield(a); return a + 1 end */
static void push_generator(lrt_State* L) {
    FuncBuilder fb(L, "=gen", 1);
    fb.setLine(1);
    fb.getGlobal(1, LRT_COLIBNAME);
    fb.codeABC(OP_GETFIELD, 1, 1, fb.stringK("yield"));
    fb.codeABC(OP_MOVE, 2, 0, 0);
    fb.call(1, 1, 0);
    fb.setLine(2);
    fb.codeABC(OP_ADDI, 1, 0, int2sC(1));
    fb.ret(1, 1);
    fb.pushClosure();
}

static int co_call(lrt_State* L, const char* name, int nargs) {
    lrt_getglobal(L, LRT_COLIBNAME);
    lrt_getfield(L, -1, name);
    lrt_remove(L, -2);
    lrt_insert(L, -(nargs + 1));
    return lrt_pcall(L, nargs, LRT_MULTRET, 0);
}

// Test 7: coroutine.create, resume and status
static bool test_coroutine_table(lrt_State* L) {
    std::cout << "Test 7: coroutine table... ";
    lrt_settop(L, 0);

    push_generator(L);
    co_call(L, "create", 1);
    if (!lrt_isthread(L, 1)) {
        std::cout << "FAILED: create did not return a thread" << std::endl;
        return false;
    }

    lrt_pushvalue(L, 1);
    co_call(L, "status", 1);
    if (!is_string(L, -1, "suspended")) {
        std::cout << "FAILED: new coroutine status" << std::endl;
        return false;
    }
    lrt_pop(L, 1);

    lrt_pushvalue(L, 1);
    lrt_pushinteger(L, 10);
    co_call(L, "resume", 2);
    if (lrt_gettop(L) != 3 || !lrt_toboolean(L, 2) || lrt_tointeger(L, 3) != 10) {
        std::cout << "FAILED: first resume" << std::endl;
        return false;
    }
    lrt_settop(L, 1);

    lrt_pushvalue(L, 1);
    co_call(L, "resume", 1);
    if (lrt_gettop(L) != 3 || !lrt_toboolean(L, 2) || lrt_tointeger(L, 3) != 11) {
        std::cout << "FAILED: second resume" << std::endl;
        return false;
    }
    lrt_settop(L, 1);

    lrt_pushvalue(L, 1);
    co_call(L, "resume", 1);
    if (lrt_gettop(L) != 3 || lrt_toboolean(L, 2) ||
        !is_string(L, 3, "cannot resume dead coroutine")) {
        std::cout << "FAILED: resuming a dead coroutine" << std::endl;
        return false;
    }
    lrt_settop(L, 1);

    co_call(L, "status", 1);
    if (!is_string(L, -1, "dead")) {
        std::cout << "FAILED: finished coroutine status" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    co_call(L, "running", 0);
    if (!lrt_isthread(L, 1) || !lrt_toboolean(L, 2)) {
        std::cout << "FAILED: running from the main thread" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    co_call(L, "isyieldable", 0);
    if (lrt_toboolean(L, 1)) {
        std::cout << "FAILED: main thread is yieldable" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    std::cout << "PASSED" << std::endl;
    return true;
}

// Test 8: coroutine.wrap
static bool test_wrap(lrt_State* L) {
    std::cout << "Test 8: coroutine.wrap... ";
    lrt_settop(L, 0);

    push_generator(L);
    co_call(L, "wrap", 1);  /* generator function at 1 */
    lrt_pushvalue(L, 1);
    lrt_pushinteger(L, 20);
    lrt_call(L, 1, 1);
    lrt_pushvalue(L, 1);
    lrt_call(L, 0, 1);
    if (lrt_tointeger(L, 2) != 20 || lrt_tointeger(L, 3) != 21) {
        std::cout << "FAILED: wrapped values" << std::endl;
        return false;
    }
    lrt_settop(L, 1);

    lrt_pushvalue(L, 1);
    if (lrt_pcall(L, 0, 0, 0) != LRT_ERRRUN ||
        !is_string(L, -1, "cannot resume dead coroutine")) {
        std::cout << "FAILED: dead wrapped coroutine gave '" << lrt_tostring(L, -1) << "'"
                  << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    /* errors inside the body propagate to the caller */
    lrt_getglobal(L, "error");
    co_call(L, "wrap", 1);
    lrt_pushstring(L, "inner failure");
    if (lrt_pcall(L, 1, 0, 0) != LRT_ERRRUN || !is_string(L, -1, "inner failure")) {
        std::cout << "FAILED: error from body gave '" << lrt_tostring(L, -1) << "'"
                  << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    std::cout << "PASSED" << std::endl;
    return true;
}

int main() {
    std::cout << "=== Basic Library Test Suite ===" << std::endl;
    std::cout << std::endl;

    lrt_State* L = lrtL_newstate();
    if (!L) {
        std::cerr << "Failed to create state" << std::endl;
        return 1;
    }
    lrtL_openbase(L);

    int failures = 0;
    failures += !test_open(L);
    failures += !test_type_tostring(L);
    failures += !test_select(L);
    failures += !test_error(L);
    failures += !test_pcall(L);
    failures += !test_warn(L);
    failures += !test_coroutine_table(L);
    failures += !test_wrap(L);

    std::cout << std::endl;
    std::cout << "=== " << failures << " test(s) failed ===" << std::endl;

    lrt_close(L);
    return failures;
}
