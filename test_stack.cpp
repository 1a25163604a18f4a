/*
** Test program for the value stack
** Index arithmetic, stack manipulation, growth limits and moves
** between threads
*/

#include <cstring>
#include <iostream>
#include <string>

#include "lrt.h"
#include "lauxlib.h"


static int protect(lrt_State* L, lrt_CFunction f) {
    lrt_pushcfunction(L, f);
    return lrt_pcall(L, 0, 1, 0);
}

/* render the stack as "1 2 3" for comparisons */
static std::string dump(lrt_State* L) {
    std::string s;
    for (int i = 1; i <= lrt_gettop(L); i++) {
        if (i > 1) s += ' ';
        lrt_pushvalue(L, i);
        s += lrtL_tolstring(L, -1, nullptr);
        lrt_pop(L, 2);
    }
    return s;
}

static void push_range(lrt_State* L, int from, int to) {
    for (int i = from; i <= to; i++)
        lrt_pushinteger(L, i);
}

// Test 1: Push, top and absolute indices
static bool test_top(lrt_State* L) {
    std::cout << "Test 1: Top and absolute indices... ";
    lrt_settop(L, 0);

    push_range(L, 1, 5);
    if (lrt_gettop(L) != 5 || lrt_absindex(L, -1) != 5 || lrt_absindex(L, -5) != 1) {
        std::cout << "FAILED: top " << lrt_gettop(L) << std::endl;
        return false;
    }
    if (lrt_absindex(L, LRT_REGISTRYINDEX) != LRT_REGISTRYINDEX) {
        std::cout << "FAILED: pseudo-index changed" << std::endl;
        return false;
    }

    lrt_settop(L, 7);  /* pad with nil */
    if (!lrt_isnil(L, 6) || !lrt_isnil(L, 7) || lrt_gettop(L) != 7) {
        std::cout << "FAILED: settop did not pad with nil" << std::endl;
        return false;
    }
    lrt_settop(L, 3);  /* truncate */
    if (dump(L) != "1 2 3") {
        std::cout << "FAILED: settop truncation gave '" << dump(L) << "'" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    std::cout << "PASSED" << std::endl;
    return true;
}

// Test 2: Rotate, insert, remove, replace and copy
static bool test_manipulation(lrt_State* L) {
    std::cout << "Test 2: Stack manipulation... ";
    lrt_settop(L, 0);

    push_range(L, 1, 5);
    lrt_rotate(L, 2, 1);
    if (dump(L) != "1 5 2 3 4") {
        std::cout << "FAILED: rotate gave '" << dump(L) << "'" << std::endl;
        return false;
    }
    lrt_rotate(L, 2, -1);
    if (dump(L) != "1 2 3 4 5") {
        std::cout << "FAILED: rotate back gave '" << dump(L) << "'" << std::endl;
        return false;
    }

    lrt_pushinteger(L, 9);
    lrt_insert(L, 1);
    lrt_remove(L, 3);
    if (dump(L) != "9 1 3 4 5") {
        std::cout << "FAILED: insert/remove gave '" << dump(L) << "'" << std::endl;
        return false;
    }

    lrt_pushinteger(L, 0);
    lrt_replace(L, 1);
    lrt_copy(L, -1, 2);
    if (dump(L) != "0 5 3 4 5") {
        std::cout << "FAILED: replace/copy gave '" << dump(L) << "'" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    std::cout << "PASSED" << std::endl;
    return true;
}

static int bad_absindex(lrt_State* L) {
    lrt_pushinteger(L, 1);
    lrt_absindex(L, -2);
    return 0;
}

static int bad_settop(lrt_State* L) {
    lrt_pushinteger(L, 1);
    lrt_settop(L, -3);
    return 0;
}

static int bad_rotate(lrt_State* L) {
    push_range(L, 1, 2);
    lrt_rotate(L, 1, 3);
    return 0;
}

static int below_base(lrt_State* L) {
    lrt_pushvalue(L, -1);  /* frame is empty: nothing below it is reachable */
    return 0;
}

// Test 3: Invalid indices raise IndexError
static bool test_index_errors(lrt_State* L) {
    std::cout << "Test 3: Invalid indices... ";
    lrt_settop(L, 0);

    lrt_CFunction fs[] = {bad_absindex, bad_settop, bad_rotate, below_base};
    for (lrt_CFunction f : fs) {
        int status = protect(L, f);
        if (status != LRT_ERRINDEX) {
            std::cout << "FAILED: status " << lrt_statusname(status) << std::endl;
            return false;
        }
        lrt_pop(L, 1);
    }

    std::cout << "PASSED" << std::endl;
    return true;
}

static int fill_stack(lrt_State* L) {
    for (;;) {
        lrt_ensurestack(L, 1);
        lrt_pushinteger(L, 1);
    }
    return 0;
}

// Test 4: Growth and the configured limit
static bool test_growth(lrt_State* L) {
    std::cout << "Test 4: Growth and stack limit... ";
    lrt_settop(L, 0);

    int old = lrt_setstacklimit(L, 2000);
    int status = protect(L, fill_stack);
    if (status != LRT_ERRSTACK) {
        std::cout << "FAILED: status " << lrt_statusname(status) << std::endl;
        return false;
    }
    lrt_pop(L, 1);

    /* the thread recovers after the overflow */
    push_range(L, 1, 100);
    if (lrt_gettop(L) != 100) {
        std::cout << "FAILED: stack unusable after overflow" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    if (lrt_checkstack(L, 3000)) {
        std::cout << "FAILED: checkstack ignored the limit" << std::endl;
        return false;
    }
    lrt_setstacklimit(L, old);
    if (!lrt_checkstack(L, 5000)) {
        std::cout << "FAILED: could not grow to 5000 slots" << std::endl;
        return false;
    }

    std::cout << "PASSED" << std::endl;
    return true;
}

static int bad_limit(lrt_State* L) {
    lrt_setstacklimit(L, 1);
    return 0;
}

// Test 5: Stack limit validation
static bool test_limit_validation(lrt_State* L) {
    std::cout << "Test 5: Stack limit validation... ";
    lrt_settop(L, 0);

    int status = protect(L, bad_limit);
    if (status != LRT_ERRSTACK) {
        std::cout << "FAILED: status " << lrt_statusname(status) << std::endl;
        return false;
    }
    lrt_pop(L, 1);

    std::cout << "PASSED" << std::endl;
    return true;
}

// Test 6: Moving values between threads
static bool test_xmove(lrt_State* L) {
    std::cout << "Test 6: Moving values between threads... ";
    lrt_settop(L, 0);

    lrt_State* L1 = lrt_newthread(L);
    push_range(L, 1, 3);
    lrt_xmove(L, L1, 2);
    if (lrt_gettop(L) != 2 || lrt_gettop(L1) != 2 ||
        lrt_tointeger(L1, 1) != 2 || lrt_tointeger(L1, 2) != 3) {
        std::cout << "FAILED: values not moved in order" << std::endl;
        return false;
    }
    lrt_xmove(L1, L, 2);
    if (lrt_gettop(L) != 4 || lrt_tointeger(L, 4) != 3 || lrt_gettop(L1) != 0) {
        std::cout << "FAILED: values not moved back" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    std::cout << "PASSED" << std::endl;
    return true;
}

static int sum_upvalues(lrt_State* L) {
    lrt_Integer s = lrt_tointeger(L, lrt_upvalueindex(1)) + lrt_tointeger(L, lrt_upvalueindex(2));
    lrt_pushinteger(L, s);
    return 1;
}

// Test 7: Registry and native closure upvalues
static bool test_pseudo_indices(lrt_State* L) {
    std::cout << "Test 7: Registry and upvalue pseudo-indices... ";
    lrt_settop(L, 0);

    lrt_rawgeti(L, LRT_REGISTRYINDEX, LRT_RIDX_MAINTHREAD);
    if (lrt_tothread(L, -1) != L) {
        std::cout << "FAILED: registry does not hold the main thread" << std::endl;
        return false;
    }
    lrt_pop(L, 1);

    lrt_pushinteger(L, 40);
    lrt_pushinteger(L, 2);
    lrt_pushcclosure(L, sum_upvalues, 2);
    lrt_call(L, 0, 1);
    if (lrt_tointeger(L, -1) != 42) {
        std::cout << "FAILED: upvalues gave " << lrt_tointeger(L, -1) << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    std::cout << "PASSED" << std::endl;
    return true;
}

static int reach_caller(lrt_State* L) {
    lrt_pushvalue(L, -2);  /* one argument: -2 is the caller's slot */
    return 0;
}

static int pop_caller(lrt_State* L) {
    lrt_pop(L, 3);
    return 0;
}

static int settop_caller(lrt_State* L) {
    lrt_settop(L, -5);
    return 0;
}

static int xmove_caller(lrt_State* L) {
    lrt_State* L1 = lrt_newthread(L);
    lrt_xmove(L, L1, 3);  /* the frame holds the argument and the thread */
    return 0;
}

static int setfield_empty(lrt_State* L) {
    lrt_settop(L, 0);
    lrt_setfield(L, LRT_REGISTRYINDEX, "stolen");
    return 0;
}

// Test 8: A native frame cannot reach its caller's slots
static bool test_frame_base(lrt_State* L) {
    std::cout << "Test 8: Frame base is enforced... ";
    lrt_settop(L, 0);

    push_range(L, 10, 12);
    lrt_CFunction fs[] = {reach_caller, pop_caller, settop_caller, xmove_caller,
                          setfield_empty};
    for (lrt_CFunction f : fs) {
        lrt_pushcfunction(L, f);
        lrt_pushinteger(L, 1);
        int status = lrt_pcall(L, 1, 1, 0);
        if (status != LRT_ERRINDEX) {
            std::cout << "FAILED: status " << lrt_statusname(status) << std::endl;
            lrt_settop(L, 0);
            return false;
        }
        lrt_pop(L, 1);
        if (dump(L) != "10 11 12") {
            std::cout << "FAILED: caller slots changed to '" << dump(L) << "'" << std::endl;
            lrt_settop(L, 0);
            return false;
        }
    }
    lrt_getfield(L, LRT_REGISTRYINDEX, "stolen");
    if (!lrt_isnil(L, -1)) {
        std::cout << "FAILED: setfield stored a value from outside its frame" << std::endl;
        lrt_settop(L, 0);
        return false;
    }
    lrt_settop(L, 0);

    std::cout << "PASSED" << std::endl;
    return true;
}

static int yield_too_many(lrt_State* L) {
    lrt_pushinteger(L, 1);
    return lrt_yield(L, 5);
}

static int resume_too_many(lrt_State* L) {
    lrt_State* co = lrt_tothread(L, 1);
    int nres = 0;
    lrt_resume(co, L, 3, &nres);  /* only the body is on its stack */
    return 0;
}

// Test 9: Value counts larger than the frame
static bool test_count_errors(lrt_State* L) {
    std::cout << "Test 9: Value counts beyond the frame... ";
    lrt_settop(L, 0);

    /* yielding more values than the coroutine holds */
    lrt_State* co = lrt_newthread(L);
    lrt_pushcfunction(co, yield_too_many);
    int nres = 0;
    int status = lrt_resume(co, L, 0, &nres);
    if (status != LRT_ERRINDEX || lrt_costatus(L, co) != LRT_CODEAD) {
        std::cout << "FAILED: yield status " << lrt_statusname(status) << std::endl;
        lrt_settop(L, 0);
        return false;
    }
    lrt_settop(L, 0);

    /* resuming with missing arguments leaves the coroutine untouched */
    co = lrt_newthread(L);
    lrt_pushcfunction(co, yield_too_many);
    lrt_pushcfunction(L, resume_too_many);
    lrt_pushvalue(L, 1);
    status = lrt_pcall(L, 1, 1, 0);
    if (status != LRT_ERRINDEX) {
        std::cout << "FAILED: resume status " << lrt_statusname(status) << std::endl;
        lrt_settop(L, 0);
        return false;
    }
    if (lrt_gettop(co) != 1 || lrt_costatus(L, co) != LRT_COCREATED) {
        std::cout << "FAILED: coroutine stack changed (top " << lrt_gettop(co) << ")" << std::endl;
        lrt_settop(L, 0);
        return false;
    }
    status = lrt_resume(co, nullptr, 2, &nres);
    if (status != LRT_ERRINDEX || lrt_gettop(co) != 1) {
        std::cout << "FAILED: resume without a caller gave " << lrt_statusname(status) << std::endl;
        lrt_settop(L, 0);
        return false;
    }
    lrt_settop(L, 0);

    std::cout << "PASSED" << std::endl;
    return true;
}

int main() {
    std::cout << "=== Stack Test Suite ===" << std::endl;
    std::cout << std::endl;

    lrt_State* L = lrtL_newstate();
    if (!L) {
        std::cerr << "Failed to create state" << std::endl;
        return 1;
    }

    int failures = 0;
    failures += !test_top(L);
    failures += !test_manipulation(L);
    failures += !test_index_errors(L);
    failures += !test_growth(L);
    failures += !test_limit_validation(L);
    failures += !test_xmove(L);
    failures += !test_pseudo_indices(L);
    failures += !test_frame_base(L);
    failures += !test_count_errors(L);

    std::cout << std::endl;
    std::cout << "=== " << failures << " test(s) failed ===" << std::endl;

    lrt_close(L);
    return failures;
}
