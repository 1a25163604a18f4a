/*
** Test program for memory management
** State-accounted allocator, allocation hook, full collections and
** memory errors
*/

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <new>
#include <vector>

#include "lrt.h"
#include "lauxlib.h"
#include "lrtallocator.h"
#include "lstate.h"


static l_mem total_bytes(lrt_State* L) {
    return static_cast<l_mem>(lrt_gc(L, LRT_GCCOUNT)) * 1024 + lrt_gc(L, LRT_GCCOUNTB);
}

// Test 1: Containers on the state allocator
static bool test_allocator_vectors(lrt_State* L) {
    std::cout << "Test 1: Vectors on the state allocator... ";
    lrt_settop(L, 0);

    std::vector<int, LrtAllocator<int>> vec{LrtAllocator<int>(G(L))};
    for (int i = 0; i < 10000; i++)
        vec.push_back(i);
    for (int i = 0; i < 10000; i++) {
        if (vec[i] != i) {
            std::cout << "FAILED: Element " << i << " is " << vec[i] << std::endl;
            return false;
        }
    }

    struct Pair {
        int x;
        double y;
    };
    std::vector<Pair, LrtAllocator<Pair>> pvec{LrtAllocator<Pair>(vec.get_allocator())};
    for (int i = 0; i < 100; i++)
        pvec.push_back({i, i * 2.0});
    if (pvec[99].x != 99 || pvec[99].y != 198.0) {
        std::cout << "FAILED: struct elements incorrect" << std::endl;
        return false;
    }
    if (!(vec.get_allocator() == pvec.get_allocator())) {
        std::cout << "FAILED: allocators of one state differ" << std::endl;
        return false;
    }

    std::cout << "PASSED" << std::endl;
    return true;
}

// Test 2: Memory accounting
static bool test_accounting(lrt_State* L) {
    std::cout << "Test 2: Memory accounting... ";
    lrt_settop(L, 0);

    l_mem before = total_bytes(L);
    {
        std::vector<int, LrtAllocator<int>> vec{LrtAllocator<int>(G(L))};
        vec.resize(256 * 1024);  /* ~1MB */
        l_mem during = total_bytes(L);
        if (during < before + static_cast<l_mem>(256 * 1024 * sizeof(int))) {
            std::cout << "FAILED: Memory not tracked (before=" << before
                      << ", during=" << during << ")" << std::endl;
            return false;
        }
    }
    l_mem after = total_bytes(L);
    if (after != before) {
        std::cout << "FAILED: Memory not returned (before=" << before
                  << ", after=" << after << ")" << std::endl;
        return false;
    }

    std::cout << "PASSED" << std::endl;
    return true;
}

struct HookCounts {
    int tables = 0;
    int strings = 0;
    int threads = 0;
    int functions = 0;
    int other = 0;
};

static void count_allocations(void* ud, int kind, size_t size) {
    HookCounts* c = static_cast<HookCounts*>(ud);
    (void)size;
    switch (kind) {
        case LRT_TTABLE: c->tables++; break;
        case LRT_TSTRING: c->strings++; break;
        case LRT_TTHREAD: c->threads++; break;
        case LRT_TFUNCTION: c->functions++; break;
        default: c->other++; break;
    }
}

static int noop(lrt_State* L) {
    (void)L;
    return 0;
}

// Test 3: Allocation hook
static bool test_alloc_hook(lrt_State* L) {
    std::cout << "Test 3: Allocation hook... ";
    lrt_settop(L, 0);

    HookCounts counts;
    lrt_setallochook(L, count_allocations, &counts);
    for (int i = 0; i < 3; i++)
        lrt_newtable(L);
    lrt_pushstring(L, "a string seen only by the hook test");
    lrt_newthread(L);
    lrt_pushinteger(L, 1);
    lrt_pushcclosure(L, noop, 1);
    lrt_setallochook(L, nullptr, nullptr);
    lrt_newtable(L);  /* not counted */

    if (counts.tables != 3 || counts.strings != 1 || counts.threads != 1 ||
        counts.functions != 1) {
        std::cout << "FAILED: counts " << counts.tables << " " << counts.strings
                  << " " << counts.threads << " " << counts.functions << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    std::cout << "PASSED" << std::endl;
    return true;
}

// Test 4: Unreachable objects are freed, reachable ones kept
static bool test_collect(lrt_State* L) {
    std::cout << "Test 4: Full collection... ";
    lrt_settop(L, 0);

    lrt_gc(L, LRT_GCCOLLECT);
    int base = lrt_gc(L, LRT_GCOBJECTS);

    for (int i = 0; i < 100; i++) {
        lrt_newtable(L);
        lrt_pop(L, 1);
    }
    if (lrt_gc(L, LRT_GCOBJECTS) < base + 100) {
        std::cout << "FAILED: objects not counted" << std::endl;
        return false;
    }
    l_mem garbage = total_bytes(L);
    lrt_gc(L, LRT_GCCOLLECT);
    if (lrt_gc(L, LRT_GCOBJECTS) != base || total_bytes(L) >= garbage) {
        std::cout << "FAILED: garbage survived (" << lrt_gc(L, LRT_GCOBJECTS)
                  << " objects, base " << base << ")" << std::endl;
        return false;
    }

    /* a table reachable from the globals keeps its contents */
    lrt_newtable(L);
    for (int i = 1; i <= 50; i++) {
        lrt_newtable(L);
        lrt_rawseti(L, -2, i);
    }
    lrt_setglobal(L, "keep");
    lrt_gc(L, LRT_GCCOLLECT);
    if (lrt_gc(L, LRT_GCOBJECTS) < base + 51) {
        std::cout << "FAILED: reachable objects freed" << std::endl;
        return false;
    }
    lrt_getglobal(L, "keep");
    lrt_rawgeti(L, -1, 50);
    if (!lrt_istable(L, -1)) {
        std::cout << "FAILED: reachable table lost its contents" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    lrt_pushnil(L);
    lrt_setglobal(L, "keep");
    lrt_gc(L, LRT_GCCOLLECT);
    if (lrt_gc(L, LRT_GCOBJECTS) > base + 1) {  /* the interned name "keep" */
        std::cout << "FAILED: released tables survived" << std::endl;
        return false;
    }

    std::cout << "PASSED" << std::endl;
    return true;
}

static int yield_once(lrt_State* L) {
    return lrt_yield(L, 0);
}

/* collects while its own thread is referenced from nowhere */
static int collect_inside(lrt_State* L) {
    lrt_newtable(L);
    lrt_gc(L, LRT_GCCOLLECT);
    lrt_pushinteger(L, 42);
    lrt_rawseti(L, -2, 1);
    lrt_rawgeti(L, -1, 1);
    return 1;
}

// Test 5: Threads and the collector
static bool test_threads(lrt_State* L) {
    std::cout << "Test 5: Threads and the collector... ";
    lrt_settop(L, 0);

    lrt_gc(L, LRT_GCCOLLECT);
    int base = lrt_gc(L, LRT_GCOBJECTS);

    /* a suspended coroutine nobody refers to is garbage */
    lrt_State* co = lrt_newthread(L);
    lrt_pushcfunction(co, yield_once);
    int nres = 0;
    if (lrt_resume(co, L, 0, &nres) != LRT_YIELD) {
        std::cout << "FAILED: coroutine did not yield" << std::endl;
        return false;
    }
    lrt_pop(L, 1);
    lrt_gc(L, LRT_GCCOLLECT);
    if (lrt_gc(L, LRT_GCOBJECTS) != base) {
        std::cout << "FAILED: dropped coroutine survived" << std::endl;
        return false;
    }

    /* the running thread is a root even when nothing refers to it */
    co = lrt_newthread(L);
    lrt_pop(L, 1);
    lrt_pushcfunction(co, collect_inside);
    if (lrt_resume(co, L, 0, &nres) != LRT_OK || lrt_tointeger(co, -1) != 42) {
        std::cout << "FAILED: running thread was collected" << std::endl;
        return false;
    }
    lrt_gc(L, LRT_GCCOLLECT);

    std::cout << "PASSED" << std::endl;
    return true;
}

struct Budget {
    size_t used = 0;
    size_t limit = 0;
};

static void* limited_alloc(void* ud, void* ptr, size_t osize, size_t nsize) {
    Budget* b = static_cast<Budget*>(ud);
    if (ptr == nullptr)
        osize = 0;
    if (nsize == 0) {
        std::free(ptr);
        b->used -= osize;
        return nullptr;
    }
    if (b->limit != 0 && b->used - osize + nsize > b->limit)
        return nullptr;
    void* p = std::realloc(ptr, nsize);
    if (p != nullptr)
        b->used += nsize - osize;
    return p;
}

static int fill_memory(lrt_State* L) {
    lrt_newtable(L);
    for (lrt_Integer i = 1; ; i++) {
        lrt_pushinteger(L, i);
        lrt_rawseti(L, -2, i);
    }
    return 0;
}

// Test 6: Memory errors are recoverable
static bool test_memory_error() {
    std::cout << "Test 6: Memory errors... ";

    Budget budget;
    lrt_State* L = lrt_newstate(limited_alloc, &budget);
    if (!L) {
        std::cout << "FAILED: could not create state" << std::endl;
        return false;
    }
    budget.limit = budget.used + 64 * 1024;

    lrt_pushcfunction(L, fill_memory);
    int status = lrt_pcall(L, 0, 0, 0);
    if (status != LRT_ERRMEM || std::strcmp(lrt_tostring(L, -1), "not enough memory") != 0) {
        std::cout << "FAILED: status " << lrt_statusname(status) << std::endl;
        lrt_close(L);
        return false;
    }
    lrt_settop(L, 0);

    lrt_gc(L, LRT_GCCOLLECT);
    lrt_newtable(L);
    lrt_pushinteger(L, 7);
    lrt_rawseti(L, -2, 1);
    lrt_settop(L, 0);

    lrt_close(L);
    if (budget.used != 0) {
        std::cout << "FAILED: " << budget.used << " bytes leaked" << std::endl;
        return false;
    }

    std::cout << "PASSED" << std::endl;
    return true;
}

int main() {
    std::cout << "=== Memory Test Suite ===" << std::endl;
    std::cout << std::endl;

    lrt_State* L = lrtL_newstate();
    if (!L) {
        std::cerr << "Failed to create state" << std::endl;
        return 1;
    }

    int failures = 0;
    failures += !test_allocator_vectors(L);
    failures += !test_accounting(L);
    failures += !test_alloc_hook(L);
    failures += !test_collect(L);
    failures += !test_threads(L);
    failures += !test_memory_error();

    std::cout << std::endl;
    std::cout << "=== " << failures << " test(s) failed ===" << std::endl;

    lrt_close(L);
    return failures;
}
