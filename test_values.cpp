/*
** Test program for values and conversions
** Numerals, number formatting, equality and ordering through the API
*/

#include <cmath>
#include <cstring>
#include <iostream>
#include <string>

#include "lrt.h"
#include "lauxlib.h"


/* run 'f' in protected mode; returns the status and leaves the result or the error */
static int protect(lrt_State* L, lrt_CFunction f) {
    lrt_pushcfunction(L, f);
    return lrt_pcall(L, 0, 1, 0);
}

// Test 1: Decimal, hex and float numerals
static bool test_numerals(lrt_State* L) {
    std::cout << "Test 1: String to number conversion... ";
    lrt_settop(L, 0);

    struct { const char* text; bool isint; lrt_Integer i; double f; } cases[] = {
        {"10", true, 10, 0},
        {"  -7  ", true, -7, 0},
        {"0x10", true, 16, 0},
        {"0XfF", true, 255, 0},
        {"1e2", false, 0, 100.0},
        {"3.", false, 0, 3.0},
        {".5", false, 0, 0.5},
        {"0x1p4", false, 0, 16.0},
        {"9223372036854775808", false, 0, 9223372036854775808.0},  /* overflow to float */
    };

    for (const auto& c : cases) {
        lrt_pushstring(L, c.text);
        int isnum = 0;
        lrt_Number n = lrt_tonumberx(L, -1, &isnum);
        if (!isnum) {
            std::cout << "FAILED: '" << c.text << "' not converted" << std::endl;
            return false;
        }
        if (c.isint) {
            lrt_Integer i = lrt_tointegerx(L, -1, &isnum);
            if (!isnum || i != c.i) {
                std::cout << "FAILED: '" << c.text << "' gave " << i << std::endl;
                return false;
            }
        }
        else if (n != c.f) {
            std::cout << "FAILED: '" << c.text << "' gave " << n << std::endl;
            return false;
        }
        lrt_pop(L, 1);
    }

    /* hex integers wrap around */
    lrt_pushstring(L, "0xffffffffffffffff");
    int isnum = 0;
    if (lrt_tointegerx(L, -1, &isnum) != -1 || !isnum) {
        std::cout << "FAILED: hex integer did not wrap" << std::endl;
        return false;
    }
    lrt_pop(L, 1);

    std::cout << "PASSED" << std::endl;
    return true;
}

// Test 2: Rejected numerals
static bool test_bad_numerals(lrt_State* L) {
    std::cout << "Test 2: Rejection of malformed numerals... ";
    lrt_settop(L, 0);

    const char* bad[] = {"", "  ", "abc", "1x", "0x", "1e", "inf", "nan", "- 1", "1 2"};
    for (const char* s : bad) {
        lrt_pushstring(L, s);
        int isnum = 1;
        lrt_tonumberx(L, -1, &isnum);
        if (isnum) {
            std::cout << "FAILED: '" << s << "' accepted" << std::endl;
            return false;
        }
        lrt_pop(L, 1);
    }

    std::cout << "PASSED" << std::endl;
    return true;
}

// Test 3: Float to integer only for integral values
static bool test_float_to_integer(lrt_State* L) {
    std::cout << "Test 3: Float to integer conversion... ";
    lrt_settop(L, 0);

    int isnum = 0;
    lrt_pushnumber(L, 3.0);
    if (lrt_tointegerx(L, -1, &isnum) != 3 || !isnum) {
        std::cout << "FAILED: 3.0 not converted" << std::endl;
        return false;
    }
    lrt_pushnumber(L, 3.5);
    lrt_tointegerx(L, -1, &isnum);
    if (isnum) {
        std::cout << "FAILED: 3.5 converted" << std::endl;
        return false;
    }
    lrt_pushnumber(L, 1e100);
    lrt_tointegerx(L, -1, &isnum);
    if (isnum) {
        std::cout << "FAILED: 1e100 converted" << std::endl;
        return false;
    }
    lrt_pop(L, 3);

    std::cout << "PASSED" << std::endl;
    return true;
}

// Test 4: Number formatting
static bool test_number_format(lrt_State* L) {
    std::cout << "Test 4: Number to string formatting... ";
    lrt_settop(L, 0);

    struct { bool isint; lrt_Integer i; double f; const char* expected; } cases[] = {
        {true, 42, 0, "42"},
        {true, -9223372036854775807LL - 1, 0, "-9223372036854775808"},
        {false, 0, 3.0, "3.0"},
        {false, 0, -0.5, "-0.5"},
        {false, 0, 1e100, "1e+100"},
        {false, 0, 0.1, "0.1"},
    };

    for (const auto& c : cases) {
        if (c.isint) lrt_pushinteger(L, c.i);
        else lrt_pushnumber(L, c.f);
        size_t len;
        const char* s = lrt_tolstring(L, -1, &len);
        if (s == nullptr || std::string(s, len) != c.expected) {
            std::cout << "FAILED: expected '" << c.expected << "', got '"
                      << (s ? s : "(null)") << "'" << std::endl;
            return false;
        }
        if (lrt_type(L, -1) != LRT_TSTRING) {
            std::cout << "FAILED: number not converted in place" << std::endl;
            return false;
        }
        lrt_pop(L, 1);
    }

    /* non-convertible values give no string */
    lrt_pushboolean(L, 1);
    if (lrt_tolstring(L, -1, nullptr) != nullptr) {
        std::cout << "FAILED: boolean converted to string" << std::endl;
        return false;
    }
    lrt_pop(L, 1);

    std::cout << "PASSED" << std::endl;
    return true;
}

static int convert_table(lrt_State* L) {
    lrt_newtable(L);
    lrt_tonumber(L, -1);
    return 0;
}

static int convert_middle(lrt_State* L) {
    lrt_pushinteger(L, 1);
    lrt_newtable(L);
    lrt_pushinteger(L, 3);
    lrt_tointeger(L, -2);
    return 0;
}

// Test 5: Raising conversions report the index and type
static bool test_conversion_error(lrt_State* L) {
    std::cout << "Test 5: Conversion errors... ";
    lrt_settop(L, 0);

    int status = protect(L, convert_table);
    if (status != LRT_ERRCONV) {
        std::cout << "FAILED: status " << lrt_statusname(status) << std::endl;
        return false;
    }
    std::string msg = lrt_tostring(L, -1);
    if (msg != "cannot convert value at index 1 to number (a table)") {
        std::cout << "FAILED: message '" << msg << "'" << std::endl;
        return false;
    }
    lrt_pop(L, 1);

    /* a relative index is reported as its absolute position */
    status = protect(L, convert_middle);
    if (status != LRT_ERRCONV) {
        std::cout << "FAILED: status " << lrt_statusname(status) << std::endl;
        lrt_settop(L, 0);
        return false;
    }
    msg = lrt_tostring(L, -1);
    if (msg != "cannot convert value at index 2 to integer (a table)") {
        std::cout << "FAILED: message '" << msg << "'" << std::endl;
        lrt_settop(L, 0);
        return false;
    }
    lrt_pop(L, 1);

    std::cout << "PASSED" << std::endl;
    return true;
}

// Test 6: Truthiness
static bool test_toboolean(lrt_State* L) {
    std::cout << "Test 6: Truth values... ";
    lrt_settop(L, 0);

    lrt_pushnil(L);
    lrt_pushboolean(L, 0);
    lrt_pushinteger(L, 0);
    lrt_pushstring(L, "");
    if (lrt_toboolean(L, 1) || lrt_toboolean(L, 2) ||
        !lrt_toboolean(L, 3) || !lrt_toboolean(L, 4)) {
        std::cout << "FAILED: wrong truth values" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    std::cout << "PASSED" << std::endl;
    return true;
}

// Test 7: Equality and ordering
static bool test_compare(lrt_State* L) {
    std::cout << "Test 7: Equality and ordering... ";
    lrt_settop(L, 0);

    lrt_pushinteger(L, 1);
    lrt_pushnumber(L, 1.0);
    if (!lrt_compare(L, 1, 2, LRT_OPEQ) || !lrt_rawequal(L, 1, 2)) {
        std::cout << "FAILED: 1 ~= 1.0" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    lrt_pushstring(L, "abc");
    lrt_pushstring(L, "abd");
    if (!lrt_compare(L, 1, 2, LRT_OPLT) || lrt_compare(L, 2, 1, LRT_OPLE)) {
        std::cout << "FAILED: string ordering" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    /* large integers compare exactly against floats */
    lrt_pushinteger(L, (1LL << 53) + 1);
    lrt_pushnumber(L, 9007199254740992.0);
    if (lrt_compare(L, 1, 2, LRT_OPLE) || !lrt_compare(L, 2, 1, LRT_OPLT)) {
        std::cout << "FAILED: mixed integer/float ordering" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    lrt_pushnumber(L, std::nan(""));
    if (lrt_compare(L, 1, 1, LRT_OPEQ)) {
        std::cout << "FAILED: NaN equal to itself" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    lrt_newtable(L);
    lrt_newtable(L);
    if (lrt_compare(L, 1, 2, LRT_OPEQ) || !lrt_compare(L, 1, 1, LRT_OPEQ)) {
        std::cout << "FAILED: table identity" << std::endl;
        return false;
    }
    lrt_settop(L, 0);

    std::cout << "PASSED" << std::endl;
    return true;
}

static int compare_tables(lrt_State* L) {
    lrt_newtable(L);
    lrt_newtable(L);
    lrt_compare(L, 1, 2, LRT_OPLT);
    return 0;
}

// Test 8: Ordering between tables without a handler
static bool test_order_error(lrt_State* L) {
    std::cout << "Test 8: Ordering error... ";
    lrt_settop(L, 0);

    int status = protect(L, compare_tables);
    if (status != LRT_ERRRUN ||
        std::strcmp(lrt_tostring(L, -1), "attempt to compare two table values") != 0) {
        std::cout << "FAILED: " << lrt_statusname(status) << std::endl;
        return false;
    }
    lrt_pop(L, 1);

    std::cout << "PASSED" << std::endl;
    return true;
}

static int divide_by_zero(lrt_State* L) {
    lrt_pushinteger(L, 1);
    lrt_pushinteger(L, 0);
    lrt_arith(L, LRT_OPIDIV);
    return 1;
}

// Test 9: Arithmetic through the API
static bool test_arith(lrt_State* L) {
    std::cout << "Test 9: Arithmetic... ";
    lrt_settop(L, 0);

    lrt_pushinteger(L, 7);
    lrt_pushinteger(L, 2);
    lrt_arith(L, LRT_OPIDIV);
    if (!lrt_isinteger(L, -1) || lrt_tointeger(L, -1) != 3) {
        std::cout << "FAILED: 7 // 2" << std::endl;
        return false;
    }
    lrt_pop(L, 1);

    lrt_pushinteger(L, -7);
    lrt_pushinteger(L, 2);
    lrt_arith(L, LRT_OPMOD);
    if (lrt_tointeger(L, -1) != 1) {
        std::cout << "FAILED: -7 % 2" << std::endl;
        return false;
    }
    lrt_pop(L, 1);

    lrt_pushinteger(L, 7);
    lrt_pushinteger(L, 2);
    lrt_arith(L, LRT_OPDIV);
    if (lrt_isinteger(L, -1) || lrt_tonumber(L, -1) != 3.5) {
        std::cout << "FAILED: 7 / 2" << std::endl;
        return false;
    }
    lrt_pop(L, 1);

    lrt_pushinteger(L, LRT_MAXINTEGER);
    lrt_pushinteger(L, 1);
    lrt_arith(L, LRT_OPADD);
    if (lrt_tointeger(L, -1) != LRT_MININTEGER) {
        std::cout << "FAILED: integer addition does not wrap" << std::endl;
        return false;
    }
    lrt_pop(L, 1);

    int status = protect(L, divide_by_zero);
    if (status != LRT_ERRRUN ||
        std::strcmp(lrt_tostring(L, -1), "attempt to perform 'n//0'") != 0) {
        std::cout << "FAILED: integer division by zero" << std::endl;
        return false;
    }
    lrt_pop(L, 1);

    std::cout << "PASSED" << std::endl;
    return true;
}

// Test 10: Userdata and type names
static bool test_userdata(lrt_State* L) {
    std::cout << "Test 10: Userdata blocks and type names... ";
    lrt_settop(L, 0);

    void* p = lrt_newuserdata(L, 64, 7);
    std::memset(p, 0xab, 64);
    if (lrt_touserdata(L, -1) != p || lrt_userdatatag(L, -1) != 7 ||
        lrt_rawlen(L, -1) != 64) {
        std::cout << "FAILED: userdata block" << std::endl;
        return false;
    }
    if (std::strcmp(lrt_typename(L, lrt_type(L, -1)), "userdata") != 0 ||
        std::strcmp(lrt_typename(L, LRT_TNONE), "no value") != 0) {
        std::cout << "FAILED: type names" << std::endl;
        return false;
    }
    lrt_pop(L, 1);

    std::cout << "PASSED" << std::endl;
    return true;
}

int main() {
    std::cout << "=== Values Test Suite ===" << std::endl;
    std::cout << std::endl;

    lrt_State* L = lrtL_newstate();
    if (!L) {
        std::cerr << "Failed to create state" << std::endl;
        return 1;
    }

    int failures = 0;
    failures += !test_numerals(L);
    failures += !test_bad_numerals(L);
    failures += !test_float_to_integer(L);
    failures += !test_number_format(L);
    failures += !test_conversion_error(L);
    failures += !test_toboolean(L);
    failures += !test_compare(L);
    failures += !test_order_error(L);
    failures += !test_arith(L);
    failures += !test_userdata(L);

    std::cout << std::endl;
    std::cout << "=== " << failures << " test(s) failed ===" << std::endl;

    lrt_close(L);
    return failures;
}
