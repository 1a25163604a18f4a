/*
** $Id: lrtallocator.h $
** Standard C++ Allocator for state-accounted memory
** See Copyright Notice in lrt.h
*/

#ifndef lrtallocator_h
#define lrtallocator_h

#include <cstddef>
#include <limits>
#include <new>
#include <type_traits>

#include "lmem.h"

/*
** LrtAllocator - Standard C++ allocator that draws from a state's
** allocator function
**
** Containers owned by runtime objects (table parts, the string table,
** prototype code) use it so that their memory shows up in the state's
** accounting ('lrt_gc(L, LRT_GCCOUNT)') and is released through the
** host allocator. It is bound to the 'global_State' and not to a thread,
** because objects outlive the thread that created them.
**
** Usage example:
**   std::vector<int, LrtAllocator<int>> vec{LrtAllocator<int>(G(L))};
**   vec.push_back(42);
**
** Allocation failures throw std::bad_alloc; protected calls turn it
** into an LRT_ERRMEM status.
*/
template<typename T>
class LrtAllocator {
public:
    using value_type = T;
    using size_type = std::size_t;
    using difference_type = std::ptrdiff_t;
    using propagate_on_container_move_assignment = std::true_type;
    using is_always_equal = std::false_type;

    explicit LrtAllocator(global_State* g) noexcept : g_(g) {
        lrt_assert(g != nullptr);
    }

    LrtAllocator(const LrtAllocator& other) noexcept = default;

    // Copy constructor for different types (rebinding)
    template<typename U>
    LrtAllocator(const LrtAllocator<U>& other) noexcept : g_(other.getGlobal()) {}

    [[nodiscard]] T* allocate(std::size_t n) {
        if (n == 0) return nullptr;
        if (n > std::numeric_limits<std::size_t>::max() / sizeof(T))
            throw std::bad_array_new_length();
        void* p = lrtM_galloc(g_, nullptr, 0, n * sizeof(T));
        if (p == nullptr)
            throw std::bad_alloc();
        return static_cast<T*>(p);
    }

    void deallocate(T* p, std::size_t n) noexcept {
        if (p == nullptr) return;
        lrtM_galloc(g_, p, n * sizeof(T), 0);
    }

    global_State* getGlobal() const noexcept { return g_; }

    // allocators are equal if they draw from the same state
    template<typename U>
    bool operator==(const LrtAllocator<U>& other) const noexcept {
        return g_ == other.getGlobal();
    }

    template<typename U>
    bool operator!=(const LrtAllocator<U>& other) const noexcept {
        return !(*this == other);
    }

private:
    global_State* g_;

    template<typename U> friend class LrtAllocator;
};

#endif
