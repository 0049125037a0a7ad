#ifndef BRANDREF_BOX_HPP
#define BRANDREF_BOX_HPP

#include <cassert>
#include <new>      // for std::nothrow
#include <utility>  // for std::move, std::forward

#include "brandref/verify.hpp"

// Box<T> - A heap-allocated value with single ownership
// The container of the Heap storage kind.
//
// Guarantees:
// - Single ownership (no copying)
// - Automatic deallocation when Box goes out of scope
// - Move semantics only
// - Null state after move or into_raw()
// - Allocation failure aborts

// @safe
namespace brandref {

template<typename T>
class Box {
private:
    T* ptr;

public:
    Box() : ptr(nullptr) {}

    // @lifetime: owned
    template<typename... Args>
    static Box<T> new_(Args&&... args) {
        T* p = new (std::nothrow) T(std::forward<Args>(args)...);
        BRANDREF_VERIFY(p != nullptr, "out of memory while allocating a Box");
        return Box<T>(p);
    }

    // Adopt a pointer previously released by into_raw()
    // @unsafe
    // @lifetime: owned
    static Box<T> from_raw(T* p) {
        return Box<T>(p);
    }

    Box(const Box&) = delete;
    Box& operator=(const Box&) = delete;

    // @lifetime: owned
    Box(Box&& other) noexcept : ptr(other.ptr) {
        other.ptr = nullptr;
    }

    // @lifetime: owned
    Box& operator=(Box&& other) noexcept {
        if (this != &other) {
            delete ptr;
            ptr = other.ptr;
            other.ptr = nullptr;
        }
        return *this;
    }

    ~Box() {
        delete ptr;
    }

    // @lifetime: (&'a) -> &'a
    T& operator*() {
        assert(ptr != nullptr);
        return *ptr;
    }

    // @lifetime: (&'a) -> &'a
    const T& operator*() const {
        assert(ptr != nullptr);
        return *ptr;
    }

    // @lifetime: (&'a) -> &'a
    T* operator->() {
        assert(ptr != nullptr);
        return ptr;
    }

    // @lifetime: (&'a) -> &'a
    const T* operator->() const {
        assert(ptr != nullptr);
        return ptr;
    }

    bool is_valid() const {
        return ptr != nullptr;
    }

    explicit operator bool() const {
        return is_valid();
    }

    // Give up ownership of the allocation; the Box is empty afterwards
    // @lifetime: owned
    T* into_raw() {
        T* temp = ptr;
        ptr = nullptr;
        return temp;
    }

    // @lifetime: (&'a) -> &'a
    T* get() const {
        return ptr;
    }

private:
    explicit Box(T* p) : ptr(p) {}
};

} // namespace brandref

#endif // BRANDREF_BOX_HPP
