#ifndef BRANDREF_REFERENCE_HPP
#define BRANDREF_REFERENCE_HPP

#include <cassert>
#include <cstddef>      // for size_t
#include <type_traits>  // for std::enable_if_t
#include <utility>      // for std::move, std::pair

#include "brandref/brand.hpp"
#include "brandref/owned.hpp"
#include "brandref/storage.hpp"
#include "brandref/verify.hpp"

// Ref<T, B, Level> - A branded reference into a divided Owned value
//
// Level 0 is the unique mutable view. split() turns one reference into two
// read-only references one level up; join() takes two references of the same
// brand and level back down one level. A level-0 reference that has been
// joined all the way back is the only survivor of its tree and may be
// reconstructed with its Husk.
//
// Guarantees:
// - Mutable access exists only on Ref<T, B, 0>
// - join() and reconstruct() only accept the same brand type B
// - join() is unavailable at level 0, reconstruct() above it; the level
//   gates compare against Level itself, so explicit template arguments
//   cannot open them
// - Not copyable: a copy of a level-0 reference would be a second writer
// - Dropping a reference leaves the value in place (a leak, never a free)

// @safe
namespace brandref {

template<typename T, typename B, std::size_t Level>
class Ref {
    static_assert(is_brand<B>::value, "Ref must be tagged with a Brand");

private:
    T* ptr;
    B brand;

public:
    using value_type = T;
    using brand_type = B;
    static constexpr std::size_t level = Level;

    // @unsafe
    // 1. `p` must belong to an Owned divided by Owned::split() with a brand
    //    of type B.
    // 2. Only one Ref of level 0 may be made this way. Every other Ref comes
    //    from split() (one level up) or join() (one level down).
    Ref(T* p, B b) : ptr(p), brand(std::move(b)) {
        BRANDREF_VERIFY(p != nullptr, "creating a reference to a null location");
    }

    Ref(const Ref&) = delete;
    Ref& operator=(const Ref&) = delete;

    Ref(Ref&& other) noexcept : ptr(other.ptr), brand(std::move(other.brand)) {
        other.ptr = nullptr;
    }

    Ref& operator=(Ref&& other) noexcept {
        if (this != &other) {
            ptr = other.ptr;
            brand = std::move(other.brand);
            other.ptr = nullptr;
        }
        return *this;
    }

    bool is_valid() const {
        return ptr != nullptr;
    }

    // Split into two read-only references of the next level
    std::pair<Ref<T, B, Level + 1>, Ref<T, B, Level + 1>> split() && {
        assert(ptr != nullptr && "split() on a moved-from Ref");
        T* p = ptr;
        ptr = nullptr;
        std::pair<B, B> brands = std::move(brand).duplicate();
        return std::pair<Ref<T, B, Level + 1>, Ref<T, B, Level + 1>>(
            Ref<T, B, Level + 1>(p, std::move(brands.first)),
            Ref<T, B, Level + 1>(p, std::move(brands.second)));
    }

    // Join with the other half of a split, one level down
    template<std::size_t L = Level,
             std::enable_if_t<L == Level && (L > 0), int> = 0>
    Ref<T, B, Level - 1> join(Ref&& other) && {
        assert(this != &other && "join() with itself");
        assert(ptr != nullptr && other.ptr != nullptr && "join() on a moved-from Ref");
        assert(ptr == other.ptr && "joined references point to different values");
        T* p = ptr;
        ptr = nullptr;
        other.ptr = nullptr;
        return Ref<T, B, Level - 1>(p, std::move(brand));
    }

    // Give the last reference back to its Husk, recovering ownership
    // @lifetime: owned
    template<typename Kind, std::size_t L = Level,
             std::enable_if_t<L == Level && L == 0, int> = 0>
    Owned<T, Kind> reconstruct(Husk<T, B, Kind>&& husk) && {
        assert(ptr != nullptr && "reconstruct() on a moved-from Ref");
        T* p = ptr;
        ptr = nullptr;
        // This was the last reference, so the storage can be rejoined
        return Owned<T, Kind>::from_inner(storage_traits<Kind, T>::rejoin(
            std::move(husk).into_inner(), p));
    }

    // @lifetime: (&'a) -> &'a
    const T& operator*() const {
        assert(ptr != nullptr);
        return *ptr;
    }

    // @lifetime: (&'a) -> &'a
    const T* operator->() const {
        assert(ptr != nullptr);
        return ptr;
    }

    // @lifetime: (&'a) -> &'a
    const T* get() const {
        return ptr;
    }

    // @lifetime: (&'a mut) -> &'a mut
    template<std::size_t L = Level, std::enable_if_t<L == Level && L == 0, int> = 0>
    T& operator*() {
        assert(ptr != nullptr);
        return *ptr;
    }

    // @lifetime: (&'a mut) -> &'a mut
    template<std::size_t L = Level, std::enable_if_t<L == Level && L == 0, int> = 0>
    T* operator->() {
        assert(ptr != nullptr);
        return ptr;
    }

    // @lifetime: (&'a mut) -> &'a mut
    template<std::size_t L = Level, std::enable_if_t<L == Level && L == 0, int> = 0>
    T* get_mut() {
        return ptr;
    }
};

// The unique mutable reference
template<typename T, typename B>
using RefMut = Ref<T, B, 0>;

} // namespace brandref

#endif // BRANDREF_REFERENCE_HPP
