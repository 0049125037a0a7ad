#ifndef BRANDREF_OWNED_HPP
#define BRANDREF_OWNED_HPP

#include <cassert>
#include <type_traits>  // for std::decay_t
#include <utility>      // for std::move, std::forward, std::pair

#include "brandref/brand.hpp"
#include "brandref/storage.hpp"

// Owned<T, Kind> - Whole, undivided ownership of a value
// Husk<T, B, Kind> - What is left of an Owned while its value is borrowed
//
// Guarantees:
// - Owned is the only handle that can move the value out
// - An Owned is either whole or divided into a Husk and a reference tree,
//   never both: split() consumes it
// - A Husk pairs only with a level-0 Ref carrying the same brand type
// - Dropping a Husk without reconstructing strands the value (a leak)

// @safe
namespace brandref {

template<typename T, typename B, typename Kind>
class Husk;

template<typename T, typename Kind = Heap>
class Owned {
    static_assert(is_storage_kind<Kind, T>::value,
                  "Owned requires a storage kind with storage_traits<Kind, T>");

private:
    using traits = storage_traits<Kind, T>;

public:
    using value_type = T;
    using kind_type = Kind;
    using container_type = typename traits::Container;
    using residual_type = typename traits::Residual;

private:
    container_type inner;
    bool whole;

    explicit Owned(container_type c) : inner(std::move(c)), whole(true) {}

public:
    // Wrap a container. Always safe for a freshly built container; for one
    // coming out of storage_traits::rejoin() no reference may remain.
    // @unsafe
    // @lifetime: owned
    static Owned from_inner(container_type c) {
        return Owned(std::move(c));
    }

    Owned(const Owned&) = delete;
    Owned& operator=(const Owned&) = delete;

    Owned(Owned&& other) noexcept
        : inner(std::move(other.inner)), whole(other.whole) {
        other.whole = false;
    }

    Owned& operator=(Owned&& other) noexcept {
        if (this != &other) {
            inner = std::move(other.inner);
            whole = other.whole;
            other.whole = false;
        }
        return *this;
    }

    bool is_valid() const {
        return whole;
    }

    // Move the value out, ending ownership
    // @lifetime: owned
    T into_inner() && {
        assert(whole && "into_inner() on a moved-from Owned");
        whole = false;
        return traits::extract(std::move(inner));
    }

    // Divide into a Husk tagged with `brand` and the value's location.
    // @unsafe
    // The initial reference must be built from the returned pointer and a
    // brand of the same type B.
    template<typename B>
    std::pair<Husk<T, B, Kind>, T*> split(B brand) && {
        static_assert(is_brand<B>::value, "Owned::split() takes a Brand");
        assert(whole && "split() on a moved-from Owned");
        whole = false;
        std::pair<residual_type, T*> divided = traits::divide(std::move(inner));
        return std::pair<Husk<T, B, Kind>, T*>(
            Husk<T, B, Kind>(std::move(divided.first), std::move(brand)),
            divided.second);
    }
};

template<typename T, typename B, typename Kind = Heap>
class Husk {
    static_assert(is_brand<B>::value, "Husk must be tagged with a Brand");

public:
    using residual_type = typename storage_traits<Kind, T>::Residual;
    using brand_type = B;

private:
    residual_type inner;
    B brand;

    Husk(residual_type r, B b) : inner(std::move(r)), brand(std::move(b)) {}

    friend class Owned<T, Kind>;

public:
    Husk(const Husk&) = delete;
    Husk& operator=(const Husk&) = delete;

    Husk(Husk&&) noexcept = default;
    Husk& operator=(Husk&&) noexcept = default;

    // Forget the brand, leaving the bare residual
    residual_type into_inner() && {
        return std::move(inner);
    }
};

// Allocate `value` on the heap and take sole ownership of it
// @lifetime: owned
template<typename T>
Owned<std::decay_t<T>, Heap> make_owned(T&& value) {
    using U = std::decay_t<T>;
    return Owned<U, Heap>::from_inner(Box<U>::new_(std::forward<T>(value)));
}

// Construct the value in place on the heap
// @lifetime: owned
template<typename T, typename... Args>
Owned<T, Heap> make_owned_in_place(Args&&... args) {
    return Owned<T, Heap>::from_inner(Box<T>::new_(std::forward<Args>(args)...));
}

} // namespace brandref

#endif // BRANDREF_OWNED_HPP
