#ifndef BRANDREF_STORAGE_HPP
#define BRANDREF_STORAGE_HPP

#include <type_traits>  // for std::false_type, std::true_type
#include <utility>      // for std::move, std::pair

#include "brandref/box.hpp"
#include "brandref/verify.hpp"

// Storage kinds - how an owned value is allocated, divided and rejoined
//
// A storage kind is a tag type with a specialization of storage_traits:
//
//   Residual   what is left in the Husk while the value is borrowed
//   Container  the owning representation held by Owned
//
//   divide(Container&&)       -> (Residual, T*)   never fails
//   rejoin(Residual&&, T*)    -> Container        @unsafe
//   extract(Container&&)      -> T                never fails
//
// rejoin() may only be given a pointer obtained from divide() on the same
// value, and only once no reference to that pointer remains. Violating this
// is undefined behavior, not a reported error.
//
// Only Heap is provided. A stack-backed kind would need a residual that
// pins the value in place.

// @safe
namespace brandref {

template<typename Kind, typename T>
struct storage_traits;

// Heap-allocated storage kind
struct Heap {};

// The residual of a heap value carries nothing: the pointer is the allocation
struct HeapResidual {};

template<typename T>
struct storage_traits<Heap, T> {
    using Residual = HeapResidual;
    using Container = Box<T>;

    static std::pair<Residual, T*> divide(Container&& inner) {
        T* ptr = inner.into_raw();
        BRANDREF_VERIFY(ptr != nullptr, "dividing an empty Box");
        return std::pair<Residual, T*>(Residual{}, ptr);
    }

    // @unsafe
    static Container rejoin(Residual&&, T* ptr) {
        BRANDREF_VERIFY(ptr != nullptr, "rejoining a null location");
        return Container::from_raw(ptr);
    }

    static T extract(Container&& inner) {
        Container owned(std::move(inner));
        return T(std::move(*owned));
    }
};

template<typename Kind, typename T, typename = void>
struct is_storage_kind : std::false_type {};

template<typename Kind, typename T>
struct is_storage_kind<Kind, T,
    decltype(void(sizeof(storage_traits<Kind, T>)))> : std::true_type {};

} // namespace brandref

#endif // BRANDREF_STORAGE_HPP
