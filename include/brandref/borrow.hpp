#ifndef BRANDREF_BORROW_HPP
#define BRANDREF_BORROW_HPP

#include <utility>  // for std::move, std::pair

#include "brandref/brand.hpp"
#include "brandref/owned.hpp"
#include "brandref/reference.hpp"

// borrow() - Divide an Owned into a Husk and the unique mutable Ref
//
// This is the one sanctioned way to start borrowing: the brand is duplicated
// here, one copy goes to the Husk, the other to the level-0 Ref, and nothing
// else ever sees either copy.

// @safe
namespace brandref {

namespace detail {

struct borrower {
    template<typename T, typename Kind, typename Tag>
    static std::pair<Husk<T, Brand<Tag>, Kind>, RefMut<T, Brand<Tag>>>
    borrow(Owned<T, Kind>&& owned, Brand<Tag>&& brand) {
        std::pair<Brand<Tag>, Brand<Tag>> brands = std::move(brand).duplicate();
        std::pair<Husk<T, Brand<Tag>, Kind>, T*> divided =
            std::move(owned).split(std::move(brands.first));
        return std::pair<Husk<T, Brand<Tag>, Kind>, RefMut<T, Brand<Tag>>>(
            std::move(divided.first),
            RefMut<T, Brand<Tag>>(divided.second, std::move(brands.second)));
    }
};

} // namespace detail

// @unsafe
// `brand` must be fresh. A BRANDREF_BRAND() expanded in a function that runs
// twice is not. BRANDREF_BORROW() is the safe entry point.
template<typename T, typename Kind, typename Tag>
std::pair<Husk<T, Brand<Tag>, Kind>, RefMut<T, Brand<Tag>>>
borrow(Owned<T, Kind>&& owned, Brand<Tag> brand) {
    return detail::borrower::borrow(std::move(owned), std::move(brand));
}

} // namespace brandref

// Borrow an Owned rvalue under a brand nothing else can carry:
//
//   auto borrowed = BRANDREF_BORROW(std::move(owned));
//   auto& husk = borrowed.first;
//   auto& ref = borrowed.second;
#define BRANDREF_BORROW(owned) (::brandref::borrow((owned), BRANDREF_BRAND()))

#endif // BRANDREF_BORROW_HPP
