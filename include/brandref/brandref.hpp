#ifndef BRANDREF_HPP
#define BRANDREF_HPP

// brandref - Branded ownership and references without lifetimes
//
// A value is owned by an Owned<T, Kind>. Borrowing divides it into a Husk
// and a level-0 Ref, both tagged with a brand whose type no other borrow can
// produce. References split into read-only halves and join back into the
// mutable one; the mutable one rejoins its Husk to recover ownership.
// Mixing references or husks of different borrows does not compile.
//
//   auto owned = brandref::make_owned(0);
//   auto borrowed = BRANDREF_BORROW(std::move(owned));
//   *borrowed.second += 1;
//   auto halves = std::move(borrowed.second).split();
//   assert(*halves.first == *halves.second);
//   auto ref = std::move(halves.first).join(std::move(halves.second));
//   owned = std::move(ref).reconstruct(std::move(borrowed.first));
//   int value = std::move(owned).into_inner();

#include "brandref/brand.hpp"
#include "brandref/box.hpp"
#include "brandref/storage.hpp"
#include "brandref/owned.hpp"
#include "brandref/reference.hpp"
#include "brandref/borrow.hpp"

#endif // BRANDREF_HPP
