// Demo of branded ownership: borrow, split, join, reconstruct

#include "brandref/brandref.hpp"
#include <cstdio>
#include <string>

// @safe
namespace demo {

// Example 1: Owned - the whole value
// @safe
void demo_owned() {
    printf("\n=== Owned Demo ===\n");

    auto owned = brandref::make_owned(std::string("hello"));
    std::string value = std::move(owned).into_inner();
    printf("Moved out: %s\n", value.c_str());

    // owned is empty now:
    // std::move(owned).into_inner();  // Error: use after move
}

// Example 2: the unique mutable reference
// @safe
void demo_mutable() {
    printf("\n=== Mutable Ref Demo ===\n");

    auto [husk, ref] = BRANDREF_BORROW(brandref::make_owned(0));
    *ref += 1;
    printf("Level %zu reference sees %d\n", decltype(ref)::level, *ref);

    auto owned = std::move(ref).reconstruct(std::move(husk));
    printf("Reconstructed: %d\n", std::move(owned).into_inner());
}

// Example 3: split into readers, join back into the writer
// @safe
void demo_split_join() {
    printf("\n=== Split/Join Demo ===\n");

    auto [husk, ref] = BRANDREF_BORROW(brandref::make_owned(1));
    auto [reader1, reader2] = std::move(ref).split();
    printf("Readers at level %zu: %d %d\n", decltype(reader1)::level, *reader1, *reader2);

    // Readers cannot write:
    // *reader1 += 1;  // Error: assignment of read-only location

    auto writer = std::move(reader1).join(std::move(reader2));
    *writer += 1;
    printf("Writer after join: %d\n", *writer);

    auto owned = std::move(writer).reconstruct(std::move(husk));
    printf("Final value: %d\n", std::move(owned).into_inner());
}

// Example 4: borrows never mix
// @safe
void demo_cross_origin() {
    printf("\n=== Cross-Origin Demo ===\n");

    auto [husk1, ref1] = BRANDREF_BORROW(brandref::make_owned(10));
    auto [husk2, ref2] = BRANDREF_BORROW(brandref::make_owned(20));

    // Neither of these compiles:
    // std::move(ref2).reconstruct(std::move(husk1));
    // auto [a, b] = std::move(ref1).split();
    // auto [c, d] = std::move(ref2).split();
    // std::move(b).join(std::move(d));

    auto owned1 = std::move(ref1).reconstruct(std::move(husk1));
    auto owned2 = std::move(ref2).reconstruct(std::move(husk2));
    printf("Sum: %d\n", std::move(owned1).into_inner() + std::move(owned2).into_inner());
}

} // namespace demo

int main() {
    printf("Branded ownership demo\n");

    demo::demo_owned();
    demo::demo_mutable();
    demo::demo_split_join();
    demo::demo_cross_origin();

    printf("\nDone.\n");
    return 0;
}
