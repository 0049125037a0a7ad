#ifndef BRANDREF_BRAND_HPP
#define BRANDREF_BRAND_HPP

#include <cstddef>      // for size_t
#include <type_traits>  // for std::false_type, std::true_type
#include <utility>      // for std::move, std::pair

// Brand<Tag> - A zero-sized, unforgeable proof of common origin
//
// Guarantees:
// - Carries no data (std::is_empty holds)
// - Two brands are compatible iff they have the same type
// - Not copyable: copying a brand would be duplicating it
// - Duplication is private to split() and borrow()
//
// Every BRANDREF_BRAND() expansion produces a brand of a type no other
// expansion can produce. Note that one expansion evaluated several times
// (in a loop, or in a function called twice) yields the same type each time.

// @safe
namespace brandref {

template<typename T, typename B, std::size_t Level>
class Ref;

namespace detail {
struct borrower;
}

// Tag made unique by the closure type of a lambda expression
template<typename F>
struct closure_tag {};

// Tag made unique by __COUNTER__. Unique within a translation unit only.
template<unsigned long N>
struct counter_tag {};

template<typename Tag>
class Brand {
private:
    // User-provided so that Brand is not an aggregate: Brand{} must not compile
    Brand() {}

    // @unsafe
    // Only allowed to:
    // 1. Split a reference into two references of the next level
    // 2. Obtain a husk and a reference from an owned value
    std::pair<Brand, Brand> duplicate() && {
        return std::pair<Brand, Brand>(Brand(), Brand());
    }

    template<typename, typename, std::size_t>
    friend class Ref;
    friend struct detail::borrower;

public:
    using tag_type = Tag;

    Brand(const Brand&) = delete;
    Brand& operator=(const Brand&) = delete;

    Brand(Brand&&) noexcept = default;
    Brand& operator=(Brand&&) noexcept = default;

    // Implementation detail of the BRANDREF_*_BRAND() macros.
    // @unsafe
    // Calling this twice with the same Tag creates two compatible brands,
    // which has the same implications as duplication.
    static Brand unchecked() {
        return Brand();
    }
};

template<typename B>
struct is_brand : std::false_type {};

template<typename Tag>
struct is_brand<Brand<Tag>> : std::true_type {};

// @unsafe
template<typename F>
Brand<closure_tag<F>> closure_brand(F) {
    return Brand<closure_tag<F>>::unchecked();
}

} // namespace brandref

// A new unique brand, typed after the lambda written in this expansion.
// Compiler diagnostics name the closure type, which is hard to read.
#define BRANDREF_CLOSURE_BRAND() (::brandref::closure_brand([] {}))

// A new unique brand, typed after __COUNTER__. Diagnostics read
// counter_tag<N>. Brands must not cross translation units.
#define BRANDREF_COUNTER_BRAND() \
    (::brandref::Brand< ::brandref::counter_tag<__COUNTER__>>::unchecked())

#ifdef BRANDREF_COUNTER_BRANDS
#define BRANDREF_BRAND() BRANDREF_COUNTER_BRAND()
#else
#define BRANDREF_BRAND() BRANDREF_CLOSURE_BRAND()
#endif

#endif // BRANDREF_BRAND_HPP
