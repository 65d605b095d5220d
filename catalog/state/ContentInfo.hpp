#pragma once
#include "catalog/types.hpp"
#include <cstdint>

namespace catalog { namespace state {

/** Records a published content item.  Everything but the view count is fixed at publication. */
struct ContentInfo {
    /// Creates the record of a newly published item, with no views.
    ContentInfo(content_t content, account_t author, genre_t genre)
        : content{content}, author{author}, genre{genre} {}

    /// The reference of the content manager holding the content
    const content_t content;

    /// The author who published it
    const account_t author;

    /// The genre tag reported at publication
    const genre_t genre;

    /// Number of access grants issued for this item, pay-per-view and premium together
    uint64_t views = 0;
};

}}
