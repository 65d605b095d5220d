#pragma once
#include <eris/types.hpp>
#include <array>
#include <cstdint>

/// \file catalog/types.hpp Scalar types shared by every part of the catalog.

/// Primary namespace for all Catalog library code.
namespace catalog {

/** Identity of an account (an author, a consumer, the owner, or the catalog itself).  The value 0
 * is never a valid account and is used as the "nobody" sentinel.
 */
using account_t = eris::eris_id_t;

/** Reference to a published content item; this is the address of the content manager
 * collaborator that holds the content.  The value 0 is the empty sentinel returned by queries that
 * found nothing.
 */
using content_t = eris::eris_id_t;

/// Currency amount, in the smallest currency unit.
using amount_t = uint64_t;

/// Absolute time, in seconds.
using timestamp_t = uint64_t;

/// Opaque genre tag.  The catalog never interprets it beyond equality.
using genre_t = uint32_t;

/// A 32-byte cryptographic digest of a content item's raw bytes.
using Fingerprint = std::array<uint8_t, 32>;

/// Number of seconds in a day, for period settings.
constexpr timestamp_t DAY = 86400;

}
