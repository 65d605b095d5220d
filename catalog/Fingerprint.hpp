#pragma once
#include "catalog/types.hpp"
#include <string>

namespace catalog {

/** Computes the SHA-256 fingerprint of the given raw content bytes.
 *
 * \throws std::runtime_error if the digest cannot be computed.
 */
Fingerprint fingerprint(const std::string &bytes);

/// Returns the lowercase hexadecimal representation of a fingerprint.
std::string to_hex(const Fingerprint &fp);

}
