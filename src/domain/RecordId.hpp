/**
 * @file RecordId.hpp
 * @brief Identifier type shared by every persisted record.
 */

#pragma once

#include <cstdint>

namespace deskpal::domain {

/// Assigned by the store, starting at 1, never reused within a collection.
using RecordId = std::uint64_t;

} // namespace deskpal::domain
