/**
 * @file Note.hpp
 * @brief Domain entity for a free-form text note.
 */

#pragma once

#include <string>
#include "RecordId.hpp"
#include "Timestamp.hpp"

namespace deskpal::domain {

struct Note {
    RecordId id = 0;
    std::string text;      ///< Only ever replaced as a whole.
    Timestamp createdAt{};
    Timestamp updatedAt{}; ///< Equals createdAt until the text is replaced.
};

} // namespace deskpal::domain
