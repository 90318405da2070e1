#pragma once

#include <string>
#include <vector>

#include "internal/db/model/catalog_record.hpp"

namespace checkout::db {

/*
  Order item translations are stored as one JSON column
  (sqlite TEXT, postgres JSONB) using the ProductTranslationSet
  proto JSON mapping.
*/

std::string EncodeTranslations(const std::vector<model::TranslationRecord>& translations);

// Throws std::runtime_error on malformed JSON.
std::vector<model::TranslationRecord> DecodeTranslations(const std::string& json);

} // namespace checkout::db
