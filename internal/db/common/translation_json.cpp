#include "translation_json.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "checkout/manager/v1/types.pb.h"

namespace checkout::db {

std::string EncodeTranslations(const std::vector<model::TranslationRecord>& translations) {
  checkout::manager::v1::ProductTranslationSet set;
  for (const auto& t : translations) {
    auto* out = set.add_translations();
    out->set_id(t.id);
    out->set_language_id(t.language_id);
    out->set_name(t.name);
    out->set_description(t.description);
  }

  std::string                             json;
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;
  const auto status                  = google::protobuf::util::MessageToJsonString(set, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to encode translations: " + std::string(status.message()));
  }
  return json;
}

std::vector<model::TranslationRecord> DecodeTranslations(const std::string& json) {
  if (json.empty()) return {};

  checkout::manager::v1::ProductTranslationSet set;
  const auto status = google::protobuf::util::JsonStringToMessage(json, &set);
  if (!status.ok()) {
    throw std::runtime_error("failed to decode translations: " + std::string(status.message()));
  }

  std::vector<model::TranslationRecord> out;
  out.reserve(set.translations_size());
  for (const auto& t : set.translations()) {
    out.push_back(model::TranslationRecord{t.id(), t.language_id(), t.name(), t.description()});
  }
  return out;
}

} // namespace checkout::db
