// Repository: BatchScribe
// Component: Archive metadata normalization
// Copyright (c) 2025 BatchScribe

#include <algorithm>
#include <cctype>

#include "batchscribe/archive/IObjectStore.hpp"

namespace batchscribe::archive {

namespace {

constexpr size_t kMaxKeyLength = 1024;
constexpr size_t kMaxValueLength = 2048;

std::string SanitizeKey(const std::string& key) {
  std::string out;
  out.reserve(key.size());
  for (char c : key) {
    unsigned char uc = static_cast<unsigned char>(c);
    char lower = static_cast<char>(std::tolower(uc));
    if (std::isalnum(uc) || lower == '-' || lower == '_') {
      out += lower;
    } else {
      out += '_';
    }
    if (out.size() == kMaxKeyLength) break;
  }
  return out;
}

std::string SanitizeValue(const std::string& value) {
  size_t begin = 0;
  size_t end = value.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) --end;
  return value.substr(begin, std::min(end - begin, kMaxValueLength));
}

}  // namespace

Metadata NormalizeMetadata(const std::string& session_id,
                           const std::string& language,
                           const std::string& uploaded_at,
                           const Metadata& extra) {
  Metadata raw;
  raw["session_id"] = session_id;
  raw["language"] = language.empty() ? "unknown" : language;
  raw["uploaded_at"] = uploaded_at;
  for (const auto& [key, value] : extra) {
    raw[key] = value;
  }

  Metadata out;
  for (const auto& [key, value] : raw) {
    if (key.empty()) continue;
    out[SanitizeKey(key)] = SanitizeValue(value);
  }
  return out;
}

}  // namespace batchscribe::archive
