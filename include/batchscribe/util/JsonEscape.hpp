// Repository: BatchScribe
// Component: JSON string escaping
// Purpose: Escapes text for embedding in hand-written JSON documents.
// Copyright (c) 2025 BatchScribe

#ifndef BATCHSCRIBE_UTIL_JSON_ESCAPE_HPP_
#define BATCHSCRIBE_UTIL_JSON_ESCAPE_HPP_

#include <string>

namespace batchscribe::util {

// Returns s escaped for use between JSON double quotes. Quote, backslash and
// every byte below 0x20 are escaped; other bytes pass through unchanged.
std::string JsonEscape(const std::string& s);

}  // namespace batchscribe::util

#endif  // BATCHSCRIBE_UTIL_JSON_ESCAPE_HPP_
