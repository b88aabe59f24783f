// Repository: BatchScribe
// Component: Filesystem object store implementation
// Copyright (c) 2025 BatchScribe

#include "batchscribe/archive/FileObjectStore.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <utility>
#include <sys/stat.h>

#include "batchscribe/util/JsonEscape.hpp"
#include "batchscribe/util/Logger.hpp"
#include "batchscribe/util/Timestamp.hpp"

namespace batchscribe::archive {

namespace {

bool EnsureDir(const std::string& dir, std::string* err) {
  if (mkdir(dir.c_str(), 0755) != 0 && errno != EEXIST) {
    *err = "mkdir " + dir + ": " + std::strerror(errno);
    return false;
  }
  return true;
}

// Session ids come from the server, but keep the key a single path segment.
std::string SafeSegment(const std::string& s) {
  std::string out = s;
  for (char& c : out) {
    if (c == '/' || c == '\\') c = '_';
  }
  return out;
}

}  // namespace

FileObjectStore::FileObjectStore(std::string root, const time::ITimeSource& clock)
    : root_(std::move(root)), clock_(clock) {}

std::string FileObjectStore::MetadataToJson(const Metadata& metadata) {
  std::ostringstream o;
  o << "{";
  bool first = true;
  for (const auto& [key, value] : metadata) {
    if (!first) o << ",";
    first = false;
    o << "\"" << util::JsonEscape(key) << "\":\"" << util::JsonEscape(value) << "\"";
  }
  o << "}";
  return o.str();
}

StoreOutcome FileObjectStore::Store(const std::string& session_id,
                                    const std::vector<uint8_t>& wav,
                                    const Metadata& metadata) {
  if (root_.empty()) {
    util::Logger::Info("[FileObjectStore] archive root not configured; skipping session=" +
                       session_id);
    return StoreOutcome::Skipped();
  }

  std::string err;
  const std::string dir = root_ + "/recordings";
  if (!EnsureDir(root_, &err) || !EnsureDir(dir, &err)) {
    return StoreOutcome::Failed(err);
  }

  const std::string stem = "recordings/" + SafeSegment(session_id) + "_" +
                           util::FormatUtcObjectStamp(clock_.NowUtcMs());
  const std::string wav_path = root_ + "/" + stem + ".wav";
  const std::string meta_path = root_ + "/" + stem + ".json";

  {
    std::ofstream out(wav_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      return StoreOutcome::Failed("cannot open " + wav_path);
    }
    out.write(reinterpret_cast<const char*>(wav.data()),
              static_cast<std::streamsize>(wav.size()));
    if (!out) {
      return StoreOutcome::Failed("short write " + wav_path);
    }
  }
  {
    std::ofstream out(meta_path, std::ios::trunc);
    if (!out) {
      return StoreOutcome::Failed("cannot open " + meta_path);
    }
    out << MetadataToJson(metadata) << "\n";
  }

  util::Logger::Info("[FileObjectStore] stored session=" + session_id + " handle=" + stem +
                     ".wav bytes=" + std::to_string(wav.size()));
  return StoreOutcome::Stored(stem + ".wav");
}

}  // namespace batchscribe::archive
