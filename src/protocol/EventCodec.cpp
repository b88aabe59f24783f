// Repository: BatchScribe
// Component: Event codec implementation
// Copyright (c) 2025 BatchScribe

#include "batchscribe/protocol/EventCodec.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <vector>

#include "batchscribe/util/JsonEscape.hpp"

namespace batchscribe::protocol {

namespace {

using util::JsonEscape;

constexpr int kMaxNestingDepth = 32;
constexpr char kInvalidJson[] = "Invalid JSON format";

// Top-level member of the parsed object: key plus the raw value span.
struct Member {
  std::string key;
  size_t value_begin = 0;
  size_t value_end = 0;
};

void SkipWs(const std::string& s, size_t* pos) {
  while (*pos < s.size() && std::isspace(static_cast<unsigned char>(s[*pos]))) ++*pos;
}

void AppendUtf8(uint32_t cp, std::string* out) {
  if (cp < 0x80) {
    *out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    *out += static_cast<char>(0xC0 | (cp >> 6));
    *out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    *out += static_cast<char>(0xE0 | (cp >> 12));
    *out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    *out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    *out += static_cast<char>(0xF0 | (cp >> 18));
    *out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    *out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    *out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

// Reads four hex digits at s[at..at+3].
bool ReadHex4(const std::string& s, size_t at, uint32_t* out) {
  if (at + 4 > s.size()) return false;
  uint32_t v = 0;
  for (size_t k = at; k < at + 4; ++k) {
    char h = s[k];
    v <<= 4;
    if (h >= '0' && h <= '9') v |= static_cast<uint32_t>(h - '0');
    else if (h >= 'a' && h <= 'f') v |= static_cast<uint32_t>(h - 'a' + 10);
    else if (h >= 'A' && h <= 'F') v |= static_cast<uint32_t>(h - 'A' + 10);
    else return false;
  }
  *out = v;
  return true;
}

// Parses a JSON string starting at s[*pos] == '"'; leaves *pos after the
// closing quote.
bool ParseString(const std::string& s, size_t* pos, std::string* out) {
  if (*pos >= s.size() || s[*pos] != '"') return false;
  out->clear();
  for (size_t i = *pos + 1; i < s.size(); ++i) {
    char c = s[i];
    if (c == '"') {
      *pos = i + 1;
      return true;
    }
    if (c != '\\') {
      *out += c;
      continue;
    }
    if (++i >= s.size()) return false;
    switch (s[i]) {
      case '"': *out += '"'; break;
      case '\\': *out += '\\'; break;
      case '/': *out += '/'; break;
      case 'b': *out += '\b'; break;
      case 'f': *out += '\f'; break;
      case 'n': *out += '\n'; break;
      case 'r': *out += '\r'; break;
      case 't': *out += '\t'; break;
      case 'u': {
        uint32_t cp = 0;
        if (!ReadHex4(s, i + 1, &cp)) return false;
        i += 4;
        if (cp >= 0xDC00 && cp <= 0xDFFF) return false;  // Lone low surrogate.
        if (cp >= 0xD800 && cp <= 0xDBFF) {
          // High surrogate must be followed by an escaped low surrogate.
          uint32_t low = 0;
          if (i + 2 >= s.size() || s[i + 1] != '\\' || s[i + 2] != 'u' ||
              !ReadHex4(s, i + 3, &low) || low < 0xDC00 || low > 0xDFFF) {
            return false;
          }
          cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
          i += 6;
        }
        AppendUtf8(cp, out);
        break;
      }
      default:
        return false;
    }
  }
  return false;
}

bool SkipValue(const std::string& s, size_t* pos, int depth);

bool SkipContainer(const std::string& s, size_t* pos, int depth, char open, char close) {
  if (depth > kMaxNestingDepth) return false;
  ++*pos;  // past open
  SkipWs(s, pos);
  if (*pos < s.size() && s[*pos] == close) {
    ++*pos;
    return true;
  }
  while (*pos < s.size()) {
    if (open == '{') {
      std::string key;
      if (!ParseString(s, pos, &key)) return false;
      SkipWs(s, pos);
      if (*pos >= s.size() || s[*pos] != ':') return false;
      ++*pos;
      SkipWs(s, pos);
    }
    if (!SkipValue(s, pos, depth + 1)) return false;
    SkipWs(s, pos);
    if (*pos >= s.size()) return false;
    if (s[*pos] == close) {
      ++*pos;
      return true;
    }
    if (s[*pos] != ',') return false;
    ++*pos;
    SkipWs(s, pos);
  }
  return false;
}

bool SkipValue(const std::string& s, size_t* pos, int depth) {
  if (*pos >= s.size()) return false;
  char c = s[*pos];
  if (c == '"') {
    std::string ignored;
    return ParseString(s, pos, &ignored);
  }
  if (c == '{') return SkipContainer(s, pos, depth, '{', '}');
  if (c == '[') return SkipContainer(s, pos, depth, '[', ']');
  if (s.compare(*pos, 4, "true") == 0 || s.compare(*pos, 4, "null") == 0) {
    *pos += 4;
    return true;
  }
  if (s.compare(*pos, 5, "false") == 0) {
    *pos += 5;
    return true;
  }
  size_t start = *pos;
  while (*pos < s.size() &&
         (std::isdigit(static_cast<unsigned char>(s[*pos])) || s[*pos] == '-' ||
          s[*pos] == '+' || s[*pos] == '.' || s[*pos] == 'e' || s[*pos] == 'E')) {
    ++*pos;
  }
  return *pos > start;
}

// Splits a JSON object into its top-level members. Returns false if the
// text is not exactly one well-formed object.
bool ScanObject(const std::string& s, std::vector<Member>* members) {
  size_t pos = 0;
  SkipWs(s, &pos);
  if (pos >= s.size() || s[pos] != '{') return false;
  ++pos;
  SkipWs(s, &pos);
  if (pos < s.size() && s[pos] == '}') {
    ++pos;
  } else {
    while (true) {
      Member m;
      if (!ParseString(s, &pos, &m.key)) return false;
      SkipWs(s, &pos);
      if (pos >= s.size() || s[pos] != ':') return false;
      ++pos;
      SkipWs(s, &pos);
      m.value_begin = pos;
      if (!SkipValue(s, &pos, 1)) return false;
      m.value_end = pos;
      members->push_back(std::move(m));
      SkipWs(s, &pos);
      if (pos >= s.size()) return false;
      if (s[pos] == '}') {
        ++pos;
        break;
      }
      if (s[pos] != ',') return false;
      ++pos;
      SkipWs(s, &pos);
    }
  }
  SkipWs(s, &pos);
  return pos == s.size();
}

const Member* FindMember(const std::vector<Member>& members, const std::string& key) {
  // Last occurrence wins, as with most JSON readers.
  const Member* found = nullptr;
  for (const auto& m : members) {
    if (m.key == key) found = &m;
  }
  return found;
}

bool IsNull(const std::string& s, const Member& m) {
  return s.compare(m.value_begin, m.value_end - m.value_begin, "null") == 0;
}

bool ReadString(const std::string& s, const Member& m, std::string* out) {
  size_t pos = m.value_begin;
  return ParseString(s, &pos, out) && pos == m.value_end;
}

bool ReadInt64(const std::string& s, const Member& m, int64_t* out) {
  const std::string token = s.substr(m.value_begin, m.value_end - m.value_begin);
  if (token.empty()) return false;
  errno = 0;
  char* end = nullptr;
  long long v = std::strtoll(token.c_str(), &end, 10);
  if (errno != 0 || end != token.c_str() + token.size()) return false;
  *out = static_cast<int64_t>(v);
  return true;
}

bool ReadByteArray(const std::string& s, const Member& m, std::vector<uint8_t>* out) {
  size_t pos = m.value_begin;
  if (pos >= m.value_end || s[pos] != '[') return false;
  ++pos;
  out->clear();
  SkipWs(s, &pos);
  if (pos < m.value_end && s[pos] == ']') return true;
  while (pos < m.value_end) {
    unsigned value = 0;
    size_t digits = 0;
    while (pos < m.value_end && std::isdigit(static_cast<unsigned char>(s[pos]))) {
      value = value * 10 + static_cast<unsigned>(s[pos] - '0');
      if (value > 255) return false;
      ++pos;
      ++digits;
    }
    if (digits == 0) return false;
    out->push_back(static_cast<uint8_t>(value));
    SkipWs(s, &pos);
    if (pos >= m.value_end) return false;
    if (s[pos] == ']') return true;
    if (s[pos] != ',') return false;
    ++pos;
    SkipWs(s, &pos);
  }
  return false;
}

InboundType TypeFromName(const std::string& name) {
  if (name == "audio_chunk") return InboundType::kAudioChunk;
  if (name == "start_recording") return InboundType::kStartRecording;
  if (name == "stop_recording") return InboundType::kStopRecording;
  if (name == "end_recording") return InboundType::kEndRecording;
  if (name == "ping") return InboundType::kPing;
  return InboundType::kUnknown;
}

ParseResult Fail(const std::string& message) {
  ParseResult r;
  r.error = message;
  return r;
}

std::string FormatDouble(double v) {
  if (!std::isfinite(v)) return "0";
  std::ostringstream o;
  o << std::setprecision(6) << v;
  return o.str();
}

}  // namespace

const char* OutboundTypeName(OutboundType type) {
  switch (type) {
    case OutboundType::kConnection: return "connection";
    case OutboundType::kAudioAck: return "audio_ack";
    case OutboundType::kBatchProcessing: return "batch_processing";
    case OutboundType::kBatchTranscription: return "batch_transcription";
    case OutboundType::kRecordingComplete: return "recording_complete";
    case OutboundType::kError: return "error";
    case OutboundType::kPong: return "pong";
    case OutboundType::kRecordingStarted: return "recording_started";
    case OutboundType::kRecordingStopped: return "recording_stopped";
    case OutboundType::kUnknownMessage: return "unknown_message";
  }
  return "error";
}

ParseResult ParseInbound(const std::string& text) {
  std::vector<Member> members;
  if (!ScanObject(text, &members)) {
    return Fail(kInvalidJson);
  }

  const Member* type_member = FindMember(members, "type");
  InboundEvent event;
  if (!type_member || !ReadString(text, *type_member, &event.type_name)) {
    return Fail(kInvalidJson);
  }
  event.type = TypeFromName(event.type_name);

  if (event.type == InboundType::kAudioChunk) {
    const Member* data = FindMember(members, "data");
    if (!data || !ReadByteArray(text, *data, &event.data)) {
      return Fail("audio_chunk requires 'data' as an array of bytes");
    }
    const Member* seq = FindMember(members, "sequenceNumber");
    if (!seq || !ReadInt64(text, *seq, &event.sequence_number)) {
      return Fail("audio_chunk requires an integer 'sequenceNumber'");
    }
    const Member* mime = FindMember(members, "mimeType");
    if (mime && !IsNull(text, *mime) && !ReadString(text, *mime, &event.mime_type)) {
      return Fail("audio_chunk 'mimeType' must be a string");
    }
    const Member* ts = FindMember(members, "timestamp");
    if (ts && !IsNull(text, *ts) && !ReadString(text, *ts, &event.timestamp)) {
      return Fail("audio_chunk 'timestamp' must be a string");
    }
  } else if (event.type == InboundType::kStartRecording) {
    const Member* lang = FindMember(members, "language");
    if (lang && !IsNull(text, *lang)) {
      std::string value;
      if (!ReadString(text, *lang, &value)) {
        return Fail("start_recording 'language' must be a string");
      }
      if (!value.empty()) event.language = value;
    }
  }

  ParseResult result;
  result.event = std::move(event);
  return result;
}

std::string ToJson(const OutboundEvent& e) {
  std::ostringstream o;
  o << "{\"type\":\"" << OutboundTypeName(e.type) << "\"";
  switch (e.type) {
    case OutboundType::kConnection:
      o << ",\"message\":\"" << JsonEscape(e.message) << "\""
        << ",\"session_id\":\"" << JsonEscape(e.session_id) << "\"";
      break;
    case OutboundType::kAudioAck:
      o << ",\"sequenceNumber\":" << e.sequence_number
        << ",\"batch_size\":" << e.batch_size
        << ",\"message\":\"" << JsonEscape(e.message) << "\""
        << ",\"processed_at\":\"" << JsonEscape(e.processed_at) << "\"";
      break;
    case OutboundType::kBatchTranscription:
      o << ",\"text\":\"" << JsonEscape(e.text) << "\""
        << ",\"confidence\":" << FormatDouble(e.confidence)
        << ",\"chunk_count\":" << e.chunk_count
        << ",\"duration_seconds\":" << FormatDouble(std::round(e.duration_seconds * 100.0) / 100.0);
      break;
    case OutboundType::kRecordingComplete:
      o << ",\"message\":\"" << JsonEscape(e.message) << "\""
        << ",\"total_chunks_processed\":" << e.total_chunks_processed;
      break;
    case OutboundType::kRecordingStarted:
      o << ",\"message\":\"" << JsonEscape(e.message) << "\""
        << ",\"language\":\"" << JsonEscape(e.language) << "\"";
      break;
    case OutboundType::kPong:
      break;
    case OutboundType::kBatchProcessing:
    case OutboundType::kError:
    case OutboundType::kRecordingStopped:
    case OutboundType::kUnknownMessage:
      o << ",\"message\":\"" << JsonEscape(e.message) << "\"";
      break;
  }
  o << ",\"timestamp\":\"" << JsonEscape(e.timestamp) << "\"";
  if (e.type == OutboundType::kBatchTranscription) {
    o << ",\"ready_for_llm\":true";
  }
  o << "}";
  return o.str();
}

}  // namespace batchscribe::protocol
