#include "uuid.hpp"

#include <random>

namespace fleet::util {
namespace {

constexpr char   kHexDigits[]  = "0123456789abcdef";
constexpr size_t kCanonicalLen = 36;

constexpr IdKind kAllKinds[] = {IdKind::kJob, IdKind::kState, IdKind::kSession, IdKind::kExecution};

bool IsDashPosition(size_t i) {
  return i == 8 || i == 13 || i == 18 || i == 23;
}

bool IsCanonicalUuid(std::string_view text) {
  if (text.size() != kCanonicalLen) return false;
  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (IsDashPosition(i)) {
      if (c != '-') return false;
    } else if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
      return false;
    }
  }
  // version nibble
  return text[14] == '4';
}

} // namespace

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID id{};
  for (size_t i = 0; i < id.size(); i += 8) {
    const uint64_t word = rng();
    for (size_t b = 0; b < 8; ++b) id[i + b] = static_cast<uint8_t>(word >> (b * 8));
  }

  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;
  return id;
}

std::string ToString(const UUID& id) {
  std::string out;
  out.reserve(kCanonicalLen);
  for (size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
    out.push_back(kHexDigits[id[i] >> 4]);
    out.push_back(kHexDigits[id[i] & 0x0F]);
  }
  return out;
}

std::string_view IdPrefix(IdKind kind) {
  switch (kind) {
    case IdKind::kJob:
      return "job-";
    case IdKind::kState:
      return "state-";
    case IdKind::kSession:
      return "sess-";
    case IdKind::kExecution:
      return "exec-";
  }
  return "id-";
}

std::string GenerateId(IdKind kind) {
  std::string id(IdPrefix(kind));
  id += ToString(GenerateUUID());
  return id;
}

std::optional<IdKind> ParseIdKind(std::string_view id) {
  for (IdKind kind : kAllKinds) {
    const auto prefix = IdPrefix(kind);
    if (id.substr(0, prefix.size()) == prefix && IsCanonicalUuid(id.substr(prefix.size()))) {
      return kind;
    }
  }
  return std::nullopt;
}

} // namespace fleet::util
