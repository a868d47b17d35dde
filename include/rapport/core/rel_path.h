#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "rapport/core/enums.h"

namespace rapport {

// --- structured addresses for relationship state ---
//
// A higher-level state-path layer reads and writes relationship values
// generically through these paths rather than through named accessors.

enum class TrustPath : std::uint8_t {
  Competence = 0, // Work-domain competence
  Benevolence = 1,
  Integrity = 2,
  SupportWillingness = 3, // computed, never stored
};

inline bool is_computed(TrustPath p) { return p == TrustPath::SupportWillingness; }

enum class SharedPath : std::uint8_t {
  Affinity = 0,
  Respect = 1,
  Tension = 2,
  Intimacy = 3,
  History = 4,
};

enum class DirectionalKind : std::uint8_t {
  Trust = 0,
  Warmth,
  Resentment,
  Dependence,
  Attraction,
  Attachment,
  Jealousy,
  Fear,
  Obligation,
  PerceivedRisk,
};

// A per-direction field; `trust` is only read when kind == Trust.
struct DirectionalPath {
  DirectionalKind kind{DirectionalKind::Warmth};
  TrustPath trust{TrustPath::Competence};

  static DirectionalPath of(DirectionalKind k) { return DirectionalPath{k, TrustPath::Competence}; }
  static DirectionalPath of_trust(TrustPath t) { return DirectionalPath{DirectionalKind::Trust, t}; }

  bool operator==(const DirectionalPath& o) const {
    return kind == o.kind && (kind != DirectionalKind::Trust || trust == o.trust);
  }
  bool operator!=(const DirectionalPath& o) const { return !(*this == o); }
};

struct RelPath {
  enum class Scope : std::uint8_t { Shared = 0, Directional = 1, Stage = 2 };

  Scope scope{Scope::Stage};
  SharedPath shared{SharedPath::Affinity};
  Direction direction{Direction::AToB};
  DirectionalPath directional{};

  static RelPath of_shared(SharedPath p) {
    RelPath r;
    r.scope = Scope::Shared;
    r.shared = p;
    return r;
  }
  static RelPath of_directional(Direction d, DirectionalPath p) {
    RelPath r;
    r.scope = Scope::Directional;
    r.direction = d;
    r.directional = p;
    return r;
  }
  static RelPath stage() { return RelPath{}; }

  bool operator==(const RelPath& o) const;
  bool operator!=(const RelPath& o) const { return !(*this == o); }
};

const char* trust_path_id(TrustPath p);
const char* shared_path_id(SharedPath p);
const char* directional_kind_id(DirectionalKind k);

// Text form: "shared.affinity", "a_to_b.warmth", "b_to_a.trust.integrity",
// "a_to_b.perceived_risk", "stage".
std::string rel_path_to_string(const RelPath& p);
std::optional<RelPath> parse_rel_path(const std::string& text);

} // namespace rapport
