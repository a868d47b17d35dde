#include "rapport/core/rel_path.h"

#include <array>

#include "rapport/util/strings.h"

namespace rapport {
namespace {

constexpr std::array<SharedPath, 5> kSharedPaths{SharedPath::Affinity, SharedPath::Respect, SharedPath::Tension,
                                                 SharedPath::Intimacy, SharedPath::History};

constexpr std::array<DirectionalKind, 9> kPlainDirectionalKinds{
    DirectionalKind::Warmth,     DirectionalKind::Resentment, DirectionalKind::Dependence,
    DirectionalKind::Attraction, DirectionalKind::Attachment, DirectionalKind::Jealousy,
    DirectionalKind::Fear,       DirectionalKind::Obligation, DirectionalKind::PerceivedRisk,
};

constexpr std::array<TrustPath, 4> kTrustPaths{TrustPath::Competence, TrustPath::Benevolence, TrustPath::Integrity,
                                               TrustPath::SupportWillingness};

} // namespace

bool RelPath::operator==(const RelPath& o) const {
  if (scope != o.scope) return false;
  switch (scope) {
    case Scope::Shared: return shared == o.shared;
    case Scope::Directional: return direction == o.direction && directional == o.directional;
    case Scope::Stage: return true;
  }
  return true;
}

const char* trust_path_id(TrustPath p) {
  switch (p) {
    case TrustPath::Competence: return "competence";
    case TrustPath::Benevolence: return "benevolence";
    case TrustPath::Integrity: return "integrity";
    case TrustPath::SupportWillingness: return "support_willingness";
  }
  return "competence";
}

const char* shared_path_id(SharedPath p) {
  switch (p) {
    case SharedPath::Affinity: return "affinity";
    case SharedPath::Respect: return "respect";
    case SharedPath::Tension: return "tension";
    case SharedPath::Intimacy: return "intimacy";
    case SharedPath::History: return "history";
  }
  return "affinity";
}

const char* directional_kind_id(DirectionalKind k) {
  switch (k) {
    case DirectionalKind::Trust: return "trust";
    case DirectionalKind::Warmth: return "warmth";
    case DirectionalKind::Resentment: return "resentment";
    case DirectionalKind::Dependence: return "dependence";
    case DirectionalKind::Attraction: return "attraction";
    case DirectionalKind::Attachment: return "attachment";
    case DirectionalKind::Jealousy: return "jealousy";
    case DirectionalKind::Fear: return "fear";
    case DirectionalKind::Obligation: return "obligation";
    case DirectionalKind::PerceivedRisk: return "perceived_risk";
  }
  return "warmth";
}

std::string rel_path_to_string(const RelPath& p) {
  switch (p.scope) {
    case RelPath::Scope::Shared: return std::string("shared.") + shared_path_id(p.shared);
    case RelPath::Scope::Directional: {
      std::string out = std::string(direction_id(p.direction)) + "." + directional_kind_id(p.directional.kind);
      if (p.directional.kind == DirectionalKind::Trust) out += std::string(".") + trust_path_id(p.directional.trust);
      return out;
    }
    case RelPath::Scope::Stage: return "stage";
  }
  return "stage";
}

std::optional<RelPath> parse_rel_path(const std::string& text) {
  const std::string s = to_lower(trim_copy(text));
  if (s == "stage") return RelPath::stage();

  const auto dot = s.find('.');
  if (dot == std::string::npos) return std::nullopt;
  const std::string head = s.substr(0, dot);
  const std::string rest = s.substr(dot + 1);

  if (head == "shared") {
    for (SharedPath p : kSharedPaths) {
      if (rest == shared_path_id(p)) return RelPath::of_shared(p);
    }
    return std::nullopt;
  }

  if (head != direction_id(Direction::AToB) && head != direction_id(Direction::BToA)) return std::nullopt;
  const Direction dir = (head == direction_id(Direction::AToB)) ? Direction::AToB : Direction::BToA;

  for (DirectionalKind k : kPlainDirectionalKinds) {
    if (rest == directional_kind_id(k)) return RelPath::of_directional(dir, DirectionalPath::of(k));
  }
  if (rest.rfind("trust.", 0) == 0) {
    const std::string leaf = rest.substr(6);
    for (TrustPath t : kTrustPaths) {
      if (leaf == trust_path_id(t)) return RelPath::of_directional(dir, DirectionalPath::of_trust(t));
    }
  }
  return std::nullopt;
}

} // namespace rapport
