#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace clmash {

enum class stem_role { vocals, drums, bass, other };

inline constexpr std::array all_stem_roles{
  stem_role::vocals, stem_role::drums, stem_role::bass, stem_role::other
};

[[nodiscard]] constexpr std::string_view to_string(stem_role role) noexcept
{
  switch (role) {
    case stem_role::vocals: return "vocals";
    case stem_role::drums:  return "drums";
    case stem_role::bass:   return "bass";
    case stem_role::other:  return "other";
  }
  return "other";
}

[[nodiscard]] constexpr std::optional<stem_role>
parse_stem_role(std::string_view name) noexcept
{
  for (stem_role role: all_stem_roles)
    if (to_string(role) == name) return role;
  return std::nullopt;
}

// Identifies one prepared stem buffer: (track id, role).
using stem_key = std::pair<std::string, stem_role>;

}
