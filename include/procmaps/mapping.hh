#ifndef __PROCMAPS_MAPPING_HH__
#define __PROCMAPS_MAPPING_HH__

#include "flag_set.hh"
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace procmaps {

// Access rights of a mapping. Shared and Private are exclusive categories:
// a decoded mapping carries exactly one of them.
enum class Permission : uint8_t {
  Execute = 1 << 0,
  Write = 1 << 1,
  Read = 1 << 2,
  Shared = 1 << 3,
  Private = 1 << 4,
};

using Permissions = FlagSet<Permission>;

constexpr Permissions operator|(Permission lhs, Permission rhs) {
  return Permissions(lhs) | Permissions(rhs);
}

// Renders the four character "rwxp" form.
std::string ToString(Permissions permissions);
std::ostream &operator<<(std::ostream &os, Permissions permissions);

struct Device {
  uint32_t major{0};
  uint32_t minor{0};

  bool operator==(const Device &other) const;
  bool operator!=(const Device &other) const { return !(*this == other); }
  friend std::ostream &operator<<(std::ostream &os, const Device &device);
};

// One virtual memory region, decoded from a maps/smaps header line.
// start < end holds for kernel output but is not checked.
struct Mapping {
  uint64_t start{0};
  uint64_t end{0};
  Permissions permissions;
  uint64_t offset{0};
  Device device;
  uint64_t inode{0};
  std::optional<std::string> path;

  uint64_t Length() const { return end - start; }
  bool Contains(uint64_t addr) const;
  bool IsAnonymous() const { return inode == 0; }

  bool operator<(const Mapping &other) const;
  bool operator==(const Mapping &other) const;
  bool operator!=(const Mapping &other) const { return !(*this == other); }
  friend std::ostream &operator<<(std::ostream &os, const Mapping &mapping);
};

} // namespace procmaps

#endif
