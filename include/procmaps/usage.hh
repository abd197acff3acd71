#ifndef __PROCMAPS_USAGE_HH__
#define __PROCMAPS_USAGE_HH__

#include "flag_set.hh"
#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>

namespace procmaps {

// Per-region kernel flags reported on the smaps "VmFlags:" line.
enum class VmFlag : uint32_t {
  RD = 1u << 0,  // readable
  WR = 1u << 1,  // writable
  EX = 1u << 2,  // executable
  SH = 1u << 3,  // shared
  MR = 1u << 4,  // may read
  MW = 1u << 5,  // may write
  ME = 1u << 6,  // may execute
  MS = 1u << 7,  // may share
  GD = 1u << 8,  // stack segment grows down
  PF = 1u << 9,  // pure PFN range
  DW = 1u << 10, // disabled write to the mapped file
  LO = 1u << 11, // pages are locked in memory
  IO = 1u << 12, // memory mapped I/O area
  SR = 1u << 13, // sequential read advise provided
  RR = 1u << 14, // random read advise provided
  DC = 1u << 15, // do not copy area on fork
  DE = 1u << 16, // do not expand area on remapping
  AC = 1u << 17, // area is accountable
  NR = 1u << 18, // swap space is not reserved for the area
  HT = 1u << 19, // area uses huge tlb pages
  SF = 1u << 20, // synchronous page faults
  NL = 1u << 21, // non-linear mapping (removed in Linux 4.0)
  AR = 1u << 22, // architecture specific flag
  WF = 1u << 23, // wipe on fork
  DD = 1u << 24, // do not include area into core dump
  SD = 1u << 25, // soft-dirty flag
  MM = 1u << 26, // mixed map area
  HG = 1u << 27, // huge page advise flag
  NH = 1u << 28, // no-huge page advise flag
  MG = 1u << 29, // mergeable advise flag
  UM = 1u << 30, // userfaultfd missing pages tracking
  UW = 1u << 31, // userfaultfd wprotect pages tracking
};

using VmFlags = FlagSet<VmFlag>;

constexpr VmFlags operator|(VmFlag lhs, VmFlag rhs) {
  return VmFlags(lhs) | VmFlags(rhs);
}

// Two-letter smaps mnemonic of a flag, e.g. "rd".
const char *Mnemonic(VmFlag flag);
std::optional<VmFlag> VmFlagFromMnemonic(std::string_view mnemonic);

// Space separated mnemonics, in bit order.
std::ostream &operator<<(std::ostream &os, VmFlags flags);

// Detail statistics of the mapping preceding it in an smaps stream. Sizes are
// in bytes. Fields whose line is absent stay zero.
struct Usage {
  uint64_t size{0};
  uint64_t kernel_page_size{0};
  uint64_t mmu_page_size{0};
  uint64_t rss{0};
  uint64_t pss{0};
  uint64_t pss_dirty{0};
  uint64_t shared_clean{0};
  uint64_t shared_dirty{0};
  uint64_t private_clean{0};
  uint64_t private_dirty{0};
  uint64_t referenced{0};
  uint64_t anonymous{0};
  uint64_t ksm{0};
  uint64_t lazy_free{0};
  uint64_t anon_huge_pages{0};
  uint64_t shmem_huge_pages{0};
  uint64_t shmem_pmd_mapped{0};
  uint64_t file_pmd_mapped{0};
  uint64_t shared_hugetlb{0};
  uint64_t private_hugetlb{0};
  uint64_t swap{0};
  uint64_t swap_pss{0};
  uint64_t locked{0};
  bool thp_eligible{false};
  std::optional<uint64_t> protection_key;
  VmFlags vm_flags;

  bool operator==(const Usage &other) const;
  bool operator!=(const Usage &other) const { return !(*this == other); }
  friend std::ostream &operator<<(std::ostream &os, const Usage &usage);
};

// Byte-count field of Usage named by its smaps key ("Rss", "Pss_Dirty", ...),
// or nullptr. THPeligible, ProtectionKey and VmFlags are not byte counts and
// are not listed.
uint64_t Usage::*FindUsageField(std::string_view key);

} // namespace procmaps

#endif
