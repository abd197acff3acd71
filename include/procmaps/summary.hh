#ifndef __PROCMAPS_SUMMARY_HH__
#define __PROCMAPS_SUMMARY_HH__

#include "parser.hh"
#include <cstdint>
#include <ostream>
#include <vector>

namespace procmaps {

// Totals over a set of parsed mappings, in bytes.
struct UsageSummary {
  uint64_t mappings{0};
  uint64_t size{0};
  uint64_t rss{0};
  uint64_t pss{0};
  uint64_t shared_clean{0};
  uint64_t shared_dirty{0};
  uint64_t private_clean{0};
  uint64_t private_dirty{0};
  uint64_t anonymous{0};
  uint64_t swap{0};
  uint64_t swap_pss{0};
  uint64_t locked{0};

  void Add(const Usage &usage);
  friend std::ostream &operator<<(std::ostream &os,
                                  const UsageSummary &summary);
};

UsageSummary Summarize(const std::vector<Entry> &entries);

} // namespace procmaps

#endif
