#include "summary.hh"

namespace procmaps {

namespace {
double ToMegabytes(uint64_t bytes) {
  return static_cast<double>(bytes) / (1024.0 * 1024.0);
}
} // namespace

void UsageSummary::Add(const Usage &usage) {
  mappings++;
  size += usage.size;
  rss += usage.rss;
  pss += usage.pss;
  shared_clean += usage.shared_clean;
  shared_dirty += usage.shared_dirty;
  private_clean += usage.private_clean;
  private_dirty += usage.private_dirty;
  anonymous += usage.anonymous;
  swap += usage.swap;
  swap_pss += usage.swap_pss;
  locked += usage.locked;
}

UsageSummary Summarize(const std::vector<Entry> &entries) {
  UsageSummary summary;
  for (const auto &entry : entries) {
    summary.Add(entry.second);
  }
  return summary;
}

std::ostream &operator<<(std::ostream &os, const UsageSummary &summary) {
  auto row = [&os](const char *label, uint64_t bytes) {
    os << "  " << label << bytes << " (" << ToMegabytes(bytes) << " MB)\n";
  };
  os << "Usage Summary:\n"
     << std::dec << "  Mappings:       " << summary.mappings << "\n";
  row("Size:           ", summary.size);
  row("Rss:            ", summary.rss);
  row("Pss:            ", summary.pss);
  row("Shared clean:   ", summary.shared_clean);
  row("Shared dirty:   ", summary.shared_dirty);
  row("Private clean:  ", summary.private_clean);
  row("Private dirty:  ", summary.private_dirty);
  row("Anonymous:      ", summary.anonymous);
  row("Swap:           ", summary.swap);
  row("Swap pss:       ", summary.swap_pss);
  os << "  Locked:         " << summary.locked << " ("
     << ToMegabytes(summary.locked) << " MB)";
  return os;
}

} // namespace procmaps
