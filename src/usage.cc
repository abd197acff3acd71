#include "usage.hh"
#include <array>
#include <tuple>

namespace procmaps {

namespace {

struct FlagName {
  const char *mnemonic;
  VmFlag flag;
};

// Bit order.
constexpr std::array<FlagName, 32> kVmFlagNames = {{
    {"rd", VmFlag::RD}, {"wr", VmFlag::WR}, {"ex", VmFlag::EX},
    {"sh", VmFlag::SH}, {"mr", VmFlag::MR}, {"mw", VmFlag::MW},
    {"me", VmFlag::ME}, {"ms", VmFlag::MS}, {"gd", VmFlag::GD},
    {"pf", VmFlag::PF}, {"dw", VmFlag::DW}, {"lo", VmFlag::LO},
    {"io", VmFlag::IO}, {"sr", VmFlag::SR}, {"rr", VmFlag::RR},
    {"dc", VmFlag::DC}, {"de", VmFlag::DE}, {"ac", VmFlag::AC},
    {"nr", VmFlag::NR}, {"ht", VmFlag::HT}, {"sf", VmFlag::SF},
    {"nl", VmFlag::NL}, {"ar", VmFlag::AR}, {"wf", VmFlag::WF},
    {"dd", VmFlag::DD}, {"sd", VmFlag::SD}, {"mm", VmFlag::MM},
    {"hg", VmFlag::HG}, {"nh", VmFlag::NH}, {"mg", VmFlag::MG},
    {"um", VmFlag::UM}, {"uw", VmFlag::UW},
}};

struct UsageField {
  std::string_view key;
  uint64_t Usage::*member;
};

const std::array<UsageField, 23> kUsageFields = {{
    {"Size", &Usage::size},
    {"KernelPageSize", &Usage::kernel_page_size},
    {"MMUPageSize", &Usage::mmu_page_size},
    {"Rss", &Usage::rss},
    {"Pss", &Usage::pss},
    {"Pss_Dirty", &Usage::pss_dirty},
    {"Shared_Clean", &Usage::shared_clean},
    {"Shared_Dirty", &Usage::shared_dirty},
    {"Private_Clean", &Usage::private_clean},
    {"Private_Dirty", &Usage::private_dirty},
    {"Referenced", &Usage::referenced},
    {"Anonymous", &Usage::anonymous},
    {"KSM", &Usage::ksm},
    {"LazyFree", &Usage::lazy_free},
    {"AnonHugePages", &Usage::anon_huge_pages},
    {"ShmemHugePages", &Usage::shmem_huge_pages},
    {"ShmemPmdMapped", &Usage::shmem_pmd_mapped},
    {"FilePmdMapped", &Usage::file_pmd_mapped},
    {"Shared_Hugetlb", &Usage::shared_hugetlb},
    {"Private_Hugetlb", &Usage::private_hugetlb},
    {"Swap", &Usage::swap},
    {"SwapPss", &Usage::swap_pss},
    {"Locked", &Usage::locked},
}};

} // namespace

const char *Mnemonic(VmFlag flag) {
  for (const auto &name : kVmFlagNames) {
    if (name.flag == flag) {
      return name.mnemonic;
    }
  }
  return "??";
}

std::optional<VmFlag> VmFlagFromMnemonic(std::string_view mnemonic) {
  for (const auto &name : kVmFlagNames) {
    if (mnemonic == name.mnemonic) {
      return name.flag;
    }
  }
  return std::nullopt;
}

std::ostream &operator<<(std::ostream &os, VmFlags flags) {
  bool first = true;
  for (const auto &name : kVmFlagNames) {
    if (!flags.Has(name.flag)) {
      continue;
    }
    if (!first) {
      os << ' ';
    }
    os << name.mnemonic;
    first = false;
  }
  return os;
}

uint64_t Usage::*FindUsageField(std::string_view key) {
  for (const auto &field : kUsageFields) {
    if (field.key == key) {
      return field.member;
    }
  }
  return nullptr;
}

bool Usage::operator==(const Usage &other) const {
  auto fields = [](const Usage &u) {
    return std::tie(u.size, u.kernel_page_size, u.mmu_page_size, u.rss, u.pss,
                    u.pss_dirty, u.shared_clean, u.shared_dirty,
                    u.private_clean, u.private_dirty, u.referenced,
                    u.anonymous, u.ksm, u.lazy_free, u.anon_huge_pages,
                    u.shmem_huge_pages, u.shmem_pmd_mapped, u.file_pmd_mapped,
                    u.shared_hugetlb, u.private_hugetlb, u.swap, u.swap_pss,
                    u.locked, u.thp_eligible, u.protection_key, u.vm_flags);
  };
  return fields(*this) == fields(other);
}

// Only non-zero byte counts are printed.
std::ostream &operator<<(std::ostream &os, const Usage &usage) {
  os << "Usage{";
  const char *sep = "";
  for (const auto &field : kUsageFields) {
    if (usage.*field.member == 0) {
      continue;
    }
    os << sep << field.key << '=' << usage.*field.member;
    sep = " ";
  }
  if (usage.thp_eligible) {
    os << sep << "THPeligible";
    sep = " ";
  }
  if (usage.protection_key) {
    os << sep << "ProtectionKey=" << *usage.protection_key;
    sep = " ";
  }
  os << sep << "VmFlags=[" << usage.vm_flags << "]}";
  return os;
}

} // namespace procmaps
