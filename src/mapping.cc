#include "mapping.hh"
#include <iomanip>
#include <ios>

namespace procmaps {

std::string ToString(Permissions permissions) {
  std::string out(4, '-');
  if (permissions.Has(Permission::Read)) {
    out[0] = 'r';
  }
  if (permissions.Has(Permission::Write)) {
    out[1] = 'w';
  }
  if (permissions.Has(Permission::Execute)) {
    out[2] = 'x';
  }
  if (permissions.Has(Permission::Shared)) {
    out[3] = 's';
  } else if (permissions.Has(Permission::Private)) {
    out[3] = 'p';
  }
  return out;
}

std::ostream &operator<<(std::ostream &os, Permissions permissions) {
  return os << ToString(permissions);
}

bool Device::operator==(const Device &other) const {
  return major == other.major && minor == other.minor;
}

std::ostream &operator<<(std::ostream &os, const Device &device) {
  std::ios_base::fmtflags flags = os.flags();
  os << std::hex << std::setfill('0') << std::setw(2) << device.major << ':'
     << std::setw(2) << device.minor;
  os.flags(flags);
  return os;
}

bool Mapping::Contains(uint64_t addr) const {
  return addr >= start && addr < end;
}

bool Mapping::operator<(const Mapping &other) const {
  return start < other.start;
}

bool Mapping::operator==(const Mapping &other) const {
  return start == other.start && end == other.end &&
         permissions == other.permissions && offset == other.offset &&
         device == other.device && inode == other.inode && path == other.path;
}

std::ostream &operator<<(std::ostream &os, const Mapping &mapping) {
  std::ios_base::fmtflags flags = os.flags();
  os << std::hex << "0x" << mapping.start << "-0x" << mapping.end << ' '
     << mapping.permissions << " offset=0x" << mapping.offset << ' '
     << mapping.device << std::dec << " inode=" << mapping.inode;
  if (mapping.path) {
    os << ' ' << *mapping.path;
  }
  os.flags(flags);
  return os;
}

} // namespace procmaps
