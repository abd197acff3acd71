#ifndef __PROCMAPS_FLAG_SET_HH__
#define __PROCMAPS_FLAG_SET_HH__

#include <cstdint>
#include <type_traits>

namespace procmaps {

// Bit-set over a closed enum class vocabulary. Each enumerator must be a
// single bit.
template <typename Flag> class FlagSet {
public:
  using Bits = typename std::underlying_type<Flag>::type;

  constexpr FlagSet() : bits_(0) {}
  constexpr FlagSet(Flag flag) : bits_(static_cast<Bits>(flag)) {}

  static constexpr FlagSet FromBits(Bits bits) {
    FlagSet set;
    set.bits_ = bits;
    return set;
  }

  constexpr Bits GetBits() const { return bits_; }
  constexpr bool Empty() const { return bits_ == 0; }

  constexpr bool Has(Flag flag) const {
    return (bits_ & static_cast<Bits>(flag)) == static_cast<Bits>(flag);
  }

  FlagSet &operator|=(FlagSet other) {
    bits_ = static_cast<Bits>(bits_ | other.bits_);
    return *this;
  }

  friend constexpr FlagSet operator|(FlagSet lhs, FlagSet rhs) {
    return FromBits(static_cast<Bits>(lhs.bits_ | rhs.bits_));
  }

  friend constexpr bool operator==(FlagSet lhs, FlagSet rhs) {
    return lhs.bits_ == rhs.bits_;
  }
  friend constexpr bool operator!=(FlagSet lhs, FlagSet rhs) {
    return lhs.bits_ != rhs.bits_;
  }

private:
  Bits bits_;
};

} // namespace procmaps

#endif
