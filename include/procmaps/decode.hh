#ifndef __PROCMAPS_DECODE_HH__
#define __PROCMAPS_DECODE_HH__

#include "mapping.hh"
#include "usage.hh"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace procmaps {

// Token decoders. Malformed input yields std::nullopt. Vocabulary the parser
// does not know (size units, VmFlags mnemonics) throws procmaps::Error.

// Strict base-16: no sign, no "0x" prefix, no overflow.
std::optional<uint64_t> ParseHex(std::string_view token);

// Strict base-10 with the same rules as ParseHex.
std::optional<uint64_t> ParseDecimal(std::string_view token);

// Position-fixed "[-r][-w][-x][sp]".
std::optional<Permissions> ParsePermissions(std::string_view token);

// "MAJ:MIN", both sides hex.
std::optional<Device> ParseDevice(std::string_view token);

// Decodes "KEY: NUMBER [UNIT]" into the key (colon stripped) and the value
// scaled by the binary unit. A fourth token fails the line.
// Throws Error(UnrecognizedUnit) for a unit outside kB, mB, gB, tB.
std::optional<std::pair<std::string, uint64_t>>
ParseSizedValue(std::string_view line);

// Union of whitespace separated two-letter mnemonics. Empty text is the empty
// set. Throws Error(UnrecognizedFlag) for an unknown mnemonic.
VmFlags ParseVmFlags(std::string_view text);

// Decodes "START-END PERMS OFFSET MAJ:MIN INODE [PATH...]". The path is the
// rest of the line after INODE with surrounding whitespace removed.
std::optional<Mapping> ParseMapping(std::string_view line);

// Header lines are told apart from detail lines by the presence of '-'.
// Detail keys and values never contain one in the kernel format.
bool IsHeaderLine(std::string_view line);

} // namespace procmaps

#endif
