#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace exifnote {

// Appends a printable-ASCII rendition of `s` to `out`, safe for a terminal.
//
// - `\`, `"`, `\n`, `\r`, `\t` are backslash-escaped
// - other control bytes, DEL and bytes >= 0x80 become `\xNN`
// - at most `max_bytes` input bytes are rendered (0 = unlimited); a cut
//   string ends in "..."
//
// Returns true when anything other than quoting was escaped, or the input
// was cut.
bool
append_console_escaped_ascii(std::string_view s, uint32_t max_bytes,
                             std::string* out) noexcept;

// Returns `s` escaped as above.
std::string
console_escaped(std::string_view s, uint32_t max_bytes = 0);

}  // namespace exifnote
