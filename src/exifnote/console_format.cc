#include "exifnote/console_format.h"

namespace exifnote {
namespace {

    static constexpr char kHexDigits[] = "0123456789ABCDEF";

    // Returns the escape letter for `c`, or 0 if `c` has none.
    static constexpr char short_escape(unsigned char c) noexcept
    {
        switch (c) {
        case '\n': return 'n';
        case '\r': return 'r';
        case '\t': return 't';
        default: return 0;
        }
    }

}  // namespace

bool
append_console_escaped_ascii(std::string_view s, uint32_t max_bytes,
                             std::string* out) noexcept
{
    if (!out) {
        return false;
    }
    const bool cut     = max_bytes != 0U && s.size() > max_bytes;
    const size_t limit = cut ? static_cast<size_t>(max_bytes) : s.size();

    bool escaped = cut;
    out->reserve(out->size() + limit + (cut ? 3U : 0U));
    for (size_t i = 0; i < limit; ++i) {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        if (c == '\\' || c == '"') {
            out->push_back('\\');
            out->push_back(static_cast<char>(c));
        } else if (const char e = short_escape(c); e != 0) {
            out->push_back('\\');
            out->push_back(e);
            escaped = true;
        } else if (c < 0x20U || c >= 0x7FU) {
            out->push_back('\\');
            out->push_back('x');
            out->push_back(kHexDigits[(c >> 4) & 0x0FU]);
            out->push_back(kHexDigits[c & 0x0FU]);
            escaped = true;
        } else {
            out->push_back(static_cast<char>(c));
        }
    }
    if (cut) {
        out->append("...");
    }
    return escaped;
}


std::string
console_escaped(std::string_view s, uint32_t max_bytes)
{
    std::string out;
    (void)append_console_escaped_ascii(s, max_bytes, &out);
    return out;
}

}  // namespace exifnote
