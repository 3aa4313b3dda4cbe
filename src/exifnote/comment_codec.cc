#include "exifnote/comment_codec.h"

#include <optional>

namespace exifnote {
namespace {

    static bool is_space(char c) noexcept
    {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v'
               || c == '\f';
    }


    static std::string_view trim(std::string_view s) noexcept
    {
        while (!s.empty() && is_space(s.front())) {
            s.remove_prefix(1);
        }
        while (!s.empty() && is_space(s.back())) {
            s.remove_suffix(1);
        }
        return s;
    }


    // Splits on "\n", "\r\n" and a lone "\r". Calls fn(line) until it
    // returns true.
    template<typename Fn>
    static bool any_line(std::string_view text, Fn&& fn)
    {
        size_t pos = 0;
        while (true) {
            const size_t brk = text.find_first_of("\r\n", pos);
            const std::string_view line = (brk == std::string_view::npos)
                                              ? text.substr(pos)
                                              : text.substr(pos, brk - pos);
            if (fn(line)) {
                return true;
            }
            if (brk == std::string_view::npos) {
                return false;
            }
            pos = brk + 1;
            if (text[brk] == '\r' && pos < text.size() && text[pos] == '\n') {
                pos += 1;
            }
        }
    }

}  // namespace

std::string
decode_user_comment(const ExifValue* value)
{
    if (!value) {
        return {};
    }
    const std::optional<std::string> raw = value_text(*value);
    if (!raw) {
        return {};
    }
    return decode_user_comment(std::string_view(*raw));
}


std::string
decode_user_comment(std::string_view raw)
{
    if (raw.starts_with(kAsciiCharsetPrefix)) {
        raw.remove_prefix(kAsciiCharsetPrefix.size());
    }
    return std::string(raw);
}


std::string
encode_user_comment(std::string_view text)
{
    std::string out;
    out.reserve(kAsciiCharsetPrefix.size() + text.size());
    out.append(kAsciiCharsetPrefix);
    out.append(text);
    return out;
}


bool
has_annotation_line(std::string_view text) noexcept
{
    return any_line(text, [](std::string_view line) noexcept {
        return trim(line).starts_with(kOriginalFilenameLabel);
    });
}


std::string
find_annotation_value(std::string_view text)
{
    std::string_view found;
    (void)any_line(text, [&found](std::string_view line) noexcept {
        line = trim(line);
        if (!line.starts_with(kOriginalFilenameLabel)) {
            return false;
        }
        line.remove_prefix(kOriginalFilenameLabel.size());
        if (line.empty() || line.front() != ':') {
            return false;
        }
        line.remove_prefix(1);
        line = trim(line);
        if (line.empty()) {
            return false;
        }
        found = line;
        return true;
    });
    return std::string(found);
}


std::string
append_annotation_line(std::string_view text, std::string_view file_name)
{
    std::string out(text);
    if (!out.empty()) {
        out.push_back('\n');
    }
    out.append(kOriginalFilenameLabel);
    out.append(": ");
    out.append(file_name);
    return out;
}

}  // namespace exifnote
