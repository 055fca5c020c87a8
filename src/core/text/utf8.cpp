#include "core/text/utf8.hpp"

namespace runner::core::text {

namespace {

constexpr std::string_view kReplacementChar = "\xEF\xBF\xBD";

bool is_continuation(const unsigned char c) {
    return (c & 0xC0U) == 0x80U;
}

struct Sequence {
    std::size_t length = 0;
    bool valid = false;
};

// Scans the sequence starting at `pos`. An ill-formed sequence reports the
// length of its maximal subpart: the lead byte plus the continuation bytes
// that were still acceptable when decoding failed. The second-byte ranges
// exclude overlongs, surrogates and values above U+10FFFF.
Sequence scan_sequence(std::string_view bytes, const std::size_t pos) {
    const auto lead = static_cast<unsigned char>(bytes[pos]);
    if (lead < 0x80U) {
        return Sequence{1, true};
    }

    std::size_t length = 0;
    unsigned char lower = 0x80U;
    unsigned char upper = 0xBFU;
    if (lead >= 0xC2U && lead <= 0xDFU) {
        length = 2;
    } else if (lead >= 0xE0U && lead <= 0xEFU) {
        length = 3;
        if (lead == 0xE0U) lower = 0xA0U;
        if (lead == 0xEDU) upper = 0x9FU;
    } else if (lead >= 0xF0U && lead <= 0xF4U) {
        length = 4;
        if (lead == 0xF0U) lower = 0x90U;
        if (lead == 0xF4U) upper = 0x8FU;
    } else {
        return Sequence{1, false};
    }

    std::size_t consumed = 1;
    for (; consumed < length && pos + consumed < bytes.size(); ++consumed) {
        const auto c = static_cast<unsigned char>(bytes[pos + consumed]);
        if (c < lower || c > upper) {
            return Sequence{consumed, false};
        }
        lower = 0x80U;
        upper = 0xBFU;
    }
    return Sequence{consumed, consumed == length};
}

}  // namespace

std::size_t count_chars(std::string_view utf8) {
    std::size_t count = 0;
    for (const char c : utf8) {
        if (!is_continuation(static_cast<unsigned char>(c))) {
            ++count;
        }
    }
    return count;
}

std::string sanitize_utf8(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());
    std::size_t pos = 0;
    while (pos < bytes.size()) {
        const Sequence sequence = scan_sequence(bytes, pos);
        if (sequence.valid) {
            out.append(bytes.substr(pos, sequence.length));
        } else {
            out.append(kReplacementChar);
        }
        pos += sequence.length;
    }
    return out;
}

std::string truncate_chars(const std::string& utf8, const std::size_t limit,
                           std::string_view marker) {
    std::size_t seen = 0;
    for (std::size_t pos = 0; pos < utf8.size(); ++pos) {
        if (is_continuation(static_cast<unsigned char>(utf8[pos]))) {
            continue;
        }
        if (seen == limit) {
            std::string truncated = utf8.substr(0, pos);
            truncated.append(marker);
            return truncated;
        }
        ++seen;
    }
    return utf8;
}

}  // namespace runner::core::text
