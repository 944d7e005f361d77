#include "nlp/normalizer.hpp"

#include <algorithm>
#include <cctype>
#include <locale>

#include <boost/locale/conversion.hpp>
#include <boost/locale/encoding_utf.hpp>
#include <boost/locale/generator.hpp>

namespace minigpt::nlp {
namespace {

// White_Space code points, matching str.isspace() plus the ASCII separators.
bool IsSpace(char32_t c) {
    if (c == U' ' || (c >= U'\t' && c <= U'\r') || (c >= 0x1c && c <= 0x1f)) {
        return true;
    }
    switch (c) {
        case 0x85:
        case 0xa0:
        case 0x1680:
        case 0x2028:
        case 0x2029:
        case 0x202f:
        case 0x205f:
        case 0x3000:
            return true;
        default:
            return c >= 0x2000 && c <= 0x200a;
    }
}

const std::locale& Utf8Locale() {
    static const std::locale locale = boost::locale::generator()("en_US.UTF-8");
    return locale;
}

std::string NormalizeBytes(const std::string& text) {
    auto begin = text.begin();
    auto end = text.end();
    while (begin != end && std::isspace(static_cast<unsigned char>(*begin))) {
        ++begin;
    }
    while (end != begin && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        --end;
    }
    std::string lowered(begin, end);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(c < 0x80 ? std::tolower(c) : c);
    });
    return lowered;
}

}  // namespace

std::string Normalize(const std::string& text) {
    std::u32string code_points;
    try {
        code_points = boost::locale::conv::utf_to_utf<char32_t>(text, boost::locale::conv::stop);
    } catch (const boost::locale::conv::conversion_error&) {
        return NormalizeBytes(text);
    }

    std::size_t begin = 0;
    std::size_t end = code_points.size();
    while (begin < end && IsSpace(code_points[begin])) {
        ++begin;
    }
    while (end > begin && IsSpace(code_points[end - 1])) {
        --end;
    }
    const auto trimmed = boost::locale::conv::utf_to_utf<char>(
        code_points.data() + begin, code_points.data() + end);
    return boost::locale::to_lower(trimmed, Utf8Locale());
}

}  // namespace minigpt::nlp
