#include "utf8.hpp"

namespace sidecar {

namespace {

constexpr std::string_view kReplacement = "\xEF\xBF\xBD";

} // anonymous namespace

std::string to_valid_utf8(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());

    size_t i = 0;
    while (i < bytes.size()) {
        const auto lead = static_cast<unsigned char>(bytes[i]);
        if (lead < 0x80) {
            out += static_cast<char>(lead);
            i++;
            continue;
        }

        // 序列长度和第一个续字节的范围（排除过长编码、代理区和 > U+10FFFF）
        size_t len = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            len = 2;
        } else if (lead == 0xE0) {
            len = 3;
            lo = 0xA0;
        } else if (lead == 0xED) {
            len = 3;
            hi = 0x9F;
        } else if (lead >= 0xE1 && lead <= 0xEF) {
            len = 3;
        } else if (lead == 0xF0) {
            len = 4;
            lo = 0x90;
        } else if (lead >= 0xF1 && lead <= 0xF3) {
            len = 4;
        } else if (lead == 0xF4) {
            len = 4;
            hi = 0x8F;
        } else {
            out += kReplacement;
            i++;
            continue;
        }

        size_t matched = 1;
        while (matched < len && i + matched < bytes.size()) {
            const auto c = static_cast<unsigned char>(bytes[i + matched]);
            const unsigned char min = matched == 1 ? lo : 0x80;
            const unsigned char max = matched == 1 ? hi : 0xBF;
            if (c < min || c > max) {
                break;
            }
            matched++;
        }

        if (matched == len) {
            out.append(bytes.substr(i, len));
        } else {
            out += kReplacement;
        }
        i += matched;
    }
    return out;
}

} // namespace sidecar
