/// \file detail/win_ansi.h
/// \brief UTF-8 to WinAnsi conversion for the standard PDF fonts.

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace LabelSheet::detail {

struct WinAnsiExtra {
    char32_t code_point;
    uint8_t byte;
};

// Code points WinAnsi places in 0x80-0x9F.
inline constexpr std::array<WinAnsiExtra, 12> kWinAnsiExtras = {{
    {0x20AC, 0x80}, // euro
    {0x201A, 0x82},
    {0x201E, 0x84},
    {0x2026, 0x85}, // ellipsis
    {0x2018, 0x91},
    {0x2019, 0x92},
    {0x201C, 0x93},
    {0x201D, 0x94},
    {0x2022, 0x95}, // bullet
    {0x2013, 0x96},
    {0x2014, 0x97},
    {0x2122, 0x99}, // trademark
}};

inline char EncodeWinAnsi(char32_t cp) {
    if (cp < 0x80) { return static_cast<char>(cp); }
    if (cp >= 0xA0 && cp <= 0xFF) { return static_cast<char>(static_cast<unsigned char>(cp)); }
    for (const WinAnsiExtra& extra : kWinAnsiExtras) {
        if (extra.code_point == cp) { return static_cast<char>(extra.byte); }
    }
    return '?';
}

/// Converts UTF-8 to WinAnsi. Unmappable or malformed sequences become '?'.
inline std::string ToWinAnsi(std::string_view utf8) {
    std::string out;
    out.reserve(utf8.size());
    size_t i = 0;
    while (i < utf8.size()) {
        const unsigned char lead = static_cast<unsigned char>(utf8[i]);
        char32_t cp              = 0;
        size_t len               = 0;
        if (lead < 0x80) {
            cp  = lead;
            len = 1;
        } else if ((lead & 0xE0) == 0xC0) {
            cp  = lead & 0x1F;
            len = 2;
        } else if ((lead & 0xF0) == 0xE0) {
            cp  = lead & 0x0F;
            len = 3;
        } else if ((lead & 0xF8) == 0xF0) {
            cp  = lead & 0x07;
            len = 4;
        } else {
            out.push_back('?');
            ++i;
            continue;
        }

        if (i + len > utf8.size()) {
            out.push_back('?');
            break;
        }
        bool valid = true;
        for (size_t k = 1; k < len; ++k) {
            const unsigned char cont = static_cast<unsigned char>(utf8[i + k]);
            if ((cont & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (cont & 0x3F);
        }
        if (!valid) {
            out.push_back('?');
            ++i;
            continue;
        }
        out.push_back(EncodeWinAnsi(cp));
        i += len;
    }
    return out;
}

} // namespace LabelSheet::detail
