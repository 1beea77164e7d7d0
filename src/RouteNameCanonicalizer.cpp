#include "RouteNameCanonicalizer.hpp"

#include <cstdint>
#include <new>

namespace
{
constexpr char32_t REPLACEMENT_CHARACTER = 0xFFFD;

// Decodes one code point at `i`. Returns 0 length for an invalid sequence.
std::size_t decodeUtf8(std::string_view s, std::size_t i, char32_t& cp)
{
    auto byte = [&](std::size_t k) { return static_cast<unsigned char>(s[k]); };
    auto continuation = [&](std::size_t k) { return k < s.size() && (byte(k) & 0xC0) == 0x80; };

    unsigned char lead = byte(i);
    if (lead < 0x80)
    {
        cp = lead;
        return 1;
    }
    if ((lead & 0xE0) == 0xC0 && lead >= 0xC2 && continuation(i + 1))
    {
        cp = (static_cast<char32_t>(lead & 0x1F) << 6) | (byte(i + 1) & 0x3F);
        return 2;
    }
    if ((lead & 0xF0) == 0xE0 && continuation(i + 1) && continuation(i + 2))
    {
        cp = (static_cast<char32_t>(lead & 0x0F) << 12)
           | (static_cast<char32_t>(byte(i + 1) & 0x3F) << 6)
           | (byte(i + 2) & 0x3F);
        return cp >= 0x800 ? 3 : 0;
    }
    if ((lead & 0xF8) == 0xF0 && continuation(i + 1) && continuation(i + 2) && continuation(i + 3))
    {
        cp = (static_cast<char32_t>(lead & 0x07) << 18)
           | (static_cast<char32_t>(byte(i + 1) & 0x3F) << 12)
           | (static_cast<char32_t>(byte(i + 2) & 0x3F) << 6)
           | (byte(i + 3) & 0x3F);
        return (cp >= 0x10000 && cp <= 0x10FFFF) ? 4 : 0;
    }
    return 0;
}
}

bool RouteNameCanonicalizer::isSpace(char32_t cp) noexcept
{
    switch (cp)
    {
        case U' ': case U'\t': case U'\n': case U'\v': case U'\f': case U'\r':
        case 0x00A0: case 0x202F: case 0x205F: case 0x3000:
            return true;
        default:
            return cp >= 0x2000 && cp <= 0x200A;
    }
}

char32_t RouteNameCanonicalizer::toUpper(char32_t cp) noexcept
{
    if (cp >= U'a' && cp <= U'z')
        return cp - 0x20;
    if (cp >= 0x00E0 && cp <= 0x00FE && cp != 0x00F7)
        return cp - 0x20;
    if (cp == 0x03C2)                       // final sigma
        return 0x03A3;
    if (cp >= 0x03B1 && cp <= 0x03C9)
        return cp - 0x20;

    switch (cp)
    {
        case 0x03AC: return 0x0386;         // tonos
        case 0x03AD: return 0x0388;
        case 0x03AE: return 0x0389;
        case 0x03AF: return 0x038A;
        case 0x03CC: return 0x038C;
        case 0x03CD: return 0x038E;
        case 0x03CE: return 0x038F;
        case 0x03CA: return 0x03AA;         // dialytika
        case 0x03CB: return 0x03AB;
        default:     return cp;
    }
}

// Ρ and Χ land on P and X; Ξ also gives X. Kept as the live page renders them.
char const* RouteNameCanonicalizer::transliterate(char32_t upperGreek) noexcept
{
    switch (upperGreek)
    {
        case 0x0391: return "A";
        case 0x0392: return "B";
        case 0x0393: return "G";
        case 0x0394: return "D";
        case 0x0395: return "E";
        case 0x0396: return "Z";
        case 0x0397: return "H";
        case 0x0398: return "TH";
        case 0x0399: return "I";
        case 0x039A: return "K";
        case 0x039B: return "L";
        case 0x039C: return "M";
        case 0x039D: return "N";
        case 0x039E: return "X";
        case 0x039F: return "O";
        case 0x03A0: return "P";
        case 0x03A1: return "P";
        case 0x03A3: return "S";
        case 0x03A4: return "T";
        case 0x03A5: return "Y";
        case 0x03A6: return "F";
        case 0x03A7: return "X";
        case 0x03A8: return "PS";
        case 0x03A9: return "O";
        default:     return nullptr;
    }
}

void RouteNameCanonicalizer::appendUtf8(std::string& out, char32_t cp)
{
    if (cp < 0x80)
    {
        out += static_cast<char>(cp);
    }
    else if (cp < 0x800)
    {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else if (cp < 0x10000)
    {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else
    {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::string RouteNameCanonicalizer::canonicalize(std::string_view label) noexcept
{
    std::string out;
    try
    {
        out.reserve(label.size());

        std::size_t i = 0;
        while (i < label.size())
        {
            char32_t cp = 0;
            std::size_t len = decodeUtf8(label, i, cp);
            if (len == 0)
            {
                appendUtf8(out, REPLACEMENT_CHARACTER);
                ++i;
                continue;
            }
            i += len;

            if (isSpace(cp))
                continue;

            cp = toUpper(cp);
            if (char const* latin = transliterate(cp))
                out += latin;
            else
                appendUtf8(out, cp);
        }
    }
    catch (std::bad_alloc const&)
    {
        out.clear();
    }
    return out;
}
