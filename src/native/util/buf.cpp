/* Copyright (C) 2016 NooBaa */
#include "buf.h"

#include <ctype.h>

namespace chunkbench
{

const char Buf::HEX_CHARS[] = {
    '0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'
};

void
Buf::hexdump(const void* p, size_t len, const char* prefix)
{
    const uint8_t* bytes = reinterpret_cast<const uint8_t*>(p);
    for (size_t line = 0; line < len; line += 16) {
        const size_t n = std::min<size_t>(16, len - line);
        std::string hex;
        std::string ascii;
        for (size_t i = 0; i < 16; ++i) {
            if (i < n) {
                const uint8_t c = bytes[line + i];
                hex += ' ';
                hex += HEX_CHARS[c >> 4];
                hex += HEX_CHARS[c & 0xf];
                ascii += isprint(c) ? char(c) : '.';
            } else {
                hex += "   ";
            }
        }
        std::cerr << (prefix ? prefix : "") << (prefix ? " " : "")
                  << std::setw(8) << std::setfill('0') << std::hex << line << std::dec << std::setfill(' ') << ":"
                  << hex << "   " << ascii << std::endl;
    }
}

} // namespace chunkbench
