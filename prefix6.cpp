/* prefix6.cpp - ipv6 prefix masking and ULA classification
 *
 * (c) 2026 The ularoute authors
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * - Redistributions of source code must retain the above copyright notice,
 *   this list of conditions and the following disclaimer.
 *
 * - Redistributions in binary form must reproduce the above copyright notice,
 *   this list of conditions and the following disclaimer in the documentation
 *   and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 * ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
 * LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 * CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 * POSSIBILITY OF SUCH DAMAGE.
 */

#include <string.h>
#include <fmt/format.h>
#include "prefix6.hpp"

namespace ba = boost::asio;

ba::ip::address_v6 mask_prefix(const ba::ip::address_v6 &v, uint8_t pl)
{
    if (pl >= 128)
        return v;
    auto a6 = v.to_bytes();
    uint8_t keep_bytes = pl / 8;
    uint8_t keep_bits = pl % 8;
    if (keep_bits == 0)
        memset(a6.data() + keep_bytes, 0, 16 - keep_bytes);
    else {
        memset(a6.data() + keep_bytes + 1, 0, 16 - keep_bytes - 1);
        uint8_t mask = 0xff;
        while (keep_bits--)
            mask >>= 1;
        a6[keep_bytes] &= ~mask;
    }
    return ba::ip::address_v6(a6);
}

bool is_ula_prefix(const ba::ip::address_v6 &prefix, uint8_t pl)
{
    if (pl < 8)
        return false;
    return mask_prefix(prefix, pl).to_bytes()[0] == ula_first_octet;
}

std::string format_prefix(const ba::ip::address_v6 &prefix, uint8_t pl)
{
    return fmt::format("{}/{}", prefix.to_string(), pl);
}
