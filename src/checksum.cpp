/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <array>

#include <dfms/checksum.hpp>

namespace dfms {

namespace {

constexpr std::array<std::uint32_t, 256> make_crc32_table() {
    std::array<std::uint32_t, 256> table{};
    for (std::uint32_t i = 0; i < table.size(); ++i) {
        std::uint32_t c = i;
        for (int bit = 0; bit < 8; ++bit) {
            std::uint32_t mask = -(c & 1u);
            c = (c >> 1) ^ (0xEDB88320u & mask);
        }
        table[i] = c;
    }
    return table;
}

constexpr auto crc32_table = make_crc32_table();

}  // namespace

std::uint32_t crc32(std::span<std::uint8_t const> data, std::uint32_t crc) noexcept {
    crc = ~crc;
    for (auto byte : data) {
        crc = crc32_table[(crc ^ byte) & 0xFFu] ^ (crc >> 8);
    }
    return ~crc;
}

std::uint32_t crc32(std::string_view data, std::uint32_t crc) noexcept {
    return crc32(
        std::span<std::uint8_t const>{
            reinterpret_cast<std::uint8_t const*>(data.data()), data.size()
        },
        crc
    );
}

}  // namespace dfms
