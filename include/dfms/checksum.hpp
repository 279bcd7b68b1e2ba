/**
 * SPDX-FileCopyrightText: Copyright (c) 2025, dfms contributors.
 * SPDX-License-Identifier: Apache-2.0
 */
#pragma once

#include <cstdint>
#include <span>
#include <string_view>

namespace dfms {

/**
 * @brief Incremental CRC-32 (IEEE 802.3, reflected polynomial 0xEDB88320).
 *
 * The value is chainable: `crc32(b, crc32(a))` equals `crc32(ab)`, which makes the
 * result independent of how a byte stream is split into blocks.
 *
 * @param data The bytes to fold into the checksum.
 * @param crc The checksum of all preceding bytes (0 for an empty prefix).
 * @return The updated checksum.
 */
[[nodiscard]] std::uint32_t crc32(
    std::span<std::uint8_t const> data, std::uint32_t crc = 0
) noexcept;

/**
 * @copydoc crc32(std::span<std::uint8_t const>, std::uint32_t)
 */
[[nodiscard]] std::uint32_t crc32(std::string_view data, std::uint32_t crc = 0) noexcept;

}  // namespace dfms
