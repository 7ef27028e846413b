/**
 * @file byte_size.hpp
 * @brief Human-readable byte counts for summaries and size tallies.
 */

#ifndef BYTE_SIZE_HPP
#define BYTE_SIZE_HPP

#include <cstdint>
#include <string>

/**
 * @brief Formats @p value with comma thousands separators, e.g. 2,243,154,758.
 */
std::string groupThousands(std::uintmax_t value);

/**
 * @brief Scales @p bytes by powers of 1024 into B, KB, MB ... YB with one decimal, e.g. "2.1 GB".
 */
std::string humanBytes(std::uintmax_t bytes);

/**
 * @brief Scales @p bytes by powers of 1024 into B, KiB, MiB, GiB or TiB with one decimal.
 *
 * TiB is the largest unit used; bigger packages are reported as many TiB.
 */
std::string humanBytesIec(std::uintmax_t bytes);

#endif // BYTE_SIZE_HPP
