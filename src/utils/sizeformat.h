/**
 * @file sizeformat.h
 * @brief Human-readable byte counts for status output.
 */

#ifndef SIZEFORMAT_H
#define SIZEFORMAT_H

#include <QString>

namespace syncq {

/**
 * @brief Formats @p bytes as "512B", "1.50KB", "3.00MB" or "2.25GB".
 *
 * Units are binary (1KB = 1024 bytes) with two decimals; counts below
 * 1KB are printed as whole bytes. Negative values are treated as 0.
 */
[[nodiscard]] QString formatSize(qint64 bytes);

} // namespace syncq

#endif // SIZEFORMAT_H
