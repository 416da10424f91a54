#include "sizeformat.h"

namespace syncq {

QString formatSize(qint64 bytes)
{
    constexpr qint64 KB = 1024;
    constexpr qint64 MB = KB * 1024;
    constexpr qint64 GB = MB * 1024;

    if (bytes < 0) {
        bytes = 0;
    }

    if (bytes >= GB) {
        return QString("%1GB").arg(static_cast<double>(bytes) / static_cast<double>(GB), 0, 'f', 2);
    }
    if (bytes >= MB) {
        return QString("%1MB").arg(static_cast<double>(bytes) / static_cast<double>(MB), 0, 'f', 2);
    }
    if (bytes >= KB) {
        return QString("%1KB").arg(static_cast<double>(bytes) / static_cast<double>(KB), 0, 'f', 2);
    }
    return QString("%1B").arg(bytes);
}

} // namespace syncq
