#pragma once
#include <QtGlobal>
#include <QString>

namespace Utils {

// 1536 -> "1.50 KB". Binary units, two decimals above one kilobyte.
inline QString formatSize(qint64 bytes) {
    const qint64 kb = 1024;
    const qint64 mb = kb * 1024;
    const qint64 gb = mb * 1024;
    if (bytes >= gb) return QString::number(double(bytes) / gb, 'f', 2) + " GB";
    if (bytes >= mb) return QString::number(double(bytes) / mb, 'f', 2) + " MB";
    if (bytes >= kb) return QString::number(double(bytes) / kb, 'f', 2) + " KB";
    return QString::number(bytes) + " B";
}

// 850 -> "850 ms", 1500 -> "1.5 s", 90000 -> "1.5 min".
inline QString formatDuration(qint64 ms) {
    if (ms >= 60000) return QString::number(double(ms) / 60000.0, 'f', 1) + " min";
    if (ms >= 1000) return QString::number(double(ms) / 1000.0, 'f', 1) + " s";
    return QString::number(ms) + " ms";
}

} // namespace Utils
