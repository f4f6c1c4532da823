#ifndef OTA_PROGRESS_H
#define OTA_PROGRESS_H

#include <stdint.h>

// Percentage of an OTA transfer. Zero until the total size is known.
inline unsigned int otaProgressPercent(unsigned int progress, unsigned int total) {
    if (total == 0) {
        return 0;
    }
    return (unsigned int)((uint64_t)progress * 100 / total);
}

#endif // OTA_PROGRESS_H
