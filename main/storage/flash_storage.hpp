#ifndef FLASH_STORAGE_HPP
#define FLASH_STORAGE_HPP

#include <cstddef>

// SPIFFS partition holding the daily CSV log
namespace FlashStorage {
    // Formats the partition on first use if it cannot be mounted
    bool mount();
    bool isMounted();
    void logUsage();
}

#endif // FLASH_STORAGE_HPP
