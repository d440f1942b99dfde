#ifndef MEMORY_READER_H
#define MEMORY_READER_H

#include <cstdint>

// Read capability handed to the APU for DMC sample fetches.
// Implementations must not have side effects visible to the APU.
class MemoryReader {
public:
    virtual ~MemoryReader() = default;

    virtual uint8_t readMemory(uint16_t addr) = 0;
};

#endif
