#ifndef BUS_H
#define BUS_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>

#include "MemoryReader.h"

class apu;

// CPU address space as seen by the audio core: work RAM, the APU register
// window and a 32 KiB PRG area ($8000-$FFFF) holding DMC sample data.
class bus : public MemoryReader {
public:
    bus();
    ~bus() override;

    apu* connectedAPU = nullptr;

    std::array<uint8_t, 2048> ram = {};
    std::vector<uint8_t> prg;

    void connectAPU(apu* a);

    // Copies 'len' bytes into PRG space at 'addr' ($8000-$FFFF). Returns
    // false if the block does not fit. Load before playback starts.
    bool loadPrg(uint16_t addr, const uint8_t* data, size_t len);

    uint8_t read(uint16_t addr, bool readonly = false);
    void write(uint16_t addr, uint8_t data);

    // DMC fetch path. Called with the APU lock held from the producer
    // thread, so it only sees PRG: never the APU, never work RAM (which the
    // CPU thread writes unsynchronised). Everything else reads as 0.
    uint8_t readMemory(uint16_t addr) override;

    void reset();
};
#endif
