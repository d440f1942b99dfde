#include "header/Bus.h"
#include "header/apu.h"

#include <cstring>

bus::bus() : prg(0x8000, 0x00) {
    reset();
}

bus::~bus() {}

void bus::connectAPU(apu* a) {
    this->connectedAPU = a;
}

bool bus::loadPrg(uint16_t addr, const uint8_t* data, size_t len) {
    if (addr < 0x8000 || !data) return false;

    size_t offset = addr - 0x8000;
    if (offset + len > prg.size()) return false;

    memcpy(prg.data() + offset, data, len);
    return true;
}

uint8_t bus::read(uint16_t addr, bool readonly) {
    // internal RAM, mirrored every 2 KB
    if (addr <= 0x1FFF)
        return ram[addr & 0x07FF];

    // APU status ($4015)
    if (addr == 0x4015)
        return connectedAPU ? connectedAPU->cpuRead(addr, readonly) : 0;

    if (addr >= 0x8000)
        return prg[addr - 0x8000];

    return 0;
}

void bus::write(uint16_t addr, uint8_t data) {
    // internal RAM
    if (addr <= 0x1FFF) {
        ram[addr & 0x07FF] = data;
    }

    // APU registers ($4000-$4013, $4015, $4017)
    else if ((addr >= 0x4000 && addr <= 0x4013) || addr == 0x4015 || addr == 0x4017) {
        if (connectedAPU) connectedAPU->cpuWrite(addr, data);
    }

    // PRG is ROM; everything else is not mapped here
}

uint8_t bus::readMemory(uint16_t addr) {
    // DMC addresses never leave $8000-$FFFF, and PRG is only written by
    // loadPrg() before playback, so no lock is needed here
    if (addr >= 0x8000)
        return prg[addr - 0x8000];

    return 0;
}

void bus::reset() {
    for (auto& r : ram)
        r = 0;
}
