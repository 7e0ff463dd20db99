/**
 * Author:    domin568
 * Created:   19.10.2026
 * Brief:     memory access hooks of an emulator
 **/
#pragma once
#include "CHookContainer.hpp"
#include "MemoryHookTypes.hpp"
#include <functional>

namespace hook
{

using MemoryHookCallback = std::function<void( emu::CEmulator &emulator, MemoryType type, uint64_t address, int size,
                                               uint64_t value, void *userData )>;
// returning true tells unicorn the invalid access was handled and emulation may continue
using MemoryEventHookCallback = std::function<bool( emu::CEmulator &emulator, MemoryType type, uint64_t address,
                                                    int size, uint64_t value, void *userData )>;

class CMemoryHookContainer : public CHookContainer
{
  public:
    explicit CMemoryHookContainer( emu::CEmulator &emulator );

    std::expected<CHookHandle, common::Error> add( MemoryHookType type, MemoryHookCallback callback,
                                                   void *userData = nullptr );
    std::expected<CHookHandle, common::Error> add( MemoryHookType type, MemoryHookCallback callback, uint64_t begin,
                                                   uint64_t end, void *userData );
    std::expected<CHookHandle, common::Error> add( MemoryEventHookType type, MemoryEventHookCallback callback,
                                                   void *userData = nullptr );
    std::expected<CHookHandle, common::Error> add( MemoryEventHookType type, MemoryEventHookCallback callback,
                                                   uint64_t begin, uint64_t end, void *userData );

  private:
    std::expected<CHookHandle, common::Error> add_internal( MemoryHookType type, MemoryHookCallback &&callback,
                                                            uint64_t begin, uint64_t end, void *userData );
    std::expected<CHookHandle, common::Error> add_internal( MemoryEventHookType type,
                                                            MemoryEventHookCallback &&callback, uint64_t begin,
                                                            uint64_t end, void *userData );
};
} // namespace hook
