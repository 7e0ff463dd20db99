/**
 * Author:    domin568
 * Created:   19.10.2026
 * Brief:     interrupt hooks of an emulator
 **/
#pragma once
#include "CHookContainer.hpp"
#include <functional>

namespace hook
{

using InterruptHookCallback = std::function<void( emu::CEmulator &emulator, int interruptNumber, void *userData )>;

class CInterruptHookContainer : public CHookContainer
{
  public:
    explicit CInterruptHookContainer( emu::CEmulator &emulator );

    // interrupts are not address bound, always registered for the whole address space
    std::expected<CHookHandle, common::Error> add( InterruptHookCallback callback, void *userData = nullptr );
};
} // namespace hook
