/**
 * Author:    domin568
 * Created:   20.10.2026
 * Brief:     special instruction hooks of an emulator
 **/
#pragma once
#include "CHookContainer.hpp"
#include <functional>

namespace hook
{

using InstructionHookCallback = std::function<void( emu::CEmulator &emulator, void *userData )>;

// Hooks instructions with the uc_cb_insn_syscall_t shape (x86 SYSCALL, SYSENTER).
// Instructions unicorn cannot hook are refused by unicorn itself.
class CInstructionHookContainer : public CHookContainer
{
  public:
    explicit CInstructionHookContainer( emu::CEmulator &emulator );

    std::expected<CHookHandle, common::Error> add( int instruction, InstructionHookCallback callback,
                                                   void *userData = nullptr );
    std::expected<CHookHandle, common::Error> add( int instruction, InstructionHookCallback callback, uint64_t begin,
                                                   uint64_t end, void *userData );
};
} // namespace hook
