/**
 * Author:    domin568
 * Created:   19.10.2026
 * Brief:     instruction and basic block hooks of an emulator
 **/
#pragma once
#include "CHookContainer.hpp"
#include <functional>

namespace hook
{

// for block hooks size is the size of the whole block
using CodeHookCallback =
    std::function<void( emu::CEmulator &emulator, uint64_t address, int size, void *userData )>;
using BlockHookCallback = CodeHookCallback;

// UC_HOOK_CODE and UC_HOOK_BLOCK share the uc_cb_hookcode_t signature
template <uc_hook_type HookType> class CCodeHookContainerT : public CHookContainer
{
  public:
    explicit CCodeHookContainerT( emu::CEmulator &emulator );

    std::expected<CHookHandle, common::Error> add( CodeHookCallback callback, void *userData = nullptr );
    std::expected<CHookHandle, common::Error> add( CodeHookCallback callback, uint64_t begin, uint64_t end,
                                                   void *userData );
};

extern template class CCodeHookContainerT<UC_HOOK_CODE>;
extern template class CCodeHookContainerT<UC_HOOK_BLOCK>;

using CCodeHookContainer = CCodeHookContainerT<UC_HOOK_CODE>;
using CBlockHookContainer = CCodeHookContainerT<UC_HOOK_BLOCK>;
} // namespace hook
