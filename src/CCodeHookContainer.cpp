/**
 * Author:    domin568
 * Created:   19.10.2026
 * Brief:     instruction and basic block hooks of an emulator
 **/

#include "../include/CCodeHookContainer.hpp"
#include "../include/CEmulator.hpp"
#include <exception>

namespace hook
{

namespace
{
struct CodeHookBinding : CHookBinding
{
    CodeHookBinding( emu::CEmulator &emulator, CodeHookCallback &&callback, void *userData )
        : CHookBinding{ emulator, userData }, m_callback{ std::move( callback ) }
    {
    }
    CodeHookCallback m_callback;
};

// uc_cb_hookcode_t
void hook_code( uc_engine *uc, uint64_t address, uint32_t size, void *user_data )
{
    const auto *binding{ static_cast<CodeHookBinding *>( user_data ) };
    if (!binding->owned_by( uc ))
        return;
    try
    {
        binding->m_callback( binding->m_emulator, address, static_cast<int>( size ), binding->m_userData );
    }
    catch (...)
    {
        binding->m_emulator.capture_exception( std::current_exception() );
    }
}
} // namespace

template <uc_hook_type HookType>
CCodeHookContainerT<HookType>::CCodeHookContainerT( emu::CEmulator &emulator ) : CHookContainer{ emulator }
{
}

template <uc_hook_type HookType>
std::expected<CHookHandle, common::Error> CCodeHookContainerT<HookType>::add( CodeHookCallback callback,
                                                                            void *userData )
{
    return add( std::move( callback ), common::Unbounded_Range_Begin, common::Unbounded_Range_End, userData );
}

template <uc_hook_type HookType>
std::expected<CHookHandle, common::Error> CCodeHookContainerT<HookType>::add( CodeHookCallback callback,
                                                                            uint64_t begin, uint64_t end,
                                                                            void *userData )
{
    if (auto alive{ m_emulator.check_disposed() }; !alive)
        return std::unexpected{ std::move( alive ).error() };

    if (!callback)
        return std::unexpected{ common::Error{ common::Error::Type::Invalid_Argument,
                                               HookType == UC_HOOK_BLOCK ? "Block hook callback is empty."
                                                                         : "Code hook callback is empty." } };

    auto binding{ std::make_unique<CodeHookBinding>( m_emulator, std::move( callback ), userData ) };
    return CHookContainer::add( HookType, reinterpret_cast<void *>( hook_code ), std::move( binding ), begin, end );
}

template class CCodeHookContainerT<UC_HOOK_CODE>;
template class CCodeHookContainerT<UC_HOOK_BLOCK>;
} // namespace hook
