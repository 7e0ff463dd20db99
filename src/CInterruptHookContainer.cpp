/**
 * Author:    domin568
 * Created:   19.10.2026
 * Brief:     interrupt hooks of an emulator
 **/

#include "../include/CInterruptHookContainer.hpp"
#include "../include/CEmulator.hpp"
#include <exception>

namespace hook
{

namespace
{
struct InterruptHookBinding : CHookBinding
{
    InterruptHookBinding( emu::CEmulator &emulator, InterruptHookCallback &&callback, void *userData )
        : CHookBinding{ emulator, userData }, m_callback{ std::move( callback ) }
    {
    }
    InterruptHookCallback m_callback;
};

// uc_cb_hookintr_t
void hook_intr( uc_engine *uc, uint32_t intno, void *user_data )
{
    const auto *binding{ static_cast<InterruptHookBinding *>( user_data ) };
    if (!binding->owned_by( uc ))
        return;
    try
    {
        binding->m_callback( binding->m_emulator, static_cast<int>( intno ), binding->m_userData );
    }
    catch (...)
    {
        binding->m_emulator.capture_exception( std::current_exception() );
    }
}
} // namespace

CInterruptHookContainer::CInterruptHookContainer( emu::CEmulator &emulator ) : CHookContainer{ emulator }
{
}

std::expected<CHookHandle, common::Error> CInterruptHookContainer::add( InterruptHookCallback callback,
                                                                        void *userData )
{
    if (auto alive{ m_emulator.check_disposed() }; !alive)
        return std::unexpected{ std::move( alive ).error() };

    if (!callback)
        return std::unexpected{
            common::Error{ common::Error::Type::Invalid_Argument, "Interrupt hook callback is empty." } };

    auto binding{ std::make_unique<InterruptHookBinding>( m_emulator, std::move( callback ), userData ) };
    return CHookContainer::add( UC_HOOK_INTR, reinterpret_cast<void *>( hook_intr ), std::move( binding ),
                                common::Unbounded_Range_Begin, common::Unbounded_Range_End );
}
} // namespace hook
