/**
 * Author:    domin568
 * Created:   19.10.2026
 * Brief:     base for typed hook containers, hook handle and binding record
 **/

#include "../include/CHookContainer.hpp"
#include "../include/CEmulator.hpp"
#include <iostream>

namespace hook
{
CHookBinding::CHookBinding( emu::CEmulator &emulator, void *userData ) : m_emulator{ emulator }, m_userData{ userData }
{
}

bool CHookBinding::owned_by( uc_engine *uc ) const
{
    if (uc == m_emulator.handle())
        return true;
    std::cerr << "Hook invoked for foreign engine 0x" << std::hex << reinterpret_cast<uintptr_t>( uc )
              << ", expected 0x" << reinterpret_cast<uintptr_t>( m_emulator.handle() ) << std::dec << std::endl;
    return false;
}

CHookContainer::CHookContainer( emu::CEmulator &emulator ) : m_emulator{ emulator }
{
}

std::expected<void, common::Error> CHookContainer::remove( const CHookHandle &handle )
{
    return m_emulator.remove_hook( handle );
}

std::expected<CHookHandle, common::Error> CHookContainer::add( int type, void *trampoline,
                                                               std::unique_ptr<CHookBinding> binding, uint64_t begin,
                                                               uint64_t end, int instruction )
{
    return m_emulator.add_hook( type, trampoline, std::move( binding ), begin, end, instruction );
}

CScopedHook::CScopedHook( CHookContainer &container, CHookHandle handle ) : m_container{ container }, m_handle{ handle }
{
}

CScopedHook::~CScopedHook()
{
    const std::expected<void, common::Error> removed{ m_container.remove( m_handle ) };
    if (!removed)
        std::cerr << "Could not remove hook: " << removed.error().message << std::endl;
}
} // namespace hook
