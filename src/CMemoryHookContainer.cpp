/**
 * Author:    domin568
 * Created:   19.10.2026
 * Brief:     memory access hooks of an emulator
 **/

#include "../include/CMemoryHookContainer.hpp"
#include "../include/CEmulator.hpp"
#include <exception>
#include <iostream>

namespace hook
{

namespace
{
struct MemoryHookBinding : CHookBinding
{
    MemoryHookBinding( emu::CEmulator &emulator, MemoryHookCallback &&callback, void *userData )
        : CHookBinding{ emulator, userData }, m_callback{ std::move( callback ) }
    {
    }
    MemoryHookCallback m_callback;
};

struct MemoryEventHookBinding : CHookBinding
{
    MemoryEventHookBinding( emu::CEmulator &emulator, MemoryEventHookCallback &&callback, void *userData )
        : CHookBinding{ emulator, userData }, m_callback{ std::move( callback ) }
    {
    }
    MemoryEventHookCallback m_callback;
};

std::optional<MemoryType> translate_type( uc_mem_type type )
{
    const std::optional<MemoryType> memoryType{ to_memory_type( static_cast<int>( type ) ) };
    if (!memoryType)
        std::cerr << "Unknown memory access type " << static_cast<int>( type ) << " reported by unicorn" << std::endl;
    return memoryType;
}

// uc_cb_hookmem_t
void hook_mem( uc_engine *uc, uc_mem_type type, uint64_t address, int size, int64_t value, void *user_data )
{
    const auto *binding{ static_cast<MemoryHookBinding *>( user_data ) };
    if (!binding->owned_by( uc ))
        return;
    const std::optional<MemoryType> memoryType{ translate_type( type ) };
    if (!memoryType)
        return;
    try
    {
        binding->m_callback( binding->m_emulator, *memoryType, address, size, static_cast<uint64_t>( value ),
                             binding->m_userData );
    }
    catch (...)
    {
        // must not unwind through unicorn
        binding->m_emulator.capture_exception( std::current_exception() );
    }
}

// uc_cb_eventmem_t
bool hook_mem_event( uc_engine *uc, uc_mem_type type, uint64_t address, int size, int64_t value, void *user_data )
{
    const auto *binding{ static_cast<MemoryEventHookBinding *>( user_data ) };
    if (!binding->owned_by( uc ))
        return false;
    const std::optional<MemoryType> memoryType{ translate_type( type ) };
    if (!memoryType)
        return false;
    try
    {
        return binding->m_callback( binding->m_emulator, *memoryType, address, size, static_cast<uint64_t>( value ),
                                    binding->m_userData );
    }
    catch (...)
    {
        binding->m_emulator.capture_exception( std::current_exception() );
        return false;
    }
}
} // namespace

CMemoryHookContainer::CMemoryHookContainer( emu::CEmulator &emulator ) : CHookContainer{ emulator }
{
}

std::expected<CHookHandle, common::Error> CMemoryHookContainer::add( MemoryHookType type, MemoryHookCallback callback,
                                                                     void *userData )
{
    return add( type, std::move( callback ), common::Unbounded_Range_Begin, common::Unbounded_Range_End, userData );
}

std::expected<CHookHandle, common::Error> CMemoryHookContainer::add( MemoryHookType type, MemoryHookCallback callback,
                                                                     uint64_t begin, uint64_t end, void *userData )
{
    if (auto alive{ m_emulator.check_disposed() }; !alive)
        return std::unexpected{ std::move( alive ).error() };

    if (!callback)
        return std::unexpected{ common::Error{ common::Error::Type::Invalid_Argument, "Memory hook callback is empty." } };

    return add_internal( type, std::move( callback ), begin, end, userData );
}

std::expected<CHookHandle, common::Error> CMemoryHookContainer::add( MemoryEventHookType type,
                                                                     MemoryEventHookCallback callback, void *userData )
{
    return add( type, std::move( callback ), common::Unbounded_Range_Begin, common::Unbounded_Range_End, userData );
}

std::expected<CHookHandle, common::Error> CMemoryHookContainer::add( MemoryEventHookType type,
                                                                     MemoryEventHookCallback callback, uint64_t begin,
                                                                     uint64_t end, void *userData )
{
    if (auto alive{ m_emulator.check_disposed() }; !alive)
        return std::unexpected{ std::move( alive ).error() };

    if (!callback)
        return std::unexpected{
            common::Error{ common::Error::Type::Invalid_Argument, "Memory event hook callback is empty." } };

    return add_internal( type, std::move( callback ), begin, end, userData );
}

std::expected<CHookHandle, common::Error> CMemoryHookContainer::add_internal( MemoryHookType type,
                                                                              MemoryHookCallback &&callback,
                                                                              uint64_t begin, uint64_t end,
                                                                              void *userData )
{
    auto binding{ std::make_unique<MemoryHookBinding>( m_emulator, std::move( callback ), userData ) };
    return CHookContainer::add( static_cast<int>( type ), reinterpret_cast<void *>( hook_mem ), std::move( binding ),
                                begin, end );
}

std::expected<CHookHandle, common::Error> CMemoryHookContainer::add_internal( MemoryEventHookType type,
                                                                              MemoryEventHookCallback &&callback,
                                                                              uint64_t begin, uint64_t end,
                                                                              void *userData )
{
    auto binding{ std::make_unique<MemoryEventHookBinding>( m_emulator, std::move( callback ), userData ) };
    return CHookContainer::add( static_cast<int>( type ), reinterpret_cast<void *>( hook_mem_event ),
                                std::move( binding ), begin, end );
}
} // namespace hook
