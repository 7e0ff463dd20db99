/**
 * Author:    domin568
 * Created:   19.10.2026
 * Brief:     memory access kinds shared with unicorn
 **/

#include "../include/MemoryHookTypes.hpp"
#include <algorithm>
#include <array>
#include <unicorn/unicorn.h>
#include <utility>

namespace hook
{

static_assert( static_cast<int>( MemoryHookType::Read ) == UC_HOOK_MEM_READ );
static_assert( static_cast<int>( MemoryHookType::Write ) == UC_HOOK_MEM_WRITE );
static_assert( static_cast<int>( MemoryHookType::Fetch ) == UC_HOOK_MEM_FETCH );
static_assert( static_cast<int>( MemoryHookType::ReadAfter ) == UC_HOOK_MEM_READ_AFTER );

static_assert( static_cast<int>( MemoryEventHookType::UnmappedRead ) == UC_HOOK_MEM_READ_UNMAPPED );
static_assert( static_cast<int>( MemoryEventHookType::UnmappedWrite ) == UC_HOOK_MEM_WRITE_UNMAPPED );
static_assert( static_cast<int>( MemoryEventHookType::UnmappedFetch ) == UC_HOOK_MEM_FETCH_UNMAPPED );
static_assert( static_cast<int>( MemoryEventHookType::ProtectedRead ) == UC_HOOK_MEM_READ_PROT );
static_assert( static_cast<int>( MemoryEventHookType::ProtectedWrite ) == UC_HOOK_MEM_WRITE_PROT );
static_assert( static_cast<int>( MemoryEventHookType::ProtectedFetch ) == UC_HOOK_MEM_FETCH_PROT );
static_assert( static_cast<int>( Memory_Event_Invalid ) == UC_HOOK_MEM_INVALID );

static constexpr std::array<std::pair<MemoryType, std::string_view>, 10> Memory_Type_Table{ {
    { MemoryType::Read, "READ" },
    { MemoryType::Write, "WRITE" },
    { MemoryType::Fetch, "FETCH" },
    { MemoryType::ReadUnmapped, "READ_UNMAPPED" },
    { MemoryType::WriteUnmapped, "WRITE_UNMAPPED" },
    { MemoryType::FetchUnmapped, "FETCH_UNMAPPED" },
    { MemoryType::WriteProtected, "WRITE_PROT" },
    { MemoryType::ReadProtected, "READ_PROT" },
    { MemoryType::FetchProtected, "FETCH_PROT" },
    { MemoryType::ReadAfter, "READ_AFTER" },
} };

static_assert( static_cast<int>( MemoryType::Read ) == UC_MEM_READ );
static_assert( static_cast<int>( MemoryType::Write ) == UC_MEM_WRITE );
static_assert( static_cast<int>( MemoryType::Fetch ) == UC_MEM_FETCH );
static_assert( static_cast<int>( MemoryType::ReadUnmapped ) == UC_MEM_READ_UNMAPPED );
static_assert( static_cast<int>( MemoryType::WriteUnmapped ) == UC_MEM_WRITE_UNMAPPED );
static_assert( static_cast<int>( MemoryType::FetchUnmapped ) == UC_MEM_FETCH_UNMAPPED );
static_assert( static_cast<int>( MemoryType::WriteProtected ) == UC_MEM_WRITE_PROT );
static_assert( static_cast<int>( MemoryType::ReadProtected ) == UC_MEM_READ_PROT );
static_assert( static_cast<int>( MemoryType::FetchProtected ) == UC_MEM_FETCH_PROT );
static_assert( static_cast<int>( MemoryType::ReadAfter ) == UC_MEM_READ_AFTER );

std::optional<MemoryType> to_memory_type( int native )
{
    const auto it{ std::ranges::find( Memory_Type_Table, native, []( const std::pair<MemoryType, std::string_view> &p ) {
        return static_cast<int>( p.first );
    } ) };
    if (it == Memory_Type_Table.end())
        return std::nullopt;
    return it->first;
}

std::string_view to_string( MemoryType type )
{
    const auto it{ std::ranges::find( Memory_Type_Table, type, &std::pair<MemoryType, std::string_view>::first ) };
    if (it == Memory_Type_Table.end())
        return "UNKNOWN";
    return it->second;
}
} // namespace hook
