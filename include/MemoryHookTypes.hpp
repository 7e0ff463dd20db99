/**
 * Author:    domin568
 * Created:   19.10.2026
 * Brief:     memory access kinds shared with unicorn
 **/
#pragma once
#include <optional>
#include <string_view>

namespace hook
{

// Values are unicorn's uc_hook_type bits and uc_mem_type codes, they cross the boundary as raw ints.

// informational hooks
enum class MemoryHookType : int
{
    Read = 1 << 10,      // UC_HOOK_MEM_READ
    Write = 1 << 11,     // UC_HOOK_MEM_WRITE
    Fetch = 1 << 12,     // UC_HOOK_MEM_FETCH
    ReadAfter = 1 << 13, // UC_HOOK_MEM_READ_AFTER
};

// invalid access hooks, callback decides if the access is resolved
enum class MemoryEventHookType : int
{
    UnmappedRead = 1 << 4,   // UC_HOOK_MEM_READ_UNMAPPED
    UnmappedWrite = 1 << 5,  // UC_HOOK_MEM_WRITE_UNMAPPED
    UnmappedFetch = 1 << 6,  // UC_HOOK_MEM_FETCH_UNMAPPED
    ProtectedRead = 1 << 7,  // UC_HOOK_MEM_READ_PROT
    ProtectedWrite = 1 << 8, // UC_HOOK_MEM_WRITE_PROT
    ProtectedFetch = 1 << 9, // UC_HOOK_MEM_FETCH_PROT
};

// access kind reported to callbacks
enum class MemoryType : int
{
    Read = 16,           // UC_MEM_READ
    Write = 17,          // UC_MEM_WRITE
    Fetch = 18,          // UC_MEM_FETCH
    ReadUnmapped = 19,   // UC_MEM_READ_UNMAPPED
    WriteUnmapped = 20,  // UC_MEM_WRITE_UNMAPPED
    FetchUnmapped = 21,  // UC_MEM_FETCH_UNMAPPED
    WriteProtected = 22, // UC_MEM_WRITE_PROT
    ReadProtected = 23,  // UC_MEM_READ_PROT
    FetchProtected = 24, // UC_MEM_FETCH_PROT
    ReadAfter = 25,      // UC_MEM_READ_AFTER
};

constexpr MemoryHookType operator|( MemoryHookType a, MemoryHookType b )
{
    return static_cast<MemoryHookType>( static_cast<int>( a ) | static_cast<int>( b ) );
}

constexpr MemoryHookType operator&( MemoryHookType a, MemoryHookType b )
{
    return static_cast<MemoryHookType>( static_cast<int>( a ) & static_cast<int>( b ) );
}

constexpr MemoryEventHookType operator|( MemoryEventHookType a, MemoryEventHookType b )
{
    return static_cast<MemoryEventHookType>( static_cast<int>( a ) | static_cast<int>( b ) );
}

constexpr MemoryEventHookType operator&( MemoryEventHookType a, MemoryEventHookType b )
{
    return static_cast<MemoryEventHookType>( static_cast<int>( a ) & static_cast<int>( b ) );
}

inline constexpr MemoryEventHookType Memory_Event_Unmapped{ MemoryEventHookType::UnmappedRead |
                                                            MemoryEventHookType::UnmappedWrite |
                                                            MemoryEventHookType::UnmappedFetch };
inline constexpr MemoryEventHookType Memory_Event_Protected{ MemoryEventHookType::ProtectedRead |
                                                             MemoryEventHookType::ProtectedWrite |
                                                             MemoryEventHookType::ProtectedFetch };
inline constexpr MemoryEventHookType Memory_Event_Invalid{ Memory_Event_Unmapped | Memory_Event_Protected };

std::optional<MemoryType> to_memory_type( int native );
std::string_view to_string( MemoryType type );
} // namespace hook
