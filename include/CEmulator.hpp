/**
 * Author:    domin568
 * Created:   19.10.2026
 * Brief:     owning wrapper of a unicorn engine with typed hook containers
 **/
#pragma once
#include "CCodeHookContainer.hpp"
#include "CHookContainer.hpp"
#include "CInstructionHookContainer.hpp"
#include "CInterruptHookContainer.hpp"
#include "CMemoryHookContainer.hpp"
#include "Common.hpp"
#include <concepts>
#include <exception>
#include <expected>
#include <memory>
#include <span>
#include <unicorn/unicorn.h>
#include <unordered_map>
#include <vector>

namespace emu
{

class CEmulator
{
  public:
    static std::expected<std::unique_ptr<CEmulator>, common::Error> init( uc_arch arch, uc_mode mode );
    ~CEmulator();
    // hook bindings keep a reference to the emulator, it must not move
    CEmulator( const CEmulator & ) = delete;
    CEmulator &operator=( const CEmulator & ) = delete;

    // disposed-state guard shared by every operation
    std::expected<void, common::Error> check_disposed() const;
    bool is_disposed() const;
    // closes the engine and releases all hook bindings, safe to call more than once,
    // refused while emulation is running
    void close();
    uc_engine *handle() const;
    uc_arch arch() const;

    // generic registration, binding is kept alive until remove_hook() or close()
    // instruction is only read by unicorn for UC_HOOK_INSN
    std::expected<hook::CHookHandle, common::Error> add_hook( int type, void *trampoline,
                                                              std::unique_ptr<hook::CHookBinding> binding,
                                                              uint64_t begin, uint64_t end, int instruction = 0 );
    std::expected<void, common::Error> remove_hook( const hook::CHookHandle &handle );
    std::size_t hook_count() const;

    std::expected<void, common::Error> mem_map( uint64_t address, size_t size, uint32_t perms );
    std::expected<void, common::Error> mem_unmap( uint64_t address, size_t size );
    std::expected<void, common::Error> mem_protect( uint64_t address, size_t size, uint32_t perms );
    std::expected<void, common::Error> mem_write( uint64_t address, std::span<const uint8_t> data );
    std::expected<std::vector<uint8_t>, common::Error> mem_read( uint64_t address, size_t size );
    // unicorn copies the full register width, value has to be at least that large
    std::expected<void, common::Error> reg_write( int regId, std::span<const uint8_t> value );
    std::expected<void, common::Error> reg_read( int regId, std::span<uint8_t> value );

    // T has to be as wide as the register, e.g. uint32_t for EAX, uint64_t for RAX
    template <std::integral T> std::expected<void, common::Error> reg_write( int regId, T value )
    {
        return reg_write( regId, std::span<const uint8_t>{ reinterpret_cast<const uint8_t *>( &value ), sizeof( T ) } );
    }
    template <std::integral T> std::expected<T, common::Error> reg_read( int regId )
    {
        T value{};
        if (auto read{ reg_read( regId, std::span<uint8_t>{ reinterpret_cast<uint8_t *>( &value ), sizeof( T ) } ) };
            !read)
            return std::unexpected{ std::move( read ).error() };
        return value;
    }

    std::expected<void, common::Error> start( uint64_t begin, uint64_t until, uint64_t timeout = 0, size_t count = 0 );
    std::expected<void, common::Error> stop();

    // called by trampolines, the first exception stops emulation and is reported by start()
    void capture_exception( std::exception_ptr exception );

    hook::CMemoryHookContainer &memory_hooks()
    {
        return m_memoryHooks;
    }
    hook::CCodeHookContainer &code_hooks()
    {
        return m_codeHooks;
    }
    hook::CBlockHookContainer &block_hooks()
    {
        return m_blockHooks;
    }
    hook::CInstructionHookContainer &instruction_hooks()
    {
        return m_instructionHooks;
    }
    hook::CInterruptHookContainer &interrupt_hooks()
    {
        return m_interruptHooks;
    }

  private:
    CEmulator( uc_engine *uc, uc_arch arch );

    uc_engine *m_uc{ nullptr };
    uc_arch m_arch;
    // uc_emu_start may be nested from inside callbacks
    int m_runDepth{ 0 };
    std::exception_ptr m_callbackException{};
    std::unordered_map<uc_hook, std::unique_ptr<hook::CHookBinding>> m_hooks{};
    // bindings removed from inside a callback, released once the outermost start() returns
    std::vector<std::unique_ptr<hook::CHookBinding>> m_retiredHooks{};

    hook::CMemoryHookContainer m_memoryHooks;
    hook::CCodeHookContainer m_codeHooks;
    hook::CBlockHookContainer m_blockHooks;
    hook::CInstructionHookContainer m_instructionHooks;
    hook::CInterruptHookContainer m_interruptHooks;
};
} // namespace emu
