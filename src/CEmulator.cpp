/**
 * Author:    domin568
 * Created:   19.10.2026
 * Brief:     owning wrapper of a unicorn engine with typed hook containers
 **/

#include "../include/CEmulator.hpp"
#include <iostream>
#include <utility>

namespace emu
{
CEmulator::CEmulator( uc_engine *uc, uc_arch arch )
    : m_uc{ uc }, m_arch{ arch }, m_memoryHooks{ *this }, m_codeHooks{ *this }, m_blockHooks{ *this },
      m_instructionHooks{ *this }, m_interruptHooks{ *this }
{
}

std::expected<std::unique_ptr<CEmulator>, common::Error> CEmulator::init( uc_arch arch, uc_mode mode )
{
    uc_engine *uc{ nullptr };
    const uc_err err{ uc_open( arch, mode, &uc ) };
    if (err != UC_ERR_OK)
    {
        common::Error error{ common::from_uc_err( err, "Could not create unicorn emulator" ) };
        error.type = common::Error::Type::Unicorn_Open_Error;
        return std::unexpected{ std::move( error ) };
    }
    return std::unique_ptr<CEmulator>{ new CEmulator{ uc, arch } };
}

CEmulator::~CEmulator()
{
    close();
}

std::expected<void, common::Error> CEmulator::check_disposed() const
{
    if (is_disposed())
        return std::unexpected{ common::Error{ common::Error::Type::Disposed, "Emulator is already closed." } };
    return {};
}

bool CEmulator::is_disposed() const
{
    return m_uc == nullptr;
}

void CEmulator::close()
{
    if (!m_uc)
        return;
    if (m_runDepth > 0)
    {
        std::cerr << "Could not close unicorn engine while emulation is running." << std::endl;
        return;
    }
    const uc_err err{ uc_close( m_uc ) };
    if (err != UC_ERR_OK)
        std::cerr << "Could not close unicorn engine: " << uc_strerror( err ) << std::endl;
    m_uc = nullptr;
    // engine is gone, no trampoline can run anymore
    m_hooks.clear();
    m_retiredHooks.clear();
}

uc_engine *CEmulator::handle() const
{
    return m_uc;
}

uc_arch CEmulator::arch() const
{
    return m_arch;
}

std::expected<hook::CHookHandle, common::Error> CEmulator::add_hook( int type, void *trampoline,
                                                                     std::unique_ptr<hook::CHookBinding> binding,
                                                                     uint64_t begin, uint64_t end, int instruction )
{
    if (auto alive{ check_disposed() }; !alive)
        return std::unexpected{ std::move( alive ).error() };

    // only the node allocation can still fail after uc_hook_add
    m_hooks.reserve( m_hooks.size() + 1 );

    uc_hook native{};
    const uc_err err{ uc_hook_add( m_uc, &native, type, trampoline, binding.get(), begin, end, instruction ) };
    if (err != UC_ERR_OK)
        return std::unexpected{ common::from_uc_err( err, "Could not add hook" ) };

    try
    {
        m_hooks.emplace( native, std::move( binding ) );
    }
    catch (...)
    {
        // binding is about to be freed, unicorn must not call into it anymore
        if (const uc_err delErr{ uc_hook_del( m_uc, native ) }; delErr != UC_ERR_OK)
            std::cerr << "Could not roll back hook: " << uc_strerror( delErr ) << std::endl;
        throw;
    }
    return hook::CHookHandle{ native };
}

std::expected<void, common::Error> CEmulator::remove_hook( const hook::CHookHandle &handle )
{
    if (auto alive{ check_disposed() }; !alive)
        return std::unexpected{ std::move( alive ).error() };

    const auto it{ m_hooks.find( handle.native() ) };
    if (it == m_hooks.end())
        return std::unexpected{ common::Error{ common::Error::Type::Hook_Not_Found, "Hook is not registered." } };

    if (m_runDepth > 0)
        m_retiredHooks.reserve( m_retiredHooks.size() + 1 );

    const uc_err err{ uc_hook_del( m_uc, handle.native() ) };
    if (err != UC_ERR_OK)
        return std::unexpected{ common::from_uc_err( err, "Could not delete hook" ) };

    if (m_runDepth > 0)
        m_retiredHooks.push_back( std::move( it->second ) );
    m_hooks.erase( it );
    return {};
}

std::size_t CEmulator::hook_count() const
{
    return m_hooks.size();
}

std::expected<void, common::Error> CEmulator::mem_map( uint64_t address, size_t size, uint32_t perms )
{
    if (auto alive{ check_disposed() }; !alive)
        return std::unexpected{ std::move( alive ).error() };
    const uc_err err{ uc_mem_map( m_uc, address, size, perms ) };
    if (err != UC_ERR_OK)
        return std::unexpected{ common::from_uc_err( err, "Could not map memory" ) };
    return {};
}

std::expected<void, common::Error> CEmulator::mem_unmap( uint64_t address, size_t size )
{
    if (auto alive{ check_disposed() }; !alive)
        return std::unexpected{ std::move( alive ).error() };
    const uc_err err{ uc_mem_unmap( m_uc, address, size ) };
    if (err != UC_ERR_OK)
        return std::unexpected{ common::from_uc_err( err, "Could not unmap memory" ) };
    return {};
}

std::expected<void, common::Error> CEmulator::mem_protect( uint64_t address, size_t size, uint32_t perms )
{
    if (auto alive{ check_disposed() }; !alive)
        return std::unexpected{ std::move( alive ).error() };
    const uc_err err{ uc_mem_protect( m_uc, address, size, perms ) };
    if (err != UC_ERR_OK)
        return std::unexpected{ common::from_uc_err( err, "Could not change memory protection" ) };
    return {};
}

std::expected<void, common::Error> CEmulator::mem_write( uint64_t address, std::span<const uint8_t> data )
{
    if (auto alive{ check_disposed() }; !alive)
        return std::unexpected{ std::move( alive ).error() };
    const uc_err err{ uc_mem_write( m_uc, address, data.data(), data.size() ) };
    if (err != UC_ERR_OK)
        return std::unexpected{ common::from_uc_err( err, "Could not write memory" ) };
    return {};
}

std::expected<std::vector<uint8_t>, common::Error> CEmulator::mem_read( uint64_t address, size_t size )
{
    if (auto alive{ check_disposed() }; !alive)
        return std::unexpected{ std::move( alive ).error() };
    std::vector<uint8_t> buf( size );
    const uc_err err{ uc_mem_read( m_uc, address, buf.data(), buf.size() ) };
    if (err != UC_ERR_OK)
        return std::unexpected{ common::from_uc_err( err, "Could not read memory" ) };
    return buf;
}

std::expected<void, common::Error> CEmulator::reg_write( int regId, std::span<const uint8_t> value )
{
    if (auto alive{ check_disposed() }; !alive)
        return std::unexpected{ std::move( alive ).error() };
    if (value.empty())
        return std::unexpected{ common::Error{ common::Error::Type::Invalid_Argument, "Register value is empty." } };
    const uc_err err{ uc_reg_write( m_uc, regId, value.data() ) };
    if (err != UC_ERR_OK)
        return std::unexpected{ common::from_uc_err( err, "Could not write register" ) };
    return {};
}

std::expected<void, common::Error> CEmulator::reg_read( int regId, std::span<uint8_t> value )
{
    if (auto alive{ check_disposed() }; !alive)
        return std::unexpected{ std::move( alive ).error() };
    if (value.empty())
        return std::unexpected{ common::Error{ common::Error::Type::Invalid_Argument, "Register buffer is empty." } };
    const uc_err err{ uc_reg_read( m_uc, regId, value.data() ) };
    if (err != UC_ERR_OK)
        return std::unexpected{ common::from_uc_err( err, "Could not read register" ) };
    return {};
}

std::expected<void, common::Error> CEmulator::start( uint64_t begin, uint64_t until, uint64_t timeout, size_t count )
{
    if (auto alive{ check_disposed() }; !alive)
        return std::unexpected{ std::move( alive ).error() };

    m_runDepth++;
    const uc_err err{ uc_emu_start( m_uc, begin, until, timeout, count ) };
    m_runDepth--;
    // outer frames may still be executing a retired binding
    if (m_runDepth == 0)
        m_retiredHooks.clear();

    if (m_callbackException)
    {
        std::exception_ptr exception{ std::exchange( m_callbackException, nullptr ) };
        common::Error error{ common::Error::Type::Callback_Exception, "Hook callback threw an exception", err };
        try
        {
            std::rethrow_exception( exception );
        }
        catch (const std::exception &e)
        {
            error.message += ": ";
            error.message += e.what();
        }
        catch (...)
        {
            error.message += ": unknown exception";
        }
        return std::unexpected{ std::move( error ) };
    }

    if (err != UC_ERR_OK)
        return std::unexpected{ common::from_uc_err( err, "Emulation stopped" ) };
    return {};
}

std::expected<void, common::Error> CEmulator::stop()
{
    if (auto alive{ check_disposed() }; !alive)
        return std::unexpected{ std::move( alive ).error() };
    const uc_err err{ uc_emu_stop( m_uc ) };
    if (err != UC_ERR_OK)
        return std::unexpected{ common::from_uc_err( err, "Could not stop emulation" ) };
    return {};
}

void CEmulator::capture_exception( std::exception_ptr exception )
{
    if (!m_callbackException)
        m_callbackException = std::move( exception );
    if (!m_uc)
        return;
    const uc_err err{ uc_emu_stop( m_uc ) };
    if (err != UC_ERR_OK)
        std::cerr << "Could not stop emulation after callback exception: " << uc_strerror( err ) << std::endl;
}
} // namespace emu
