/**
 * Author:    domin568
 * Created:   19.10.2026
 * Brief:     base for typed hook containers, hook handle and binding record
 **/
#pragma once
#include "Common.hpp"
#include <cstdint>
#include <expected>
#include <memory>
#include <unicorn/unicorn.h>

namespace emu
{
class CEmulator;
}

namespace hook
{

// opaque, only meaningful for the emulator which returned it
class CHookHandle
{
  public:
    explicit CHookHandle( uc_hook native ) : m_native{ native }
    {
    }

    uc_hook native() const
    {
        return m_native;
    }

    bool operator==( const CHookHandle & ) const = default;

  private:
    uc_hook m_native{};
};

// Owning record of one registration. Its address is the user_data given to unicorn, so it has to
// outlive the native hook. The emulator keeps it until remove_hook() or close().
class CHookBinding
{
  public:
    CHookBinding( emu::CEmulator &emulator, void *userData );
    virtual ~CHookBinding() = default;
    CHookBinding( const CHookBinding & ) = delete;
    CHookBinding &operator=( const CHookBinding & ) = delete;

    // uc passed to a trampoline must be the engine the hook was registered on
    bool owned_by( uc_engine *uc ) const;

    emu::CEmulator &m_emulator;
    void *m_userData{ nullptr };
};

class CHookContainer
{
  public:
    explicit CHookContainer( emu::CEmulator &emulator );
    CHookContainer( const CHookContainer & ) = delete;
    CHookContainer &operator=( const CHookContainer & ) = delete;

    std::expected<void, common::Error> remove( const CHookHandle &handle );

  protected:
    std::expected<CHookHandle, common::Error> add( int type, void *trampoline, std::unique_ptr<CHookBinding> binding,
                                                   uint64_t begin, uint64_t end, int instruction = 0 );

    emu::CEmulator &m_emulator;
};

// removes the hook when leaving the scope
class CScopedHook
{
  public:
    CScopedHook( CHookContainer &container, CHookHandle handle );
    ~CScopedHook();
    CScopedHook( const CScopedHook & ) = delete;
    CScopedHook &operator=( const CScopedHook & ) = delete;

  private:
    CHookContainer &m_container;
    CHookHandle m_handle;
};
} // namespace hook
