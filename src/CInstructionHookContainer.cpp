/**
 * Author:    domin568
 * Created:   20.10.2026
 * Brief:     special instruction hooks of an emulator
 **/

#include "../include/CInstructionHookContainer.hpp"
#include "../include/CEmulator.hpp"
#include <exception>

namespace hook
{

namespace
{
struct InstructionHookBinding : CHookBinding
{
    InstructionHookBinding( emu::CEmulator &emulator, InstructionHookCallback &&callback, void *userData )
        : CHookBinding{ emulator, userData }, m_callback{ std::move( callback ) }
    {
    }
    InstructionHookCallback m_callback;
};

// uc_cb_insn_syscall_t
void hook_insn( uc_engine *uc, void *user_data )
{
    const auto *binding{ static_cast<InstructionHookBinding *>( user_data ) };
    if (!binding->owned_by( uc ))
        return;
    try
    {
        binding->m_callback( binding->m_emulator, binding->m_userData );
    }
    catch (...)
    {
        binding->m_emulator.capture_exception( std::current_exception() );
    }
}

// these x86 instructions expect callbacks with other signatures
bool has_other_callback_shape( uc_arch arch, int instruction )
{
    return arch == UC_ARCH_X86 &&
           ( instruction == UC_X86_INS_IN || instruction == UC_X86_INS_OUT || instruction == UC_X86_INS_CPUID );
}
} // namespace

CInstructionHookContainer::CInstructionHookContainer( emu::CEmulator &emulator ) : CHookContainer{ emulator }
{
}

std::expected<CHookHandle, common::Error> CInstructionHookContainer::add( int instruction,
                                                                          InstructionHookCallback callback,
                                                                          void *userData )
{
    return add( instruction, std::move( callback ), common::Unbounded_Range_Begin, common::Unbounded_Range_End,
                userData );
}

std::expected<CHookHandle, common::Error> CInstructionHookContainer::add( int instruction,
                                                                          InstructionHookCallback callback,
                                                                          uint64_t begin, uint64_t end,
                                                                          void *userData )
{
    if (auto alive{ m_emulator.check_disposed() }; !alive)
        return std::unexpected{ std::move( alive ).error() };

    if (!callback)
        return std::unexpected{
            common::Error{ common::Error::Type::Invalid_Argument, "Instruction hook callback is empty." } };

    if (has_other_callback_shape( m_emulator.arch(), instruction ))
        return std::unexpected{ common::Error{ common::Error::Type::Invalid_Argument,
                                               "Instruction needs a callback with a different signature." } };

    auto binding{ std::make_unique<InstructionHookBinding>( m_emulator, std::move( callback ), userData ) };
    return CHookContainer::add( UC_HOOK_INSN, reinterpret_cast<void *>( hook_insn ), std::move( binding ), begin, end,
                                instruction );
}
} // namespace hook
