#include "../../include/CEmulator.hpp"
#include "gtest/gtest.h"
#include <algorithm>
#include <array>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{
constexpr uint64_t Code_Address{ 0x1000 };

// inc ecx; inc edx; inc ecx
constexpr std::array<uint8_t, 3> Increment_Code{ 0x41, 0x42, 0x41 };
// int 0x80
constexpr std::array<uint8_t, 2> Syscall_Code{ 0xCD, 0x80 };

std::unique_ptr<emu::CEmulator> make_emulator()
{
    auto emulator{ emu::CEmulator::init( UC_ARCH_X86, UC_MODE_32 ) };
    if (!emulator)
        return nullptr;
    if (!( *emulator )->mem_map( Code_Address, 0x1000, UC_PROT_ALL ))
        return nullptr;
    return std::move( *emulator );
}

template <size_t N> std::expected<void, common::Error> run( emu::CEmulator &e, const std::array<uint8_t, N> &code )
{
    if (auto written{ e.mem_write( Code_Address, code ) }; !written)
        return std::unexpected{ written.error() };
    return e.start( Code_Address, Code_Address + code.size() );
}
} // namespace

TEST( Emulator, InitBadArchitecture )
{
    const auto emulator{ emu::CEmulator::init( static_cast<uc_arch>( 0x7f ), UC_MODE_32 ) };
    ASSERT_FALSE( emulator.has_value() );
    EXPECT_EQ( emulator.error().type, common::Error::Type::Unicorn_Open_Error );
    EXPECT_EQ( emulator.error().ucError, UC_ERR_ARCH );
}

TEST( Emulator, OperationsAfterCloseFail )
{
    auto e{ make_emulator() };
    ASSERT_NE( e, nullptr );
    e->close();
    EXPECT_EQ( e->handle(), nullptr );
    EXPECT_EQ( e->mem_read( Code_Address, 4 ).error().type, common::Error::Type::Disposed );
    EXPECT_EQ( e->reg_read<uint32_t>( UC_X86_REG_EAX ).error().type, common::Error::Type::Disposed );
    EXPECT_EQ( e->start( Code_Address, Code_Address + 1 ).error().type, common::Error::Type::Disposed );
    EXPECT_EQ( e->remove_hook( hook::CHookHandle{ 1 } ).error().type, common::Error::Type::Disposed );
}

TEST( Emulator, MemoryRoundTrip )
{
    auto e{ make_emulator() };
    ASSERT_NE( e, nullptr );
    const std::array<uint8_t, 4> data{ 0xDE, 0xAD, 0xBE, 0xEF };
    ASSERT_TRUE( e->mem_write( Code_Address + 0x10, data ).has_value() );
    const auto read{ e->mem_read( Code_Address + 0x10, data.size() ) };
    ASSERT_TRUE( read.has_value() );
    EXPECT_TRUE( std::ranges::equal( *read, data ) );
}

TEST( Emulator, UnmappedReadPropagatesNativeError )
{
    auto e{ make_emulator() };
    ASSERT_NE( e, nullptr );
    const auto read{ e->mem_read( 0x8000'0000, 4 ) };
    ASSERT_FALSE( read.has_value() );
    EXPECT_EQ( read.error().ucError, UC_ERR_READ_UNMAPPED );
}

TEST( CodeHooks, EveryInstructionReported )
{
    auto e{ make_emulator() };
    ASSERT_NE( e, nullptr );
    std::vector<uint64_t> addresses{};
    ASSERT_TRUE( e->code_hooks()
                     .add( [&addresses]( emu::CEmulator &, uint64_t address, int size, void * ) {
                         EXPECT_EQ( size, 1 );
                         addresses.push_back( address );
                     } )
                     .has_value() );
    ASSERT_TRUE( run( *e, Increment_Code ).has_value() );

    EXPECT_EQ( addresses, ( std::vector<uint64_t>{ Code_Address, Code_Address + 1, Code_Address + 2 } ) );
    const auto ecx{ e->reg_read<uint32_t>( UC_X86_REG_ECX ) };
    ASSERT_TRUE( ecx.has_value() );
    EXPECT_EQ( *ecx, 2u );
}

TEST( CodeHooks, RangeLimitsInstructions )
{
    auto e{ make_emulator() };
    ASSERT_NE( e, nullptr );
    std::vector<uint64_t> addresses{};
    ASSERT_TRUE( e->code_hooks()
                     .add( [&addresses]( emu::CEmulator &, uint64_t address, int, void * ) {
                         addresses.push_back( address );
                     },
                           Code_Address + 1, Code_Address + 1, nullptr )
                     .has_value() );
    ASSERT_TRUE( run( *e, Increment_Code ).has_value() );

    EXPECT_EQ( addresses, std::vector<uint64_t>{ Code_Address + 1 } );
}

TEST( CodeHooks, EmptyCallbackRejected )
{
    auto e{ make_emulator() };
    ASSERT_NE( e, nullptr );
    const auto result{ e->code_hooks().add( hook::CodeHookCallback{} ) };
    ASSERT_FALSE( result.has_value() );
    EXPECT_EQ( result.error().type, common::Error::Type::Invalid_Argument );
    EXPECT_EQ( e->hook_count(), 0u );
}

TEST( CodeHooks, RemoveFromInsideCallback )
{
    auto e{ make_emulator() };
    ASSERT_NE( e, nullptr );
    int calls{};
    std::optional<hook::CHookHandle> self{};
    const auto handle{ e->code_hooks().add( [&]( emu::CEmulator &emulator, uint64_t, int, void * ) {
        calls++;
        if (self)
            EXPECT_TRUE( emulator.code_hooks().remove( *self ).has_value() );
    } ) };
    ASSERT_TRUE( handle.has_value() );
    self = *handle;

    ASSERT_TRUE( run( *e, Increment_Code ).has_value() );
    EXPECT_EQ( calls, 1 );
    EXPECT_EQ( e->hook_count(), 0u );
}

TEST( BlockHooks, SingleBlockReported )
{
    auto e{ make_emulator() };
    ASSERT_NE( e, nullptr );
    std::vector<std::pair<uint64_t, int>> blocks{};
    ASSERT_TRUE( e->block_hooks()
                     .add( [&blocks]( emu::CEmulator &, uint64_t address, int size, void * ) {
                         blocks.emplace_back( address, size );
                     } )
                     .has_value() );
    ASSERT_TRUE( run( *e, Increment_Code ).has_value() );

    ASSERT_EQ( blocks.size(), 1u );
    EXPECT_EQ( blocks[0].first, Code_Address );
    EXPECT_GT( blocks[0].second, 0 );
}

TEST( BlockHooks, ClosedEmulatorRejected )
{
    auto e{ make_emulator() };
    ASSERT_NE( e, nullptr );
    e->close();
    const auto result{ e->block_hooks().add( []( emu::CEmulator &, uint64_t, int, void * ) {} ) };
    ASSERT_FALSE( result.has_value() );
    EXPECT_EQ( result.error().type, common::Error::Type::Disposed );
}

TEST( InterruptHooks, InterruptNumberReported )
{
    auto e{ make_emulator() };
    ASSERT_NE( e, nullptr );
    int marker{};
    std::vector<int> interrupts{};
    ASSERT_TRUE( e->interrupt_hooks()
                     .add(
                         [&]( emu::CEmulator &, int interruptNumber, void *userData ) {
                             EXPECT_EQ( userData, &marker );
                             interrupts.push_back( interruptNumber );
                         },
                         &marker )
                     .has_value() );
    ASSERT_TRUE( run( *e, Syscall_Code ).has_value() );

    EXPECT_EQ( interrupts, std::vector<int>{ 0x80 } );
}

TEST( InterruptHooks, EmptyCallbackRejected )
{
    auto e{ make_emulator() };
    ASSERT_NE( e, nullptr );
    const auto result{ e->interrupt_hooks().add( nullptr ) };
    ASSERT_FALSE( result.has_value() );
    EXPECT_EQ( result.error().type, common::Error::Type::Invalid_Argument );
}

TEST( Emulator, WideRegisterUsesCallerBuffer )
{
    auto e{ make_emulator() };
    ASSERT_NE( e, nullptr );
    std::array<uint8_t, 16> pattern{};
    for (size_t i{ 0 }; i < pattern.size(); i++)
        pattern[i] = static_cast<uint8_t>( i + 1 );
    ASSERT_TRUE( e->reg_write( UC_X86_REG_XMM0, pattern ).has_value() );

    std::array<uint8_t, 16> xmm0{};
    ASSERT_TRUE( e->reg_read( UC_X86_REG_XMM0, xmm0 ).has_value() );
    EXPECT_EQ( xmm0, pattern );
}

TEST( Emulator, RegisterBufferMustNotBeEmpty )
{
    auto e{ make_emulator() };
    ASSERT_NE( e, nullptr );
    const auto read{ e->reg_read( UC_X86_REG_EAX, std::span<uint8_t>{} ) };
    ASSERT_FALSE( read.has_value() );
    EXPECT_EQ( read.error().type, common::Error::Type::Invalid_Argument );
}

TEST( Emulator, IntegralRegisterRoundTrip )
{
    auto e{ make_emulator() };
    ASSERT_NE( e, nullptr );
    ASSERT_TRUE( e->reg_write( UC_X86_REG_EBX, uint32_t{ 0xCAFEBABE } ).has_value() );
    const auto ebx{ e->reg_read<uint32_t>( UC_X86_REG_EBX ) };
    ASSERT_TRUE( ebx.has_value() );
    EXPECT_EQ( *ebx, 0xCAFEBABEu );
}

TEST( Emulator, CloseRefusedWhileRunning )
{
    auto e{ make_emulator() };
    ASSERT_NE( e, nullptr );
    ASSERT_TRUE( e->code_hooks()
                     .add( []( emu::CEmulator &emulator, uint64_t, int, void * ) { emulator.close(); } )
                     .has_value() );
    ASSERT_TRUE( run( *e, Increment_Code ).has_value() );

    EXPECT_FALSE( e->is_disposed() );
    EXPECT_EQ( e->hook_count(), 1u );
    e->close();
    EXPECT_TRUE( e->is_disposed() );
    EXPECT_EQ( e->hook_count(), 0u );
}

TEST( Emulator, HookTableFollowsRegistrations )
{
    auto e{ make_emulator() };
    ASSERT_NE( e, nullptr );
    std::vector<hook::CHookHandle> handles{};
    for (int i{ 0 }; i < 32; i++)
    {
        const auto handle{ e->code_hooks().add( []( emu::CEmulator &, uint64_t, int, void * ) {} ) };
        ASSERT_TRUE( handle.has_value() );
        handles.push_back( *handle );
    }
    EXPECT_EQ( e->hook_count(), handles.size() );
    for (const hook::CHookHandle &handle : handles)
        ASSERT_TRUE( e->remove_hook( handle ).has_value() );
    EXPECT_EQ( e->hook_count(), 0u );
    ASSERT_TRUE( run( *e, Increment_Code ).has_value() );
}

TEST( CodeHooks, NestedStartAfterSelfRemoval )
{
    auto e{ make_emulator() };
    ASSERT_NE( e, nullptr );
    // inc ecx; inc edx
    const std::array<uint8_t, 2> code{ 0x41, 0x42 };
    ASSERT_TRUE( e->mem_write( Code_Address, code ).has_value() );

    int calls{};
    std::optional<hook::CHookHandle> self{};
    std::optional<std::expected<void, common::Error>> nested{};
    const auto handle{ e->code_hooks().add(
        [&]( emu::CEmulator &emulator, uint64_t, int, void * ) {
            EXPECT_TRUE( emulator.code_hooks().remove( *self ).has_value() );
            // runs inc edx while the outer run is paused on inc ecx
            nested = emulator.start( Code_Address + 1, Code_Address + 2 );
            calls++;
        },
        Code_Address, Code_Address, nullptr ) };
    ASSERT_TRUE( handle.has_value() );
    self = *handle;

    ASSERT_TRUE( e->start( Code_Address, Code_Address + 1 ).has_value() );
    EXPECT_EQ( calls, 1 );
    ASSERT_TRUE( nested.has_value() );
    EXPECT_TRUE( nested->has_value() );
    EXPECT_EQ( e->hook_count(), 0u );
    EXPECT_EQ( *e->reg_read<uint32_t>( UC_X86_REG_ECX ), 1u );
    EXPECT_EQ( *e->reg_read<uint32_t>( UC_X86_REG_EDX ), 1u );
}

TEST( CodeHooks, ThrowingCallbackReportedByStart )
{
    auto e{ make_emulator() };
    ASSERT_NE( e, nullptr );
    ASSERT_TRUE( e->code_hooks()
                     .add( []( emu::CEmulator &, uint64_t, int, void * ) {
                         throw std::runtime_error( "bad instruction" );
                     } )
                     .has_value() );
    const auto result{ run( *e, Increment_Code ) };

    ASSERT_FALSE( result.has_value() );
    EXPECT_EQ( result.error().type, common::Error::Type::Callback_Exception );
    EXPECT_NE( result.error().message.find( "bad instruction" ), std::string::npos );
    EXPECT_FALSE( e->is_disposed() );
}

TEST( InterruptHooks, ThrowingNonStandardException )
{
    auto e{ make_emulator() };
    ASSERT_NE( e, nullptr );
    const auto handle{ e->interrupt_hooks().add( []( emu::CEmulator &, int, void * ) { throw 42; } ) };
    ASSERT_TRUE( handle.has_value() );
    const auto result{ run( *e, Syscall_Code ) };

    ASSERT_FALSE( result.has_value() );
    EXPECT_EQ( result.error().type, common::Error::Type::Callback_Exception );
    EXPECT_NE( result.error().message.find( "unknown exception" ), std::string::npos );

    // reported once, the next run starts clean
    ASSERT_TRUE( e->remove_hook( *handle ).has_value() );
    EXPECT_TRUE( run( *e, Increment_Code ).has_value() );
}

TEST( InstructionHooks, SyscallReported )
{
    auto emulator{ emu::CEmulator::init( UC_ARCH_X86, UC_MODE_64 ) };
    ASSERT_TRUE( emulator.has_value() );
    emu::CEmulator &e{ **emulator };
    ASSERT_TRUE( e.mem_map( Code_Address, 0x1000, UC_PROT_ALL ).has_value() );

    int marker{};
    int calls{};
    ASSERT_TRUE( e.instruction_hooks()
                     .add(
                         UC_X86_INS_SYSCALL,
                         [&]( emu::CEmulator &, void *userData ) {
                             EXPECT_EQ( userData, &marker );
                             calls++;
                         },
                         &marker )
                     .has_value() );
    // syscall
    const std::array<uint8_t, 2> code{ 0x0F, 0x05 };
    ASSERT_TRUE( run( e, code ).has_value() );
    EXPECT_EQ( calls, 1 );
}

TEST( InstructionHooks, UnicornRefusalPropagated )
{
    auto e{ make_emulator() };
    ASSERT_NE( e, nullptr );
    const auto result{ e->instruction_hooks().add( UC_X86_INS_RET, []( emu::CEmulator &, void * ) {} ) };

    ASSERT_FALSE( result.has_value() );
    EXPECT_EQ( result.error().type, common::Error::Type::Unicorn_Error );
    EXPECT_EQ( result.error().ucError, UC_ERR_HOOK );
    EXPECT_EQ( e->hook_count(), 0u );
}

TEST( InstructionHooks, OtherCallbackShapeRejected )
{
    auto e{ make_emulator() };
    ASSERT_NE( e, nullptr );
    const auto result{ e->instruction_hooks().add( UC_X86_INS_IN, []( emu::CEmulator &, void * ) {} ) };

    ASSERT_FALSE( result.has_value() );
    EXPECT_EQ( result.error().type, common::Error::Type::Invalid_Argument );
    EXPECT_EQ( e->hook_count(), 0u );
}

TEST( InstructionHooks, EmptyCallbackRejected )
{
    auto e{ make_emulator() };
    ASSERT_NE( e, nullptr );
    const auto result{ e->instruction_hooks().add( UC_X86_INS_SYSCALL, nullptr ) };
    ASSERT_FALSE( result.has_value() );
    EXPECT_EQ( result.error().type, common::Error::Type::Invalid_Argument );
}
