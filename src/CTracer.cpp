/**
 * Author:    domin568
 * Created:   19.10.2026
 * Brief:     memory access tracer for raw code blobs
 **/

#include "../include/CTracer.hpp"
#include <algorithm>
#include <array>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>

namespace trace
{

static constexpr std::array<Arch, 5> Known_Archs{ {
    { "x86", UC_ARCH_X86, UC_MODE_32, UC_X86_REG_ESP, 4 },
    { "x86_64", UC_ARCH_X86, UC_MODE_64, UC_X86_REG_RSP, 8 },
    { "arm", UC_ARCH_ARM, UC_MODE_ARM, UC_ARM_REG_SP, 4 },
    { "arm64", UC_ARCH_ARM64, UC_MODE_ARM, UC_ARM64_REG_SP, 8 },
    { "ppc32", UC_ARCH_PPC, static_cast<uc_mode>( UC_MODE_PPC32 | UC_MODE_BIG_ENDIAN ), UC_PPC_REG_1, 4 },
} };

const Arch *find_arch( std::string_view name )
{
    const auto it{ std::ranges::find( Known_Archs, name, &Arch::name ) };
    return it == Known_Archs.end() ? nullptr : &*it;
}

std::optional<uint64_t> parse_number( std::string_view s )
{
    int base{ 10 };
    if (s.starts_with( "0x" ) || s.starts_with( "0X" ))
    {
        s.remove_prefix( 2 );
        base = 16;
    }
    if (s.empty())
        return std::nullopt;
    uint64_t value{};
    const auto [ptr, ec]{ std::from_chars( s.data(), s.data() + s.size(), value, base ) };
    if (ec != std::errc{} || ptr != s.data() + s.size())
        return std::nullopt;
    return value;
}

// uctrace <arch> <code.bin> [--base <addr>] [--range <begin> <end>] [--count <n>]
std::expected<Config, Error> Config::parse( std::span<const std::string> args )
{
    if (args.size() < 3)
        return std::unexpected{ Error{ Error::Type::Bad_Arguments,
                                       "Usage: uctrace <x86|x86_64|arm|arm64|ppc32> <code.bin> [--base <addr>] "
                                       "[--range <begin> <end>] [--count <n>]" } };

    Config config{};
    config.arch = find_arch( args[1] );
    if (!config.arch)
        return std::unexpected{ Error{ Error::Type::Unsupported_Arch, "Unsupported architecture: " + args[1] } };
    config.codePath = args[2];

    for (size_t i{ 3 }; i < args.size(); i++)
    {
        const std::string &opt{ args[i] };
        const size_t operands{ opt == "--range" ? 2u : 1u };
        if (i + operands >= args.size())
            return std::unexpected{ Error{ Error::Type::Bad_Arguments, "Missing value for " + opt } };

        std::array<uint64_t, 2> values{};
        for (size_t j{ 0 }; j < operands; j++)
        {
            const std::optional<uint64_t> value{ parse_number( args[i + 1 + j] ) };
            if (!value)
                return std::unexpected{
                    Error{ Error::Type::Bad_Arguments, "Bad number for " + opt + ": " + args[i + 1 + j] } };
            values[j] = *value;
        }

        if (opt == "--base")
            config.base = values[0];
        else if (opt == "--range")
        {
            config.rangeBegin = values[0];
            config.rangeEnd = values[1];
        }
        else if (opt == "--count")
            config.count = static_cast<size_t>( values[0] );
        else
            return std::unexpected{ Error{ Error::Type::Bad_Arguments, "Unknown option: " + opt } };
        i += operands;
    }

    if (common::page_align_down( config.base ) != config.base)
        return std::unexpected{ Error{ Error::Type::Bad_Arguments, "Base address has to be page aligned." } };
    return config;
}

CTracer::CTracer( std::unique_ptr<emu::CEmulator> emulator, const Config &config, uint64_t codeSize )
    : m_emulator{ std::move( emulator ) }, m_config{ config }, m_codeSize{ codeSize }
{
}

std::optional<std::vector<uint8_t>> CTracer::read_code( const std::string &path )
{
    std::ifstream file{ path, std::ios::binary };
    if (!file)
        return std::nullopt;
    return std::vector<uint8_t>( std::istreambuf_iterator<char>( file ), std::istreambuf_iterator<char>() );
}

std::expected<CTracer, Error> CTracer::init( const Config &config )
{
    if (!config.arch)
        return std::unexpected{ Error{ Error::Type::Unsupported_Arch, "No architecture selected." } };
    if (!std::filesystem::exists( config.codePath ))
        return std::unexpected{ Error{ Error::Type::FileNotFound, "File not found." } };

    const std::optional<std::vector<uint8_t>> code{ read_code( config.codePath ) };
    if (!code || code->empty())
        return std::unexpected{ Error{ Error::Type::FileNotFound, "Could not read code from " + config.codePath } };

    std::expected<std::unique_ptr<emu::CEmulator>, common::Error> emulator{
        emu::CEmulator::init( config.arch->arch, config.arch->mode ) };
    if (!emulator)
        return std::unexpected{ Error{ Error::Type::EmulatorError, emulator.error().message } };

    emu::CEmulator &e{ **emulator };
    if (auto mapped{ e.mem_map( config.base, common::page_align_up( code->size() ), UC_PROT_ALL ) }; !mapped)
        return std::unexpected{ Error{ Error::Type::EmulatorError, mapped.error().message } };
    if (auto written{ e.mem_write( config.base, *code ) }; !written)
        return std::unexpected{ Error{ Error::Type::EmulatorError, written.error().message } };
    if (auto stack{ e.mem_map( Stack_Address, Stack_Size, UC_PROT_READ | UC_PROT_WRITE ) }; !stack)
        return std::unexpected{ Error{ Error::Type::EmulatorError, stack.error().message } };
    const uint64_t sp{ Stack_Address + Stack_Size - Stack_Red_Zone };
    const std::expected<void, common::Error> spWritten{
        config.arch->pointerSize == sizeof( uint32_t )
            ? e.reg_write( config.arch->stackRegister, static_cast<uint32_t>( sp ) )
            : e.reg_write( config.arch->stackRegister, sp ) };
    if (!spWritten)
        return std::unexpected{ Error{ Error::Type::EmulatorError, spWritten.error().message } };

    return CTracer{ std::move( *emulator ), config, code->size() };
}

bool CTracer::run( std::ostream &os )
{
    auto printAccess{ [&os]( emu::CEmulator &, hook::MemoryType type, uint64_t address, int size, uint64_t value,
                             void * ) {
        os << hook::to_string( type ) << " @ 0x" << std::hex << address << " size=" << std::dec << size
           << " value=0x" << std::hex << value << std::dec << "\n";
    } };
    // leave the fault unresolved so emulation stops at the first invalid access
    auto printInvalid{ [&os]( emu::CEmulator &, hook::MemoryType type, uint64_t address, int size, uint64_t value,
                              void * ) {
        os << "MEM_INVALID " << hook::to_string( type ) << " @ 0x" << std::hex << address << " size=" << std::dec
           << size << " value=0x" << std::hex << value << std::dec << "\n";
        return false;
    } };

    const std::expected<hook::CHookHandle, common::Error> accessHook{ m_emulator->memory_hooks().add(
        hook::MemoryHookType::Read | hook::MemoryHookType::Write, printAccess, m_config.rangeBegin, m_config.rangeEnd,
        nullptr ) };
    if (!accessHook)
    {
        std::cerr << "Could not create memory access hook: " << accessHook.error().message << std::endl;
        return false;
    }
    const hook::CScopedHook accessHookScope{ m_emulator->memory_hooks(), *accessHook };

    const std::expected<hook::CHookHandle, common::Error> invalidHook{
        m_emulator->memory_hooks().add( hook::Memory_Event_Invalid, printInvalid ) };
    if (!invalidHook)
    {
        std::cerr << "Could not create invalid memory hook: " << invalidHook.error().message << std::endl;
        return false;
    }
    const hook::CScopedHook invalidHookScope{ m_emulator->memory_hooks(), *invalidHook };

    const std::expected<void, common::Error> result{
        m_emulator->start( m_config.base, m_config.base + m_codeSize, 0, m_config.count ) };
    if (!result)
    {
        std::cerr << result.error().message << std::endl;
        return false;
    }
    return true;
}
} // namespace trace
