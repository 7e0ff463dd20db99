/**
 * Author:    domin568
 * Created:   19.10.2026
 * Brief:     memory access tracer for raw code blobs
 **/
#pragma once
#include "CEmulator.hpp"
#include "Common.hpp"
#include <expected>
#include <memory>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <unicorn/unicorn.h>
#include <vector>

namespace trace
{

struct Error
{
    enum Type
    {
        Bad_Arguments,
        FileNotFound,
        Unsupported_Arch,
        EmulatorError,
    };
    Type type;
    std::string message{};
};

struct Arch
{
    std::string_view name;
    uc_arch arch;
    uc_mode mode;
    int stackRegister;
    size_t pointerSize;
};

struct Config
{
    const Arch *arch{ nullptr };
    std::string codePath{};
    uint64_t base{ 0x1000'0000 };
    uint64_t rangeBegin{ common::Unbounded_Range_Begin };
    uint64_t rangeEnd{ common::Unbounded_Range_End };
    size_t count{ 0 };

    static std::expected<Config, Error> parse( std::span<const std::string> args );
};

std::optional<uint64_t> parse_number( std::string_view s );
const Arch *find_arch( std::string_view name );

class CTracer
{
  public:
    static std::expected<CTracer, Error> init( const Config &config );
    // hooks live only for the duration of one run
    bool run( std::ostream &os );
    const emu::CEmulator &emulator() const
    {
        return *m_emulator;
    }

  private:
    CTracer( std::unique_ptr<emu::CEmulator> emulator, const Config &config, uint64_t codeSize );

    static constexpr uint64_t Stack_Address{ 0x7F00'0000 };
    static constexpr size_t Stack_Size{ 0x10'0000 };
    static constexpr uint64_t Stack_Red_Zone{ 0x100 };

    std::unique_ptr<emu::CEmulator> m_emulator;
    Config m_config;
    uint64_t m_codeSize{};

    static std::optional<std::vector<uint8_t>> read_code( const std::string &path );
};
} // namespace trace
