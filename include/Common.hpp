/**
 * Author:    domin568
 * Created:   19.10.2026
 * Brief:     Common types
 **/
#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <unicorn/unicorn.h>

namespace common
{

// begin > end means "whole address space" for uc_hook_add
inline constexpr uint64_t Unbounded_Range_Begin{ 1 };
inline constexpr uint64_t Unbounded_Range_End{ 0 };

struct Error
{
    enum Type
    {
        Invalid_Argument,
        Disposed,
        Unicorn_Open_Error,
        Unicorn_Error,
        Hook_Not_Found,
        Callback_Exception,
    };
    Type type;
    std::string message{};
    uc_err ucError{ UC_ERR_OK };
};

Error from_uc_err( uc_err err, std::string_view context );

uint64_t page_align_down( uint64_t a );
uint64_t page_align_up( uint64_t a );

} // namespace common
