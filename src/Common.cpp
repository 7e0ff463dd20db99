/**
 * Author:    domin568
 * Created:   19.10.2026
 * Brief:     Common types
 **/

#include "../include/Common.hpp"

namespace common
{
uint64_t page_align_down( uint64_t a )
{
    uint64_t ps = 0x1000;
    return a & ~( ps - 1 );
}

uint64_t page_align_up( uint64_t a )
{
    uint64_t ps = 0x1000;
    return ( a + ps - 1 ) & ~( ps - 1 );
}

Error from_uc_err( uc_err err, std::string_view context )
{
    std::string message{ context };
    message += ": ";
    message += uc_strerror( err );
    return Error{ Error::Type::Unicorn_Error, std::move( message ), err };
}

} // namespace common
