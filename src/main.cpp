/**
 * Author:    domin568
 * Created:   19.10.2026
 * Brief:     main source file
 **/

#include "../include/CTracer.hpp"
#include <iostream>
#include <string>
#include <vector>

int main( int argc, const char *argv[] )
{
    const std::vector<std::string> args( argv, argv + argc );
    const std::expected<trace::Config, trace::Error> config{ trace::Config::parse( args ) };
    if (!config)
    {
        std::cerr << config.error().message << std::endl;
        return -1;
    }

    std::expected<trace::CTracer, trace::Error> tracer{ trace::CTracer::init( *config ) };
    if (!tracer)
    {
        std::cerr << tracer.error().message << std::endl;
        return tracer.error().type + 1;
    }

    return tracer->run( std::cout ) ? 0 : 1;
}
