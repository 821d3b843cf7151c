// Copyright 2018, University of Freiburg,
// Chair of Algorithms and Data Structures.
// Authors: Patrick Brosi <brosi@informatik.uni-freiburg.de>

#include "app.h"

#include <gtfsnav/config/config_reader.h>

#include <exceptions/exception_handler_if.h>
#include <exceptions/exceptions.h>
#include <exceptions/factory.h>

#include <iostream>

int main(int argc, char* argv[])
{
    auto handler = exceptions::factory::create_exceptions_handler();

    try
    {
        app app(argc, argv);
        return static_cast<int>(app.run());
    }
    catch (const invalid_parameter_exception& ex)
    {
        std::cerr << strip_location(ex.what()) << "\n\n";
        gtfsnav::config::config_reader::help(argv[0], std::cerr);
        return static_cast<int>(ret_code::INVALID_OPTION);
    }
}
