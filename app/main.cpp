#include <iostream>

#include <spdlog/spdlog.h>

#include "pwnreport/common/errors.h"
#include "work_functions.hpp"


int main(int argc, char* argv[]) try {
    spdlog::set_pattern("[%^%L%$] %v");

    pwn::work_report(argc, argv);
    return 0;
} catch (const pwn::InputError& e) {
    spdlog::error("{}, please try again.", e.what());
    return 1;
} catch (const pwn::ExtractionError& e) {
    spdlog::error("{}, exiting.", e.what());
    return 1;
} catch (const pwn::RateLimitError& e) {
    spdlog::error("{}", e.what());
    return 1;
} catch (const pwn::ConfigError& e) {
    spdlog::error("Configuration error: {}", e.what());
    return 1;
} catch (const pwn::ReportError& e) {
    spdlog::error("Report error: {}", e.what());
    return 1;
} catch (const std::runtime_error& e) {
    std::cout << "\nstd::runtime_error: " << e.what() << std::endl;
    return 1;
} catch (const std::exception& e) {
    std::cout << "\nstd::exception: " << e.what() << std::endl;
    return 1;
} catch (...) {
    std::cout << "\nunknown object thrown" << std::endl;
    return 1;
}
