/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <celltrack.hpp>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>

/** Replace ~ with HOME directory */
std::string expandTilde(const std::string &path) {
    if (!path.empty() && path[0] == '~') {
        const char *home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

/** Program entry point */
int main(int argc, char* argv[]) {

    celltrack::Config config;

    auto configFile = expandTilde("~/.celltrack.toml");

    CLI::App app{"CellTrack - cellular tracker client"};
    argv = app.ensure_utf8(argv);

    app.set_config("--config", configFile, "Read configuration from this file (default: " + configFile + ").");

    app.add_option_function<std::string>("-p,--port",
        [&config](const std::string &p) { config.setPort(p); },
        "Modem serial port (default: /dev/ttyUSB0)");
    app.add_option_function<unsigned int>("-b,--baud",
        [&config](const unsigned int b) { config.setBaud(b); },
        "Modem baud rate (default: 115200)");
    app.add_option_function<std::string>("-s,--server",
        [&config](const std::string &s) { config.setServerAddress(s); },
        "Collector address as host:port (default: udp-eu.tartabit.com:10106)");
    app.add_option_function<uint32_t>("-i,--interval",
        [&config](const uint32_t i) { config.setReportingInterval(i); },
        "Reporting interval in seconds (default: 120)");
    app.add_option_function<uint32_t>("-r,--readings",
        [&config](const uint32_t r) { config.setReadingInterval(r); },
        "Sensor reading interval in seconds (default: 60)");
    app.add_option_function<uint32_t>("--motion",
        [&config](const uint32_t m) { config.setMotionInterval(m); },
        "Motion report interval in seconds, 0 to disable (default: 0)");
    app.add_option_function<std::string>("-m,--imei",
        [&config](const std::string &imei) { config.setImei(imei); },
        "Device IMEI (default: read from the modem)");
    app.add_option_function<std::string>("-c,--code",
        [&config](const std::string &code) { config.setCustomerCode(code); },
        "Customer code, 8 hex digits (default: 00000000)")
        ->check(CLI::Validator([](std::string &code) {
            try {
                celltrack::parseCustomerCode(code);
            } catch (const std::invalid_argument &e) {
                return std::string(e.what());
            }
            return std::string();
        }, "HEX8"));
    app.add_option_function<std::string>("-a,--apn",
        [&config](const std::string &apn) { config.setApn(apn); },
        "Packet data APN (default: modem default)");

    std::map<std::string, celltrack::LocationMode> locationModes{
        {"simulated", celltrack::LocationMode::SIMULATED},
        {"cell", celltrack::LocationMode::CELL}
    };
    app.add_option_function<celltrack::LocationMode>("--location",
        [&config](const celltrack::LocationMode mode) { config.setLocationMode(mode); },
        "Location source: simulated or cell (default: simulated)")
        ->transform(CLI::CheckedTransformer(locationModes, CLI::ignore_case));

    app.add_option_function<double>("--lat",
        [&config](const double l) { config.setLatitude(l); },
        "Starting latitude of the simulated location (in decimal format)");
    app.add_option_function<double>("--lon",
        [&config](const double l) { config.setLongitude(l); },
        "Starting longitude of the simulated location (in decimal format)");
    app.add_flag_function("-v,--verbose",
        [&config](const int64_t v) { config.setVerbose(v > 0); },
        "Display debugging information");

    app.ignore_case();

    CLI11_PARSE(app, argc, argv);

    spdlog::set_level(config.getVerbose() ? spdlog::level::debug : spdlog::level::info);

    spdlog::info("Port: {} @ {} baud", config.getPort(), config.getBaud());
    spdlog::info("Server: {}", config.getServerAddress());
    spdlog::info("Intervals: reporting {}s, readings {}s, motion {}s",
        config.getReportingInterval(), config.getReadingInterval(), config.getMotionInterval());
    spdlog::info("Location: {}", celltrack::locationModeToString(config.getLocationMode()));

    celltrack::Client client(config);
    if (!client.start()) {
        // Start up failures still exit with status 0
        std::cerr << "CellTrack could not start, see the log for details." << std::endl;
        return 0;
    }
    client.wait();

    return 0;
}
