/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitring.hpp>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <cmath>
#include <cstdlib>
#include <format>
#include <iostream>
#include <string>

using spdlog::debug;

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

/** Resolve a body name, falling back to the configured body, or exit with the command's help */
orbitring::Body requireBody(const std::string &id, orbitring::Config &config, CLI::App *command) {
    if (!id.empty()) {
        auto body = orbitring::parseBody(id);
        if (!body.has_value()) {
            std::cerr << "Unknown orbiting body: " << id << " (expected iss, tss or hst)" << std::endl;
            std::cerr << command->help() << std::endl;
            std::exit(1);
        }
        config.setBody(*body);
    }
    if (!orbitring::hasProfile(config.getBody())) {
        std::cerr << "No orbit track for " << config.getBody() << std::endl;
        std::cerr << command->help() << std::endl;
        std::exit(1);
    }
    return config.getBody();
}

/** Print one line per profile */
void printBodies(orbitring::Config &config) {
    using namespace orbitring;

    constexpr std::string_view rowFormat = "{:<5} {:<28} {:>11} {:>10} {:>11} {:>6} {:>16}";
    std::cout << std::format(rowFormat, "ID", "Name", "Inclination", "Altitude", "Ring Radius", "Bands",
        std::format("Visible @ {:g}°", config.getMinimumElevation())) << std::endl;
    std::cout << std::format(rowFormat, std::string(5, '-'), std::string(28, '-'), std::string(11, '-'),
        std::string(10, '-'), std::string(11, '-'), std::string(6, '-'), std::string(16, '-')) << std::endl;

    for (auto body : allBodies()) {
        const auto &profile = getProfile(body);
        double diameter = visibilityDiameterKm(profile.getNominalAltitudeKm(), config.getMinimumElevation());
        std::cout << std::format(rowFormat,
            bodyID(body),
            profile.getName(),
            std::format("{:.2f}°", profile.getInclinationRadians() * RADIANS_TO_DEGREES),
            std::format("{:.0f} km", profile.getNominalAltitudeKm()),
            std::format("{:.4f}", profile.getRingRadiusScene()),
            profile.bandCount(),
            std::format("{:.1f} km", diameter)) << std::endl;
    }
}

/** Program entry point */
int main(int argc, char* argv[]) {

    orbitring::Config config;

    auto configFile = expandTilde("~/.orbitring.toml");

    CLI::App app{"OrbitRing"};
    argv = app.ensure_utf8(argv);

    app.set_config("--config", configFile, "Read configuration from this file (default: " + configFile + ").");

    app.add_flag_function("-v,--verbose",
        [&config](const int64_t v) {
            config.setVerbose(v > 0);
            if (config.getVerbose()) {
                spdlog::set_level(spdlog::level::debug);
            }
        },
        "Display debugging information");
    app.add_option_function<std::string>("--body",
        [&config](const std::string &id) {
            auto body = orbitring::parseBody(id);
            if (!body.has_value()) {
                throw CLI::ValidationError("--body", "expected iss, tss, hst or none: " + id);
            }
            config.setBody(*body);
        },
        "Default orbiting body when a command is not given one (default: iss)");
    app.add_option_function<double>("--elev",
        [&config](const double e) { config.setMinimumElevation(e); },
        "Minimum elevation in degrees for visibility calculations (default 10)");

    app.ignore_case();
    app.fallthrough();

    auto bodiesCommand = app.add_subcommand("bodies", "List the orbiting bodies and their orbit track parameters");

    std::string infoBody;
    auto infoCommand = app.add_subcommand("info", "Display an orbiting body's profile");
    infoCommand->add_option("body", infoBody, "Orbiting body (iss, tss or hst)");

    std::string correctionBody;
    auto correctionCommand = app.add_subcommand("correction", "Display the inclination correction at a latitude");
    correctionCommand->add_option("body", correctionBody, "Orbiting body (iss, tss or hst)");
    correctionCommand->add_option_function<double>("--lat",
        [&config](const double l) { config.setLatitude(l); },
        "Sub-point latitude (in decimal format)");

    std::string transformBody;
    auto transformCommand = app.add_subcommand("transform", "Compute the orbit track ring orientation");
    transformCommand->add_option("body", transformBody, "Orbiting body (iss, tss or hst)");
    transformCommand->add_option_function<double>("--lat",
        [&config](const double l) { config.setLatitude(l); },
        "Sub-point latitude (in decimal format)");
    transformCommand->add_option_function<double>("--long",
        [&config](const double l) { config.setLongitude(l); },
        "Sub-point longitude (in decimal format)");
    transformCommand->add_option_function<std::string>("--heading",
        [&config](const std::string &heading) {
            auto factor = orbitring::parseHeadingFactor(heading);
            if (!factor.has_value()) {
                throw CLI::ValidationError("--heading", "expected N, S, +1 or -1: " + heading);
            }
            config.setHeadingFactor(*factor);
        },
        "Ground track heading: N or +1 (north), S or -1 (south)");
    transformCommand->add_option_function<double>("--prev-lat",
        [&config](const double l) { config.setPreviousLatitude(l); },
        "Previous sub-point latitude, used to derive the heading");

    auto visibilityCommand = app.add_subcommand("visibility", "Compute the visibility circle diameter");
    visibilityCommand->add_option_function<double>("--alt",
        [&config](const double a) { config.setAltitude(a); },
        "Satellite altitude in kilometers")->required();

    // Command callbacks

    bodiesCommand->final_callback([&config](void) {
        try {
            printBodies(config);
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    infoCommand->final_callback([infoCommand, &config, &infoBody](void) {
        auto body = requireBody(infoBody, config, infoCommand);
        try {
            orbitring::getProfile(body).printInfo(std::cout);
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    correctionCommand->final_callback([correctionCommand, &config, &correctionBody](void) {
        using namespace orbitring;
        auto body = requireBody(correctionBody, config, correctionCommand);
        try {
            const auto &profile = getProfile(body);
            float latitude = static_cast<float>(config.getLatitude());
            float absLat = std::fabs(latitude);
            float base = exponentBase(profile, absLat);
            float power = selectCorrectionPower(profile, absLat);
            float correction = inclinationCorrection(profile, latitude);
            float inclination = correctedInclination(profile, latitude);

            debug("{}: lat={} absLat={} base={} power={}", bodyID(body), latitude, absLat, base, power);

            std::cout << "Body:                 " << profile.getName() << std::endl;
            std::cout << "Latitude:             " << std::format("{:.4f}°", latitude) << std::endl;
            std::cout << "Exponent Base:        " << std::format("{:.6f}", base) << std::endl;
            std::cout << "Band Power:           " << std::format("{:.2f}", power) << std::endl;
            std::cout << "Correction:           " << std::format("{:.6f}", correction) << std::endl;
            std::cout << "Nominal Inclination:  " << std::format("{:.4f}° ({:.6f} rad)",
                profile.getInclinationRadians() * RADIANS_TO_DEGREES, profile.getInclinationRadians()) << std::endl;
            std::cout << "Corrected Inclination:" << std::format(" {:.4f}° ({:.6f} rad)",
                inclination * RADIANS_TO_DEGREES, inclination) << std::endl;
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    transformCommand->final_callback([transformCommand, &config, &transformBody](void) {
        using namespace orbitring;
        auto body = requireBody(transformBody, config, transformCommand);
        try {
            float heading = config.getHeadingFactor();
            if (config.getPreviousLatitude().has_value()) {
                heading = headingFactor(static_cast<float>(*config.getPreviousLatitude()),
                                        static_cast<float>(config.getLatitude()));
                debug("Derived heading factor {} from previous latitude {}", heading, *config.getPreviousLatitude());
            }

            GeodeticSample sample{
                .latitudeDeg = static_cast<float>(config.getLatitude()),
                .longitudeDeg = static_cast<float>(config.getLongitude()),
                .headingFactor = heading
            };

            auto transform = orbitTrackTransform(body, sample);
            if (!transform.has_value()) {
                std::cerr << "No orbit track for " << body << std::endl;
                std::exit(1);
            }

            std::cout << std::format("Orbit track orientation for {} at {:.4f}°, {:.4f}° heading {}:",
                getProfile(body).getName(), sample.latitudeDeg, sample.longitudeDeg,
                sample.headingFactor > 0 ? "north" : "south") << std::endl;
            std::cout << *transform;
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    visibilityCommand->final_callback([&config](void) {
        double diameter = orbitring::visibilityDiameterKm(config.getAltitude(), config.getMinimumElevation());
        if (diameter == 0.0) {
            debug("No visibility circle at {} km above {:g}° elevation", config.getAltitude(), config.getMinimumElevation());
        }
        std::cout << std::format("Visibility diameter at {:.1f} km, {:g}° minimum elevation: {:.1f} km",
            config.getAltitude(), config.getMinimumElevation(), diameter) << std::endl;
    });

    CLI11_PARSE(app, argc, argv);

    if (app.get_subcommands().empty()) {
        std::cerr << app.help() << std::endl;
        std::exit(1);
    }

    return 0;
}
