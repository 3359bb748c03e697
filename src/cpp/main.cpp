/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "ordprops/base/PropertiesException.hpp"
#include "ordprops/codec/XmlCodec.hpp"
#include "ordprops/properties/OrderedPropertiesBuilder.hpp"
#include "ordprops/properties/OrderedPropertiesConfig.hpp"
#include "ordprops/util/logging.hpp"

#include <CLI/CLI.hpp>
#include <fmt/format.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

namespace fs = std::filesystem;

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    CLI::App app{"ordprops - rewrite properties files in a stable key order"};

    fs::path input;
    app.add_option("input", input, "Properties file to read")
        ->required()
        ->check(CLI::ExistingFile);

    fs::path output;
    app.add_option("-o,--output", output, "File to write, stdout if omitted");

    fs::path config;
    auto optConfig = app.add_option("-f,--config-file", config, "OrderedProperties config file")
        ->check(CLI::ExistingFile);

    bool sort = false;
    app.add_flag("-s,--sort", sort, "Order keys lexicographically")
        ->excludes(optConfig);

    bool suppressDate = false;
    app.add_flag("-d,--suppress-date", suppressDate, "Leave out the timestamp comment")
        ->excludes(optConfig);

    std::optional<std::string> comment;
    app.add_option("-c,--comment", comment, "Header comment to write");

    bool xmlIn = false;
    app.add_flag("--xml-in", xmlIn, "Read the input as XML properties");

    bool xmlOut = false;
    app.add_flag("--xml-out", xmlOut, "Write XML properties");

    std::string encoding{ordprops::codec::kDefaultXmlEncoding};
    app.add_option("-e,--encoding", encoding, "Encoding of XML output")
        ->capture_default_str();

    bool verbose = false;
    app.add_flag("-v,--verbose", verbose, "Log load and store details");

    CLI11_PARSE(app, argc, argv);

    if (verbose) {
        ordprops::util::setLogLevel(spdlog::level::debug);
    }

    try {
        auto builder = [&] {
            if (!config.empty()) {
                return ordprops::OrderedPropertiesBuilder::fromConfig(
                    ordprops::OrderedPropertiesConfig::fromFile(config));
            }
            ordprops::OrderedPropertiesBuilder fromFlags;
            if (sort) {
                fromFlags.withNaturalOrdering();
            }
            fromFlags.suppressDateInComment(suppressDate);
            return fromFlags;
        }();
        auto props = builder.build();

        std::ifstream ifs{input, std::ios::binary};
        if (xmlIn) {
            props.loadFromXML(ifs);
        } else {
            props.load(ifs);
        }

        std::ofstream ofs;
        if (!output.empty()) {
            ofs.open(output, std::ios::binary | std::ios::trunc);
        }
        std::ostream& os = output.empty() ? std::cout : ofs;

        if (xmlOut) {
            props.storeToXML(os, comment, encoding);
        } else {
            props.store(os, comment);
        }

        ordprops::util::logger().info(
            "Rewrote {} properties from '{}'", props.size(), input.generic_string());
    }
    catch (const ordprops::PropertiesException& exc) {
        ordprops::util::logger().error("{}", exc.what());
        return 1;
    }

    return 0;
}

//-------------------------------------------------------------------------
