/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Main implementation for the Turtle exporter
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <string>
#include <vector>
#include <set>
#include <iostream>
#include <fstream>
#include <stdexcept>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>
#include <boost/foreach.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/iostreams/filtering_streambuf.hpp>
#include <boost/iostreams/filter/line.hpp>

#include "ecrdf/engine/ExportSettings.h"
#include "ecrdf/engine/Repository.h"
#include "ecrdf/engine/RepositoryReader.h"
#include "ecrdf/engine/TurtleExporter.h"
#include "ecrdf/rdf/TurtleWriter.h"
#include "ecrdf/logging/ConsoleLogHandler.h"
#include "ecrdf/logging/internal/logging.hpp"

using std::string;
namespace po = boost::program_options;
namespace fs = boost::filesystem;
namespace pt = boost::property_tree;
using namespace ecrdf::engine;
using ecrdf::logging::LogHandler;
using ecrdf::logging::ConsoleLogHandler;

class strip_comments : public boost::iostreams::line_filter {
private:
    std::string do_filter(const std::string& line) {
        // for now we only support comments that begin the line
        string trimmed = line;
        boost::trim(trimmed);
        if (boost::starts_with(trimmed, "#") ||
            boost::starts_with(trimmed, "//")) {
            return std::string();
        }
        return line;
    }
};

static void readConfig(ExportSettings& settings, const string& configFile) {
    pt::ptree properties;

    LOG(INFO) << "Reading configuration from " << configFile;

    std::ifstream file(configFile.c_str(),
                       std::ios_base::in | std::ios_base::binary);
    if (!file)
        throw std::runtime_error("Could not open config file " + configFile);
    boost::iostreams::filtering_streambuf<boost::iostreams::input> inbuf;
    inbuf.push(strip_comments());
    inbuf.push(file);
    std::istream instream(&inbuf);

    try {
        pt::read_json(instream, properties);
    } catch (pt::json_parser_error& e) {
        LOG(ERROR) << "Error parsing config file: " << configFile << "("
                   << e.line() << "): " << e.message();
        throw;
    }
    settings.setProperties(properties);
}

static bool isConfigPath(const fs::path& file) {
    const string fstr = file.filename().string();
    if (boost::algorithm::ends_with(fstr, ".conf") &&
        !boost::algorithm::starts_with(fstr, ".")) {
        return true;
    }

    return false;
}

static void configure(ExportSettings& settings,
                      const std::vector<string>& configFiles) {
    BOOST_FOREACH(const string& configFile, configFiles) {
        if (fs::is_directory(configFile)) {
            LOG(INFO) << "Reading configuration from config directory "
                      << configFile;

            fs::directory_iterator end;
            std::set<string> files;
            for (fs::directory_iterator it(configFile);
                 it != end; ++it) {
                if (isConfigPath(it->path())) {
                    files.insert(it->path().string());
                }
            }
            BOOST_FOREACH(const string& fstr, files) {
                readConfig(settings, fstr);
            }
        } else {
            readConfig(settings, configFile);
        }
    }
}

int main(int argc, char** argv) {
    // Parse command line options
    po::options_description desc("Allowed options");
    desc.add_options()
        ("help,h", "Print this help message")
        ("input,i", po::value<string>(),
         "Read the repository from the specified JSON file")
        ("output,o", po::value<string>(),
         "Write Turtle to the specified file, replacing its contents, "
         "or to standard out if the file is -")
        ("config,c",
         po::value<std::vector<string> >(),
         "Read configuration from the specified files or directories")
        ("level", po::value<string>()->default_value("info"),
         "Use the specified log level (default info). "
         "Overridden by log level in configuration file")
        ("schemas-only", "Export the vocabulary and schemas but no instances")
        ;

    ConsoleLogHandler logger(INFO);
    LogHandler::registerHandler(logger);

    string inputFile;
    string outputFile;
    string levelStr;

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).
                  options(desc).run(), vm);
        po::notify(vm);

        if (vm.count("help")) {
            std::cout << "Usage: " << argv[0] << " [options]\n";
            std::cout << desc;
            return 0;
        }
        if (!vm.count("input") || !vm.count("output")) {
            std::cerr << "Both --input and --output are required" << std::endl;
            std::cerr << "Usage: " << argv[0] << " [options]\n" << desc;
            return 1;
        }
        inputFile = vm["input"].as<string>();
        outputFile = vm["output"].as<string>();
        levelStr = vm["level"].as<string>();
        logger.setLevel(LogHandler::parseLevel(levelStr));
    } catch (po::error& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    } catch (std::invalid_argument& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    // keep standard out for the document
    if (outputFile == "-")
        logger.setErrorOnly(true);

    std::vector<string> configFiles;
    if (vm.count("config"))
        configFiles = vm["config"].as<std::vector<string> >();

    try {
        ExportSettings settings;
        configure(settings, configFiles);
        if (vm.count("schemas-only"))
            settings.setExportInstances(false);

        Repository repository;
        RepositoryReader reader(repository);
        reader.readFile(inputFile);
        if (reader.getDroppedCount() > 0)
            LOG(WARNING) << "Dropped " << reader.getDroppedCount()
                         << " instances while reading " << inputFile;

        if (outputFile == "-") {
            ecrdf::rdf::TurtleWriter writer(std::cout);
            TurtleExporter::exportRepository(repository, writer, settings);
            LOG(INFO) << "Exported repository " << repository.getId()
                      << " to standard out: " << writer.getTripleCount()
                      << " statements";
        } else {
            TurtleExporter::exportRepository(repository, outputFile,
                                             settings);
        }
    } catch (const std::exception& e) {
        LOG(ERROR) << "Fatal error: " << e.what();
        return 2;
    }

    return 0;
}
