#include <fstream>
#include <iostream>

#include <cxxopts.hpp>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include "common/configuration.h"
#include "common/errors.h"
#include "experiment/experiment_spec.h"
#include "experiment/topology_writer.h"

using namespace Mosaic;

int main(int argc, char* argv[]) {
    // Initialize logging
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = 1; // log only to console, no files.

    cxxopts::Options options("mosaic_compose", "Resolve an experiment document into a launchable topology");
    options.add_options()
        ("s,spec", "Experiment document (YAML)", cxxopts::value<std::string>())
        ("c,config", "Mosaic configuration file (YAML)", cxxopts::value<std::string>())
        ("o,output", "Write the topology here instead of stdout", cxxopts::value<std::string>())
        ("l,log_level", "Verbose log level", cxxopts::value<int>())
        ("h,help", "Print usage");

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }
    if (!result.count("spec")) {
        LOG(ERROR) << "--spec is required";
        std::cerr << options.help() << std::endl;
        return 1;
    }

    Configuration& config = Configuration::getInstance();
    if (result.count("config")) {
        if (!config.loadFromFile(result["config"].as<std::string>())) {
            LOG(ERROR) << "Failed to load configuration file";
            for (const auto& error : config.getValidationErrors()) {
                LOG(ERROR) << "Config validation error: " << error;
            }
            return 1;
        }
    } else if (!config.validate()) {
        for (const auto& error : config.getValidationErrors()) {
            LOG(ERROR) << "Config validation error: " << error;
        }
        return 1;
    }
    FLAGS_v = result.count("log_level") ? result["log_level"].as<int>() : config.config().logging.verbosity.get();

    const std::string spec_path = result["spec"].as<std::string>();
    std::string topology;
    try {
        Experiment experiment = LoadExperiment(YAML::LoadFile(spec_path));
        topology = EmitTopology(experiment);
    } catch (const MosaicError& e) {
        LOG(ERROR) << "Composition of " << spec_path << " failed: " << e.what();
        return 1;
    } catch (const TypeError& e) {
        LOG(ERROR) << "Invalid value in " << spec_path << ": " << e.what();
        return 1;
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to read " << spec_path << ": " << e.what();
        return 1;
    } catch (const std::exception& e) {
        LOG(ERROR) << "Composition of " << spec_path << " aborted: " << e.what();
        return 1;
    }

    if (result.count("output")) {
        const std::string out_path = result["output"].as<std::string>();
        std::ofstream out(out_path);
        if (!out) {
            LOG(ERROR) << "Cannot open " << out_path << " for writing";
            return 1;
        }
        out << topology;
        LOG(INFO) << "Topology written to " << out_path;
    } else {
        std::cout << topology;
    }
    return 0;
}
