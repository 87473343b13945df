#ifndef MOSAIC_TOPOLOGY_WRITER_H_
#define MOSAIC_TOPOLOGY_WRITER_H_

#include <string>

#include <yaml-cpp/yaml.h>

#include "experiment_spec.h"

namespace Mosaic {

/// Run command, launch argv and environment
YAML::Node DescribeSettings(const RunSettings& settings);

YAML::Node DescribeModel(const Model& model);
YAML::Node DescribeEnsemble(const Ensemble& ensemble);
YAML::Node DescribeDBNode(const DBNode& node);

/// Nodes, port list, cluster flag and the batch job preamble when batched
YAML::Node DescribeOrchestrator(const Orchestrator& orchestrator);

/// Resolved topology handed to the launcher
YAML::Node DescribeExperiment(const Experiment& experiment);

std::string EmitTopology(const Experiment& experiment);

} // namespace Mosaic

#endif // MOSAIC_TOPOLOGY_WRITER_H_
