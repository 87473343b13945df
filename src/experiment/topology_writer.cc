#include "topology_writer.h"

namespace Mosaic {

namespace {

YAML::Node Strings(const std::vector<std::string>& values) {
	YAML::Node node(YAML::NodeType::Sequence);
	for (const auto& value : values) {
		node.push_back(value);
	}
	return node;
}

} // End of anonymous namespace

YAML::Node DescribeSettings(const RunSettings& settings) {
	YAML::Node node;
	auto cmd = settings.run_command();
	node["run_command"] = cmd.has_value() ? RunCommandName(*cmd) : "none";
	node["argv"] = Strings(settings.Format());
	if (!settings.env_vars().empty()) {
		YAML::Node env(YAML::NodeType::Map);
		for (const auto& [key, value] : settings.env_vars()) {
			env[key] = value;
		}
		node["env"] = env;
	}
	return node;
}

YAML::Node DescribeModel(const Model& model) {
	YAML::Node node;
	node["name"] = model.name();
	node["path"] = model.path();
	node["params"] = AssignmentToYaml(model.params());
	node["key_prefixing"] = model.QueryKeyPrefixing();
	if (!model.incoming_entities().empty()) {
		node["incoming"] = Strings(model.incoming_entities());
	}
	node["launch"] = DescribeSettings(model.run_settings());
	return node;
}

YAML::Node DescribeEnsemble(const Ensemble& ensemble) {
	YAML::Node node;
	node["name"] = ensemble.name();
	node["strategy"] = ensemble.strategy().name();
	YAML::Node models(YAML::NodeType::Sequence);
	for (const auto& model : ensemble) {
		models.push_back(DescribeModel(*model));
	}
	node["models"] = models;
	if (ensemble.batch_settings()) {
		node["batch"] = Strings(ensemble.batch_settings()->FormatBatchArgs());
	}
	return node;
}

YAML::Node DescribeDBNode(const DBNode& db_node) {
	YAML::Node node;
	node["name"] = db_node.name();
	node["path"] = db_node.path();
	if (db_node.host().has_value()) {
		node["host"] = *db_node.host();
	} else {
		node["host"] = YAML::Null;
	}
	YAML::Node ports(YAML::NodeType::Sequence);
	for (int port : db_node.ports()) {
		ports.push_back(port);
	}
	node["ports"] = ports;
	node["launch"] = DescribeSettings(db_node.run_settings());
	return node;
}

YAML::Node DescribeOrchestrator(const Orchestrator& orchestrator) {
	YAML::Node node;
	node["name"] = orchestrator.name();
	node["clustered"] = orchestrator.IsClustered();
	node["run_command"] = RunCommandName(orchestrator.run_command());
	YAML::Node ports(YAML::NodeType::Sequence);
	for (int port : orchestrator.Ports()) {
		ports.push_back(port);
	}
	node["ports"] = ports;
	YAML::Node nodes(YAML::NodeType::Sequence);
	for (const auto& db_node : orchestrator) {
		nodes.push_back(DescribeDBNode(*db_node));
	}
	node["nodes"] = nodes;
	if (orchestrator.batch_settings()) {
		node["batch"] = Strings(orchestrator.batch_settings()->FormatBatchArgs());
	}
	return node;
}

YAML::Node DescribeExperiment(const Experiment& experiment) {
	YAML::Node node;
	YAML::Node ensembles(YAML::NodeType::Sequence);
	for (const auto& ensemble : experiment.ensembles) {
		ensembles.push_back(DescribeEnsemble(ensemble));
	}
	node["ensembles"] = ensembles;
	if (experiment.orchestrator) {
		node["orchestrator"] = DescribeOrchestrator(*experiment.orchestrator);
	}
	return node;
}

std::string EmitTopology(const Experiment& experiment) {
	YAML::Emitter out;
	out << DescribeExperiment(experiment);
	return std::string(out.c_str()) + "\n";
}

} // namespace Mosaic
