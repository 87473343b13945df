#include "orchestrator.h"

#include <filesystem>

#include <glog/logging.h>

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"

#include "../common/configuration.h"
#include "../common/errors.h"

namespace Mosaic {

Orchestrator::Orchestrator(const OrchestratorOptions& options) :
	name_(options.name),
	path_(options.path.has_value() ? *options.path : std::filesystem::current_path().string()),
	port_(options.port.value_or(GetConfig().getDatabasePort())),
	db_nodes_(options.db_nodes),
	cluster_(options.db_nodes >= 3),
	batch_(options.batch.value_or(GetConfig().config().launcher.batch.get())),
	run_command_(RunCommand::APRUN),
	threads_per_queue_(options.threads_per_queue),
	inter_op_threads_(options.inter_op_threads),
	intra_op_threads_(options.intra_op_threads) {
	if (db_nodes_ == 2) {
		throw TopologyConstraintError("Database clusters of size 2 are not supported, "
				"use 1 node or at least 3 nodes");
	}
	if (db_nodes_ < 1) {
		throw ConfigurationError("Database node count must be at least 1, got " + std::to_string(db_nodes_));
	}
	if (name_.empty()) {
		throw ConfigurationError("Orchestrator name must not be empty");
	}
	if (port_ < 1 || port_ > 65535) {
		throw ConfigurationError("Database port must be between 1 and 65535, got " + std::to_string(port_));
	}
	run_command_ = ParseRunCommand(options.run_command.value_or(GetConfig().getRunCommand()));
}

void Orchestrator::SetPath(const std::string& path) {
	path_ = path;
	for (auto& node : nodes_) {
		node->SetPath(path);
	}
}

std::vector<std::string> Orchestrator::GetAddresses() const {
	std::vector<std::string> addresses;
	for (const auto& node : nodes_) {
		auto node_addresses = node->GetAddresses();
		addresses.insert(addresses.end(), node_addresses.begin(), node_addresses.end());
	}
	return addresses;
}

void Orchestrator::SetHosts(const std::vector<std::string>& hosts) {
	for (const auto& host : hosts) {
		if (host.empty()) {
			throw TypeError("host_list argument must be a list of non-empty host names");
		}
	}
	AssignHosts(hosts);
}

void Orchestrator::SetHost(const std::string& host) {
	SetHosts(std::vector<std::string>{std::string(absl::StripAsciiWhitespace(host))});
}

void Orchestrator::SetHostsFromYaml(const YAML::Node& hosts) {
	if (hosts.IsScalar()) {
		SetHost(hosts.Scalar());
		return;
	}
	if (!hosts.IsSequence()) {
		throw TypeError("host_list argument must be a string or a list of strings");
	}
	std::vector<std::string> host_list;
	for (const auto& host : hosts) {
		if (!host.IsScalar()) {
			throw TypeError("host_list argument must be a list of strings");
		}
		host_list.push_back(host.Scalar());
	}
	SetHosts(host_list);
}

std::vector<std::string> Orchestrator::GetDatabaseArgs() const {
	const Configuration& config = GetConfig();
	std::vector<std::string> args{config.getDatabaseConf()};
	auto ai_module = GetAIModuleArgs();
	auto ip_module = GetIPModuleArgs();
	args.insert(args.end(), ai_module.begin(), ai_module.end());
	args.insert(args.end(), ip_module.begin(), ip_module.end());
	args.push_back("--port");
	args.push_back(std::to_string(port_));
	return args;
}

std::vector<std::string> Orchestrator::GetClusterArgs(const std::string& node_name, int port) {
	return {
		"--cluster-enabled", "yes",
		"--cluster-config-file", absl::StrCat("nodes-", node_name, "-", port, ".conf")
	};
}

std::vector<std::string> Orchestrator::GetAIModuleArgs() const {
	std::vector<std::string> args{"--loadmodule", GetConfig().config().database.ai_module.get()};
	if (threads_per_queue_.has_value()) {
		args.push_back("THREADS_PER_QUEUE");
		args.push_back(std::to_string(*threads_per_queue_));
	}
	if (inter_op_threads_.has_value()) {
		args.push_back("INTER_OP_PARALLELISM");
		args.push_back(std::to_string(*inter_op_threads_));
	}
	if (intra_op_threads_.has_value()) {
		args.push_back("INTRA_OP_PARALLELISM");
		args.push_back(std::to_string(*intra_op_threads_));
	}
	return args;
}

std::vector<std::string> Orchestrator::GetIPModuleArgs() const {
	return {"--loadmodule", GetConfig().config().database.ip_module.get()};
}

} // namespace Mosaic
