#include "pbs_orchestrator.h"

#include <glog/logging.h>

#include "../common/configuration.h"
#include "../common/errors.h"

namespace Mosaic {

namespace {

std::unique_ptr<RunSettings> BuildAprunSettings(std::string exe,
		std::vector<std::string> exe_args,
		const RunArgs& run_args) {
	return std::make_unique<AprunSettings>(std::move(exe), std::move(exe_args), run_args);
}

std::unique_ptr<RunSettings> BuildMpirunSettings(std::string exe,
		std::vector<std::string> exe_args,
		const RunArgs& run_args) {
	return std::make_unique<MpirunSettings>(std::move(exe), std::move(exe_args), run_args);
}

const PBSOrchestrator::LauncherPolicy kLauncherPolicies[] = {
	// command              build                 requires_hosts  hostlist_in_batch
	{RunCommand::APRUN,  &BuildAprunSettings,  false,          false},
	{RunCommand::MPIRUN, &BuildMpirunSettings, true,           true},
};

} // End of anonymous namespace

const PBSOrchestrator::LauncherPolicy& PBSOrchestrator::Policy(RunCommand command) {
	for (const auto& policy : kLauncherPolicies) {
		if (policy.command == command) return policy;
	}
	throw UnsupportedCapabilityError(std::string("PBSOrchestrator does not support ") +
			RunCommandName(command) + " as a launch binary", RunCommandNames());
}

PBSOrchestrator::PBSOrchestrator(const OrchestratorOptions& options) :
	Orchestrator(options) {
	const LauncherPolicy& policy = Policy(run_command_);
	if (options.hosts.empty() && policy.requires_hosts) {
		throw TopologyConstraintError(std::string("hosts argument is required when launching PBSOrchestrator with ") +
				RunCommandName(run_command_));
	}

	InitializeNodes(options);
	if (batch_) {
		batch_settings_ = BuildBatchSettings(options);
	}
	if (!options.hosts.empty()) {
		SetHosts(options.hosts);
	}
	LOG(INFO) << "PBSOrchestrator " << name_ << ": " << db_nodes_ << " node(s) on port " << port_
		<< " via " << RunCommandName(run_command_)
		<< (cluster_ ? ", clustered" : "") << (batch_ ? ", batch" : "");
}

void PBSOrchestrator::InitializeNodes(const OrchestratorOptions& options) {
	const LauncherPolicy& policy = Policy(run_command_);
	const std::string exe = GetConfig().getDatabaseExe();

	for (int db_id = 0; db_id < db_nodes_; ++db_id) {
		std::string node_name = name_ + "_" + std::to_string(db_id);
		std::vector<std::string> node_args = GetDatabaseArgs();
		if (cluster_) {
			auto cluster_args = GetClusterArgs(node_name, port_);
			node_args.insert(node_args.end(), cluster_args.begin(), cluster_args.end());
		}

		auto run_settings = policy.build_settings(exe, std::move(node_args), options.run_args);
		// One database process per compute node
		run_settings->SetTasks(1);
		run_settings->SetTasksPerNode(1);

		VLOG(1) << "\t[PBSOrchestrator]\tCreated " << node_name;
		nodes_.push_back(std::make_unique<DBNode>(node_name, path_, std::move(run_settings), std::vector<int>{port_}));
	}
	ports_ = {port_};
}

std::unique_ptr<QsubBatchSettings> PBSOrchestrator::BuildBatchSettings(const OrchestratorOptions& options) const {
	return std::make_unique<QsubBatchSettings>(db_nodes_, 1, options.time, options.queue, options.account);
}

void PBSOrchestrator::AssignHosts(const std::vector<std::string>& hosts) {
	if (hosts.size() != nodes_.size()) {
		LOG(WARNING) << "PBSOrchestrator " << name_ << " given " << hosts.size() << " host(s) for "
			<< nodes_.size() << " node(s)";
	}
	if (batch_) {
		batch_settings_->SetHostlist(hosts);
	}

	const LauncherPolicy& policy = Policy(run_command_);
	const bool per_node_hostlist = !batch_ || policy.hostlist_in_batch;
	for (size_t i = 0; i < hosts.size() && i < nodes_.size(); ++i) {
		nodes_[i]->SetHost(hosts[i]);
		if (per_node_hostlist) {
			nodes_[i]->run_settings().SetHostlist({hosts[i]});
		}
		VLOG(2) << "\t[PBSOrchestrator]\t" << nodes_[i]->name() << " -> " << hosts[i]
			<< (per_node_hostlist ? "" : " (placement left to batch)");
	}
}

void PBSOrchestrator::SetCpus(int num_cpus) {
	if (batch_) {
		batch_settings_->SetNcpus(num_cpus);
	}
	for (auto& node : nodes_) {
		node->run_settings().SetCpusPerTask(num_cpus);
	}
}

void PBSOrchestrator::SetWalltime(const std::string& walltime) {
	if (!batch_) {
		throw ConfigurationError("Not running in batch, cannot set walltime");
	}
	batch_settings_->SetWalltime(walltime);
}

void PBSOrchestrator::SetBatchArg(const std::string& key, std::optional<std::string> value) {
	if (!batch_) {
		throw ConfigurationError("Not running as batch, cannot set batch_arg");
	}
	batch_settings_->SetBatchArg(key, std::move(value));
}

} // namespace Mosaic
