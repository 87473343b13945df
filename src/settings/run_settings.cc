#include "run_settings.h"

#include <glog/logging.h>

#include "absl/strings/str_join.h"

#include "../common/errors.h"

namespace Mosaic {

RunSettings::RunSettings(std::string exe,
		std::vector<std::string> exe_args,
		RunArgs run_args,
		EnvVars env_vars) :
	exe_(std::move(exe)),
	exe_args_(std::move(exe_args)),
	run_args_(std::move(run_args)),
	env_vars_(std::move(env_vars)) {
	if (exe_.empty()) {
		throw ConfigurationError("RunSettings requires an executable");
	}
}

std::unique_ptr<RunSettings> RunSettings::Clone() const {
	return std::unique_ptr<RunSettings>(new RunSettings(*this));
}

void RunSettings::SetTasks(int) {
	throw UnsupportedCapabilityError("Settings for '" + exe_ + "' have no launch binary to set tasks on",
			RunCommandNames());
}

void RunSettings::SetTasksPerNode(int) {
	throw UnsupportedCapabilityError("Settings for '" + exe_ + "' have no launch binary to set tasks per node on",
			RunCommandNames());
}

void RunSettings::SetCpusPerTask(int) {
	throw UnsupportedCapabilityError("Settings for '" + exe_ + "' have no launch binary to set cpus per task on",
			RunCommandNames());
}

void RunSettings::SetHostlist(const std::vector<std::string>&) {
	throw UnsupportedCapabilityError("Settings for '" + exe_ + "' have no launch binary to set a host list on",
			RunCommandNames());
}

void RunSettings::SetRunArg(const std::string& key, std::optional<std::string> value) {
	if (key.empty()) {
		throw ConfigurationError("Run argument name must not be empty");
	}
	run_args_[key] = std::move(value);
}

void RunSettings::SetEnvVar(const std::string& key, const std::string& value) {
	env_vars_[key] = value;
}

void RunSettings::AddExeArgs(const std::vector<std::string>& args) {
	exe_args_.insert(exe_args_.end(), args.begin(), args.end());
}

std::vector<std::string> RunSettings::Format() const {
	std::vector<std::string> argv;
	auto cmd = run_command();
	if (cmd.has_value()) {
		argv.emplace_back(RunCommandName(*cmd));
		auto flags = FormatRunArgs();
		argv.insert(argv.end(), flags.begin(), flags.end());
	}
	argv.push_back(exe_);
	argv.insert(argv.end(), exe_args_.begin(), exe_args_.end());
	return argv;
}

void RunSettings::CheckPositive(const char* what, int value) {
	if (value < 1) {
		throw ConfigurationError(std::string(what) + " must be at least 1, got " + std::to_string(value));
	}
}

std::string RunSettings::JoinHosts(const std::vector<std::string>& hosts) {
	if (hosts.empty()) {
		throw TypeError("Host list must contain at least one host");
	}
	for (const auto& host : hosts) {
		if (host.empty()) {
			throw TypeError("Host list must not contain empty host names");
		}
	}
	return absl::StrJoin(hosts, ",");
}

//----------------------------------------------------------------------------
// aprun
//----------------------------------------------------------------------------

std::unique_ptr<RunSettings> AprunSettings::Clone() const {
	return std::make_unique<AprunSettings>(*this);
}

void AprunSettings::SetTasks(int tasks) {
	CheckPositive("tasks", tasks);
	run_args_["pes"] = std::to_string(tasks);
}

void AprunSettings::SetTasksPerNode(int tasks_per_node) {
	CheckPositive("tasks per node", tasks_per_node);
	run_args_["pes-per-node"] = std::to_string(tasks_per_node);
}

void AprunSettings::SetCpusPerTask(int cpus_per_task) {
	CheckPositive("cpus per task", cpus_per_task);
	run_args_["cpus-per-pe"] = std::to_string(cpus_per_task);
}

void AprunSettings::SetHostlist(const std::vector<std::string>& hosts) {
	run_args_["node-list"] = JoinHosts(hosts);
}

std::vector<std::string> AprunSettings::FormatRunArgs() const {
	std::vector<std::string> args;
	for (const auto& [key, value] : run_args_) {
		if (key.size() == 1) {
			args.push_back("-" + key);
			if (value.has_value()) args.push_back(*value);
		} else if (value.has_value()) {
			args.push_back("--" + key + "=" + *value);
		} else {
			args.push_back("--" + key);
		}
	}
	return args;
}

//----------------------------------------------------------------------------
// mpirun
//----------------------------------------------------------------------------

std::unique_ptr<RunSettings> MpirunSettings::Clone() const {
	return std::make_unique<MpirunSettings>(*this);
}

void MpirunSettings::SetTasks(int tasks) {
	CheckPositive("tasks", tasks);
	run_args_["n"] = std::to_string(tasks);
}

void MpirunSettings::SetTasksPerNode(int tasks_per_node) {
	CheckPositive("tasks per node", tasks_per_node);
	run_args_["npernode"] = std::to_string(tasks_per_node);
}

void MpirunSettings::SetCpusPerTask(int cpus_per_task) {
	CheckPositive("cpus per task", cpus_per_task);
	run_args_["cpus-per-proc"] = std::to_string(cpus_per_task);
}

void MpirunSettings::SetHostlist(const std::vector<std::string>& hosts) {
	run_args_["host"] = JoinHosts(hosts);
}

std::vector<std::string> MpirunSettings::FormatRunArgs() const {
	std::vector<std::string> args;
	for (const auto& [key, value] : run_args_) {
		args.push_back((key.size() == 1 ? "-" : "--") + key);
		if (value.has_value()) args.push_back(*value);
	}
	return args;
}

std::unique_ptr<RunSettings> MakeRunSettings(RunCommand cmd,
		std::string exe,
		std::vector<std::string> exe_args,
		RunArgs run_args) {
	switch (cmd) {
		case RunCommand::APRUN:
			return std::make_unique<AprunSettings>(std::move(exe), std::move(exe_args), std::move(run_args));
		case RunCommand::MPIRUN:
			return std::make_unique<MpirunSettings>(std::move(exe), std::move(exe_args), std::move(run_args));
	}
	LOG(ERROR) << "Unhandled run command value " << static_cast<int>(cmd);
	throw UnsupportedCapabilityError("Unhandled run command", RunCommandNames());
}

} // namespace Mosaic
