#ifndef MOSAIC_RUN_SETTINGS_H_
#define MOSAIC_RUN_SETTINGS_H_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/container/btree_map.h"

#include "run_command.h"

namespace Mosaic {

/// Launcher flag -> value. A nullopt value renders as a bare flag.
using RunArgs = absl::btree_map<std::string, std::optional<std::string>>;
using EnvVars = absl::btree_map<std::string, std::string>;

/**
 * How a single process is launched: executable, its arguments and the
 * arguments of the launch binary wrapping it.
 *
 * A plain RunSettings has no launch binary and executes the program
 * directly. Subclasses bind a RunCommand family and translate the
 * generic resource setters into that binary's flags.
 *
 * Settings are values. Every entity owns its own copy obtained via
 * Clone(), so mutating one never affects a sibling or the template.
 */
class RunSettings {
	public:
		RunSettings(std::string exe,
				std::vector<std::string> exe_args = {},
				RunArgs run_args = {},
				EnvVars env_vars = {});
		virtual ~RunSettings() = default;

		/// Deep copy preserving the dynamic type
		virtual std::unique_ptr<RunSettings> Clone() const;

		/// Launch binary family, nullopt when the executable runs directly
		virtual std::optional<RunCommand> run_command() const { return std::nullopt; }

		/**
		 * Resource setters. Families map them onto their own flags;
		 * the base class has no launcher to pass them to.
		 * @throws UnsupportedCapabilityError on a plain RunSettings
		 */
		virtual void SetTasks(int tasks);
		virtual void SetTasksPerNode(int tasks_per_node);
		virtual void SetCpusPerTask(int cpus_per_task);
		virtual void SetHostlist(const std::vector<std::string>& hosts);

		void SetRunArg(const std::string& key, std::optional<std::string> value = std::nullopt);
		void SetEnvVar(const std::string& key, const std::string& value);
		void AddExeArgs(const std::vector<std::string>& args);

		const std::string& exe() const { return exe_; }
		const std::vector<std::string>& exe_args() const { return exe_args_; }
		const RunArgs& run_args() const { return run_args_; }
		const EnvVars& env_vars() const { return env_vars_; }

		/// Full launch argv: [run command, run args..., exe, exe args...]
		std::vector<std::string> Format() const;

	protected:
		RunSettings(const RunSettings&) = default;
		RunSettings& operator=(const RunSettings&) = default;

		/// Launcher flags rendered in the family's syntax
		virtual std::vector<std::string> FormatRunArgs() const { return {}; }

		static void CheckPositive(const char* what, int value);
		static std::string JoinHosts(const std::vector<std::string>& hosts);

		std::string exe_;
		std::vector<std::string> exe_args_;
		RunArgs run_args_;
		EnvVars env_vars_;
};

/**
 * Settings for the Cray ALPS launcher.
 * Long flags render as --key=value, single letter flags as -k value.
 */
class AprunSettings : public RunSettings {
	public:
		using RunSettings::RunSettings;

		std::unique_ptr<RunSettings> Clone() const override;
		std::optional<RunCommand> run_command() const override { return RunCommand::APRUN; }

		void SetTasks(int tasks) override;
		void SetTasksPerNode(int tasks_per_node) override;
		void SetCpusPerTask(int cpus_per_task) override;
		void SetHostlist(const std::vector<std::string>& hosts) override;

	protected:
		std::vector<std::string> FormatRunArgs() const override;
};

/**
 * Settings for OpenMPI's mpirun.
 * Flags render as separate tokens: -k value / --key value.
 */
class MpirunSettings : public RunSettings {
	public:
		using RunSettings::RunSettings;

		std::unique_ptr<RunSettings> Clone() const override;
		std::optional<RunCommand> run_command() const override { return RunCommand::MPIRUN; }

		void SetTasks(int tasks) override;
		void SetTasksPerNode(int tasks_per_node) override;
		void SetCpusPerTask(int cpus_per_task) override;
		void SetHostlist(const std::vector<std::string>& hosts) override;

	protected:
		std::vector<std::string> FormatRunArgs() const override;
};

/// Construct the settings subtype for a run command family
std::unique_ptr<RunSettings> MakeRunSettings(RunCommand cmd,
		std::string exe,
		std::vector<std::string> exe_args = {},
		RunArgs run_args = {});

} // namespace Mosaic

#endif // MOSAIC_RUN_SETTINGS_H_
