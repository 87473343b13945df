#ifndef MOSAIC_ORCHESTRATOR_H_
#define MOSAIC_ORCHESTRATOR_H_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "../entity/db_node.h"
#include "../settings/batch_settings.h"
#include "../settings/run_command.h"
#include "../settings/run_settings.h"

namespace Mosaic {

/// Declarative description of a database deployment
struct OrchestratorOptions {
	std::string name = "orchestrator";
	/// Defaults to the configured database port
	std::optional<int> port;
	int db_nodes = 1;
	/// Submit as a batch job instead of using an existing allocation; configured default
	std::optional<bool> batch;
	/// Empty means no explicit placement
	std::vector<std::string> hosts;
	/// "aprun" or "mpirun"; configured default
	std::optional<std::string> run_command;
	std::optional<std::string> account;
	std::optional<std::string> time;
	std::optional<std::string> queue;
	/// Extra launcher flags for every node
	RunArgs run_args;
	// Database module threading
	std::optional<int> threads_per_queue;
	std::optional<int> inter_op_threads;
	std::optional<int> intra_op_threads;
	/// Working directory, defaults to the current directory
	std::optional<std::string> path;
};

/**
 * Resolved placement of a distributed key-value store: one DBNode per
 * database process, the shared port list and the optional batch job
 * wrapping them.
 *
 * Scheduler specific subclasses build the nodes in their constructor.
 * A node count of two is rejected for every scheduler since the
 * clustering protocol needs at least three members; three or more
 * nodes run in cluster mode.
 */
class Orchestrator {
	public:
		virtual ~Orchestrator() = default;

		Orchestrator(const Orchestrator&) = delete;
		Orchestrator& operator=(const Orchestrator&) = delete;

		const std::string& name() const { return name_; }
		const std::string& path() const { return path_; }

		/// Change the working directory of the orchestrator and every node
		void SetPath(const std::string& path);

		int db_nodes() const { return db_nodes_; }
		bool IsClustered() const { return cluster_; }
		bool batch() const { return batch_; }
		RunCommand run_command() const { return run_command_; }
		int port() const { return port_; }
		const std::vector<int>& Ports() const { return ports_; }

		const std::vector<std::unique_ptr<DBNode>>& Nodes() const { return nodes_; }
		size_t size() const { return nodes_.size(); }
		auto begin() const { return nodes_.begin(); }
		auto end() const { return nodes_.end(); }

		/// nullptr unless launching as batch
		const BatchSettings* batch_settings() const { return batch_settings_.get(); }

		/**
		 * "host:port" of every node, in node order
		 * @throws ConfigurationError if a node has no host yet
		 */
		std::vector<std::string> GetAddresses() const;

		/**
		 * Place nodes on hosts, first host to first node.
		 * An empty list places nothing.
		 * @throws TypeError for an empty host name
		 */
		void SetHosts(const std::vector<std::string>& hosts);

		/// Whitespace is stripped; equivalent to a one-host list
		void SetHost(const std::string& host);

		/**
		 * Host list from a document value: a string or a list of strings
		 * @throws TypeError for any other shape
		 */
		void SetHostsFromYaml(const YAML::Node& hosts);

		/// Number of CPUs available to each database shard
		virtual void SetCpus(int num_cpus) = 0;

		/// @throws ConfigurationError if not launching as batch
		virtual void SetWalltime(const std::string& walltime) = 0;

		/// @throws ConfigurationError if not launching as batch
		virtual void SetBatchArg(const std::string& key, std::optional<std::string> value = std::nullopt) = 0;

	protected:
		/**
		 * Resolve defaults from the configuration and check the node count
		 * @throws TopologyConstraintError if db_nodes is 2
		 * @throws ConfigurationError if db_nodes < 1 or the port is out of range
		 * @throws UnsupportedCapabilityError for an unknown run command
		 */
		explicit Orchestrator(const OrchestratorOptions& options);

		/// Called by SetHosts after the host list has been validated
		virtual void AssignHosts(const std::vector<std::string>& hosts) = 0;

		/// Database process arguments shared by every node
		std::vector<std::string> GetDatabaseArgs() const;

		/// Flags that make a node join the cluster
		static std::vector<std::string> GetClusterArgs(const std::string& node_name, int port);

		std::vector<std::string> GetAIModuleArgs() const;
		std::vector<std::string> GetIPModuleArgs() const;

		std::string name_;
		std::string path_;
		int port_;
		int db_nodes_;
		bool cluster_;
		bool batch_;
		RunCommand run_command_;
		std::optional<int> threads_per_queue_;
		std::optional<int> inter_op_threads_;
		std::optional<int> intra_op_threads_;

		std::vector<std::unique_ptr<DBNode>> nodes_;
		std::vector<int> ports_;
		std::unique_ptr<BatchSettings> batch_settings_;
};

} // namespace Mosaic

#endif // MOSAIC_ORCHESTRATOR_H_
