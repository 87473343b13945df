#ifndef MOSAIC_PBS_ORCHESTRATOR_H_
#define MOSAIC_PBS_ORCHESTRATOR_H_

#include "orchestrator.h"

namespace Mosaic {

/**
 * Orchestrator for PBSPro systems.
 *
 * Launches as a batch job by default; with batch disabled the nodes
 * run inside an existing interactive allocation. Only one database
 * per compute node is supported. The mpirun family cannot discover
 * placement on its own, so it requires explicit hosts.
 */
class PBSOrchestrator : public Orchestrator {
	public:
		/// Per run-command behavior consulted while composing and placing nodes
		struct LauncherPolicy {
			RunCommand command;
			std::unique_ptr<RunSettings> (*build_settings)(std::string exe,
					std::vector<std::string> exe_args,
					const RunArgs& run_args);
			/// Composition fails without explicit hosts
			bool requires_hosts;
			/// Per-node host lists are passed to the launcher inside a batch job.
			/// aprun rejects them there and relies on the batch placement instead.
			bool hostlist_in_batch;
		};

		static const LauncherPolicy& Policy(RunCommand command);

		/**
		 * @throws TopologyConstraintError for 2 nodes, or for mpirun without hosts
		 * @throws UnsupportedCapabilityError for a run command other than aprun/mpirun
		 */
		explicit PBSOrchestrator(const OrchestratorOptions& options);

		/// nullptr unless launching as batch
		const QsubBatchSettings* qsub_settings() const {
			return static_cast<const QsubBatchSettings*>(batch_settings_.get());
		}

		/// In batch mode also raises the ncpus request of the job
		void SetCpus(int num_cpus) override;
		void SetWalltime(const std::string& walltime) override;

		/// Store a qsub directive, e.g. SetBatchArg("A", "project")
		void SetBatchArg(const std::string& key, std::optional<std::string> value = std::nullopt) override;

	protected:
		void AssignHosts(const std::vector<std::string>& hosts) override;

	private:
		void InitializeNodes(const OrchestratorOptions& options);
		std::unique_ptr<QsubBatchSettings> BuildBatchSettings(const OrchestratorOptions& options) const;
};

} // namespace Mosaic

#endif // MOSAIC_PBS_ORCHESTRATOR_H_
