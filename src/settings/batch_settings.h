#ifndef MOSAIC_BATCH_SETTINGS_H_
#define MOSAIC_BATCH_SETTINGS_H_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/container/btree_map.h"

namespace Mosaic {

/// Scheduler directive -> value. A nullopt value renders as a bare flag.
using BatchArgs = absl::btree_map<std::string, std::optional<std::string>>;

/**
 * Settings for submitting a group of entities as one workload manager job
 */
class BatchSettings {
	public:
		BatchSettings(std::string batch_cmd, BatchArgs batch_args = {});
		virtual ~BatchSettings() = default;

		virtual std::unique_ptr<BatchSettings> Clone() const;

		virtual void SetNodes(int nodes);
		virtual void SetNcpus(int ncpus);
		virtual void SetWalltime(const std::string& walltime);
		virtual void SetHostlist(const std::vector<std::string>& hosts);
		virtual void SetQueue(const std::string& queue);
		virtual void SetAccount(const std::string& account);

		/**
		 * Store an arbitrary scheduler directive
		 * @throws ConfigurationError if key is empty
		 */
		void SetBatchArg(const std::string& key, std::optional<std::string> value = std::nullopt);

		const std::string& batch_cmd() const { return batch_cmd_; }
		const BatchArgs& batch_args() const { return batch_args_; }
		BatchArgs& batch_args() { return batch_args_; }

		/// Script preamble lines, one directive per entry
		virtual std::vector<std::string> FormatBatchArgs() const;

	protected:
		BatchSettings(const BatchSettings&) = default;
		BatchSettings& operator=(const BatchSettings&) = default;

		std::string batch_cmd_;
		BatchArgs batch_args_;
};

/**
 * PBSPro qsub settings.
 * time, queue and account are passed through verbatim.
 */
class QsubBatchSettings : public BatchSettings {
	public:
		QsubBatchSettings(int nodes = 1,
				int ncpus = 1,
				std::optional<std::string> time = std::nullopt,
				std::optional<std::string> queue = std::nullopt,
				std::optional<std::string> account = std::nullopt,
				BatchArgs batch_args = {});

		std::unique_ptr<BatchSettings> Clone() const override;

		void SetNodes(int nodes) override;
		void SetNcpus(int ncpus) override;
		void SetWalltime(const std::string& walltime) override;
		void SetHostlist(const std::vector<std::string>& hosts) override;
		void SetQueue(const std::string& queue) override;
		void SetAccount(const std::string& account) override;

		int nodes() const { return nodes_; }
		int ncpus() const { return ncpus_; }
		const std::optional<std::string>& walltime() const { return walltime_; }
		const std::optional<std::string>& queue() const { return queue_; }
		const std::optional<std::string>& account() const { return account_; }
		const std::vector<std::string>& hosts() const { return hosts_; }

		/// "#PBS ..." lines: resource selection, placement, walltime, queue, account, then batch_args
		std::vector<std::string> FormatBatchArgs() const override;

	private:
		std::string SelectStatement() const;

		int nodes_;
		int ncpus_;
		std::optional<std::string> walltime_;
		std::optional<std::string> queue_;
		std::optional<std::string> account_;
		std::vector<std::string> hosts_;
};

} // namespace Mosaic

#endif // MOSAIC_BATCH_SETTINGS_H_
