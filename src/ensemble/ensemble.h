#ifndef MOSAIC_ENSEMBLE_H_
#define MOSAIC_ENSEMBLE_H_

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "absl/container/flat_hash_set.h"

#include "../entity/model.h"
#include "../settings/batch_settings.h"
#include "../settings/run_settings.h"
#include "parameter_space.h"
#include "strategies.h"

namespace Mosaic {

/// A built-in strategy name or a ready strategy object
using StrategyChoice = std::variant<std::string, PermutationStrategy>;

struct EnsembleOptions {
	/// Template cloned into every member; required when parameters are given
	std::unique_ptr<RunSettings> run_settings;
	/// Submit the whole ensemble as one batch job
	std::unique_ptr<BatchSettings> batch_settings;
	/// Defaults to the configured strategy name
	std::optional<StrategyChoice> strategy;
	/// Number of identical members when there are no parameters. 0 means none.
	std::optional<int> replicas;
	StrategyOptions strategy_options;
	/// Working directory for members, defaults to the current directory
	std::optional<std::string> path;
};

/**
 * A named, ordered group of Model instances expanded from a parameter
 * space or replicated from a single template.
 *
 * Composition happens in the constructor and either yields a fully
 * populated ensemble or throws. Member names are {name}_{index} in
 * expansion order and are unique within the ensemble.
 */
class Ensemble {
	public:
		/**
		 * @param name Ensemble name, prefix of every member name
		 * @param params Parameter space to expand, may be empty
		 * @param options Settings templates, strategy and replica count
		 * @throws ConfigurationError if the inputs do not describe anything launchable
		 * @throws UnsupportedCapabilityError for an unknown strategy name
		 * @throws StrategyContractError if the strategy output is malformed
		 */
		Ensemble(std::string name, ParameterSpace params, EnsembleOptions options);

		Ensemble(const Ensemble&) = delete;
		Ensemble& operator=(const Ensemble&) = delete;
		Ensemble(Ensemble&&) = default;
		Ensemble& operator=(Ensemble&&) = default;

		const std::string& name() const { return name_; }
		const std::string& path() const { return path_; }
		const ParameterSpace& params() const { return params_; }
		const PermutationStrategy& strategy() const { return strategy_; }

		/// nullptr when not given
		const RunSettings* run_settings() const { return run_settings_.get(); }
		const BatchSettings* batch_settings() const { return batch_settings_.get(); }
		BatchSettings* batch_settings() { return batch_settings_.get(); }

		const std::vector<std::unique_ptr<Model>>& Models() const { return models_; }
		size_t size() const { return models_.size(); }
		bool empty() const { return models_.empty(); }

		auto begin() const { return models_.begin(); }
		auto end() const { return models_.end(); }

		/// @throws ConfigurationError if no member has that name
		Model& GetModel(const std::string& name) const;

		/**
		 * Add a member
		 * @throws TypeError if model is null
		 * @throws DuplicateEntityError if a member with the same name exists
		 */
		void AddModel(std::unique_ptr<Model> model);

		void EnableKeyPrefixing();

		/// True only if every member prefixes its keys
		bool QueryKeyPrefixing() const;

		/// Every member will read data produced by incoming
		void RegisterIncomingEntity(const Entity& incoming);

	private:
		void InitializeModels(const EnsembleOptions& options);
		void CreateMember(size_t index, ParamAssignment params);

		static PermutationStrategy ResolveStrategy(const std::optional<StrategyChoice>& choice);

		std::string name_;
		std::string path_;
		ParameterSpace params_;
		std::unique_ptr<RunSettings> run_settings_;
		std::unique_ptr<BatchSettings> batch_settings_;
		PermutationStrategy strategy_;

		std::vector<std::unique_ptr<Model>> models_;
		absl::flat_hash_set<std::string> model_names_;
};

} // namespace Mosaic

#endif // MOSAIC_ENSEMBLE_H_
