#ifndef MOSAIC_STRATEGIES_H_
#define MOSAIC_STRATEGIES_H_

#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include <yaml-cpp/yaml.h>

#include "parameter_space.h"

namespace Mosaic {

/// Largest number of assignments a built-in expansion may produce
constexpr size_t kMaxAssignments = 1000000;

/// Options forwarded to a permutation strategy
struct StrategyOptions {
	/// Number of assignments to draw (required by random)
	std::optional<size_t> count;
	/// Seed for random; nondeterministic when absent
	std::optional<uint64_t> seed;
	/// Free-form options for user strategies
	absl::flat_hash_map<std::string, std::string> extra;
};

/**
 * User strategy. Must return a YAML sequence of mappings, each binding
 * every parameter name to one scalar. Anything else is a contract violation.
 */
using CustomStrategyFn = std::function<YAML::Node(const ParamNames& names,
		const ParamValueLists& values,
		const StrategyOptions& options)>;

//----------------------------------------------------------------------------
// Built-in expansions
//----------------------------------------------------------------------------

/// Cartesian product; the last parameter varies fastest
std::vector<ParamAssignment> CreateAllPermutations(const ParamNames& names,
		const ParamValueLists& values);

/// Positional zip, truncated to the shortest list
std::vector<ParamAssignment> StepValues(const ParamNames& names,
		const ParamValueLists& values);

/// count independent draws with replacement, one value per list per draw
std::vector<ParamAssignment> RandomPermutations(const ParamNames& names,
		const ParamValueLists& values,
		size_t count,
		std::mt19937_64& rng);

/// "all_perm", "step", "random"
std::vector<std::string> BuiltinStrategyNames();

/**
 * How a parameter space is expanded into concrete assignments.
 * Built-in and user strategies share one invocation and one output
 * validation path in Expand().
 */
class PermutationStrategy {
	public:
		enum class Kind {
			ALL_PERMUTATIONS,
			STEPPED,
			RANDOM,
			CUSTOM
		};

		static PermutationStrategy AllPermutations();
		static PermutationStrategy Stepped();
		static PermutationStrategy Random();
		static PermutationStrategy Custom(std::string name, CustomStrategyFn fn);

		/**
		 * Select a built-in by name
		 * @throws UnsupportedCapabilityError listing BuiltinStrategyNames()
		 */
		static PermutationStrategy FromName(const std::string& name);

		Kind kind() const { return kind_; }
		const std::string& name() const { return name_; }

		/**
		 * Expand space into assignments and validate the result
		 * @throws ConfigurationError if random is used without options.count
		 * @throws StrategyContractError naming this strategy on malformed output
		 */
		std::vector<ParamAssignment> Expand(const ParameterSpace& space,
				const StrategyOptions& options) const;

	private:
		PermutationStrategy(Kind kind, std::string name, CustomStrategyFn fn = nullptr)
			: kind_(kind), name_(std::move(name)), fn_(std::move(fn)) {}

		std::vector<ParamAssignment> Invoke(const ParameterSpace& space,
				const StrategyOptions& options) const;
		std::vector<ParamAssignment> DecodeOutput(const YAML::Node& output, const ParameterSpace& space) const;
		void Validate(const ParamNames& names, const std::vector<ParamAssignment>& assignments) const;

		Kind kind_;
		std::string name_;
		CustomStrategyFn fn_;
};

} // namespace Mosaic

#endif // MOSAIC_STRATEGIES_H_
