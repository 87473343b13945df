#ifndef MOSAIC_PARAMETER_SPACE_H_
#define MOSAIC_PARAMETER_SPACE_H_

#include <optional>
#include <string>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include <yaml-cpp/yaml.h>

#include "../entity/param_value.h"

namespace Mosaic {

using ParamNames = std::vector<std::string>;
using ParamValueLists = std::vector<std::vector<ParamValue>>;

/**
 * Validated parameter map, normalized into parallel name and
 * candidate-value arrays that keep insertion order
 */
class ParameterSpace {
	public:
		ParameterSpace() = default;

		/**
		 * Build from a YAML mapping of name -> scalar | [scalars].
		 * A null or undefined node yields an empty space.
		 * @throws TypeError if params is not a mapping or a value has another shape
		 * @throws ConfigurationError if a value list is empty
		 */
		static ParameterSpace FromYaml(const YAML::Node& params);

		/**
		 * Add a parameter with its candidate values
		 * @throws ConfigurationError if values is empty
		 * @throws DuplicateEntityError if name is already present
		 */
		void Add(const std::string& name, std::vector<ParamValue> values);

		/// A bare scalar is a one-element candidate list
		void Add(const std::string& name, ParamValue value);

		/**
		 * Add from a YAML value: a scalar or a sequence of scalars
		 * @throws TypeError naming the key for any other shape
		 */
		void Add(const std::string& name, const YAML::Node& value);

		bool empty() const { return names_.empty(); }
		size_t size() const { return names_.size(); }

		const ParamNames& Names() const { return names_; }
		const ParamValueLists& Values() const { return values_; }

	private:
		ParamNames names_;
		ParamValueLists values_;
		absl::flat_hash_set<std::string> index_;
};

/**
 * Decode a YAML scalar. Plain scalars that parse fully as an integer
 * become integers; quoted scalars and everything else stay strings.
 * @return nullopt if node is not a scalar
 */
std::optional<ParamValue> ParamValueFromYaml(const YAML::Node& node);

/**
 * Decode a scalar bound to a parameter with the given candidate values.
 * Nodes assembled in code carry no tag, so numeric-looking text takes
 * the reading found among the candidates, the integer one first. Quoted
 * scalars always stay strings. Without a matching candidate this falls
 * back to the single-argument rule.
 */
std::optional<ParamValue> ParamValueFromYaml(const YAML::Node& node,
		const std::vector<ParamValue>& candidates);

/// Strings are tagged non-specific so they are not re-read as integers
YAML::Node ParamValueToYaml(const ParamValue& value);

YAML::Node AssignmentToYaml(const ParamAssignment& assignment);

} // namespace Mosaic

#endif // MOSAIC_PARAMETER_SPACE_H_
