#include "strategies.h"

#include <algorithm>

#include <glog/logging.h>

#include "../common/errors.h"

namespace Mosaic {

std::vector<ParamAssignment> CreateAllPermutations(const ParamNames& names,
		const ParamValueLists& values) {
	std::vector<ParamAssignment> permutations;
	for (const auto& list : values) {
		if (list.empty()) return permutations;
	}

	// Odometer over list indices, rightmost digit turns first
	std::vector<size_t> cursor(names.size(), 0);
	while (true) {
		ParamAssignment assignment;
		for (size_t i = 0; i < names.size(); ++i) {
			assignment[names[i]] = values[i][cursor[i]];
		}
		permutations.push_back(std::move(assignment));

		size_t digit = names.size();
		while (digit > 0) {
			--digit;
			if (++cursor[digit] < values[digit].size()) break;
			cursor[digit] = 0;
			if (digit == 0) return permutations;
		}
		if (names.empty()) return permutations;
	}
}

std::vector<ParamAssignment> StepValues(const ParamNames& names,
		const ParamValueLists& values) {
	std::vector<ParamAssignment> steps;
	if (names.empty()) return steps;

	size_t length = values[0].size();
	for (const auto& list : values) {
		length = std::min(length, list.size());
	}
	steps.reserve(length);
	for (size_t step = 0; step < length; ++step) {
		ParamAssignment assignment;
		for (size_t i = 0; i < names.size(); ++i) {
			assignment[names[i]] = values[i][step];
		}
		steps.push_back(std::move(assignment));
	}
	return steps;
}

std::vector<ParamAssignment> RandomPermutations(const ParamNames& names,
		const ParamValueLists& values,
		size_t count,
		std::mt19937_64& rng) {
	std::vector<ParamAssignment> draws;
	for (const auto& list : values) {
		if (list.empty()) return draws;
	}
	draws.reserve(count);
	for (size_t n = 0; n < count; ++n) {
		ParamAssignment assignment;
		for (size_t i = 0; i < names.size(); ++i) {
			std::uniform_int_distribution<size_t> pick(0, values[i].size() - 1);
			assignment[names[i]] = values[i][pick(rng)];
		}
		draws.push_back(std::move(assignment));
	}
	return draws;
}

std::vector<std::string> BuiltinStrategyNames() {
	return {"all_perm", "step", "random"};
}

PermutationStrategy PermutationStrategy::AllPermutations() {
	return PermutationStrategy(Kind::ALL_PERMUTATIONS, "all_perm");
}

PermutationStrategy PermutationStrategy::Stepped() {
	return PermutationStrategy(Kind::STEPPED, "step");
}

PermutationStrategy PermutationStrategy::Random() {
	return PermutationStrategy(Kind::RANDOM, "random");
}

PermutationStrategy PermutationStrategy::Custom(std::string name, CustomStrategyFn fn) {
	if (!fn) {
		throw TypeError("Custom permutation strategy '" + name + "' is not callable");
	}
	return PermutationStrategy(Kind::CUSTOM, std::move(name), std::move(fn));
}

PermutationStrategy PermutationStrategy::FromName(const std::string& name) {
	if (name == "all_perm") return AllPermutations();
	if (name == "step") return Stepped();
	if (name == "random") return Random();
	throw UnsupportedCapabilityError("Permutation strategy given is not supported: " + name,
			BuiltinStrategyNames());
}

std::vector<ParamAssignment> PermutationStrategy::Expand(const ParameterSpace& space,
		const StrategyOptions& options) const {
	auto assignments = Invoke(space, options);
	Validate(space.Names(), assignments);
	VLOG(1) << "\t[PermutationStrategy]\t" << name_ << " expanded " << space.size()
		<< " parameter(s) into " << assignments.size() << " assignment(s)";
	return assignments;
}

std::vector<ParamAssignment> PermutationStrategy::Invoke(const ParameterSpace& space,
		const StrategyOptions& options) const {
	switch (kind_) {
		case Kind::ALL_PERMUTATIONS: {
			size_t total = 1;
			for (const auto& list : space.Values()) {
				if (list.empty()) {
					total = 0;
					break;
				}
				if (total > kMaxAssignments / list.size()) {
					throw ConfigurationError("Permutation strategy 'all_perm' would create more than " +
							std::to_string(kMaxAssignments) + " models");
				}
				total *= list.size();
			}
			return CreateAllPermutations(space.Names(), space.Values());
		}
		case Kind::STEPPED:
			return StepValues(space.Names(), space.Values());
		case Kind::RANDOM: {
			if (!options.count.has_value()) {
				throw ConfigurationError("Permutation strategy 'random' requires a count of models to draw");
			}
			if (*options.count > kMaxAssignments) {
				throw ConfigurationError("Permutation strategy 'random' cannot draw " +
						std::to_string(*options.count) + " models, the limit is " +
						std::to_string(kMaxAssignments));
			}
			std::mt19937_64 rng(options.seed.has_value() ? *options.seed : std::random_device{}());
			return RandomPermutations(space.Names(), space.Values(), *options.count, rng);
		}
		case Kind::CUSTOM: {
			YAML::Node output;
			try {
				output = fn_(space.Names(), space.Values(), options);
			} catch (const std::exception& e) {
				throw StrategyContractError(name_, std::string("strategy raised: ") + e.what());
			}
			return DecodeOutput(output, space);
		}
	}
	throw StrategyContractError(name_, "unknown strategy kind");
}

std::vector<ParamAssignment> PermutationStrategy::DecodeOutput(const YAML::Node& output,
		const ParameterSpace& space) const {
	static const std::vector<ParamValue> kNoCandidates;
	auto candidates_of = [&space](const std::string& name) -> const std::vector<ParamValue>& {
		const auto& names = space.Names();
		auto it = std::find(names.begin(), names.end(), name);
		return it == names.end() ? kNoCandidates : space.Values()[it - names.begin()];
	};

	std::vector<ParamAssignment> assignments;
	if (output.IsNull()) {
		return assignments;
	}
	if (!output.IsSequence()) {
		throw StrategyContractError(name_, "result must be a list of parameter mappings");
	}
	assignments.reserve(output.size());
	size_t index = 0;
	for (const auto& element : output) {
		if (!element.IsMap()) {
			throw StrategyContractError(name_, "element " + std::to_string(index) +
					" of the result is not a mapping of parameter name to value");
		}
		ParamAssignment assignment;
		for (const auto& entry : element) {
			if (!entry.first.IsScalar()) {
				throw StrategyContractError(name_, "element " + std::to_string(index) +
						" has a parameter name that is not a string");
			}
			auto value = ParamValueFromYaml(entry.second, candidates_of(entry.first.Scalar()));
			if (!value.has_value()) {
				throw StrategyContractError(name_, "element " + std::to_string(index) +
						" binds '" + entry.first.Scalar() + "' to a non-scalar value");
			}
			assignment[entry.first.Scalar()] = std::move(*value);
		}
		assignments.push_back(std::move(assignment));
		++index;
	}
	return assignments;
}

void PermutationStrategy::Validate(const ParamNames& names,
		const std::vector<ParamAssignment>& assignments) const {
	for (size_t i = 0; i < assignments.size(); ++i) {
		const auto& assignment = assignments[i];
		for (const auto& name : names) {
			if (assignment.find(name) == assignment.end()) {
				throw StrategyContractError(name_, "assignment " + std::to_string(i) +
						" does not bind parameter '" + name + "'");
			}
		}
		if (assignment.size() != names.size()) {
			for (const auto& [name, value] : assignment) {
				if (std::find(names.begin(), names.end(), name) == names.end()) {
					throw StrategyContractError(name_, "assignment " + std::to_string(i) +
							" binds unknown parameter '" + name + "'");
				}
			}
		}
	}
}

} // namespace Mosaic
