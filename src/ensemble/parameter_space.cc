#include "parameter_space.h"

#include <algorithm>

#include <glog/logging.h>

#include "../common/errors.h"

namespace Mosaic {

std::optional<ParamValue> ParamValueFromYaml(const YAML::Node& node) {
	if (!node.IsScalar()) {
		return std::nullopt;
	}
	// "!" is the non-specific tag the parser gives quoted scalars
	if (node.Tag() != "!") {
		int64_t as_int;
		if (YAML::convert<int64_t>::decode(node, as_int)) {
			return ParamValue(as_int);
		}
	}
	return ParamValue(node.Scalar());
}

std::optional<ParamValue> ParamValueFromYaml(const YAML::Node& node,
		const std::vector<ParamValue>& candidates) {
	if (!node.IsScalar()) {
		return std::nullopt;
	}
	if (node.Tag() == "!") {
		return ParamValue(node.Scalar());
	}
	auto is_candidate = [&candidates](const ParamValue& value) {
		return std::find(candidates.begin(), candidates.end(), value) != candidates.end();
	};
	int64_t as_int;
	if (YAML::convert<int64_t>::decode(node, as_int) && is_candidate(ParamValue(as_int))) {
		return ParamValue(as_int);
	}
	ParamValue as_string(node.Scalar());
	if (is_candidate(as_string)) {
		return as_string;
	}
	return ParamValueFromYaml(node);
}

YAML::Node ParamValueToYaml(const ParamValue& value) {
	if (const auto* i = std::get_if<int64_t>(&value)) {
		return YAML::Node(*i);
	}
	YAML::Node node(std::get<std::string>(value));
	node.SetTag("!");
	return node;
}

YAML::Node AssignmentToYaml(const ParamAssignment& assignment) {
	YAML::Node node(YAML::NodeType::Map);
	for (const auto& [name, value] : assignment) {
		node[name] = ParamValueToYaml(value);
	}
	return node;
}

ParameterSpace ParameterSpace::FromYaml(const YAML::Node& params) {
	ParameterSpace space;
	if (!params.IsDefined() || params.IsNull()) {
		return space;
	}
	if (!params.IsMap()) {
		throw TypeError("Ensemble parameters must be a mapping of name to value or list of values");
	}
	for (const auto& entry : params) {
		space.Add(entry.first.as<std::string>(), entry.second);
	}
	return space;
}

void ParameterSpace::Add(const std::string& name, std::vector<ParamValue> values) {
	if (values.empty()) {
		throw ConfigurationError("Parameter '" + name + "' must have at least one value");
	}
	if (!index_.insert(name).second) {
		throw DuplicateEntityError("Parameter '" + name + "' is already defined");
	}
	VLOG(2) << "\t[ParameterSpace]\t" << name << ": " << values.size() << " value(s)";
	names_.push_back(name);
	values_.push_back(std::move(values));
}

void ParameterSpace::Add(const std::string& name, ParamValue value) {
	Add(name, std::vector<ParamValue>{std::move(value)});
}

void ParameterSpace::Add(const std::string& name, const YAML::Node& value) {
	if (value.IsScalar()) {
		Add(name, *ParamValueFromYaml(value));
		return;
	}
	if (!value.IsSequence()) {
		throw TypeError("Incorrect type for ensemble parameter '" + name +
				"': must be a list, integer or string");
	}
	std::vector<ParamValue> values;
	values.reserve(value.size());
	for (const auto& element : value) {
		auto decoded = ParamValueFromYaml(element);
		if (!decoded.has_value()) {
			throw TypeError("Incorrect type in values of ensemble parameter '" + name +
					"': list elements must be integers or strings");
		}
		values.push_back(std::move(*decoded));
	}
	Add(name, std::move(values));
}

} // namespace Mosaic
