#include "ensemble.h"

#include <filesystem>

#include <glog/logging.h>

#include "../common/configuration.h"
#include "../common/errors.h"

namespace Mosaic {

Ensemble::Ensemble(std::string name, ParameterSpace params, EnsembleOptions options) :
	name_(std::move(name)),
	path_(options.path.has_value() ? *options.path : std::filesystem::current_path().string()),
	params_(std::move(params)),
	run_settings_(std::move(options.run_settings)),
	batch_settings_(std::move(options.batch_settings)),
	strategy_(ResolveStrategy(options.strategy)) {
	if (name_.empty()) {
		throw ConfigurationError("Ensemble name must not be empty");
	}
	InitializeModels(options);
}

PermutationStrategy Ensemble::ResolveStrategy(const std::optional<StrategyChoice>& choice) {
	if (!choice.has_value()) {
		return PermutationStrategy::FromName(GetConfig().getStrategy());
	}
	if (const auto* strategy_name = std::get_if<std::string>(&*choice)) {
		return PermutationStrategy::FromName(*strategy_name);
	}
	return std::get<PermutationStrategy>(*choice);
}

void Ensemble::InitializeModels(const EnsembleOptions& options) {
	// Parameterized expansion: one member per assignment
	if (!params_.empty()) {
		if (!run_settings_) {
			throw ConfigurationError("Ensembles supplied with parameters must be provided run settings");
		}
		auto assignments = strategy_.Expand(params_, options.strategy_options);
		for (size_t i = 0; i < assignments.size(); ++i) {
			CreateMember(i, std::move(assignments[i]));
		}
		LOG(INFO) << "Ensemble " << name_ << ": " << models_.size() << " member(s) from "
			<< params_.size() << " parameter(s) using " << strategy_.name();
		return;
	}

	// Replica expansion: identical members
	if (run_settings_) {
		int replicas = options.replicas.value_or(0);
		if (replicas < 0) {
			throw ConfigurationError("Ensemble replica count must not be negative, got " + std::to_string(replicas));
		}
		if (replicas == 0) {
			throw ConfigurationError("Ensembles without parameters or replicas to expand into members "
					"cannot be given run settings");
		}
		for (int i = 0; i < replicas; ++i) {
			CreateMember(static_cast<size_t>(i), ParamAssignment{});
		}
		LOG(INFO) << "Ensemble " << name_ << ": " << replicas << " replica(s)";
		return;
	}

	if (!batch_settings_) {
		throw ConfigurationError("Ensemble must be provided batch settings or run settings");
	}
	LOG(INFO) << "Empty ensemble " << name_ << " created for batch launch";
}

void Ensemble::CreateMember(size_t index, ParamAssignment params) {
	std::string model_name = name_ + "_" + std::to_string(index);
	auto model = std::make_unique<Model>(model_name, std::move(params), path_, run_settings_->Clone());
	model->EnableKeyPrefixing();
	VLOG(1) << "\t[Ensemble]\tCreated member " << model_name << " in " << name_;
	AddModel(std::move(model));
}

Model& Ensemble::GetModel(const std::string& name) const {
	for (const auto& model : models_) {
		if (model->name() == name) return *model;
	}
	throw ConfigurationError("Ensemble '" + name_ + "' has no member named '" + name + "'");
}

void Ensemble::AddModel(std::unique_ptr<Model> model) {
	if (!model) {
		throw TypeError("Argument to AddModel must be a Model, got null");
	}
	if (model_names_.contains(model->name())) {
		throw DuplicateEntityError("Model " + model->name() + " already exists in ensemble " + name_);
	}
	model_names_.insert(model->name());
	models_.push_back(std::move(model));
}

void Ensemble::EnableKeyPrefixing() {
	for (auto& model : models_) {
		model->EnableKeyPrefixing();
	}
}

bool Ensemble::QueryKeyPrefixing() const {
	for (const auto& model : models_) {
		if (!model->QueryKeyPrefixing()) return false;
	}
	return true;
}

void Ensemble::RegisterIncomingEntity(const Entity& incoming) {
	for (auto& model : models_) {
		model->RegisterIncomingEntity(incoming);
	}
}

} // namespace Mosaic
