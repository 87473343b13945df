#include "model.h"

#include <glog/logging.h>

#include "../common/errors.h"

namespace Mosaic {

Model::Model(std::string name,
		ParamAssignment params,
		std::string path,
		std::unique_ptr<RunSettings> run_settings) :
	Entity(std::move(name), std::move(path), std::move(run_settings)),
	params_(std::move(params)) {}

void Model::RegisterIncomingEntity(const Entity& incoming) {
	VLOG(2) << "\t[Model]\t" << name_ << " receives data from " << incoming.name();
	incoming_entities_.push_back(incoming.name());
}

void Model::ParamsToArgs(const std::vector<std::string>& names) {
	std::vector<std::string> args;
	for (const auto& param : names) {
		auto it = params_.find(param);
		if (it == params_.end()) {
			throw ConfigurationError("Model '" + name_ + "' has no parameter named '" + param + "'");
		}
		args.push_back("--" + param);
		args.push_back(ParamValueToString(it->second));
	}
	run_settings_->AddExeArgs(args);
}

} // namespace Mosaic
