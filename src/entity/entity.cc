#include "entity.h"

#include "../common/errors.h"

namespace Mosaic {

Entity::Entity(std::string name, std::string path, std::unique_ptr<RunSettings> run_settings) :
	name_(std::move(name)),
	path_(std::move(path)),
	run_settings_(std::move(run_settings)) {
	if (name_.empty()) {
		throw ConfigurationError("Entity name must not be empty");
	}
	if (!run_settings_) {
		throw TypeError("Entity '" + name_ + "' requires run settings");
	}
}

} // namespace Mosaic
