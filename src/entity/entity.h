#ifndef MOSAIC_ENTITY_H_
#define MOSAIC_ENTITY_H_

#include <memory>
#include <string>

#include "../settings/run_settings.h"

namespace Mosaic {

/**
 * Anything a launcher can start: a name unique within its owner,
 * a working directory and the settings describing the launch.
 * Entities compare equal by name.
 */
class Entity {
	public:
		/**
		 * @param name Identity within the owning collection
		 * @param path Working directory
		 * @param run_settings Owned launch settings, must not be null
		 * @throws TypeError if run_settings is null
		 */
		Entity(std::string name, std::string path, std::unique_ptr<RunSettings> run_settings);
		virtual ~Entity() = default;

		Entity(const Entity&) = delete;
		Entity& operator=(const Entity&) = delete;

		const std::string& name() const { return name_; }
		const std::string& path() const { return path_; }
		void SetPath(const std::string& path) { path_ = path; }

		const RunSettings& run_settings() const { return *run_settings_; }
		RunSettings& run_settings() { return *run_settings_; }

		bool operator==(const Entity& other) const { return name_ == other.name_; }
		bool operator!=(const Entity& other) const { return !(*this == other); }

	protected:
		std::string name_;
		std::string path_;
		std::unique_ptr<RunSettings> run_settings_;
};

} // namespace Mosaic

#endif // MOSAIC_ENTITY_H_
