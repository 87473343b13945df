#ifndef MOSAIC_MODEL_H_
#define MOSAIC_MODEL_H_

#include <string>
#include <vector>

#include "entity.h"
#include "param_value.h"

namespace Mosaic {

/**
 * One concrete run of a simulation or analysis program with a fixed
 * parameter assignment
 */
class Model : public Entity {
	public:
		Model(std::string name,
				ParamAssignment params,
				std::string path,
				std::unique_ptr<RunSettings> run_settings);

		const ParamAssignment& params() const { return params_; }

		/// Prefix keys this model writes to the database with its own name
		void EnableKeyPrefixing() { key_prefixing_enabled_ = true; }
		void DisableKeyPrefixing() { key_prefixing_enabled_ = false; }
		bool QueryKeyPrefixing() const { return key_prefixing_enabled_; }

		/**
		 * Record that this model will read data produced by another entity.
		 * The peer's name is the key prefix used to resolve its data later.
		 * Multiple peers accumulate in registration order.
		 */
		void RegisterIncomingEntity(const Entity& incoming);
		const std::vector<std::string>& incoming_entities() const { return incoming_entities_; }

		/**
		 * Append "--<name> <value>" to the executable arguments for each
		 * named parameter, in the order given
		 * @throws ConfigurationError if a name is not one of this model's parameters
		 */
		void ParamsToArgs(const std::vector<std::string>& names);

	private:
		ParamAssignment params_;
		bool key_prefixing_enabled_ = false;
		std::vector<std::string> incoming_entities_;
};

} // namespace Mosaic

#endif // MOSAIC_MODEL_H_
