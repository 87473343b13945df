#ifndef MOSAIC_DB_NODE_H_
#define MOSAIC_DB_NODE_H_

#include <optional>
#include <string>
#include <vector>

#include "entity.h"

namespace Mosaic {

/// Placement of a single database process
class DBNode : public Entity {
	public:
		DBNode(std::string name,
				std::string path,
				std::unique_ptr<RunSettings> run_settings,
				std::vector<int> ports);

		/// Bind the node to a compute host
		void SetHost(const std::string& host);

		const std::optional<std::string>& host() const { return host_; }

		/// @throws ConfigurationError if no host has been assigned yet
		const std::string& GetHost() const;

		const std::vector<int>& ports() const { return ports_; }

		/// "host:port" for every bound port
		std::vector<std::string> GetAddresses() const;

	private:
		std::optional<std::string> host_;
		std::vector<int> ports_;
};

} // namespace Mosaic

#endif // MOSAIC_DB_NODE_H_
