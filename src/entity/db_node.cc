#include "db_node.h"

#include "absl/strings/str_cat.h"

#include "../common/errors.h"

namespace Mosaic {

DBNode::DBNode(std::string name,
		std::string path,
		std::unique_ptr<RunSettings> run_settings,
		std::vector<int> ports) :
	Entity(std::move(name), std::move(path), std::move(run_settings)),
	ports_(std::move(ports)) {}

void DBNode::SetHost(const std::string& host) {
	if (host.empty()) {
		throw TypeError("Host name for database node '" + name_ + "' must not be empty");
	}
	host_ = host;
}

const std::string& DBNode::GetHost() const {
	if (!host_.has_value()) {
		throw ConfigurationError("Database node '" + name_ + "' has no host assigned");
	}
	return *host_;
}

std::vector<std::string> DBNode::GetAddresses() const {
	const std::string& host = GetHost();
	std::vector<std::string> addresses;
	addresses.reserve(ports_.size());
	for (int port : ports_) {
		addresses.push_back(absl::StrCat(host, ":", port));
	}
	return addresses;
}

} // namespace Mosaic
