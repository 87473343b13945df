#include "batch_settings.h"

#include <glog/logging.h>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

#include "../common/errors.h"

namespace Mosaic {

BatchSettings::BatchSettings(std::string batch_cmd, BatchArgs batch_args) :
	batch_cmd_(std::move(batch_cmd)),
	batch_args_(std::move(batch_args)) {}

std::unique_ptr<BatchSettings> BatchSettings::Clone() const {
	return std::unique_ptr<BatchSettings>(new BatchSettings(*this));
}

// The generic scheduler has no dedicated resource syntax, so everything
// lands in the free directive table.
void BatchSettings::SetNodes(int nodes) {
	SetBatchArg("nodes", std::to_string(nodes));
}

void BatchSettings::SetNcpus(int ncpus) {
	SetBatchArg("ncpus", std::to_string(ncpus));
}

void BatchSettings::SetWalltime(const std::string& walltime) {
	SetBatchArg("time", walltime);
}

void BatchSettings::SetHostlist(const std::vector<std::string>& hosts) {
	SetBatchArg("hosts", absl::StrJoin(hosts, ","));
}

void BatchSettings::SetQueue(const std::string& queue) {
	SetBatchArg("queue", queue);
}

void BatchSettings::SetAccount(const std::string& account) {
	SetBatchArg("account", account);
}

void BatchSettings::SetBatchArg(const std::string& key, std::optional<std::string> value) {
	if (key.empty()) {
		throw ConfigurationError("Batch argument name must not be empty");
	}
	batch_args_[key] = std::move(value);
}

std::vector<std::string> BatchSettings::FormatBatchArgs() const {
	std::vector<std::string> lines;
	for (const auto& [key, value] : batch_args_) {
		std::string line = (key.size() == 1 ? "-" : "--") + key;
		if (value.has_value()) absl::StrAppend(&line, " ", *value);
		lines.push_back(std::move(line));
	}
	return lines;
}

//----------------------------------------------------------------------------
// qsub
//----------------------------------------------------------------------------

QsubBatchSettings::QsubBatchSettings(int nodes,
		int ncpus,
		std::optional<std::string> time,
		std::optional<std::string> queue,
		std::optional<std::string> account,
		BatchArgs batch_args) :
	BatchSettings("qsub", std::move(batch_args)),
	nodes_(1),
	ncpus_(1),
	walltime_(std::move(time)),
	queue_(std::move(queue)),
	account_(std::move(account)) {
	SetNodes(nodes);
	SetNcpus(ncpus);
}

std::unique_ptr<BatchSettings> QsubBatchSettings::Clone() const {
	return std::make_unique<QsubBatchSettings>(*this);
}

void QsubBatchSettings::SetNodes(int nodes) {
	if (nodes < 1) {
		throw ConfigurationError("qsub node count must be at least 1, got " + std::to_string(nodes));
	}
	nodes_ = nodes;
}

void QsubBatchSettings::SetNcpus(int ncpus) {
	if (ncpus < 1) {
		throw ConfigurationError("qsub ncpus must be at least 1, got " + std::to_string(ncpus));
	}
	ncpus_ = ncpus;
}

void QsubBatchSettings::SetWalltime(const std::string& walltime) {
	walltime_ = walltime;
}

void QsubBatchSettings::SetHostlist(const std::vector<std::string>& hosts) {
	for (const auto& host : hosts) {
		if (host.empty()) {
			throw TypeError("Host list must not contain empty host names");
		}
	}
	hosts_ = hosts;
}

void QsubBatchSettings::SetQueue(const std::string& queue) {
	queue_ = queue;
}

void QsubBatchSettings::SetAccount(const std::string& account) {
	account_ = account;
}

std::string QsubBatchSettings::SelectStatement() const {
	if (hosts_.empty()) {
		return absl::StrCat("select=", nodes_, ":ncpus=", ncpus_);
	}
	// One chunk per named host
	if (static_cast<int>(hosts_.size()) != nodes_) {
		LOG(WARNING) << "qsub host list has " << hosts_.size() << " hosts for " << nodes_
			<< " nodes, selecting by host list";
	}
	std::vector<std::string> chunks;
	chunks.reserve(hosts_.size());
	for (const auto& host : hosts_) {
		chunks.push_back(absl::StrCat("1:ncpus=", ncpus_, ":host=", host));
	}
	return "select=" + absl::StrJoin(chunks, "+");
}

std::vector<std::string> QsubBatchSettings::FormatBatchArgs() const {
	std::vector<std::string> lines;
	lines.push_back("#PBS -l " + SelectStatement());
	lines.push_back("#PBS -l place=scatter");
	if (walltime_.has_value()) lines.push_back("#PBS -l walltime=" + *walltime_);
	if (queue_.has_value()) lines.push_back("#PBS -q " + *queue_);
	if (account_.has_value()) lines.push_back("#PBS -A " + *account_);
	for (const auto& [key, value] : batch_args_) {
		std::string line = "#PBS -" + key;
		if (value.has_value()) absl::StrAppend(&line, " ", *value);
		lines.push_back(std::move(line));
	}
	return lines;
}

} // namespace Mosaic
