#include "run_command.h"

#include "../common/errors.h"

namespace Mosaic {

const char* RunCommandName(RunCommand cmd) {
	switch (cmd) {
		case RunCommand::APRUN:
			return "aprun";
		case RunCommand::MPIRUN:
			return "mpirun";
	}
	return "unknown";
}

std::vector<std::string> RunCommandNames() {
	return {RunCommandName(RunCommand::APRUN), RunCommandName(RunCommand::MPIRUN)};
}

std::optional<RunCommand> TryParseRunCommand(const std::string& value) {
	if (value == "aprun") return RunCommand::APRUN;
	if (value == "mpirun") return RunCommand::MPIRUN;
	return std::nullopt;
}

RunCommand ParseRunCommand(const std::string& value) {
	auto cmd = TryParseRunCommand(value);
	if (!cmd.has_value()) {
		throw UnsupportedCapabilityError("Run command '" + value + "' is not a supported launch binary",
				RunCommandNames());
	}
	return *cmd;
}

} // namespace Mosaic
