#ifndef MOSAIC_RUN_COMMAND_H_
#define MOSAIC_RUN_COMMAND_H_

#include <optional>
#include <string>
#include <vector>

namespace Mosaic {

/// Launch binary families Mosaic can build settings for
enum class RunCommand {
	APRUN,   // Cray ALPS
	MPIRUN   // OpenMPI
};

const char* RunCommandName(RunCommand cmd);

/// All accepted run command spellings, in declaration order
std::vector<std::string> RunCommandNames();

std::optional<RunCommand> TryParseRunCommand(const std::string& value);

/// @throws UnsupportedCapabilityError listing RunCommandNames()
RunCommand ParseRunCommand(const std::string& value);

} // namespace Mosaic

#endif // MOSAIC_RUN_COMMAND_H_
