#ifndef MOSAIC_ERRORS_H_
#define MOSAIC_ERRORS_H_

#include <stdexcept>
#include <string>
#include <vector>

namespace Mosaic {

/**
 * Base of every composition failure raised by Mosaic
 */
class MosaicError : public std::runtime_error {
	public:
		explicit MosaicError(const std::string& msg) : std::runtime_error(msg) {}
};

/// Declarative input is internally inconsistent
class ConfigurationError : public MosaicError {
	public:
		explicit ConfigurationError(const std::string& msg) : MosaicError(msg) {}
};

/**
 * A named choice (strategy, run command, ...) is not recognized.
 * The message always lists the accepted alternatives.
 */
class UnsupportedCapabilityError : public MosaicError {
	public:
		UnsupportedCapabilityError(const std::string& msg, std::vector<std::string> valid)
			: MosaicError(Format(msg, valid)), valid_(std::move(valid)) {}

		const std::vector<std::string>& valid() const { return valid_; }

	private:
		std::vector<std::string> valid_;

		static std::string Format(const std::string& msg, const std::vector<std::string>& valid) {
			if (valid.empty()) return msg;
			std::string out = msg + " (supported: ";
			for (size_t i = 0; i < valid.size(); ++i) {
				if (i) out += ", ";
				out += valid[i];
			}
			return out + ")";
		}
};

/**
 * A permutation strategy returned something other than a sequence of
 * name -> scalar assignments. Carries the strategy name, not the caller.
 */
class StrategyContractError : public MosaicError {
	public:
		StrategyContractError(const std::string& strategy, const std::string& detail)
			: MosaicError("Permutation strategy '" + strategy + "' broke its contract: " + detail),
			  strategy_(strategy) {}

		const std::string& strategy() const { return strategy_; }

	private:
		std::string strategy_;
};

/// An entity with an already-used name was added to a collection
class DuplicateEntityError : public MosaicError {
	public:
		explicit DuplicateEntityError(const std::string& msg) : MosaicError(msg) {}
};

/// Requested database layout cannot be deployed
class TopologyConstraintError : public MosaicError {
	public:
		explicit TopologyConstraintError(const std::string& msg) : MosaicError(msg) {}
};

/// Argument has the wrong shape (host lists, parameter values, null entities)
class TypeError : public std::invalid_argument {
	public:
		explicit TypeError(const std::string& msg) : std::invalid_argument(msg) {}
};

} // namespace Mosaic

#endif // MOSAIC_ERRORS_H_
