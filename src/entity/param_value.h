#ifndef MOSAIC_PARAM_VALUE_H_
#define MOSAIC_PARAM_VALUE_H_

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "absl/container/btree_map.h"

namespace Mosaic {

/// A single concrete parameter value
using ParamValue = std::variant<int64_t, std::string>;

/// One value per parameter name
using ParamAssignment = absl::btree_map<std::string, ParamValue>;

inline std::string ParamValueToString(const ParamValue& value) {
	if (const auto* i = std::get_if<int64_t>(&value)) {
		return std::to_string(*i);
	}
	return std::get<std::string>(value);
}

} // namespace Mosaic

#endif // MOSAIC_PARAM_VALUE_H_
