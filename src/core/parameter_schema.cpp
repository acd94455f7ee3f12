/// @file src/core/parameter_schema.cpp
/// @brief ParameterSchema admission checks.

#include "wfv/types.hpp"

#include <cmath>
#include <utility>

namespace wfv {

ParameterSchema::ParameterSchema(std::map<std::string, ParameterSpec> specs)
    : specs_(std::move(specs))
{}

void ParameterSchema::add(const std::string& name, ParameterSpec spec) {
    specs_[name] = spec;
}

bool ParameterSchema::admits(const ParameterSet& params) const noexcept {
    for (const auto& [name, value] : params) {
        if (!std::isfinite(value)) return false;
        if (specs_.empty()) continue;

        const auto it = specs_.find(name);
        if (it == specs_.end()) return false;

        const ParameterSpec& spec = it->second;
        if (value < spec.min_value || value > spec.max_value) return false;
        if (spec.kind == ParameterKind::Integer && std::floor(value) != value) {
            return false;
        }
    }
    return true;
}

}  // namespace wfv
