#pragma once

#include "graphweave/engine/EngineOptions.h"
#include "graphweave/grouping/GroupingConfig.h"

#include <string>

namespace graphweave {

/**
 * @brief JSON persistence of engine options and grouping configurations
 *
 * Unknown keys are ignored and missing or mistyped keys keep their default,
 * so a document written by an older build still loads.
 *
 * The lenient readers return defaults on malformed input and log a warning;
 * the strict readers throw std::runtime_error carrying the parser message.
 */
class ConfigSerializer {
public:
    static std::string toJson(const EngineOptions& options);
    static std::string toJson(const GroupingConfig& config);

    static EngineOptions engineOptionsFromJson(const std::string& jsonStr);
    static EngineOptions engineOptionsFromJsonStrict(const std::string& jsonStr);

    static GroupingConfig groupingConfigFromJson(const std::string& jsonStr);
    static GroupingConfig groupingConfigFromJsonStrict(const std::string& jsonStr);
};

}  // namespace graphweave
