#pragma once

#include <string>

#include "config/config.pb.h"

namespace fleet::config {

/*
  Loads RuntimeConfig from YAML.

  The document is converted to a protobuf Struct, then parsed into
  RuntimeConfig through the JSON mapping, so field names follow the
  .proto and unknown fields are rejected.

  Scalars may reference the environment:

    robot_id: ${FLEET_PINNED_ROBOT}
    executor_threads: ${FLEET_THREADS:-4}

  Quoted scalars stay strings after expansion ("1.10", "0900").
*/
class ConfigLoader {
 public:
  static fleet::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static fleet::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Replaces ${NAME} and ${NAME:-fallback}. Throws util::InvalidArgument
  // for an unset variable without fallback or an unterminated reference.
  static std::string ExpandEnvironment(const std::string& text);
};

} // namespace fleet::config
