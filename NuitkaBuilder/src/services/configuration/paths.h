#pragma once
#include <string>

namespace nkb::paths {
// Settings schema: NKB_SCHEMA_PATH, else configs/setting_definitions.json in
// the working directory or one of its parents.
std::string schemaFilePath();

// Saved build configuration: NKB_CONFIG_DIR/nuitka_build.json, else the first
// nuitka_build.json found walking up from the working directory, else one in
// the working directory.
std::string buildConfigFilePath();

#ifdef NKB_INTERNAL_TESTING
void nkb_set_config_path_for_tests(const std::string& p);
#endif
}
