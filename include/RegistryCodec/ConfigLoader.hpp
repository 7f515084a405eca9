#pragma once
// ConfigLoader.hpp – Parses a registry XML configuration into a RegistryConfig.

#include "Batcher.hpp"
#include "FieldLayout.hpp"
#include "NameNormalizer.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

namespace registry {

// Thrown when the XML is structurally invalid or violates the schema rules.
// Layout rule violations (widths, overflow) surface as LayoutError instead.
class ConfigLoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct RegistryConfig {
    std::string      name;
    std::string      edition;
    FieldLayout      layout;
    NormalizerConfig normalizer;
    BatchConfig      batch;
};

// Built-in configuration: the cordata layout, default suffixes, chunks of 100.
[[nodiscard]] RegistryConfig defaultConfig();

// Loads a configuration from the given XML file path.
// Throws ConfigLoadError on any parse or validation failure.
RegistryConfig loadConfig(const std::filesystem::path& xml_path);

// Same as loadConfig(), from XML text already in memory.
RegistryConfig parseConfig(std::string_view xml_text);

} // namespace registry
