#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ferry/handshake/handshake_protocol.hpp"
#include "ferry/reliability/reliability.hpp"

namespace ferry::config {

// Everything a peer needs to run the protocol engine
struct ProtocolConfig {
    std::string device_id;
    handshake::Capabilities capabilities{
        {handshake::CAP_ENCRYPTION, true},
        {handshake::CAP_LAN, true},
    };
    handshake::HandshakeConfig handshake;
    reliability::ReliabilityConfig reliability;
    std::string resume_directory = "ferry-resume";
    std::string log_level = "info";
    std::string log_file;
};

// Parse configuration from an INI file; nullopt if the file cannot be opened.
// Throws std::invalid_argument for a malformed value.
std::optional<ProtocolConfig> load_config(const std::string& path);

// Parse configuration from CLI arguments; nullopt on a parse error
std::optional<ProtocolConfig> parse_cli(int argc, char* argv[]);

// Save configuration to an INI file
bool save_config(const ProtocolConfig& config, const std::string& path);

// Values in overlay that differ from the defaults replace those in base
ProtocolConfig merge_config(const ProtocolConfig& base, const ProtocolConfig& overlay);

// Validate configuration
struct ValidationResult {
    bool valid{true};
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

ValidationResult validate_config(const ProtocolConfig& config);

// "encryption,lan" <-> {encryption: true, lan: true}
handshake::Capabilities parse_capabilities(const std::string& list);
std::string capabilities_to_string(const handshake::Capabilities& capabilities);

}  // namespace ferry::config
