#include "ferry/config/config.hpp"

#include <CLI/CLI.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <algorithm>
#include <cctype>

namespace ferry::config {

namespace {

constexpr size_t MIN_ADVISED_CHUNK = 64 * 1024;
constexpr size_t MAX_ADVISED_CHUNK = 1024 * 1024;

// Simple INI parser
class IniParser {
public:
    struct Entry {
        std::string section;
        std::string key;
        std::string value;
    };

    static std::vector<Entry> parse(std::istream& input) {
        std::vector<Entry> entries;
        std::string current_section;
        std::string line;

        while (std::getline(input, line)) {
            // Trim whitespace
            line.erase(0, line.find_first_not_of(" \t\r\n"));
            line.erase(line.find_last_not_of(" \t\r\n") + 1);

            // Skip empty lines and comments
            if (line.empty() || line[0] == '#' || line[0] == ';') {
                continue;
            }

            // Section header
            if (line[0] == '[' && line.back() == ']') {
                current_section = line.substr(1, line.size() - 2);
                continue;
            }

            // Key=value
            auto eq_pos = line.find('=');
            if (eq_pos != std::string::npos) {
                std::string key = line.substr(0, eq_pos);
                std::string value = line.substr(eq_pos + 1);

                // Trim
                key.erase(key.find_last_not_of(" \t") + 1);
                value.erase(0, value.find_first_not_of(" \t"));

                // Remove quotes
                if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                    value = value.substr(1, value.size() - 2);
                }

                entries.push_back({current_section, key, value});
            }
        }

        return entries;
    }
};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

uint64_t parse_unsigned(const IniParser::Entry& entry) {
    try {
        size_t pos = 0;
        const auto value = std::stoull(entry.value, &pos);
        if (pos != entry.value.size() || entry.value.front() == '-') {
            throw std::invalid_argument("trailing characters");
        }
        return value;
    } catch (const std::logic_error&) {
        throw std::invalid_argument("invalid value for " + entry.section + "." + entry.key +
                                    ": '" + entry.value + "'");
    }
}

bool parse_bool(const IniParser::Entry& entry) {
    const auto value = to_lower(entry.value);
    if (value == "true" || value == "yes" || value == "1" || value == "on") return true;
    if (value == "false" || value == "no" || value == "0" || value == "off") return false;
    throw std::invalid_argument("invalid boolean for " + entry.section + "." + entry.key +
                                ": '" + entry.value + "'");
}

}  // namespace

handshake::Capabilities parse_capabilities(const std::string& list) {
    handshake::Capabilities caps;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = to_lower(trim(item));
        if (!item.empty()) {
            caps[item] = true;
        }
    }
    return caps;
}

std::string capabilities_to_string(const handshake::Capabilities& capabilities) {
    std::string out;
    for (const auto& [name, enabled] : capabilities) {
        if (!enabled) {
            continue;
        }
        if (!out.empty()) {
            out += ",";
        }
        out += name;
    }
    return out;
}

std::optional<ProtocolConfig> load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }

    auto entries = IniParser::parse(file);
    ProtocolConfig config;

    for (const auto& entry : entries) {
        std::string section = to_lower(entry.section);
        std::string key = to_lower(entry.key);

        if (section == "device" || section.empty()) {
            if (key == "device_id" || key == "id") {
                config.device_id = entry.value;
            } else if (key == "capabilities") {
                config.capabilities = parse_capabilities(entry.value);
            }
        } else if (section == "transfer") {
            if (key == "window_size") {
                config.reliability.window_size = parse_unsigned(entry);
            } else if (key == "chunk_size") {
                config.reliability.chunk_size = parse_unsigned(entry);
            } else if (key == "ack_timeout_ms") {
                config.reliability.ack_timeout = std::chrono::milliseconds(parse_unsigned(entry));
            } else if (key == "max_retries") {
                config.reliability.max_retries = static_cast<uint32_t>(parse_unsigned(entry));
            }
        } else if (section == "handshake") {
            if (key == "protocol_version") {
                config.handshake.protocol_version = static_cast<uint32_t>(parse_unsigned(entry));
            } else if (key == "min_protocol_version") {
                config.handshake.min_protocol_version = static_cast<uint32_t>(parse_unsigned(entry));
            } else if (key == "timeout_ms") {
                config.handshake.handshake_timeout = std::chrono::milliseconds(parse_unsigned(entry));
            } else if (key == "max_payload_age_ms") {
                config.handshake.max_payload_age = std::chrono::milliseconds(parse_unsigned(entry));
            } else if (key == "require_transport") {
                config.handshake.require_transport = parse_bool(entry);
            }
        } else if (section == "storage") {
            if (key == "resume_directory") {
                config.resume_directory = entry.value;
            }
        } else if (section == "logging") {
            if (key == "level") {
                config.log_level = entry.value;
            } else if (key == "file") {
                config.log_file = entry.value;
            }
        }
    }

    return config;
}

std::optional<ProtocolConfig> parse_cli(int argc, char* argv[]) {
    CLI::App app{"ferry - secure peer-to-peer file transfer"};

    ProtocolConfig config;
    std::string capabilities;
    uint64_t ack_timeout_ms = config.reliability.ack_timeout.count();
    uint64_t handshake_timeout_ms = config.handshake.handshake_timeout.count();

    app.add_option("-d,--device-id", config.device_id, "Local device identifier");
    app.add_option("--capabilities", capabilities, "Comma-separated capability list");
    app.add_option("-w,--window", config.reliability.window_size, "Chunks in flight")
        ->check(CLI::Range(size_t{1}, reliability::MAX_WINDOW_SIZE));
    app.add_option("-c,--chunk-size", config.reliability.chunk_size, "Chunk size in bytes")
        ->check(CLI::PositiveNumber);
    app.add_option("--ack-timeout-ms", ack_timeout_ms, "Ack timeout in milliseconds");
    app.add_option("--max-retries", config.reliability.max_retries, "Retransmissions per chunk");
    app.add_option("--handshake-timeout-ms", handshake_timeout_ms, "Handshake timeout in milliseconds");
    app.add_option("--resume-dir", config.resume_directory, "Directory for resume records");
    app.add_option("-l,--log-level", config.log_level, "Log level");
    app.add_option("--log-file", config.log_file, "Also write logs to this file");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError&) {
        return std::nullopt;
    }

    if (!capabilities.empty()) {
        config.capabilities = parse_capabilities(capabilities);
    }
    config.reliability.ack_timeout = std::chrono::milliseconds(ack_timeout_ms);
    config.handshake.handshake_timeout = std::chrono::milliseconds(handshake_timeout_ms);

    return config;
}

bool save_config(const ProtocolConfig& config, const std::string& path) {
    std::ofstream file(path);
    if (!file) {
        return false;
    }

    file << "[device]\n";
    file << "device_id = " << config.device_id << "\n";
    file << "capabilities = " << capabilities_to_string(config.capabilities) << "\n";
    file << "\n";

    file << "[transfer]\n";
    file << "window_size = " << config.reliability.window_size << "\n";
    file << "chunk_size = " << config.reliability.chunk_size << "\n";
    file << "ack_timeout_ms = " << config.reliability.ack_timeout.count() << "\n";
    file << "max_retries = " << config.reliability.max_retries << "\n";
    file << "\n";

    file << "[handshake]\n";
    file << "protocol_version = " << config.handshake.protocol_version << "\n";
    file << "min_protocol_version = " << config.handshake.min_protocol_version << "\n";
    file << "timeout_ms = " << config.handshake.handshake_timeout.count() << "\n";
    file << "max_payload_age_ms = " << config.handshake.max_payload_age.count() << "\n";
    file << "require_transport = " << (config.handshake.require_transport ? "true" : "false") << "\n";
    file << "\n";

    file << "[storage]\n";
    file << "resume_directory = " << config.resume_directory << "\n";
    file << "\n";

    file << "[logging]\n";
    file << "level = " << config.log_level << "\n";
    if (!config.log_file.empty()) {
        file << "file = " << config.log_file << "\n";
    }

    return static_cast<bool>(file);
}

ProtocolConfig merge_config(const ProtocolConfig& base, const ProtocolConfig& overlay) {
    const ProtocolConfig defaults;
    ProtocolConfig result = base;

    // Override with values from overlay that differ from the defaults
    if (!overlay.device_id.empty()) {
        result.device_id = overlay.device_id;
    }
    if (overlay.capabilities != defaults.capabilities) {
        result.capabilities = overlay.capabilities;
    }
    if (overlay.reliability.window_size != defaults.reliability.window_size) {
        result.reliability.window_size = overlay.reliability.window_size;
    }
    if (overlay.reliability.chunk_size != defaults.reliability.chunk_size) {
        result.reliability.chunk_size = overlay.reliability.chunk_size;
    }
    if (overlay.reliability.ack_timeout != defaults.reliability.ack_timeout) {
        result.reliability.ack_timeout = overlay.reliability.ack_timeout;
    }
    if (overlay.reliability.max_retries != defaults.reliability.max_retries) {
        result.reliability.max_retries = overlay.reliability.max_retries;
    }
    if (overlay.handshake.protocol_version != defaults.handshake.protocol_version) {
        result.handshake.protocol_version = overlay.handshake.protocol_version;
    }
    if (overlay.handshake.min_protocol_version != defaults.handshake.min_protocol_version) {
        result.handshake.min_protocol_version = overlay.handshake.min_protocol_version;
    }
    if (overlay.handshake.handshake_timeout != defaults.handshake.handshake_timeout) {
        result.handshake.handshake_timeout = overlay.handshake.handshake_timeout;
    }
    if (overlay.handshake.max_payload_age != defaults.handshake.max_payload_age) {
        result.handshake.max_payload_age = overlay.handshake.max_payload_age;
    }
    if (overlay.handshake.require_transport != defaults.handshake.require_transport) {
        result.handshake.require_transport = overlay.handshake.require_transport;
    }
    if (overlay.resume_directory != defaults.resume_directory) {
        result.resume_directory = overlay.resume_directory;
    }
    if (overlay.log_level != defaults.log_level) {
        result.log_level = overlay.log_level;
    }
    if (!overlay.log_file.empty()) {
        result.log_file = overlay.log_file;
    }

    return result;
}

ValidationResult validate_config(const ProtocolConfig& config) {
    ValidationResult result;
    auto error = [&result](std::string message) {
        result.errors.push_back(std::move(message));
        result.valid = false;
    };

    if (config.device_id.empty()) {
        error("Device id is empty");
    }

    auto enabled = [&config](const char* name) {
        auto it = config.capabilities.find(name);
        return it != config.capabilities.end() && it->second;
    };
    if (!enabled(handshake::CAP_ENCRYPTION)) {
        error("Encryption capability is required");
    }
    if (!enabled(handshake::CAP_WIFI_AWARE) && !enabled(handshake::CAP_BLUETOOTH) &&
        !enabled(handshake::CAP_LAN)) {
        result.warnings.push_back("No transport capability advertised - peers requiring one will reject us");
    }

    // Check window and chunk size
    if (config.reliability.window_size == 0 ||
        config.reliability.window_size > reliability::MAX_WINDOW_SIZE) {
        error("Window size must be between 1 and " + std::to_string(reliability::MAX_WINDOW_SIZE));
    }
    if (config.reliability.chunk_size == 0) {
        error("Chunk size must be positive");
    } else if (config.reliability.chunk_size > reliability::MAX_CHUNK_SIZE) {
        error("Chunk size exceeds the " + std::to_string(reliability::MAX_CHUNK_SIZE) +
              " byte frame limit");
    } else if (config.reliability.chunk_size < MIN_ADVISED_CHUNK ||
               config.reliability.chunk_size > MAX_ADVISED_CHUNK) {
        result.warnings.push_back("Chunk size outside the advised 64 KiB - 1 MiB range");
    }
    if (config.reliability.ack_timeout.count() <= 0) {
        error("Ack timeout must be positive");
    }
    if (config.reliability.max_retries == 0) {
        result.warnings.push_back("Max retries is 0 - a single lost chunk fails the transfer");
    }

    // Check handshake
    if (config.handshake.min_protocol_version > config.handshake.protocol_version) {
        error("Minimum protocol version exceeds our own version");
    }
    if (config.handshake.handshake_timeout.count() <= 0) {
        error("Handshake timeout must be positive");
    }
    if (config.handshake.max_payload_age.count() == 0) {
        result.warnings.push_back("Discovery payload age check is disabled");
    }

    if (config.resume_directory.empty()) {
        error("Resume directory is empty");
    }

    return result;
}

}  // namespace ferry::config
