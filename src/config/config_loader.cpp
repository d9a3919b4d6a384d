#include "config/config_loader.hpp"
#include "client/dsn.hpp"
#include "core/utils.hpp"

#include <toml.hpp>

#include <cstdint>
#include <cstdlib>
#include <stdexcept>

namespace tracesdk {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 *
 * Unset variables expand to an empty string.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    "Unclosed env var substitution at position " + std::to_string(i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

/**
 * @brief Carry traces_sample_rate over as raw JSON
 *
 * Range checks happen when a sampling decision is made, so an out-of-range
 * number or a string is kept and later rejected with a warning there.
 */
nlohmann::json extract_sample_rate(const toml::node_view<const toml::node> node) {
    if (!node) return nullptr;
    if (const auto* b = node.as_boolean()) return b->get();
    if (const auto* i = node.as_integer()) return i->get();
    if (const auto* f = node.as_floating_point()) return f->get();
    if (const auto* s = node.as_string()) return s->get();
    throw std::runtime_error("client.traces_sample_rate must be a number or a boolean");
}

ClientOptions extract_client(const toml::table& root) {
    ClientOptions options;
    const auto* tbl = root["client"].as_table();
    if (!tbl) return options;

    options.dsn = (*tbl)["dsn"].value_or(std::string{});
    options.environment = (*tbl)["environment"].value_or(std::string{});
    options.release = (*tbl)["release"].value_or(std::string{});
    options.traces_sample_rate = extract_sample_rate((*tbl)["traces_sample_rate"]);
    options.debug = (*tbl)["debug"].value_or(false);

    const int64_t max_spans = (*tbl)["max_spans"].value_or(static_cast<int64_t>(kDefaultMaxSpans));
    // Non-positive values are reported by validate_config()
    options.max_spans = max_spans > 0 ? static_cast<size_t>(max_spans) : 0;
    return options;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    if (const auto* tbl = root["logging"].as_table()) {
        cfg.level = (*tbl)["level"].value_or(cfg.level);
    }
    return cfg;
}

TransportConfig extract_transport(const toml::table& root) {
    TransportConfig cfg;
    if (const auto* tbl = root["transport"].as_table()) {
        cfg.file = (*tbl)["file"].value_or(cfg.file);
        cfg.flush_each_request = (*tbl)["flush_each_request"].value_or(cfg.flush_each_request);
    }
    return cfg;
}

SdkConfig extract_all_sections(const toml::table& tbl) {
    SdkConfig config;
    config.client = extract_client(tbl);
    config.logging = extract_logging(tbl);
    config.transport = extract_transport(tbl);
    return config;
}

ConfigLoader::LoadResult validate_and_return(SdkConfig config) {
    const auto errors = ConfigLoader::validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

} // anonymous namespace

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::string("Failed to load config: ") + e.what());
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::string("Failed to parse config: ") + e.what());
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const SdkConfig& config) {
    std::vector<std::string> errors;

    if (!config.client.dsn.empty()) {
        const auto dsn = Dsn::parse(config.client.dsn);
        if (dsn.is_error()) {
            errors.push_back("client.dsn is invalid: " + dsn.error_message());
        }
    }

    if (config.client.max_spans == 0) {
        errors.push_back("client.max_spans must be greater than 0");
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back("logging.level must be one of debug, info, warn, error, got '" +
            config.logging.level + "'");
    }

    if (config.transport.file.empty()) {
        errors.push_back("transport.file must not be empty");
    }

    return errors;
}

} // namespace tracesdk
