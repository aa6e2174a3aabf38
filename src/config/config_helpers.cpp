#include <bulkget/config/config_helpers.h>

#include <fstream>
#include <stdexcept>

namespace bulkget::config {

std::optional<std::int64_t> parse_int(std::string_view s) {
    std::string str(s);
    trim(str);
    if (str.empty())
        return std::nullopt;
    try {
        std::size_t used = 0;
        auto v = std::stoll(str, &used);
        if (used != str.size())
            return std::nullopt;
        return static_cast<std::int64_t>(v);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();
    const std::string dotted = section.empty() ? key : section + "." + key;

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                in_target_section = (section.empty() || currentSection == section);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos)
            continue;

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments outside quotes
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        } else if (!v.empty()) {
            size_t close = v.find(v.front(), 1);
            if (close != std::string::npos)
                v = v.substr(0, close + 1);
        }

        if ((in_target_section && k == key) ||
            (currentSection.empty() && k == dotted)) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }

    if (const char* cfg_env = std::getenv("BULKGET_CONFIG"); cfg_env && *cfg_env) {
        return expand_tilde(cfg_env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "bulkget" / "config.toml";
    }

    return configHome / "bulkget" / "config.toml";
}

namespace {

template <typename T>
void read_int(const std::filesystem::path& path, const char* key, std::int64_t lo, std::int64_t hi,
              std::optional<T>& out, std::vector<std::string>& problems) {
    auto raw = parse_config_value(path, "transfer", key);
    if (raw.empty())
        return;
    auto v = parse_int(raw);
    if (!v) {
        problems.push_back(std::string(key) + ": not an integer ('" + raw + "')");
        return;
    }
    if (*v < lo || *v > hi) {
        problems.push_back(std::string(key) + ": out of range [" + std::to_string(lo) + ", " +
                           std::to_string(hi) + "]");
        return;
    }
    out = static_cast<T>(*v);
}

} // namespace

TransferConfig load_transfer_config(const std::filesystem::path& config_path) {
    TransferConfig cfg;
    std::error_code ec;
    if (config_path.empty() || !std::filesystem::exists(config_path, ec))
        return cfg;

    if (auto v = parse_config_value(config_path, "transfer", "output_dir"); !v.empty())
        cfg.outputDir = expand_tilde(v);
    if (auto v = parse_config_value(config_path, "transfer", "api_key"); !v.empty())
        cfg.apiKey = v;
    if (auto v = parse_config_value(config_path, "transfer", "log_file"); !v.empty())
        cfg.logFile = expand_tilde(v);

    read_int(config_path, "parallel_files", 1, 64, cfg.parallelFiles, cfg.problems);
    read_int(config_path, "threads", 1, 64, cfg.threads, cfg.problems);
    read_int(config_path, "chunk_size_mb", 1, 4096, cfg.chunkSizeMb, cfg.problems);
    read_int(config_path, "flush_every", 1, 1000000, cfg.flushEvery, cfg.problems);
    read_int(config_path, "max_attempts", 1, 100, cfg.maxAttempts, cfg.problems);
    return cfg;
}

std::optional<std::string> api_key_from_env() {
    if (const char* env = std::getenv("NCBI_API_KEY"); env && *env)
        return std::string(env);
    return std::nullopt;
}

} // namespace bulkget::config
