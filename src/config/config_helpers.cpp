#include <simcache/config/config_helpers.h>

#include <cerrno>
#include <fstream>

namespace simcache::config {

std::optional<bool> parse_bool(std::string_view s) {
    std::string v(s);
    trim(v);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "1" || v == "true" || v == "yes" || v == "on")
        return true;
    if (v == "0" || v == "false" || v == "no" || v == "off")
        return false;
    return std::nullopt;
}

std::optional<long long> parse_int(std::string_view s) {
    std::string v(s);
    trim(v);
    if (v.empty())
        return std::nullopt;
    errno = 0;
    char* end = nullptr;
    long long out = std::strtoll(v.c_str(), &end, 10);
    if (errno != 0 || end != v.c_str() + v.size())
        return std::nullopt;
    return out;
}

std::optional<double> parse_double(std::string_view s) {
    std::string v(s);
    trim(v);
    if (v.empty())
        return std::nullopt;
    errno = 0;
    char* end = nullptr;
    double out = std::strtod(v.c_str(), &end);
    if (errno != 0 || end != v.c_str() + v.size())
        return std::nullopt;
    return out;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Inline comments; '#' inside a quoted value is kept
        if (!v.empty() && (v.front() == '"' || v.front() == '\'')) {
            if (size_t close = v.find(v.front(), 1); close != std::string::npos) {
                v = v.substr(0, close + 1);
            }
        } else if (size_t comment = v.find('#'); comment != std::string::npos) {
            v = v.substr(0, comment);
            trim(v);
        }

        // Support both "ai.embedding_model" and "[ai] embedding_model"
        const bool dotted = currentSection.empty() && k == section + "." + key;
        const bool scoped = (section.empty() || currentSection == section) && k == key;
        if (dotted || scoped) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_dir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "simcache";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "simcache";
    }
    return std::filesystem::path("~/.config") / "simcache";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (auto env = env_value("SIMCACHE_CONFIG")) {
        return expand_tilde(*env);
    }
    return get_config_dir() / "config.toml";
}

} // namespace simcache::config
