#include <charconv>
#include <fstream>
#include <webshell/config/config_helpers.h>

namespace webshell::config {

Result<ConfigTable> parse_config_file(const std::filesystem::path& config_path) {
    ConfigTable table;
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        return table;
    }
    std::ifstream file(config_path);
    if (!file) {
        return Error{ErrorCode::PermissionDenied,
                     "Cannot read config file '" + config_path.string() + "'"};
    }

    std::string line;
    std::string currentSection;
    std::size_t lineNo = 0;
    while (std::getline(file, line)) {
        ++lineNo;
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                return Error{ErrorCode::InvalidArgument,
                             config_path.string() + ":" + std::to_string(lineNo) +
                                 ": unterminated section header"};
            }
            currentSection = line.substr(1, end - 1);
            trim(currentSection);
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            return Error{ErrorCode::InvalidArgument, config_path.string() + ":" +
                                                         std::to_string(lineNo) +
                                                         ": expected key = value"};
        }
        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Inline comments, unless the value is quoted
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }
        table[currentSection][k] = unquote(v);
    }
    return table;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    auto table = parse_config_file(config_path);
    if (!table) {
        return "";
    }
    const auto& t = table.value();
    auto sec = t.find(section);
    if (sec == t.end()) {
        return "";
    }
    auto it = sec->second.find(key);
    return it == sec->second.end() ? "" : it->second;
}

std::vector<std::string> parse_string_list(const std::string& raw) {
    std::string s = raw;
    trim(s);
    if (s.size() >= 2 && s.front() == '[' && s.back() == ']') {
        s = s.substr(1, s.size() - 2);
    }
    std::vector<std::string> out;
    std::string current;
    char quote = 0;
    for (char c : s) {
        if (quote) {
            if (c == quote) {
                quote = 0;
            } else {
                current.push_back(c);
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == ',') {
            trim(current);
            if (!current.empty()) {
                out.push_back(current);
            }
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    trim(current);
    if (!current.empty()) {
        out.push_back(current);
    }
    return out;
}

Result<bool> parse_bool(std::string_view text) {
    std::string v(text);
    trim(v);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "1" || v == "true" || v == "yes" || v == "on") {
        return true;
    }
    if (v == "0" || v == "false" || v == "no" || v == "off") {
        return false;
    }
    return Error{ErrorCode::InvalidArgument, "Not a boolean: '" + std::string(text) + "'"};
}

Result<long long> parse_integer(std::string_view text, long long min, long long max) {
    std::string v(text);
    trim(v);
    long long value = 0;
    auto res = std::from_chars(v.data(), v.data() + v.size(), value);
    if (v.empty() || res.ec != std::errc{} || res.ptr != v.data() + v.size()) {
        return Error{ErrorCode::InvalidArgument, "Not an integer: '" + std::string(text) + "'"};
    }
    if (value < min || value > max) {
        return Error{ErrorCode::InvalidArgument, "Value " + v + " outside [" +
                                                     std::to_string(min) + ", " +
                                                     std::to_string(max) + "]"};
    }
    return value;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("WEBSHELL_CONFIG"); env && *env) {
        return expand_tilde(env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "webshell" / "config.toml";
    }

    return configHome / "webshell" / "config.toml";
}

} // namespace webshell::config
