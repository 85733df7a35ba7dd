#include <ragcore/config/config_helpers.h>

#include <charconv>
#include <fstream>
#include <optional>
#include <sstream>

namespace ragcore::config {

namespace {

// Drop a trailing # comment that is not inside a quoted string
std::string strip_inline_comment(const std::string& value) {
    char quote = 0;
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (quote) {
            if (c == '\\' && quote == '"') {
                ++i;
            } else if (c == quote) {
                quote = 0;
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return value.substr(0, i);
        }
    }
    return value;
}

std::string lower(std::string_view in) {
    std::string out(in);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

std::string unescape(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] != '\\' || i + 1 == in.size()) {
            out.push_back(in[i]);
            continue;
        }
        char next = in[++i];
        switch (next) {
            case 'n':
                out.push_back('\n');
                break;
            case 't':
                out.push_back('\t');
                break;
            case 'r':
                out.push_back('\r');
                break;
            case '\\':
                out.push_back('\\');
                break;
            case '"':
                out.push_back('"');
                break;
            default:
                out.push_back('\\');
                out.push_back(next);
        }
    }
    return out;
}

std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
        return unescape(std::string_view(val).substr(1, val.size() - 2));
    }
    if (val.size() >= 2 && val.front() == '\'' && val.back() == '\'') {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

ConfigMap parse_config_text(std::string_view text) {
    ConfigMap sections;
    std::string section;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t nl = text.find('\n', pos);
        std::string line(text.substr(pos, nl == std::string_view::npos ? text.npos : nl - pos));
        pos = nl == std::string_view::npos ? text.size() + 1 : nl + 1;

        trim(line);
        if (line.empty() || line.front() == '#') {
            continue;
        }
        if (line.front() == '[') {
            if (auto close = line.find(']'); close != std::string::npos) {
                section = line.substr(1, close - 1);
                trim(section);
            }
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string key = line.substr(0, eq);
        std::string value = strip_inline_comment(line.substr(eq + 1));
        trim(key);
        trim(value);

        // Dotted keys outside a section: retrieval.final_top_k = 5
        std::string target = section;
        if (auto dot = key.find('.'); target.empty() && dot != std::string::npos) {
            target = key.substr(0, dot);
            key.erase(0, dot + 1);
        }
        sections[target][key] = std::move(value);
    }
    return sections;
}

Result<ConfigMap> parse_config_file(const std::filesystem::path& config_path) {
    std::ifstream file(config_path);
    if (!file) {
        return Error{ErrorCode::NotFound, "Cannot open config file: " + config_path.string()};
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_config_text(buffer.str());
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
    bool sawQuote = false;
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (quote) {
            current.push_back(c);
            if (c == '\\' && quote == '"' && i + 1 < s.size()) {
                current.push_back(s[++i]);
            } else if (c == quote) {
                quote = 0;
            }
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
            sawQuote = true;
            current.push_back(c);
        } else if (c == ',') {
            std::string item = current;
            trim(item);
            if (!item.empty() || sawQuote) {
                out.push_back(unquote(item));
            }
            current.clear();
            sawQuote = false;
        } else {
            current.push_back(c);
        }
    }
    std::string item = current;
    trim(item);
    if (!item.empty() || sawQuote) {
        out.push_back(unquote(item));
    }
    return out;
}

Result<int64_t> parse_int(std::string_view raw) {
    std::string s = unquote(std::string(raw));
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (s.empty() || ec != std::errc{} || ptr != s.data() + s.size()) {
        return Error{ErrorCode::InvalidArgument, "Not an integer: '" + s + "'"};
    }
    return value;
}

Result<double> parse_double(std::string_view raw) {
    std::string s = unquote(std::string(raw));
    try {
        size_t consumed = 0;
        double value = std::stod(s, &consumed);
        if (consumed != s.size()) {
            return Error{ErrorCode::InvalidArgument, "Not a number: '" + s + "'"};
        }
        return value;
    } catch (const std::exception&) {
        return Error{ErrorCode::InvalidArgument, "Not a number: '" + s + "'"};
    }
}

Result<bool> parse_bool(std::string_view raw) {
    std::string s = lower(unquote(std::string(raw)));
    if (s == "true" || s == "1" || s == "yes" || s == "on") {
        return true;
    }
    if (s == "false" || s == "0" || s == "no" || s == "off") {
        return false;
    }
    return Error{ErrorCode::InvalidArgument, "Not a boolean: '" + s + "'"};
}

Result<std::chrono::milliseconds> parse_duration(std::string_view raw,
                                                 std::chrono::milliseconds unit) {
    std::string s = lower(unquote(std::string(raw)));
    size_t digits = 0;
    while (digits < s.size() && std::isdigit(static_cast<unsigned char>(s[digits]))) {
        ++digits;
    }
    if (digits == 0) {
        return Error{ErrorCode::InvalidArgument, "Not a duration: '" + s + "'"};
    }
    auto count = parse_int(s.substr(0, digits));
    if (!count) {
        return count.error();
    }
    std::string suffix = s.substr(digits);
    trim(suffix);

    using namespace std::chrono;
    if (suffix.empty()) {
        return milliseconds(count.value() * unit.count());
    }
    if (suffix == "ms") {
        return milliseconds(count.value());
    }
    if (suffix == "s") {
        return duration_cast<milliseconds>(seconds(count.value()));
    }
    if (suffix == "m") {
        return duration_cast<milliseconds>(minutes(count.value()));
    }
    if (suffix == "h") {
        return duration_cast<milliseconds>(hours(count.value()));
    }
    if (suffix == "d") {
        return duration_cast<milliseconds>(hours(24 * count.value()));
    }
    return Error{ErrorCode::InvalidArgument, "Unknown duration unit in '" + s + "'"};
}

namespace {

// $<xdgVar>/ragcore when set, else $HOME/<homeRelative>/ragcore
std::optional<std::filesystem::path> xdgDirectory(const char* xdgVar,
                                                  const std::filesystem::path& homeRelative) {
    if (const char* xdg = std::getenv(xdgVar); xdg && *xdg) {
        return std::filesystem::path(xdg) / "ragcore";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / homeRelative / "ragcore";
    }
    return std::nullopt;
}

} // namespace

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return override_path;
    }
    auto dir = xdgDirectory("XDG_CONFIG_HOME", ".config");
    return (dir ? *dir : std::filesystem::path("ragcore")) / "config.toml";
}

std::filesystem::path get_data_dir() {
    auto dir = xdgDirectory("XDG_DATA_HOME", std::filesystem::path(".local") / "share");
    return dir ? *dir : std::filesystem::current_path() / "ragcore_data";
}

} // namespace ragcore::config
