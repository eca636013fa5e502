#include "Config.hpp"
#include "Log.hpp"

#include <sstream>

namespace splitwindow {

namespace {

String DescribeParseError(const toml::parse_error& err) {
    std::ostringstream oss;
    oss << "TOML parse error: " << err.description()
        << " at line " << err.source().begin.line
        << ", column " << err.source().begin.column;
    return oss.str();
}

} // namespace

Config::Config(toml::table&& root) : m_Root(std::move(root)) {}

Result<Config, String> Config::Load(const std::filesystem::path& filePath) {
    if (!std::filesystem::exists(filePath)) {
        return Result<Config, String>::Err("Config file not found: " + filePath.string());
    }

    try {
        toml::table table = toml::parse_file(filePath.string());
        Log::Info("Loaded configuration from: {}", filePath.string());
        return Config(std::move(table));
    }
    catch (const toml::parse_error& err) {
        return Result<Config, String>::Err(DescribeParseError(err));
    }
    catch (const std::exception& ex) {
        return Result<Config, String>::Err(String("Failed to load config: ") + ex.what());
    }
}

Result<Config, String> Config::Parse(StringView text) {
    try {
        return Config(toml::parse(text));
    }
    catch (const toml::parse_error& err) {
        return Result<Config, String>::Err(DescribeParseError(err));
    }
}

bool Config::Has(StringView key) const {
    return Navigate(key) != nullptr;
}

Result<Config, String> Config::GetTable(StringView key) const {
    const toml::node* node = Navigate(key);
    if (!node) {
        return Result<Config, String>::Err("Table not found: " + String(key));
    }

    if (!node->is_table()) {
        return Result<Config, String>::Err("Key is not a table: " + String(key));
    }

    toml::table clonedTable = *node->as_table();
    return Config(std::move(clonedTable));
}

const toml::node* Config::Navigate(StringView key) const {
    const toml::node* current = &m_Root;
    usize start = 0;

    while (start < key.size()) {
        usize end = key.find('.', start);
        if (end == StringView::npos) {
            end = key.size();
        }

        StringView segment = key.substr(start, end - start);

        const toml::table* table = current->as_table();
        if (!table) {
            return nullptr;
        }

        const toml::node* child = table->get(segment);
        if (!child) {
            return nullptr;
        }
        current = child;

        start = end + 1;
    }

    return current;
}

} // namespace splitwindow
