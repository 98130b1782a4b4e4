#include "mt/options.hpp"

#include "mt/trace.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>

namespace mt::config
{
namespace
{

std::optional<bool> parseBool(const std::string &value)
{
    std::string lower;
    lower.reserve(value.size());
    for (char ch : value)
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on")
        return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off")
        return false;
    return std::nullopt;
}

std::optional<std::int64_t> parseInteger(const std::string &value)
{
    std::int64_t parsed = 0;
    const char *first = value.data();
    const char *last = value.data() + value.size();
    if (first != last && *first == '+')
        ++first;
    auto [ptr, ec] = std::from_chars(first, last, parsed);
    if (ec != std::errc() || ptr != last || first == last)
        return std::nullopt;
    return parsed;
}

nlohmann::json toJson(const OptionValue &value)
{
    switch (value.type())
    {
    case OptionValueType::Boolean:
        return value.toBool();
    case OptionValueType::Integer:
        return value.toInteger();
    case OptionValueType::String:
        return value.toString();
    case OptionValueType::None:
    default:
        return nlohmann::json();
    }
}

OptionValue fromJson(const nlohmann::json &jsonValue)
{
    if (jsonValue.is_boolean())
        return OptionValue(jsonValue.get<bool>());
    if (jsonValue.is_number_integer())
        return OptionValue(jsonValue.get<std::int64_t>());
    if (jsonValue.is_string())
        return OptionValue(jsonValue.get<std::string>());
    return OptionValue();
}

std::filesystem::path detectConfigRoot()
{
    if (const char *xdg = std::getenv("XDG_CONFIG_HOME"))
    {
        std::filesystem::path path(xdg);
        if (!path.empty())
            return path / "marktree";
    }
    if (const char *home = std::getenv("HOME"))
    {
        std::filesystem::path path(home);
        if (!path.empty())
            return path / ".config" / "marktree";
    }
    return std::filesystem::path(".config") / "marktree";
}

} // namespace

OptionValue::OptionValue(bool value)
    : value(value)
{
}

OptionValue::OptionValue(std::int64_t value)
    : value(value)
{
}

OptionValue::OptionValue(std::string value)
    : value(std::move(value))
{
}

OptionValue::OptionValue(const char *value)
    : value(std::string(value))
{
}

OptionValueType OptionValue::type() const noexcept
{
    switch (value.index())
    {
    case 1:
        return OptionValueType::Boolean;
    case 2:
        return OptionValueType::Integer;
    case 3:
        return OptionValueType::String;
    default:
        return OptionValueType::None;
    }
}

bool OptionValue::isNull() const noexcept
{
    return std::holds_alternative<std::monostate>(value);
}

bool OptionValue::toBool(bool fallback) const noexcept
{
    if (auto *ptr = std::get_if<bool>(&value))
        return *ptr;
    if (auto *iptr = std::get_if<std::int64_t>(&value))
        return *iptr != 0;
    if (auto *sptr = std::get_if<std::string>(&value))
        return parseBool(*sptr).value_or(fallback);
    return fallback;
}

std::int64_t OptionValue::toInteger(std::int64_t fallback) const noexcept
{
    if (auto *iptr = std::get_if<std::int64_t>(&value))
        return *iptr;
    if (auto *bptr = std::get_if<bool>(&value))
        return *bptr ? 1 : 0;
    if (auto *sptr = std::get_if<std::string>(&value))
        return parseInteger(*sptr).value_or(fallback);
    return fallback;
}

std::string OptionValue::toString(const std::string &fallback) const
{
    if (auto *sptr = std::get_if<std::string>(&value))
        return *sptr;
    if (auto *bptr = std::get_if<bool>(&value))
        return *bptr ? "true" : "false";
    if (auto *iptr = std::get_if<std::int64_t>(&value))
        return std::to_string(*iptr);
    return fallback;
}

bool OptionValue::operator==(const OptionValue &other) const noexcept
{
    return value == other.value;
}

OptionRegistry::OptionRegistry(std::string appId)
    : id(std::move(appId))
{
}

void OptionRegistry::registerOption(const OptionDefinition &definition)
{
    definitions[definition.key] = definition;
    auto it = overrides.find(definition.key);
    if (it == overrides.end())
        return;
    if (auto normalized = normalizeValue(definition, it->second))
        it->second = *normalized;
    else
        overrides.erase(it);
}

bool OptionRegistry::hasOption(const std::string &key) const noexcept
{
    return definitions.find(key) != definitions.end();
}

bool OptionRegistry::set(const std::string &key, const OptionValue &value)
{
    const OptionDefinition *definition = findDefinition(key);
    if (!definition)
        return false;
    auto normalized = normalizeValue(*definition, value);
    if (!normalized)
        return false;
    overrides[key] = *normalized;
    return true;
}

void OptionRegistry::reset(const std::string &key)
{
    overrides.erase(key);
}

OptionValue OptionRegistry::get(const std::string &key) const
{
    auto overrideIt = overrides.find(key);
    if (overrideIt != overrides.end())
        return overrideIt->second;
    if (const OptionDefinition *definition = findDefinition(key))
        return definition->defaultValue;
    return OptionValue();
}

bool OptionRegistry::getBool(const std::string &key, bool fallback) const
{
    return get(key).toBool(fallback);
}

std::int64_t OptionRegistry::getInteger(const std::string &key, std::int64_t fallback) const
{
    return get(key).toInteger(fallback);
}

std::string OptionRegistry::getString(const std::string &key, const std::string &fallback) const
{
    return get(key).toString(fallback);
}

void OptionRegistry::resetToDefaults() noexcept
{
    overrides.clear();
}

bool OptionRegistry::loadFromFile(const std::filesystem::path &filePath)
{
    std::ifstream in(filePath);
    if (!in)
        return false;

    nlohmann::json data;
    try
    {
        in >> data;
    }
    catch (const nlohmann::json::exception &ex)
    {
        if (diag::traceEnabled())
            diag::traceLine("[marktree][config] " + filePath.string() + ": " + ex.what());
        return false;
    }

    if (!data.is_object())
        return false;

    for (auto it = data.begin(); it != data.end(); ++it)
    {
        const OptionDefinition *definition = findDefinition(it.key());
        if (!definition)
            continue;
        // Values of the wrong shape keep whatever was there before.
        if (auto normalized = normalizeValue(*definition, fromJson(it.value())))
            overrides[it.key()] = *normalized;
    }

    return true;
}

bool OptionRegistry::saveToFile(const std::filesystem::path &filePath) const
{
    nlohmann::json data = nlohmann::json::object();
    for (const auto &[key, definition] : definitions)
    {
        (void)definition;
        data[key] = toJson(get(key));
    }

    std::error_code ec;
    if (filePath.has_parent_path())
        std::filesystem::create_directories(filePath.parent_path(), ec);

    std::ofstream out(filePath);
    if (!out)
        return false;
    out << data.dump(2) << std::endl;
    return static_cast<bool>(out);
}

bool OptionRegistry::loadDefaults()
{
    std::filesystem::path path = defaultOptionsPath();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        return false;
    return loadFromFile(path);
}

bool OptionRegistry::saveDefaults() const
{
    return saveToFile(defaultOptionsPath());
}

bool OptionRegistry::clearDefaults() const
{
    std::filesystem::path path = defaultOptionsPath();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        return true;
    return std::filesystem::remove(path, ec);
}

std::filesystem::path OptionRegistry::defaultOptionsPath() const
{
    return configRoot() / id / "defaults.json";
}

std::vector<OptionDefinition> OptionRegistry::listRegisteredOptions() const
{
    std::vector<OptionDefinition> result;
    result.reserve(definitions.size());
    for (const auto &[key, definition] : definitions)
        result.push_back(definition);
    std::sort(result.begin(), result.end(),
              [](const OptionDefinition &a, const OptionDefinition &b) { return a.key < b.key; });
    return result;
}

const OptionDefinition *OptionRegistry::definition(const std::string &key) const
{
    return findDefinition(key);
}

std::filesystem::path OptionRegistry::configRoot()
{
    return detectConfigRoot();
}

const OptionDefinition *OptionRegistry::findDefinition(const std::string &key) const
{
    auto it = definitions.find(key);
    if (it == definitions.end())
        return nullptr;
    return &it->second;
}

std::optional<OptionValue> OptionRegistry::normalizeValue(const OptionDefinition &definition,
                                                          const OptionValue &value) const
{
    switch (definition.kind)
    {
    case OptionKind::Boolean:
    {
        if (value.type() == OptionValueType::Boolean || value.type() == OptionValueType::Integer)
            return OptionValue(value.toBool());
        if (value.type() != OptionValueType::String)
            return std::nullopt;
        auto parsed = parseBool(value.toString());
        if (!parsed)
            return std::nullopt;
        return OptionValue(*parsed);
    }
    case OptionKind::Integer:
    {
        std::optional<std::int64_t> parsed;
        if (value.type() == OptionValueType::Integer || value.type() == OptionValueType::Boolean)
            parsed = value.toInteger();
        else if (value.type() == OptionValueType::String)
            parsed = parseInteger(value.toString());
        if (!parsed)
            return std::nullopt;
        std::int64_t clamped = *parsed;
        if (definition.minimum)
            clamped = std::max(clamped, *definition.minimum);
        if (definition.maximum)
            clamped = std::min(clamped, *definition.maximum);
        return OptionValue(clamped);
    }
    case OptionKind::String:
    {
        if (value.isNull())
            return std::nullopt;
        std::string text = value.toString();
        if (!definition.choices.empty() &&
            std::find(definition.choices.begin(), definition.choices.end(), text) == definition.choices.end())
            return std::nullopt;
        return OptionValue(std::move(text));
    }
    }
    return std::nullopt;
}

} // namespace mt::config
