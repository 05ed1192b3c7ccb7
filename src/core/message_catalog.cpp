#include "zuuid/core/message_catalog.hpp"
#include <algorithm>
#include <array>

namespace zuuid {
namespace core {

namespace {

struct CatalogEntry {
    MessageKey key;
    std::string_view english;
    std::string_view chinese;
};

constexpr std::string_view kPlaceholder = "{value}";

constexpr std::array kEntries = {
    CatalogEntry{
        MessageKey::ConflictWarning,
        "Warning: Both -f (full) and -s (simple) format flags specified.",
        "警告：同时指定了 -f（完整）和 -s（简单）格式标志。"},
    CatalogEntry{
        MessageKey::UsingFull,
        "Using -f (full format) based on argument order.",
        "根据参数顺序使用 -f（完整格式）。"},
    CatalogEntry{
        MessageKey::UsingSimple,
        "Using -s (simple format) based on argument order.",
        "根据参数顺序使用 -s（简单格式）。"},
    CatalogEntry{
        MessageKey::InvalidVersion,
        "Invalid UUID version: {value}. Valid values: 4, 7",
        "无效的 UUID 版本：{value}。有效值：4、7"},
    CatalogEntry{
        MessageKey::InvalidCount,
        "Invalid count: {value}. Expected a positive integer",
        "无效的数量：{value}。应为正整数"},
    CatalogEntry{
        MessageKey::UnknownOption,
        "Unknown option: {value}",
        "未知选项：{value}"},
    CatalogEntry{
        MessageKey::MissingValue,
        "Option {value} requires a value",
        "选项 {value} 需要一个值"},
    CatalogEntry{
        MessageKey::UnexpectedValue,
        "Option {value} does not take a value",
        "选项 {value} 不接受值"},
    CatalogEntry{
        MessageKey::UnexpectedArgument,
        "Unexpected argument: {value}",
        "多余的参数：{value}"},
    CatalogEntry{
        MessageKey::InvalidLogLevel,
        "Invalid log level: {value}. Valid values: debug, info, warning, error, none",
        "无效的日志级别：{value}。有效值：debug、info、warning、error、none"},
    CatalogEntry{
        MessageKey::UsageHint,
        "Usage: zuuid [OPTIONS]\n\nFor more information, try '--help'.",
        "用法：zuuid [选项]\n\n更多信息请使用 '--help'。"},
    CatalogEntry{
        MessageKey::HelpText,
        "Generate UUID v4/v7\n"
        "\n"
        "Usage: zuuid [OPTIONS]\n"
        "\n"
        "Options:\n"
        "  -V, -v, --uuid-version <VERSION>  UUID version to generate (4 or 7, default: 4)\n"
        "  -U, -u, --upper                   Output UUID in uppercase\n"
        "  -l, --lower                       Output UUID in lowercase\n"
        "  -s, -S, --simple                  Output UUID without hyphens (32 chars)\n"
        "  -f, -F, --full                    Output UUID with hyphens in full format (36 chars)\n"
        "  -n, --count <COUNT>               Number of UUIDs to generate (default: 1)\n"
        "      --config <PATH>               Read defaults from a YAML file\n"
        "      --log-level <LEVEL>           Diagnostics level: debug, info, warning, error, none\n"
        "  -h, --help                        Print help\n"
        "      --version                     Print version\n"
        "\n"
        "When both -f and -s are given, the one that appears first wins.\n",
        "生成 UUID v4/v7\n"
        "\n"
        "用法：zuuid [选项]\n"
        "\n"
        "选项：\n"
        "  -V, -v, --uuid-version <版本>     要生成的 UUID 版本（4 或 7，默认：4）\n"
        "  -U, -u, --upper                   以大写形式输出 UUID\n"
        "  -l, --lower                       以小写形式输出 UUID\n"
        "  -s, -S, --simple                  输出不带连字符的 UUID（32 个字符）\n"
        "  -f, -F, --full                    输出带连字符的完整格式 UUID（36 个字符）\n"
        "  -n, --count <数量>                要生成的 UUID 数量（默认：1）\n"
        "      --config <路径>               从 YAML 文件读取默认值\n"
        "      --log-level <级别>            诊断级别：debug、info、warning、error、none\n"
        "  -h, --help                        打印帮助信息\n"
        "      --version                     打印版本信息\n"
        "\n"
        "同时指定 -f 和 -s 时，以先出现的为准。\n"},
    CatalogEntry{
        MessageKey::ConfigLoadFailed,
        "Failed to load configuration: {value}",
        "加载配置失败：{value}"},
};

} // namespace

std::string_view MessageCatalog::lookup(MessageKey key, Language language) {
    const auto it = std::find_if(kEntries.begin(), kEntries.end(),
                                 [key](const CatalogEntry& entry) { return entry.key == key; });
    if (it == kEntries.end()) {
        return {};
    }

    if (language == Language::Chinese && !it->chinese.empty()) {
        return it->chinese;
    }
    return it->english;
}

std::string MessageCatalog::format(MessageKey key, std::string_view value) const {
    std::string result(lookup(key));

    std::size_t pos = 0;
    while ((pos = result.find(kPlaceholder, pos)) != std::string::npos) {
        result.replace(pos, kPlaceholder.length(), value);
        pos += value.length();
    }
    return result;
}

} // namespace core
} // namespace zuuid
